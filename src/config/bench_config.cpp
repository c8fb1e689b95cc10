#include "bench_config.hpp"

#include <cmath>
#include <fstream>

#include <fmt/format.h>

#include "../particles/particle.hpp"
#include "../utility/exceptions.hpp"

namespace kernelbench::config {

namespace {

json strategies_to_json(const std::vector<Strategy> &strategies) {
    if (strategies.size() == 1) {
        return kernelbench::to_string(strategies.front());
    }
    return "both";
}

void check_finite(double value, const char *name) {
    if (!std::isfinite(value)) {
        throw ConfigError(fmt::format("{} must be finite", name));
    }
}

void check_range(double low, double high, const char *axis) {
    check_finite(low, axis);
    check_finite(high, axis);
    if (high <= low) {
        throw ConfigError(fmt::format("Invalid {} bounds: [{}, {})", axis, low,
                                      high));
    }
}

void check_section(const json &j, const char *name) {
    if (!j.is_object()) {
        throw ConfigError(fmt::format("\"{}\" must be a JSON object, got {}",
                                      name, j.type_name()));
    }
}

void json_to_fractal(const json &j, FractalConfig &cfg) {
    check_section(j, "fractal");
    if (j.contains("x_low")) {
        cfg.x_low = j["x_low"].get<double>();
    }
    if (j.contains("x_high")) {
        cfg.x_high = j["x_high"].get<double>();
    }
    if (j.contains("y_low")) {
        cfg.y_low = j["y_low"].get<double>();
    }
    if (j.contains("y_high")) {
        cfg.y_high = j["y_high"].get<double>();
    }
    if (j.contains("c_real")) {
        cfg.c_real = j["c_real"].get<double>();
    }
    if (j.contains("c_imag")) {
        cfg.c_imag = j["c_imag"].get<double>();
    }
    if (j.contains("desired_width")) {
        cfg.desired_width = j["desired_width"].get<int>();
    }
    if (j.contains("max_iterations")) {
        cfg.max_iterations = j["max_iterations"].get<int>();
    }
    if (j.contains("strategy")) {
        cfg.strategies = parse_strategies(j["strategy"].get<std::string>());
    }
    if (j.contains("expected_checksum")) {
        if (j["expected_checksum"].is_null()) {
            cfg.expected_checksum.reset();
        } else {
            cfg.expected_checksum = j["expected_checksum"].get<long long>();
        }
    }
}

void json_to_particles(const json &j, ParticleConfig &cfg) {
    check_section(j, "particles");
    if (j.contains("fixture")) {
        cfg.fixture = parse_fixture(j["fixture"].get<std::string>());
    }
    if (j.contains("count")) {
        cfg.count = j["count"].get<int>();
    }
    if (j.contains("seed")) {
        cfg.seed = j["seed"].get<std::uint32_t>();
    }
    if (j.contains("duration")) {
        cfg.duration = j["duration"].get<double>();
    }
    if (j.contains("strategy")) {
        cfg.strategies = parse_strategies(j["strategy"].get<std::string>());
    }
}

} // namespace

particles::ParticleSet make_reference_particles() {
    return {
        {0.3, 0.5, +1.0},
        {0.0, -0.5, -1.0},
        {-0.1, -0.4, +3.0},
    };
}

particles::ParticleSet reference_final_positions() {
    return {
        {0.210269, 0.543863, +1.0},
        {-0.099334, -0.490034, -1.0},
        {0.191358, -0.365227, +3.0},
    };
}

fractal::GridSpec FractalConfig::grid_spec() const {
    fractal::GridSpec spec;
    spec.x_low = x_low;
    spec.x_high = x_high;
    spec.y_low = y_low;
    spec.y_high = y_high;
    spec.desired_width = desired_width;
    spec.c = fractal::ComplexPoint(c_real, c_imag);
    return spec;
}

bool FractalConfig::is_reference() const noexcept {
    const FractalConfig reference;
    return x_low == reference.x_low && x_high == reference.x_high &&
           y_low == reference.y_low && y_high == reference.y_high &&
           c_real == reference.c_real && c_imag == reference.c_imag &&
           desired_width == reference.desired_width &&
           max_iterations == reference.max_iterations;
}

std::optional<long long> FractalConfig::resolved_checksum() const noexcept {
    if (expected_checksum) {
        return expected_checksum;
    }
    if (is_reference()) {
        return reference_checksum;
    }
    return std::nullopt;
}

bool ParticleConfig::checks_reference() const noexcept {
    return fixture == ParticleFixture::Reference &&
           duration == reference_duration;
}

particles::ParticleSet ParticleConfig::make_fixture() const {
    if (fixture == ParticleFixture::Reference) {
        return make_reference_particles();
    }
    return particles::make_random_particles(count, seed);
}

void validate(const BenchConfig &cfg) {
    if (cfg.repeat < 1) {
        throw ConfigError("Invalid repeat count: " +
                          std::to_string(cfg.repeat));
    }

    const FractalConfig &f = cfg.fractal;
    check_range(f.x_low, f.x_high, "x");
    check_range(f.y_low, f.y_high, "y");
    check_finite(f.c_real, "c_real");
    check_finite(f.c_imag, "c_imag");
    if (f.desired_width <= 0) {
        throw ConfigError("Invalid grid width: " +
                          std::to_string(f.desired_width));
    }
    if (f.max_iterations < 0) {
        throw ConfigError("Invalid iteration cap: " +
                          std::to_string(f.max_iterations));
    }
    if (f.strategies.empty()) {
        throw ConfigError("No fractal strategy selected");
    }

    const ParticleConfig &p = cfg.particles;
    check_finite(p.duration, "duration");
    if (p.fixture == ParticleFixture::Random && p.count < 1) {
        throw ConfigError("Invalid particle count: " +
                          std::to_string(p.count));
    }
    if (p.strategies.empty()) {
        throw ConfigError("No particle strategy selected");
    }
}

void apply_json(const json &j, BenchConfig &cfg) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    try {
        if (j.contains("kernel")) {
            cfg.kernel = parse_kernel_selection(j["kernel"].get<std::string>());
        }
        if (j.contains("repeat")) {
            cfg.repeat = j["repeat"].get<int>();
        }
        if (j.contains("log_level")) {
            cfg.log_level = parse_log_level(j["log_level"].get<std::string>());
        }
        if (j.contains("json_output")) {
            cfg.json_output = j["json_output"].get<bool>();
        }
        if (j.contains("fractal")) {
            json_to_fractal(j["fractal"], cfg.fractal);
        }
        if (j.contains("particles")) {
            json_to_particles(j["particles"], cfg.particles);
        }
    } catch (const json::exception &e) {
        throw ConfigError("Invalid value: " + std::string(e.what()));
    }
}

void load_config_file(const std::string &path, BenchConfig &cfg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IOError("Failed to open config: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception &e) {
        throw IOError("JSON parsing failed in " + path + ": " +
                      std::string(e.what()));
    }

    apply_json(j, cfg);
}

json to_json(const BenchConfig &cfg) {
    const FractalConfig &f = cfg.fractal;
    const ParticleConfig &p = cfg.particles;

    json fractal{{"x_low", f.x_low},
                 {"x_high", f.x_high},
                 {"y_low", f.y_low},
                 {"y_high", f.y_high},
                 {"c_real", f.c_real},
                 {"c_imag", f.c_imag},
                 {"desired_width", f.desired_width},
                 {"max_iterations", f.max_iterations},
                 {"strategy", strategies_to_json(f.strategies)}};
    if (f.expected_checksum) {
        fractal["expected_checksum"] = *f.expected_checksum;
    } else {
        fractal["expected_checksum"] = nullptr;
    }

    return json{{"kernel", to_string(cfg.kernel)},
                {"repeat", cfg.repeat},
                {"log_level", Logger::level_name(cfg.log_level)},
                {"json_output", cfg.json_output},
                {"fractal", fractal},
                {"particles",
                 {{"fixture", to_string(p.fixture)},
                  {"count", p.count},
                  {"seed", p.seed},
                  {"duration", p.duration},
                  {"strategy", strategies_to_json(p.strategies)}}}};
}

std::vector<Strategy> parse_strategies(std::string_view name) {
    if (name == "both") {
        return {Strategy::Scalar, Strategy::Batch};
    }
    if (auto strategy = parse_strategy(name)) {
        return {*strategy};
    }
    throw ConfigError(fmt::format(
        "Unknown strategy '{}' (expected scalar, batch or both)", name));
}

KernelSelection parse_kernel_selection(std::string_view name) {
    if (name == "all") {
        return KernelSelection::All;
    }
    if (name == "fractal") {
        return KernelSelection::Fractal;
    }
    if (name == "particles") {
        return KernelSelection::Particles;
    }
    throw ConfigError(fmt::format(
        "Unknown kernel '{}' (expected all, fractal or particles)", name));
}

ParticleFixture parse_fixture(std::string_view name) {
    if (name == "reference") {
        return ParticleFixture::Reference;
    }
    if (name == "random") {
        return ParticleFixture::Random;
    }
    throw ConfigError(fmt::format(
        "Unknown particle fixture '{}' (expected reference or random)", name));
}

Logger::Level parse_log_level(std::string_view name) {
    Logger::Level level;
    if (!Logger::parse_level(name, level)) {
        throw ConfigError(fmt::format("Unknown log level '{}'", name));
    }
    return level;
}

const char *to_string(KernelSelection kernel) noexcept {
    switch (kernel) {
    case KernelSelection::All:
        return "all";
    case KernelSelection::Fractal:
        return "fractal";
    case KernelSelection::Particles:
        return "particles";
    }
    return "unknown";
}

const char *to_string(ParticleFixture fixture) noexcept {
    switch (fixture) {
    case ParticleFixture::Reference:
        return "reference";
    case ParticleFixture::Random:
        return "random";
    }
    return "unknown";
}

} // namespace kernelbench::config
