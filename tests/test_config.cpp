#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "config/bench_config.hpp"
#include "config/cli_args.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

using namespace kernelbench;
using namespace kernelbench::config;

namespace {

CliArgs parse(std::vector<const char *> args) {
    args.insert(args.begin(), "kernelbench");
    return parse_args(static_cast<int>(args.size()), args.data());
}

std::string write_temp(const std::string &name, const std::string &content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

TEST_CASE("Defaults are the reference configuration", "[config]") {
    BenchConfig cfg;
    REQUIRE(cfg.kernel == KernelSelection::All);
    REQUIRE(cfg.repeat == 1);
    REQUIRE(cfg.fractal.is_reference());
    REQUIRE(cfg.fractal.resolved_checksum() == reference_checksum);
    REQUIRE(cfg.fractal.strategies.size() == 2);
    REQUIRE(cfg.particles.checks_reference());
    REQUIRE(cfg.particles.make_fixture().size() == 3);
    REQUIRE_NOTHROW(validate(cfg));
}

TEST_CASE("Checksum expectation follows the configuration", "[config]") {
    FractalConfig f;
    f.max_iterations = 100;
    REQUIRE_FALSE(f.is_reference());
    REQUIRE_FALSE(f.resolved_checksum().has_value());

    f.expected_checksum = 1234;
    REQUIRE(f.resolved_checksum() == 1234);
}

TEST_CASE("Validation rejects invalid values", "[config]") {
    BenchConfig cfg;

    SECTION("repeat") { cfg.repeat = 0; }
    SECTION("width") { cfg.fractal.desired_width = 0; }
    SECTION("cap") { cfg.fractal.max_iterations = -1; }
    SECTION("range") { cfg.fractal.x_high = cfg.fractal.x_low; }
    SECTION("no strategy") { cfg.fractal.strategies.clear(); }
    SECTION("random count") {
        cfg.particles.fixture = ParticleFixture::Random;
        cfg.particles.count = 0;
    }

    REQUIRE_THROWS_AS(validate(cfg), ConfigError);
}

TEST_CASE("JSON overlays only the keys it names", "[config]") {
    BenchConfig cfg;
    apply_json(json::parse(R"({
        "kernel": "fractal",
        "repeat": 3,
        "fractal": {"desired_width": 200, "strategy": "batch"},
        "particles": {"fixture": "random", "count": 50, "seed": 9}
    })"),
               cfg);

    REQUIRE(cfg.kernel == KernelSelection::Fractal);
    REQUIRE(cfg.repeat == 3);
    REQUIRE(cfg.fractal.desired_width == 200);
    REQUIRE(cfg.fractal.max_iterations == 300);
    REQUIRE(cfg.fractal.strategies == std::vector<Strategy>{Strategy::Batch});
    REQUIRE(cfg.particles.fixture == ParticleFixture::Random);
    REQUIRE(cfg.particles.count == 50);
    REQUIRE(cfg.particles.seed == 9);
    REQUIRE(cfg.particles.duration == 0.1);
}

TEST_CASE("Bad JSON values are configuration errors", "[config]") {
    BenchConfig cfg;
    REQUIRE_THROWS_AS(apply_json(json::parse(R"({"repeat": "two"})"), cfg),
                      ConfigError);
    REQUIRE_THROWS_AS(
        apply_json(json::parse(R"({"fractal": {"strategy": "simd"}})"), cfg),
        ConfigError);
    REQUIRE_THROWS_AS(apply_json(json::parse("[1, 2]"), cfg), ConfigError);
    REQUIRE_THROWS_AS(apply_json(json::parse(R"({"fractal": 5})"), cfg),
                      ConfigError);
    REQUIRE_THROWS_AS(apply_json(json::parse(R"({"particles": "x"})"), cfg),
                      ConfigError);
}

TEST_CASE("Configuration survives a JSON round trip", "[config]") {
    BenchConfig cfg;
    cfg.kernel = KernelSelection::Particles;
    cfg.fractal.expected_checksum = 77;
    cfg.particles.strategies = {Strategy::Scalar};

    BenchConfig copy;
    apply_json(to_json(cfg), copy);
    REQUIRE(copy.kernel == KernelSelection::Particles);
    REQUIRE(copy.fractal.expected_checksum == 77);
    REQUIRE(copy.particles.strategies ==
            std::vector<Strategy>{Strategy::Scalar});
}

TEST_CASE("Config files", "[config]") {
    BenchConfig cfg;

    SECTION("missing file") {
        REQUIRE_THROWS_AS(
            load_config_file("/nonexistent/kernelbench.json", cfg), IOError);
    }
    SECTION("malformed file") {
        const auto path = write_temp("kernelbench_bad.json", "{ not json");
        REQUIRE_THROWS_AS(load_config_file(path, cfg), IOError);
    }
    SECTION("valid file") {
        const auto path =
            write_temp("kernelbench_ok.json", R"({"repeat": 4})");
        load_config_file(path, cfg);
        REQUIRE(cfg.repeat == 4);
    }
}

TEST_CASE("Command line overrides", "[config][cli]") {
    const auto args = parse({"--kernel", "particles", "--strategy=scalar",
                             "--width", "64", "--particles", "10", "--seed",
                             "5", "--repeat", "2", "--json"});
    const BenchConfig &cfg = args.config;

    REQUIRE_FALSE(args.show_help);
    REQUIRE(cfg.kernel == KernelSelection::Particles);
    REQUIRE(cfg.fractal.strategies == std::vector<Strategy>{Strategy::Scalar});
    REQUIRE(cfg.particles.strategies ==
            std::vector<Strategy>{Strategy::Scalar});
    REQUIRE(cfg.fractal.desired_width == 64);
    REQUIRE(cfg.particles.fixture == ParticleFixture::Random);
    REQUIRE(cfg.particles.count == 10);
    REQUIRE(cfg.particles.seed == 5);
    REQUIRE(cfg.repeat == 2);
    REQUIRE(cfg.json_output);
}

TEST_CASE("Command line wins over the config file", "[config][cli]") {
    const auto path = write_temp("kernelbench_cli.json",
                                 R"({"repeat": 7, "fractal": {"max_iterations": 50}})");
    const auto args = parse({"--repeat", "3", "--config", path.c_str()});

    REQUIRE(args.config_path == path);
    REQUIRE(args.config.repeat == 3);
    REQUIRE(args.config.fractal.max_iterations == 50);
}

TEST_CASE("Parsing arguments writes nothing to the log", "[config][cli]") {
    const auto path =
        write_temp("kernelbench_quiet.json", R"({"log_level": "info"})");
    Logger::set_level(Logger::INFO_LEVEL);

    std::ostringstream captured;
    std::streambuf *old = std::cerr.rdbuf(captured.rdbuf());
    CliArgs args;
    try {
        args = parse({"--config", path.c_str(), "--log-level", "off"});
    } catch (...) {
        std::cerr.rdbuf(old);
        throw;
    }
    std::cerr.rdbuf(old);

    REQUIRE(args.config.log_level == Logger::OFF_LEVEL);
    REQUIRE(captured.str().empty());
}

TEST_CASE("Command line errors", "[config][cli]") {
    REQUIRE_THROWS_AS(parse({"--frobnicate"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--width"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--width", "wide"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--width", "0"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--strategy", "gpu"}), ConfigError);
    REQUIRE(parse({"--help"}).show_help);
}
