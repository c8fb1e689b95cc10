#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../fractal/grid.hpp"
#include "../particles/particle.hpp"
#include "../strategy.hpp"
#include "../utility/logger.hpp"

namespace kernelbench::config {

using json = nlohmann::json;

/** @brief Checksum of the reference fractal configuration */
inline constexpr long long reference_checksum = 33219980;

/**
 * @brief The three-particle fixture whose evolution over reference_duration
 * has known final positions
 */
particles::ParticleSet make_reference_particles();

/** @brief Expected positions of the reference fixture after the duration */
particles::ParticleSet reference_final_positions();

/** @brief Duration the reference fixture is evolved for */
inline constexpr double reference_duration = 0.1;

enum class KernelSelection { All, Fractal, Particles };

enum class ParticleFixture { Reference, Random };

/**
 * @brief Fractal benchmark parameters. Defaults are the reference
 * configuration.
 */
struct FractalConfig {
    double x_low = -1.8;
    double x_high = 1.8;
    double y_low = -1.8;
    double y_high = 1.8;
    double c_real = -0.62772;
    double c_imag = -0.42193;
    int desired_width = 1000;
    int max_iterations = 300;
    std::vector<Strategy> strategies{Strategy::Scalar, Strategy::Batch};
    /** @brief Explicit checksum to verify, overrides the reference one */
    std::optional<long long> expected_checksum;

    fractal::GridSpec grid_spec() const;

    /** @brief True when region, parameter, width and cap match the reference */
    bool is_reference() const noexcept;

    /**
     * @brief Checksum the run must produce
     * @return expected_checksum if set, the reference checksum for the
     * reference configuration, otherwise empty
     */
    std::optional<long long> resolved_checksum() const noexcept;
};

struct ParticleConfig {
    ParticleFixture fixture = ParticleFixture::Reference;
    /** @brief Number of particles for the random fixture */
    int count = 1000;
    std::uint32_t seed = 42;
    double duration = 0.1;
    std::vector<Strategy> strategies{Strategy::Scalar, Strategy::Batch};

    /** @brief True when the run is checked against the known final positions */
    bool checks_reference() const noexcept;

    /** @brief Builds the configured starting particles */
    particles::ParticleSet make_fixture() const;
};

struct BenchConfig {
    KernelSelection kernel = KernelSelection::All;
    /** @brief Timed runs per strategy */
    int repeat = 1;
    Logger::Level log_level = Logger::INFO_LEVEL;
    bool json_output = false;
    FractalConfig fractal;
    ParticleConfig particles;
};

/**
 * @brief Checks every value of a configuration
 * @throws kernelbench::ConfigError describing the first invalid value
 */
void validate(const BenchConfig &cfg);

/**
 * @brief Overlays the keys present in a JSON object onto cfg
 * @throws kernelbench::ConfigError on unknown names or wrongly typed values
 */
void apply_json(const json &j, BenchConfig &cfg);

/**
 * @brief Reads a JSON configuration file on top of cfg
 * @throws kernelbench::IOError if the file cannot be opened or parsed
 * @throws kernelbench::ConfigError if a value is invalid
 */
void load_config_file(const std::string &path, BenchConfig &cfg);

json to_json(const BenchConfig &cfg);

/**
 * @brief Parses "scalar", "batch" or "both"
 * @throws kernelbench::ConfigError for other names
 */
std::vector<Strategy> parse_strategies(std::string_view name);

KernelSelection parse_kernel_selection(std::string_view name);
ParticleFixture parse_fixture(std::string_view name);
Logger::Level parse_log_level(std::string_view name);

const char *to_string(KernelSelection kernel) noexcept;
const char *to_string(ParticleFixture fixture) noexcept;

} // namespace kernelbench::config
