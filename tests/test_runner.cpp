#include <catch2/catch_test_macros.hpp>

#include <string>

#include "bench/report.hpp"
#include "bench/runner.hpp"
#include "utility/exceptions.hpp"

using namespace kernelbench;
using namespace kernelbench::bench;

namespace {

config::BenchConfig small_config() {
    config::BenchConfig cfg;
    cfg.fractal.desired_width = 80;
    cfg.fractal.max_iterations = 60;
    return cfg;
}

} // namespace

TEST_CASE("Runner rejects an invalid configuration", "[runner]") {
    config::BenchConfig cfg;
    cfg.repeat = 0;
    REQUIRE_THROWS_AS(BenchmarkRunner(cfg), ConfigError);
}

TEST_CASE("Fractal run compares strategies", "[runner]") {
    config::BenchConfig cfg = small_config();
    cfg.repeat = 2;
    BenchmarkRunner runner(cfg);
    const FractalReport report = runner.run_fractal();

    REQUIRE(report.points ==
            static_cast<std::size_t>(report.x_count) * report.y_count);
    REQUIRE(report.runs.size() == 2);
    REQUIRE(report.runs[0].checksum == report.runs[1].checksum);
    REQUIRE(report.runs[0].max_count <= 60);
    REQUIRE(report.runs[0].timing.runs == 2);
    REQUIRE(report.mismatched_points == std::size_t{0});
    REQUIRE_FALSE(report.expected_checksum.has_value());
    REQUIRE(report.ok());

    // every timed call is in the log
    REQUIRE(runner.timings().records().size() == 4);
}

TEST_CASE("A wrong expected checksum fails the report", "[runner]") {
    config::BenchConfig cfg = small_config();
    cfg.fractal.expected_checksum = -1;
    cfg.fractal.strategies = {Strategy::Batch};
    BenchmarkRunner runner(cfg);
    const FractalReport report = runner.run_fractal();

    REQUIRE_FALSE(report.checksum_ok());
    REQUIRE_FALSE(report.mismatched_points.has_value());
    REQUIRE_FALSE(report.ok());
}

TEST_CASE("Particle run checks the reference fixture", "[runner]") {
    config::BenchConfig cfg;
    cfg.kernel = config::KernelSelection::Particles;
    cfg.repeat = 2;
    BenchmarkRunner runner(cfg);
    const BenchReport report = runner.run();

    REQUIRE_FALSE(report.fractal.has_value());
    REQUIRE(report.particles.has_value());
    const ParticleReport &p = *report.particles;
    REQUIRE(p.particle_count == 3);
    REQUIRE(p.runs.size() == 2);
    for (const auto &run : p.runs) {
        REQUIRE(run.reference_error.has_value());
        REQUIRE(*run.reference_error < particles::position_tolerance);
    }
    REQUIRE(p.strategy_difference.has_value());
    REQUIRE(report.ok());
}

TEST_CASE("Random fixtures are only compared between strategies",
          "[runner]") {
    config::BenchConfig cfg;
    cfg.kernel = config::KernelSelection::Particles;
    cfg.particles.fixture = config::ParticleFixture::Random;
    cfg.particles.count = 200;
    cfg.particles.duration = 0.02;
    BenchmarkRunner runner(cfg);
    const ParticleReport report = runner.run_particles();

    REQUIRE(report.particle_count == 200);
    REQUIRE_FALSE(report.runs[0].reference_error.has_value());
    REQUIRE(report.strategies_agree());
    REQUIRE(report.ok());
}

TEST_CASE("Reports serialize to JSON and text", "[runner]") {
    config::BenchConfig cfg = small_config();
    BenchmarkRunner runner(cfg);
    const BenchReport report = runner.run();

    const json j = to_json(report);
    REQUIRE(j["ok"].get<bool>());
    REQUIRE(j["fractal"]["runs"].size() == 2);
    REQUIRE(j["fractal"]["expected_checksum"].is_null());
    REQUIRE(j["particles"]["runs"][0]["final_positions"].size() == 3);

    const std::string text = format_text(report);
    REQUIRE(text.find("fractal:") != std::string::npos);
    REQUIRE(text.find("particles:") != std::string::npos);
    REQUIRE(text.find("result: ok") != std::string::npos);
}

TEST_CASE("Reference benchmark passes end to end", "[runner][reference]") {
    BenchmarkRunner runner(config::BenchConfig{});
    const BenchReport report = runner.run();

    REQUIRE(report.fractal->expected_checksum == config::reference_checksum);
    REQUIRE(report.fractal->checksum_ok());
    REQUIRE(report.ok());
}
