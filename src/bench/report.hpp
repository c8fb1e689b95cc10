#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../particles/particle.hpp"
#include "../strategy.hpp"

namespace kernelbench::bench {

using json = nlohmann::json;

/**
 * @brief Timing summary of repeated runs of one strategy
 */
struct RunTiming {
    int runs = 0;
    std::chrono::nanoseconds best{0};
    std::chrono::nanoseconds mean{0};
};

struct FractalRun {
    Strategy strategy = Strategy::Scalar;
    long long checksum = 0;
    int max_count = 0;
    RunTiming timing;
};

struct FractalReport {
    int x_count = 0;
    int y_count = 0;
    std::size_t points = 0;
    int max_iterations = 0;
    std::vector<FractalRun> runs;
    std::optional<long long> expected_checksum;
    /** @brief Points whose counts differ between strategies, when both ran */
    std::optional<std::size_t> mismatched_points;

    bool checksum_ok() const noexcept;
    bool strategies_agree() const noexcept;
    bool ok() const noexcept { return checksum_ok() && strategies_agree(); }
};

struct ParticleRun {
    Strategy strategy = Strategy::Scalar;
    particles::ParticleSet final_state;
    /** @brief Largest deviation from the known final positions, if checked */
    std::optional<double> reference_error;
    RunTiming timing;
};

struct ParticleReport {
    std::size_t particle_count = 0;
    double duration = 0.0;
    long long steps = 0;
    std::vector<ParticleRun> runs;
    /** @brief Largest position difference between strategies, when both ran */
    std::optional<double> strategy_difference;

    bool reference_ok() const noexcept;
    bool strategies_agree() const noexcept;
    bool ok() const noexcept { return reference_ok() && strategies_agree(); }
};

struct BenchReport {
    std::optional<FractalReport> fractal;
    std::optional<ParticleReport> particles;

    bool ok() const noexcept;
};

json to_json(const BenchReport &report);

/** @brief Human-readable multi-line summary */
std::string format_text(const BenchReport &report);

} // namespace kernelbench::bench
