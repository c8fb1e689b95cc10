#pragma once

#include "../config/bench_config.hpp"
#include "../utility/timing.hpp"
#include "report.hpp"

namespace kernelbench::bench {

/**
 * @brief Runs the configured kernels under the timing harness and checks
 * their results
 *
 * Each selected strategy is run `repeat` times. Fractal runs are checked
 * against the expected checksum and against each other; particle runs start
 * from a fresh copy of the fixture every time and are checked against the
 * known reference positions and against each other.
 */
class BenchmarkRunner {
  public:
    /**
     * @throws kernelbench::ConfigError if the configuration is invalid
     */
    explicit BenchmarkRunner(config::BenchConfig cfg);
    ~BenchmarkRunner() = default;
    BenchmarkRunner(const BenchmarkRunner &) = delete;
    BenchmarkRunner &operator=(const BenchmarkRunner &) = delete;
    BenchmarkRunner(BenchmarkRunner &&) = delete;
    BenchmarkRunner &operator=(BenchmarkRunner &&) = delete;

    FractalReport run_fractal();
    ParticleReport run_particles();

    /** @brief Runs the kernels selected by the configuration */
    BenchReport run();

    const TimingLog &timings() const noexcept { return m_timings; }
    const config::BenchConfig &config() const noexcept { return m_cfg; }

  private:
    RunTiming summarize(const std::string &label, int runs) const;

  private:
    config::BenchConfig m_cfg;
    TimingLog m_timings;
};

} // namespace kernelbench::bench
