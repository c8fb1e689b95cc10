#include "runner.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../fractal/fractal_kernel.hpp"
#include "../fractal/grid.hpp"
#include "../particles/particle_kernel.hpp"
#include "../utility/logger.hpp"

namespace kernelbench::bench {

BenchmarkRunner::BenchmarkRunner(config::BenchConfig cfg)
    : m_cfg(std::move(cfg)) {
    config::validate(m_cfg);
}

RunTiming BenchmarkRunner::summarize(const std::string &label,
                                     int runs) const {
    RunTiming timing;
    timing.runs = runs;
    timing.best = m_timings.best(label).value_or(std::chrono::nanoseconds{0});
    timing.mean = m_timings.mean(label).value_or(std::chrono::nanoseconds{0});
    return timing;
}

FractalReport BenchmarkRunner::run_fractal() {
    const config::FractalConfig &cfg = m_cfg.fractal;

    const fractal::Grid grid = fractal::build_grid(cfg.grid_spec());
    LOG_INFO(fmt::format("Length of x: {}", grid.x_count));
    LOG_INFO(fmt::format("Total elements: {}", grid.size()));

    FractalReport report;
    report.x_count = grid.x_count;
    report.y_count = grid.y_count;
    report.points = grid.size();
    report.max_iterations = cfg.max_iterations;
    report.expected_checksum = cfg.resolved_checksum();

    std::optional<fractal::IterationCounts> first_output;
    for (Strategy strategy : cfg.strategies) {
        const auto kernel = fractal::make_fractal_kernel(strategy);
        const std::string label = fmt::format("fractal/{}", to_string(strategy));

        fractal::IterationCounts output;
        for (int r = 0; r < m_cfg.repeat; ++r) {
            output = timefn(
                label,
                [&] { return kernel->run(cfg.max_iterations, grid); },
                &m_timings);
        }

        FractalRun run;
        run.strategy = strategy;
        run.checksum = fractal::checksum(output);
        run.max_count =
            output.empty() ? 0 : *std::max_element(output.begin(), output.end());
        run.timing = summarize(label, m_cfg.repeat);

        if (report.expected_checksum &&
            run.checksum != *report.expected_checksum) {
            LOG_ERROR(fmt::format("{} checksum {} != expected {}", label,
                                  run.checksum, *report.expected_checksum));
        }
        report.runs.push_back(run);

        if (!first_output) {
            first_output = std::move(output);
            continue;
        }

        std::size_t mismatched = 0;
        for (std::size_t i = 0; i < output.size(); ++i) {
            if (output[i] != (*first_output)[i]) {
                ++mismatched;
            }
        }
        report.mismatched_points =
            std::max(report.mismatched_points.value_or(0), mismatched);
        if (mismatched != 0) {
            LOG_ERROR(fmt::format("{} disagrees with {} on {} points", label,
                                  to_string(cfg.strategies.front()),
                                  mismatched));
        }
    }

    return report;
}

ParticleReport BenchmarkRunner::run_particles() {
    const config::ParticleConfig &cfg = m_cfg.particles;

    const particles::ParticleSet fixture = cfg.make_fixture();

    ParticleReport report;
    report.particle_count = fixture.size();
    report.duration = cfg.duration;
    report.steps = particles::steps_for(cfg.duration);
    LOG_INFO(fmt::format("Evolving {} particles for {} steps", fixture.size(),
                         report.steps));

    const particles::ParticleSet expected =
        config::reference_final_positions();

    for (Strategy strategy : cfg.strategies) {
        const auto kernel = particles::make_particle_kernel(strategy);
        const std::string label =
            fmt::format("particles/{}", to_string(strategy));

        particles::ParticleSet state;
        for (int r = 0; r < m_cfg.repeat; ++r) {
            state = fixture;
            timefn(label, [&] { kernel->run(state, cfg.duration); },
                   &m_timings);
        }

        ParticleRun run;
        run.strategy = strategy;
        run.timing = summarize(label, m_cfg.repeat);
        if (cfg.checks_reference()) {
            run.reference_error =
                particles::max_position_difference(state, expected);
            if (!(*run.reference_error < particles::position_tolerance)) {
                LOG_ERROR(fmt::format("{} misses reference positions by {}",
                                      label, *run.reference_error));
            }
        }

        if (!report.runs.empty()) {
            const double diff = particles::max_position_difference(
                state, report.runs.front().final_state);
            report.strategy_difference =
                std::max(report.strategy_difference.value_or(0.0), diff);
        }

        run.final_state = std::move(state);
        report.runs.push_back(std::move(run));
    }

    return report;
}

BenchReport BenchmarkRunner::run() {
    BenchReport report;
    if (m_cfg.kernel != config::KernelSelection::Particles) {
        report.fractal = run_fractal();
    }
    if (m_cfg.kernel != config::KernelSelection::Fractal) {
        report.particles = run_particles();
    }
    return report;
}

} // namespace kernelbench::bench
