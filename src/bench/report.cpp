#include "report.hpp"

#include <fmt/format.h>

namespace kernelbench::bench {

namespace {

// final positions are only listed for small sets
constexpr std::size_t max_listed_particles = 16;

double to_seconds(std::chrono::nanoseconds ns) {
    return std::chrono::duration<double>(ns).count();
}

json timing_to_json(const RunTiming &timing) {
    return json{{"runs", timing.runs},
                {"best_seconds", to_seconds(timing.best)},
                {"mean_seconds", to_seconds(timing.mean)}};
}

json fractal_to_json(const FractalReport &report) {
    json runs = json::array();
    for (const auto &run : report.runs) {
        runs.push_back(json{{"strategy", to_string(run.strategy)},
                            {"checksum", run.checksum},
                            {"max_count", run.max_count},
                            {"timing", timing_to_json(run.timing)}});
    }

    json j{{"x_count", report.x_count},
           {"y_count", report.y_count},
           {"points", report.points},
           {"max_iterations", report.max_iterations},
           {"runs", runs},
           {"checksum_ok", report.checksum_ok()},
           {"strategies_agree", report.strategies_agree()},
           {"ok", report.ok()}};
    j["expected_checksum"] = report.expected_checksum
                                 ? json(*report.expected_checksum)
                                 : json(nullptr);
    j["mismatched_points"] = report.mismatched_points
                                 ? json(*report.mismatched_points)
                                 : json(nullptr);
    return j;
}

json particles_to_json(const ParticleReport &report) {
    json runs = json::array();
    for (const auto &run : report.runs) {
        json r{{"strategy", to_string(run.strategy)},
               {"timing", timing_to_json(run.timing)}};
        r["reference_error"] =
            run.reference_error ? json(*run.reference_error) : json(nullptr);
        if (run.final_state.size() <= max_listed_particles) {
            json positions = json::array();
            for (const auto &p : run.final_state) {
                positions.push_back(json::array({p.x, p.y}));
            }
            r["final_positions"] = positions;
        }
        runs.push_back(r);
    }

    json j{{"particle_count", report.particle_count},
           {"duration", report.duration},
           {"steps", report.steps},
           {"runs", runs},
           {"reference_ok", report.reference_ok()},
           {"strategies_agree", report.strategies_agree()},
           {"ok", report.ok()}};
    j["strategy_difference"] = report.strategy_difference
                                   ? json(*report.strategy_difference)
                                   : json(nullptr);
    return j;
}

const char *verdict(bool ok) { return ok ? "ok" : "FAILED"; }

} // namespace

bool FractalReport::checksum_ok() const noexcept {
    if (!expected_checksum) {
        return true;
    }
    for (const auto &run : runs) {
        if (run.checksum != *expected_checksum) {
            return false;
        }
    }
    return true;
}

bool FractalReport::strategies_agree() const noexcept {
    return !mismatched_points || *mismatched_points == 0;
}

bool ParticleReport::reference_ok() const noexcept {
    for (const auto &run : runs) {
        if (run.reference_error &&
            !(*run.reference_error < particles::position_tolerance)) {
            return false;
        }
    }
    return true;
}

bool ParticleReport::strategies_agree() const noexcept {
    return !strategy_difference ||
           *strategy_difference < particles::position_tolerance;
}

bool BenchReport::ok() const noexcept {
    return (!fractal || fractal->ok()) && (!particles || particles->ok());
}

json to_json(const BenchReport &report) {
    json j{{"ok", report.ok()}};
    if (report.fractal) {
        j["fractal"] = fractal_to_json(*report.fractal);
    }
    if (report.particles) {
        j["particles"] = particles_to_json(*report.particles);
    }
    return j;
}

std::string format_text(const BenchReport &report) {
    std::string out;

    if (report.fractal) {
        const FractalReport &f = *report.fractal;
        out += fmt::format("fractal: {}x{} grid, {} points, cap {}\n",
                           f.x_count, f.y_count, f.points, f.max_iterations);
        for (const auto &run : f.runs) {
            out += fmt::format(
                "  {:<7} checksum {:>10}  best {:.6f}s  mean {:.6f}s ({} "
                "runs)\n",
                to_string(run.strategy), run.checksum,
                to_seconds(run.timing.best), to_seconds(run.timing.mean),
                run.timing.runs);
        }
        if (f.expected_checksum) {
            out += fmt::format("  expected checksum {}: {}\n",
                               *f.expected_checksum, verdict(f.checksum_ok()));
        }
        if (f.mismatched_points) {
            out += fmt::format("  strategies agree ({} mismatched points): "
                               "{}\n",
                               *f.mismatched_points,
                               verdict(f.strategies_agree()));
        }
    }

    if (report.particles) {
        const ParticleReport &p = *report.particles;
        out += fmt::format("particles: {} particles, duration {}, {} steps\n",
                           p.particle_count, p.duration, p.steps);
        for (const auto &run : p.runs) {
            out += fmt::format(
                "  {:<7} best {:.6f}s  mean {:.6f}s ({} runs)",
                to_string(run.strategy), to_seconds(run.timing.best),
                to_seconds(run.timing.mean), run.timing.runs);
            if (run.reference_error) {
                out += fmt::format("  reference error {:.2e}",
                                   *run.reference_error);
            }
            out += "\n";
        }
        if (p.strategy_difference) {
            out += fmt::format("  strategies agree (max difference {:.2e}): "
                               "{}\n",
                               *p.strategy_difference,
                               verdict(p.strategies_agree()));
        }
        if (!p.runs.empty() && p.runs.front().reference_error) {
            out += fmt::format("  reference positions: {}\n",
                               verdict(p.reference_ok()));
        }
    }

    out += fmt::format("result: {}\n", verdict(report.ok()));
    return out;
}

} // namespace kernelbench::bench
