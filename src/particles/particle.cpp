#include "particle.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace kernelbench::particles {

ParticleSet make_random_particles(int count, std::uint32_t seed) {
    if (count < 0) {
        throw KernelError("Invalid particle count: " + std::to_string(count));
    }

    std::mt19937 rng{seed};
    std::uniform_real_distribution<double> uniform(-1.0, 1.0);

    ParticleSet particles;
    particles.reserve(count);
    for (int i = 0; i < count; ++i) {
        Particle p;
        p.x = uniform(rng);
        p.y = uniform(rng);
        p.angular_velocity = uniform(rng);
        particles.push_back(p);
    }
    return particles;
}

double max_position_difference(const ParticleSet &a, const ParticleSet &b) {
    if (a.size() != b.size()) {
        throw KernelError(fmt::format("Cannot compare {} particles with {}",
                                      a.size(), b.size()));
    }

    double worst = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        worst = std::max(worst, std::abs(a[i].x - b[i].x));
        worst = std::max(worst, std::abs(a[i].y - b[i].y));
    }
    return worst;
}

} // namespace kernelbench::particles
