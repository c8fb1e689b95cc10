#pragma once

#include <cstdint>
#include <vector>

namespace kernelbench::particles {

/**
 * @brief A particle rotating about the origin
 *
 * The sign of angular_velocity gives the direction of rotation. Kernels only
 * ever write x and y.
 */
struct Particle {
    double x = 0.0;
    double y = 0.0;
    double angular_velocity = 0.0;
};

/** @brief Caller-owned, index-stable particle collection */
using ParticleSet = std::vector<Particle>;

/**
 * @brief Creates particles with x, y and angular velocity drawn uniformly
 * from [-1, 1)
 * @param count Number of particles
 * @param seed Seed for the generator, equal seeds give equal sets
 */
ParticleSet make_random_particles(int count, std::uint32_t seed);

/** @brief Absolute tolerance for comparing evolved positions */
inline constexpr double position_tolerance = 1e-5;

/**
 * @brief Largest absolute x or y difference between index-aligned sets
 * @throws kernelbench::KernelError if the sets differ in size
 */
double max_position_difference(const ParticleSet &a, const ParticleSet &b);

} // namespace kernelbench::particles
