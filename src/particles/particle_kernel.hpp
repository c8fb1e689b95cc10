#pragma once

#include <memory>
#include <vector>

#include "../strategy.hpp"
#include "particle.hpp"

namespace kernelbench::particles {

/** @brief Fixed integration timestep */
inline constexpr double timestep = 0.00001;

/**
 * @brief Number of integration steps for a duration
 * @return floor(duration / timestep), or 0 for zero or negative durations
 * @throws kernelbench::KernelError if duration is not finite
 */
long long steps_for(double duration);

/**
 * @brief Integrates pure rotation about the origin
 *
 * Each step moves every particle by timestep * angular_velocity along the
 * unit tangent (-y/r, x/r). Implementations differ only in execution shape
 * and agree within 1e-5 on final positions.
 */
class ParticleKernel {
  public:
    virtual ~ParticleKernel() = default;

    virtual Strategy strategy() const noexcept = 0;

    /**
     * @brief Evolves particles in place for a duration
     * @param particles Caller-owned set; only x and y are written, order and
     * size are preserved
     * @param duration Simulated time, zero or negative is a no-op
     * @throws kernelbench::KernelError if a particle sits at the origin or the
     * duration is not finite; particles are unchanged in that case
     */
    virtual void run(ParticleSet &particles, double duration) const = 0;
};

/**
 * @brief Steps every particle record directly
 */
class ScalarParticleKernel final : public ParticleKernel {
  public:
    Strategy strategy() const noexcept override { return Strategy::Scalar; }
    void run(ParticleSet &particles, double duration) const override;
};

/**
 * @brief Steps parallel position/velocity arrays and writes the records back
 * once after the last step
 */
class BatchParticleKernel final : public ParticleKernel {
  public:
    Strategy strategy() const noexcept override { return Strategy::Batch; }
    void run(ParticleSet &particles, double duration) const override;
};

std::unique_ptr<ParticleKernel> make_particle_kernel(Strategy strategy);

} // namespace kernelbench::particles
