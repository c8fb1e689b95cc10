#include "particle_kernel.hpp"

#include <cmath>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace kernelbench::particles {

namespace {

void check_particles(const ParticleSet &particles) {
    for (std::size_t i = 0; i < particles.size(); ++i) {
        if (particles[i].x == 0.0 && particles[i].y == 0.0) {
            throw KernelError(fmt::format(
                "Particle {} sits at the origin, rotation is undefined", i));
        }
    }
}

/**
 * @brief Parallel arrays stepped by the batch kernels. Buffers are owned by
 * BatchParticleKernel::run.
 */
struct KernelData {
    int particles_count = 0;
    double *px = nullptr;
    double *py = nullptr;
    const double *angular_velocity = nullptr;
    double *norm = nullptr;
    double *vx = nullptr;
    double *vy = nullptr;
};

void kernel_norm(int start, int end, KernelData &data) {
    const double *px = data.px;
    const double *py = data.py;
    double *norm = data.norm;
    for (int i = start; i < end; ++i) {
        norm[i] = std::sqrt(px[i] * px[i] + py[i] * py[i]);
    }
}

void kernel_direction(int start, int end, KernelData &data) {
    const double *px = data.px;
    const double *py = data.py;
    const double *norm = data.norm;
    double *vx = data.vx;
    double *vy = data.vy;
    for (int i = start; i < end; ++i) {
        vx[i] = -py[i] / norm[i];
        vy[i] = px[i] / norm[i];
    }
}

void kernel_displace(int start, int end, KernelData &data) {
    const double *w = data.angular_velocity;
    const double *vx = data.vx;
    const double *vy = data.vy;
    double *px = data.px;
    double *py = data.py;
    for (int i = start; i < end; ++i) {
        const double scale = timestep * w[i];
        px[i] += scale * vx[i];
        py[i] += scale * vy[i];
    }
}

} // namespace

long long steps_for(double duration) {
    if (!std::isfinite(duration)) {
        throw KernelError(fmt::format("Invalid duration: {}", duration));
    }
    if (duration <= 0.0) {
        return 0;
    }
    return static_cast<long long>(std::floor(duration / timestep));
}

void ScalarParticleKernel::run(ParticleSet &particles, double duration) const {
    const long long nsteps = steps_for(duration);
    check_particles(particles);

    for (long long step = 0; step < nsteps; ++step) {
        for (Particle &p : particles) {
            const double norm = std::sqrt(p.x * p.x + p.y * p.y);
            const double v_x = -p.y / norm;
            const double v_y = p.x / norm;

            const double d_x = timestep * p.angular_velocity * v_x;
            const double d_y = timestep * p.angular_velocity * v_y;

            p.x += d_x;
            p.y += d_y;
        }
    }
}

void BatchParticleKernel::run(ParticleSet &particles, double duration) const {
    const long long nsteps = steps_for(duration);
    check_particles(particles);
    if (nsteps == 0 || particles.empty()) {
        return;
    }

    const int particles_count = static_cast<int>(particles.size());
    std::vector<double> px(particles_count);
    std::vector<double> py(particles_count);
    std::vector<double> angular_velocity(particles_count);
    std::vector<double> norm(particles_count);
    std::vector<double> vx(particles_count);
    std::vector<double> vy(particles_count);

    for (int i = 0; i < particles_count; ++i) {
        px[i] = particles[i].x;
        py[i] = particles[i].y;
        angular_velocity[i] = particles[i].angular_velocity;
    }

    KernelData data;
    data.particles_count = particles_count;
    data.px = px.data();
    data.py = py.data();
    data.angular_velocity = angular_velocity.data();
    data.norm = norm.data();
    data.vx = vx.data();
    data.vy = vy.data();

    for (long long step = 0; step < nsteps; ++step) {
        kernel_norm(0, particles_count, data);
        kernel_direction(0, particles_count, data);
        kernel_displace(0, particles_count, data);
    }

    // records are synchronized once, not per step
    for (int i = 0; i < particles_count; ++i) {
        particles[i].x = px[i];
        particles[i].y = py[i];
    }

    LOG_DEBUG(fmt::format("Batch particle kernel ran {} steps over {} "
                          "particles",
                          nsteps, particles_count));
}

std::unique_ptr<ParticleKernel> make_particle_kernel(Strategy strategy) {
    switch (strategy) {
    case Strategy::Scalar:
        return std::make_unique<ScalarParticleKernel>();
    case Strategy::Batch:
        return std::make_unique<BatchParticleKernel>();
    }
    throw KernelError("Unknown particle strategy");
}

} // namespace kernelbench::particles
