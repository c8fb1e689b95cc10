#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

#include "config/bench_config.hpp"
#include "particles/particle.hpp"
#include "particles/particle_kernel.hpp"
#include "utility/exceptions.hpp"

using namespace kernelbench;
using namespace kernelbench::particles;
using kernelbench::config::make_reference_particles;
using kernelbench::config::reference_duration;
using kernelbench::config::reference_final_positions;

TEST_CASE("Step count for a duration", "[particles]") {
    REQUIRE(steps_for(0.0) == 0);
    REQUIRE(steps_for(-1.0) == 0);
    REQUIRE(std::llabs(steps_for(0.1) - 10000) <= 1);
    REQUIRE(steps_for(timestep * 2.5) == 2);
    REQUIRE_THROWS_AS(steps_for(std::numeric_limits<double>::infinity()),
                      KernelError);
    REQUIRE_THROWS_AS(steps_for(std::nan("")), KernelError);
}

TEST_CASE("Reference fixture lands on the known positions", "[particles]") {
    const ParticleSet expected = reference_final_positions();

    for (Strategy s : all_strategies) {
        ParticleSet particles = make_reference_particles();
        make_particle_kernel(s)->run(particles, reference_duration);

        REQUIRE(particles.size() == expected.size());
        REQUIRE(max_position_difference(particles, expected) <
                position_tolerance);
        for (std::size_t i = 0; i < particles.size(); ++i) {
            REQUIRE(particles[i].angular_velocity ==
                    expected[i].angular_velocity);
        }
    }
}

TEST_CASE("Non-positive durations leave particles untouched", "[particles]") {
    for (Strategy s : all_strategies) {
        const auto kernel = make_particle_kernel(s);
        ParticleSet particles = make_reference_particles();

        kernel->run(particles, 0.0);
        REQUIRE(max_position_difference(particles,
                                        make_reference_particles()) == 0.0);
        kernel->run(particles, -0.5);
        REQUIRE(max_position_difference(particles,
                                        make_reference_particles()) == 0.0);
    }
}

TEST_CASE("Empty sets are accepted", "[particles]") {
    for (Strategy s : all_strategies) {
        ParticleSet particles;
        REQUIRE_NOTHROW(make_particle_kernel(s)->run(particles, 0.1));
        REQUIRE(particles.empty());
    }
}

TEST_CASE("A particle at the origin is rejected before any update",
          "[particles]") {
    for (Strategy s : all_strategies) {
        ParticleSet particles = make_reference_particles();
        particles.push_back({0.0, 0.0, 1.0});
        const ParticleSet before = particles;

        REQUIRE_THROWS_AS(make_particle_kernel(s)->run(particles, 0.01),
                          KernelError);
        REQUIRE(max_position_difference(particles, before) == 0.0);
    }
}

TEST_CASE("Particles rotate in the direction of their velocity",
          "[particles]") {
    for (Strategy s : all_strategies) {
        ParticleSet particles = {{1.0, 0.0, 1.0}, {1.0, 0.0, -1.0}};
        make_particle_kernel(s)->run(particles, 0.01);

        REQUIRE(particles[0].y > 0.0);
        REQUIRE(particles[1].y < 0.0);
        // radius only drifts by the second-order error of each step
        for (const auto &p : particles) {
            REQUIRE(std::hypot(p.x, p.y) == Catch::Approx(1.0).margin(1e-6));
        }
    }
}

TEST_CASE("Strategies agree on a random fixture", "[particles]") {
    const ParticleSet fixture = make_random_particles(500, 7);

    ParticleSet scalar = fixture;
    ParticleSet batch = fixture;
    make_particle_kernel(Strategy::Scalar)->run(scalar, 0.05);
    make_particle_kernel(Strategy::Batch)->run(batch, 0.05);

    REQUIRE(max_position_difference(scalar, batch) < position_tolerance);
}

TEST_CASE("Batch kernel can be called repeatedly on one set", "[particles]") {
    const auto batch = make_particle_kernel(Strategy::Batch);
    const auto scalar = make_particle_kernel(Strategy::Scalar);
    ParticleSet a = make_reference_particles();
    ParticleSet b = make_reference_particles();
    for (int frame = 0; frame < 5; ++frame) {
        batch->run(a, 0.01);
        scalar->run(b, 0.01);
    }

    REQUIRE(max_position_difference(a, b) < position_tolerance);
}

TEST_CASE("Random fixtures are reproducible", "[particles]") {
    const ParticleSet a = make_random_particles(100, 42);
    const ParticleSet b = make_random_particles(100, 42);
    const ParticleSet c = make_random_particles(100, 43);

    REQUIRE(a.size() == 100);
    REQUIRE(max_position_difference(a, b) == 0.0);
    REQUIRE(max_position_difference(a, c) > 0.0);
    for (const auto &p : a) {
        REQUIRE(p.x >= -1.0);
        REQUIRE(p.x < 1.0);
        REQUIRE(p.angular_velocity >= -1.0);
        REQUIRE(p.angular_velocity < 1.0);
    }
    REQUIRE(make_random_particles(0, 1).empty());
    REQUIRE_THROWS_AS(make_random_particles(-1, 1), KernelError);
}

TEST_CASE("Comparing sets of different sizes fails", "[particles]") {
    REQUIRE_THROWS_AS(
        max_position_difference(make_reference_particles(), ParticleSet{}),
        KernelError);
}
