#include "particles_renderer.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

using namespace kernelbench;

ParticlesRenderer::ParticlesRenderer(particles::ParticleSet fixture)
    : m_particles(std::move(fixture)) {}

ParticlesRenderer::BoxTransform
ParticlesRenderer::box_transform(const WindowConfig &wcfg) {
    const float w = (float)wcfg.screen_width;
    const float h = (float)wcfg.screen_height;
    return {w * 0.5f, h * 0.5f, std::floor(std::min(w, h) * 0.45f)};
}

void ParticlesRenderer::update(Context &ctx) {
    auto &vcfg = ctx.vcfg;
    if (vcfg.reset_particles) {
        vcfg.reset_particles = false;
        try {
            m_particles = vcfg.particles.make_fixture();
            ctx.stats.simulated_time = 0.0;
            ctx.stats.last_error.clear();
        } catch (const KernelError &e) {
            LOG_ERROR(e.what());
            ctx.stats.last_error = e.what();
        }
    }
    ctx.stats.particle_count = m_particles.size();

    if (vcfg.paused) {
        return;
    }
    try {
        step(ctx);
    } catch (const KernelError &e) {
        LOG_ERROR(e.what());
        ctx.stats.last_error = e.what();
        vcfg.paused = true;
    }
}

void ParticlesRenderer::step(Context &ctx) {
    auto &vcfg = ctx.vcfg;
    if (!m_kernel || m_kernel->strategy() != vcfg.particle_strategy) {
        m_kernel = particles::make_particle_kernel(vcfg.particle_strategy);
        LOG_INFO(fmt::format("Particle kernel switched to {}",
                             to_string(vcfg.particle_strategy)));
    }

    const std::string label =
        fmt::format("particles/{}", to_string(vcfg.particle_strategy));
    timefn(label, [&] { m_kernel->run(m_particles, vcfg.frame_duration); },
           &ctx.timings);
    ctx.stats.step_ms = ctx.timings.last()->seconds() * 1000.0;
    ctx.stats.simulated_time += vcfg.frame_duration;
}

void ParticlesRenderer::render(Context &ctx) {
    const auto &vcfg = ctx.vcfg;
    const BoxTransform box = box_transform(ctx.wcfg);

    DrawRectangleLinesEx((Rectangle){box.cx - box.half, box.cy - box.half,
                                     box.half * 2, box.half * 2},
                         1.0f, vcfg.box_color);
    DrawLineV({box.cx - box.half, box.cy}, {box.cx + box.half, box.cy},
              ColorAlpha(vcfg.box_color, 0.5f));
    DrawLineV({box.cx, box.cy - box.half}, {box.cx, box.cy + box.half},
              ColorAlpha(vcfg.box_color, 0.5f));

    for (const auto &p : m_particles) {
        // world y points up, screen y points down
        const Vector2 pos = {box.cx + (float)p.x * box.half,
                             box.cy - (float)p.y * box.half};
        const Color col = p.angular_velocity >= 0.0 ? vcfg.particle_color
                                                    : vcfg.reverse_color;
        DrawCircleV(pos, vcfg.core_size, col);
    }
}
