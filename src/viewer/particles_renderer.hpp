#pragma once

#include <memory>

#include <raylib.h>

#include "../particles/particle_kernel.hpp"
#include "irenderer.hpp"

/**
 * @brief Animates particles by calling the selected particle kernel once per
 * frame and draws them inside the [-1, 1] box
 *
 * Particles rotating counter-clockwise use particle_color, clockwise ones
 * reverse_color.
 */
class ParticlesRenderer : public IRenderer {
  public:
    explicit ParticlesRenderer(kernelbench::particles::ParticleSet fixture);
    ~ParticlesRenderer() override = default;
    ParticlesRenderer(const ParticlesRenderer &) = delete;
    ParticlesRenderer(ParticlesRenderer &&) = delete;
    ParticlesRenderer &operator=(const ParticlesRenderer &) = delete;
    ParticlesRenderer &operator=(ParticlesRenderer &&) = delete;

    /**
     * @brief Advances the particles by one frame duration unless paused, and
     * rebuilds them when a reset was requested
     */
    void update(Context &ctx) override;
    void render(Context &ctx) override;

  private:
    /**
     * @brief Screen placement of the [-1, 1] box
     */
    struct BoxTransform {
        float cx;
        float cy;
        float half;
    };

    static BoxTransform box_transform(const WindowConfig &wcfg);
    void step(Context &ctx);

  private:
    kernelbench::particles::ParticleSet m_particles;
    std::unique_ptr<kernelbench::particles::ParticleKernel> m_kernel;
};
