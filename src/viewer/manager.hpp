#pragma once

#include <raylib.h>
#include <rlImGui.h>

#include "julia_renderer.hpp"
#include "particles_renderer.hpp"
#include "types/context.hpp"
#include "types/window.hpp"
#include "ui/control_ui.hpp"
#include "ui/metrics_ui.hpp"

// Runs the active view's kernel and orchestrates the frame.
class RenderManager {
  public:
    RenderManager(const WindowConfig &wcfg,
                  kernelbench::particles::ParticleSet fixture)
        : m_wcfg(wcfg), m_particles(std::move(fixture)) {}

    ~RenderManager() {}

    void resize(const WindowConfig &wcfg) { m_wcfg = wcfg; }

    const ViewStats &stats() const noexcept { return m_stats; }

    bool draw_frame(Config &vcfg, kernelbench::TimingLog &timings) {
        Context ctx{vcfg, m_wcfg, timings, m_stats};

        IRenderer &view = vcfg.mode == ViewMode::Fractal
                              ? static_cast<IRenderer &>(m_julia)
                              : static_cast<IRenderer &>(m_particles);
        view.update(ctx);

        BeginDrawing();
        ClearBackground(vcfg.background_color);

        view.render(ctx);

        rlImGuiBegin();
        {
            m_control.render(ctx);
            m_metrics.render(ctx);
        }
        rlImGuiEnd();

        EndDrawing();

        return ctx.should_exit;
    }

  private:
    WindowConfig m_wcfg;
    ViewStats m_stats;
    JuliaRenderer m_julia;
    ParticlesRenderer m_particles;
    ControlUI m_control;
    MetricsUI m_metrics;
};
