#pragma once

#include <string>
#include <vector>

#include "../irenderer.hpp"

/**
 * @brief Main panel: view selection, kernel parameters and recorded timings
 */
class ControlUI : public IRenderer {
  public:
    ControlUI() = default;
    ~ControlUI() override = default;

    void render(Context &ctx) override {
        if (!ctx.vcfg.show_ui)
            return;
        render_ui(ctx);
    }

  private:
    void render_ui(Context &ctx);
    void render_fractal_controls(Context &ctx);
    void render_particle_controls(Context &ctx);
    void render_timings(Context &ctx);

    static bool strategy_combo(const char *label,
                               kernelbench::Strategy &strategy);
};
