#pragma once

#include <array>

#include <imgui.h>
#include <raylib.h>

#include "../irenderer.hpp"

class MetricsUI : public IRenderer {
  public:
    MetricsUI() = default;
    ~MetricsUI() override = default;

    void render(Context &ctx) override {
        if (!ctx.vcfg.show_ui || !ctx.vcfg.show_metrics_ui)
            return;
        render_ui(ctx);
    }

  private:
    void render_ui(Context &ctx) {
        static std::array<float, 240> fps_buf{};
        static std::array<float, 240> step_buf{};
        static int head = 0;

        const int fps = GetFPS();
        const bool stepping =
            ctx.vcfg.mode == ViewMode::Particles && !ctx.vcfg.paused;
        fps_buf[head] = (float)fps;
        step_buf[head] = stepping ? (float)ctx.stats.step_ms : 0.0f;
        head = (head + 1) % (int)fps_buf.size();

        ImGui::Begin("metrics", &ctx.vcfg.show_metrics_ui);

        const auto &wcfg = ctx.wcfg;
        ImGui::SetWindowPos(ImVec2{10.f, (float)wcfg.screen_height * 0.65f},
                            ImGuiCond_Appearing);
        ImGui::SetWindowSize(ImVec2{(float)wcfg.panel_width,
                                    (float)wcfg.screen_height * 0.30f},
                             ImGuiCond_Appearing);

        ImGui::SeparatorText("Performance");

        struct PlotCtx {
            const std::array<float, 240> *arr;
            int headIdx;
        };
        auto plot_circ = [](const std::array<float, 240> &buf, int start,
                            float scale_max) {
            PlotCtx ctx{&buf, start};
            ImGui::PlotLines(
                "",
                [](void *data, int idx) {
                    auto *ctx = (PlotCtx *)data;
                    const auto &arr = *ctx->arr;
                    const int N = (int)arr.size();
                    return arr[(ctx->headIdx + idx) % N];
                },
                (void *)&ctx, (int)buf.size(), 0, NULL, 0.0f, scale_max,
                ImVec2(-1, 44));
        };

        ImGui::Text("FPS: %d", fps);
        plot_circ(fps_buf, head, 240.0f);

        float step_max = 1.0f;
        for (float v : step_buf) {
            step_max = v > step_max ? v : step_max;
        }
        ImGui::Text("Particle step: %.3f ms", ctx.stats.step_ms);
        plot_circ(step_buf, head, step_max);

        ImGui::SeparatorText("Window");
        ImGui::Text("Screen %d x %d", GetScreenWidth(), GetScreenHeight());
        ImGui::Text("Render %d x %d", GetRenderWidth(), GetRenderHeight());

        ImGui::End();
    }
};
