#include "control_ui.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>

#include <imgui.h>

using namespace kernelbench;

bool ControlUI::strategy_combo(const char *label, Strategy &strategy) {
    const char *names[] = {to_string(all_strategies[0]),
                           to_string(all_strategies[1])};
    int current = strategy == Strategy::Scalar ? 0 : 1;
    if (ImGui::Combo(label, &current, names, IM_ARRAYSIZE(names))) {
        strategy = all_strategies[current];
        return true;
    }
    return false;
}

void ControlUI::render_ui(Context &ctx) {
    auto &wcfg = ctx.wcfg;
    auto &vcfg = ctx.vcfg;

    ImGui::Begin("kernelbench", NULL);
    ImGui::SetWindowPos(ImVec2{10.f, 10.f}, ImGuiCond_Appearing);
    ImGui::SetWindowSize(
        ImVec2{(float)wcfg.panel_width, (float)wcfg.screen_height * 0.6f},
        ImGuiCond_Appearing);

    ImGui::SeparatorText("View");
    if (ImGui::RadioButton("Julia set", vcfg.mode == ViewMode::Fractal)) {
        vcfg.mode = ViewMode::Fractal;
    }
    ImGui::SameLine();
    if (ImGui::RadioButton("Particles", vcfg.mode == ViewMode::Particles)) {
        vcfg.mode = ViewMode::Particles;
    }
    ImGui::Checkbox("Show metrics window", &vcfg.show_metrics_ui);

    if (vcfg.mode == ViewMode::Fractal) {
        render_fractal_controls(ctx);
    } else {
        render_particle_controls(ctx);
    }

    if (!ctx.stats.last_error.empty()) {
        ImGui::SeparatorText("Error");
        ImGui::TextWrapped("%s", ctx.stats.last_error.c_str());
    }

    render_timings(ctx);

    ImGui::SeparatorText("Application");
    if (ImGui::Button("Quit")) {
        ctx.should_exit = true;
    }

    ImGui::End();
}

void ControlUI::render_fractal_controls(Context &ctx) {
    auto &vcfg = ctx.vcfg;
    auto &cfg = vcfg.fractal;
    const auto &stats = ctx.stats;

    ImGui::SeparatorText("Fractal");
    // sliders recompute once released, a full grid is too slow for every drag
    bool recompute =
        strategy_combo("Strategy##fractal", vcfg.fractal_strategy);
    ImGui::SliderInt("Grid width", &cfg.desired_width, 50, 2000);
    recompute |= ImGui::IsItemDeactivatedAfterEdit();
    ImGui::SliderInt("Max iterations", &cfg.max_iterations, 0, 1000);
    recompute |= ImGui::IsItemDeactivatedAfterEdit();

    float c[2] = {(float)cfg.c_real, (float)cfg.c_imag};
    if (ImGui::DragFloat2("c", c, 0.001f, -2.0f, 2.0f, "%.5f")) {
        cfg.c_real = c[0];
        cfg.c_imag = c[1];
    }
    recompute |= ImGui::IsItemDeactivatedAfterEdit();

    if (ImGui::Button("Recompute") || recompute) {
        vcfg.recompute_fractal = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Reference")) {
        const auto strategies = cfg.strategies;
        cfg = config::FractalConfig{};
        cfg.strategies = strategies;
        vcfg.recompute_fractal = true;
    }

    ImGui::Text("Grid: %d x %d", stats.x_count, stats.y_count);
    ImGui::Text("Checksum: %lld", stats.checksum);
    if (cfg.is_reference()) {
        ImGui::SameLine();
        if (stats.checksum == config::reference_checksum) {
            ImGui::TextColored(ImVec4{0.3f, 0.9f, 0.4f, 1.f}, "(reference)");
        } else {
            ImGui::TextColored(ImVec4{0.95f, 0.3f, 0.3f, 1.f},
                               "(expected %lld)", config::reference_checksum);
        }
    }
    ImGui::Text("Max count: %d", stats.max_count);
    ImGui::Text("Last run: %.3f ms", stats.fractal_ms);
}

void ControlUI::render_particle_controls(Context &ctx) {
    auto &vcfg = ctx.vcfg;
    auto &cfg = vcfg.particles;
    const auto &stats = ctx.stats;

    ImGui::SeparatorText("Particles");
    strategy_combo("Strategy##particles", vcfg.particle_strategy);

    float frame_duration = (float)vcfg.frame_duration;
    if (ImGui::SliderFloat("Duration / frame", &frame_duration, 0.0f, 0.1f,
                           "%.4f")) {
        vcfg.frame_duration = frame_duration;
    }

    int fixture = cfg.fixture == config::ParticleFixture::Reference ? 0 : 1;
    const char *fixtures[] = {"reference", "random"};
    if (ImGui::Combo("Fixture", &fixture, fixtures, IM_ARRAYSIZE(fixtures))) {
        cfg.fixture = fixture == 0 ? config::ParticleFixture::Reference
                                   : config::ParticleFixture::Random;
        vcfg.reset_particles = true;
    }
    if (cfg.fixture == config::ParticleFixture::Random) {
        ImGui::SliderInt("Count", &cfg.count, 1, 20000);
        if (ImGui::IsItemDeactivatedAfterEdit()) {
            vcfg.reset_particles = true;
        }
        int seed = (int)cfg.seed;
        if (ImGui::InputInt("Seed", &seed)) {
            cfg.seed = (std::uint32_t)seed;
            vcfg.reset_particles = true;
        }
    }

    if (ImGui::Button(vcfg.paused ? "Resume" : "Pause")) {
        vcfg.paused = !vcfg.paused;
    }
    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        vcfg.reset_particles = true;
    }

    ImGui::Text("Particles: %zu", stats.particle_count);
    ImGui::Text("Simulated time: %.3f", stats.simulated_time);
    ImGui::Text("Last step: %.3f ms", stats.step_ms);
}

void ControlUI::render_timings(Context &ctx) {
    ImGui::SeparatorText("Timings");

    std::vector<std::string> labels;
    for (const auto &rec : ctx.timings.records()) {
        if (std::find(labels.begin(), labels.end(), rec.label) ==
            labels.end()) {
            labels.push_back(rec.label);
        }
    }
    if (labels.empty()) {
        ImGui::TextDisabled("Nothing measured yet");
        return;
    }

    auto to_ms = [](std::chrono::nanoseconds ns) {
        return std::chrono::duration<double, std::milli>(ns).count();
    };
    if (ImGui::BeginTable("timings", 3, ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("call");
        ImGui::TableSetupColumn("best ms");
        ImGui::TableSetupColumn("mean ms");
        ImGui::TableHeadersRow();
        for (const auto &label : labels) {
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::TextUnformatted(label.c_str());
            ImGui::TableNextColumn();
            ImGui::Text("%.3f", to_ms(ctx.timings.best(label).value_or(
                                    std::chrono::nanoseconds{0})));
            ImGui::TableNextColumn();
            ImGui::Text("%.3f", to_ms(ctx.timings.mean(label).value_or(
                                    std::chrono::nanoseconds{0})));
        }
        ImGui::EndTable();
    }
    if (ImGui::Button("Clear timings")) {
        ctx.timings.clear();
    }
}
