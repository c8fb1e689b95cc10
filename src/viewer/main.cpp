#include <iostream>

#include <fmt/format.h>
#include <imgui.h>
#include <raylib.h>
#include <rlImGui.h>

#include "../config/cli_args.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "../utility/timing.hpp"
#include "manager.hpp"
#include "types/config.hpp"
#include "types/window.hpp"

namespace {

// per-frame timings are only kept for the UI table
constexpr std::size_t timing_capacity = 4096;

/**
 * @brief Owns the raylib window and the rlImGui context; both are shut down
 * however the viewer loop exits
 */
class WindowSession {
  public:
    WindowSession(int width, int height, const char *title) {
        SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
        InitWindow(width, height, title);
        SetTargetFPS(60);
        rlImGuiSetup(true);
        ImGui::GetIO().IniFilename = nullptr;
    }
    ~WindowSession() {
        rlImGuiShutdown();
        CloseWindow();
    }
    WindowSession(const WindowSession &) = delete;
    WindowSession &operator=(const WindowSession &) = delete;
    WindowSession(WindowSession &&) = delete;
    WindowSession &operator=(WindowSession &&) = delete;
};

Config make_view_config(const kernelbench::config::BenchConfig &bench) {
    Config vcfg;
    vcfg.fractal = bench.fractal;
    vcfg.fractal_strategy = bench.fractal.strategies.front();
    vcfg.particles = bench.particles;
    vcfg.particle_strategy = bench.particles.strategies.back();
    vcfg.mode = bench.kernel == kernelbench::config::KernelSelection::Particles
                    ? ViewMode::Particles
                    : ViewMode::Fractal;
    return vcfg;
}

int run(int argc, char **argv) {
    auto args = kernelbench::config::parse_args(argc, argv);
    if (args.show_help) {
        kernelbench::config::print_help(argv[0]);
        return 0;
    }
    kernelbench::Logger::set_level(args.config.log_level);
    LOG_INFO("Starting kernelbench viewer");
    if (args.config_path) {
        LOG_INFO("Loaded configuration from: " + *args.config_path);
    }

    Config vcfg = make_view_config(args.config);
    const auto fixture = vcfg.particles.make_fixture();

    kernelbench::TimingLog timings;
    timings.set_report_level(kernelbench::Logger::DEBUG_LEVEL);
    timings.set_capacity(timing_capacity);

    // the session outlives the render manager, which owns GPU textures
    WindowSession session(1280, 800, "kernelbench");

    WindowConfig wcfg = {GetScreenWidth(), GetScreenHeight(), 360};
    {
        RenderManager rman(wcfg, fixture);

        while (!WindowShouldClose()) {
            if (IsWindowResized()) {
                wcfg.screen_width = GetScreenWidth();
                wcfg.screen_height = GetScreenHeight();
                LOG_INFO(fmt::format("Window resized to {}x{}",
                                     wcfg.screen_width, wcfg.screen_height));
                rman.resize(wcfg);
            }

            if (IsKeyPressed(KEY_TAB)) {
                vcfg.show_ui = !vcfg.show_ui;
            }
            if (IsKeyPressed(KEY_SPACE) && !ImGui::GetIO().WantCaptureKeyboard) {
                vcfg.paused = !vcfg.paused;
            }

            if (rman.draw_frame(vcfg, timings))
                break;
        }
    }

    LOG_INFO("Viewer closed");
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    try {
        return run(argc, argv);
    } catch (const kernelbench::KernelBenchException &e) {
        LOG_ERROR(std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
