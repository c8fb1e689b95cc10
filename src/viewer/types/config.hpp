#pragma once

#include <cstddef>
#include <string>

#include <raylib.h>

#include "../../config/bench_config.hpp"
#include "../../strategy.hpp"

enum class ViewMode { Fractal, Particles };

/**
 * @brief Viewer state edited by the UI and read by the renderers
 */
struct Config {
    bool show_ui = true;
    bool show_metrics_ui = true;
    ViewMode mode = ViewMode::Fractal;

    kernelbench::config::FractalConfig fractal;
    kernelbench::Strategy fractal_strategy = kernelbench::Strategy::Scalar;
    // set by the UI, consumed by JuliaRenderer
    bool recompute_fractal = true;

    kernelbench::config::ParticleConfig particles;
    kernelbench::Strategy particle_strategy = kernelbench::Strategy::Batch;
    double frame_duration = 0.01;
    bool paused = false;
    bool reset_particles = false;

    float core_size = 3.0f;
    Color background_color = BLACK;
    Color box_color = {60, 60, 70, 255};
    Color particle_color = {0, 228, 114, 255};
    Color reverse_color = {238, 70, 82, 255};
};

/**
 * @brief Results of the latest kernel calls, shown by the UI
 */
struct ViewStats {
    long long checksum = 0;
    int max_count = 0;
    int x_count = 0;
    int y_count = 0;
    double fractal_ms = 0.0;

    std::size_t particle_count = 0;
    double step_ms = 0.0;
    double simulated_time = 0.0;

    std::string last_error;
};
