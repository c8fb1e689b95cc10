#include "julia_renderer.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "../fractal/fractal_kernel.hpp"
#include "../fractal/grid.hpp"
#include "../fractal/intensity.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

using namespace kernelbench;

JuliaRenderer::~JuliaRenderer() {
    if (m_texture_loaded) {
        UnloadTexture(m_texture);
    }
}

void JuliaRenderer::update(Context &ctx) {
    if (!ctx.vcfg.recompute_fractal) {
        return;
    }
    ctx.vcfg.recompute_fractal = false;
    try {
        recompute(ctx);
        ctx.stats.last_error.clear();
    } catch (const KernelBenchException &e) {
        LOG_ERROR(e.what());
        ctx.stats.last_error = e.what();
    }
}

void JuliaRenderer::recompute(Context &ctx) {
    const auto &cfg = ctx.vcfg.fractal;
    const fractal::Grid grid = fractal::build_grid(cfg.grid_spec());
    const auto kernel = fractal::make_fractal_kernel(ctx.vcfg.fractal_strategy);
    const std::string label =
        fmt::format("fractal/{}", to_string(ctx.vcfg.fractal_strategy));

    const fractal::IterationCounts counts = timefn(
        label, [&] { return kernel->run(cfg.max_iterations, grid); },
        &ctx.timings);
    ctx.stats.fractal_ms = ctx.timings.last()->seconds() * 1000.0;

    ctx.stats.checksum = fractal::checksum(counts);
    ctx.stats.max_count =
        counts.empty() ? 0 : *std::max_element(counts.begin(), counts.end());
    ctx.stats.x_count = grid.x_count;
    ctx.stats.y_count = grid.y_count;
    LOG_INFO(fmt::format("{}: {}x{} points, checksum {}", label, grid.x_count,
                         grid.y_count, ctx.stats.checksum));

    m_pixels = fractal::to_intensity(counts);
    upload(grid.x_count, grid.y_count);
}

void JuliaRenderer::upload(int width, int height) {
    if (m_texture_loaded) {
        UnloadTexture(m_texture);
        m_texture_loaded = false;
    }
    if (width <= 0 || height <= 0) {
        return;
    }

    // LoadTextureFromImage copies the pixels, the image does not own them
    Image image{};
    image.data = m_pixels.data();
    image.width = width;
    image.height = height;
    image.mipmaps = 1;
    image.format = PIXELFORMAT_UNCOMPRESSED_GRAYSCALE;

    m_texture = LoadTextureFromImage(image);
    if (m_texture.id == 0) {
        throw RenderError("Failed to upload fractal texture");
    }
    m_texture_loaded = true;
}

void JuliaRenderer::render(Context &ctx) {
    if (!m_texture_loaded) {
        return;
    }
    const float tex_w = (float)m_texture.width;
    const float tex_h = (float)m_texture.height;
    const float screen_w = (float)ctx.wcfg.screen_width;
    const float screen_h = (float)ctx.wcfg.screen_height;
    const float scale = std::min(screen_w / tex_w, screen_h / tex_h);
    const float dest_w = tex_w * scale;
    const float dest_h = tex_h * scale;

    const Rectangle src = {0, 0, tex_w, tex_h};
    const Rectangle dest = {std::floor((screen_w - dest_w) * 0.5f),
                            std::floor((screen_h - dest_h) * 0.5f), dest_w,
                            dest_h};
    DrawTexturePro(m_texture, src, dest, (Vector2){0, 0}, 0.0f, WHITE);
}
