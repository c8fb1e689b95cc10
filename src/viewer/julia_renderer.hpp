#pragma once

#include <cstdint>
#include <vector>

#include <raylib.h>

#include "irenderer.hpp"

/**
 * @brief Computes the Julia set on request and draws it as a grayscale
 * texture
 *
 * Counts are mapped through to_intensity into one byte per grid point. The
 * grid is row-major with the highest y first, which is also raylib's image
 * row order, so the texture needs no flipping.
 */
class JuliaRenderer : public IRenderer {
  public:
    JuliaRenderer() = default;
    ~JuliaRenderer() override;
    JuliaRenderer(const JuliaRenderer &) = delete;
    JuliaRenderer(JuliaRenderer &&) = delete;
    JuliaRenderer &operator=(const JuliaRenderer &) = delete;
    JuliaRenderer &operator=(JuliaRenderer &&) = delete;

    /**
     * @brief Recomputes the image when ctx.vcfg.recompute_fractal is set
     * @param ctx Frame context; stats receive checksum and timing
     */
    void update(Context &ctx) override;

    /**
     * @brief Draws the last image scaled to fit the window, centered
     * @param ctx Frame context
     */
    void render(Context &ctx) override;

  private:
    void recompute(Context &ctx);
    void upload(int width, int height);

  private:
    std::vector<std::uint8_t> m_pixels;
    Texture2D m_texture{};
    bool m_texture_loaded{false};
};
