#pragma once

#include "types/context.hpp"

class IRenderer {
  public:
    virtual ~IRenderer() = default;

    /** @brief Runs kernels for the frame, called before drawing starts */
    virtual void update(Context &) {}
    virtual void render(Context &ctx) = 0;
};
