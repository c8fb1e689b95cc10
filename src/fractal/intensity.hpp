#pragma once

#include <cstdint>
#include <vector>

#include "fractal_kernel.hpp"

namespace kernelbench::fractal {

/**
 * @brief Scales counts linearly to 0..255, the largest count mapping to 255
 * @details Each value is round(count / max(counts) * 255). Empty input gives
 * empty output, all-zero input gives all zeros.
 */
std::vector<std::uint8_t> to_intensity(const IterationCounts &counts);

} // namespace kernelbench::fractal
