#include "intensity.hpp"

#include <algorithm>
#include <cmath>

namespace kernelbench::fractal {

std::vector<std::uint8_t> to_intensity(const IterationCounts &counts) {
    std::vector<std::uint8_t> out(counts.size(), 0);
    if (counts.empty()) {
        return out;
    }

    const int max_count = *std::max_element(counts.begin(), counts.end());
    if (max_count <= 0) {
        return out;
    }

    const double max_value = static_cast<double>(max_count);
    std::transform(counts.begin(), counts.end(), out.begin(), [&](int count) {
        const long v =
            std::lround(static_cast<double>(count) / max_value * 255.0);
        return static_cast<std::uint8_t>(std::clamp(v, 0L, 255L));
    });
    return out;
}

} // namespace kernelbench::fractal
