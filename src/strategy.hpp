#pragma once

#include <optional>
#include <string_view>

namespace kernelbench {

/**
 * @brief Execution shape of a kernel
 *
 * Scalar processes one element at a time, Batch runs whole-array passes over
 * parallel (structure-of-arrays) buffers. Both produce the same results.
 */
enum class Strategy { Scalar, Batch };

inline constexpr Strategy all_strategies[] = {Strategy::Scalar,
                                              Strategy::Batch};

inline const char *to_string(Strategy strategy) noexcept {
    switch (strategy) {
    case Strategy::Scalar:
        return "scalar";
    case Strategy::Batch:
        return "batch";
    }
    return "unknown";
}

inline std::optional<Strategy> parse_strategy(std::string_view name) noexcept {
    if (name == "scalar") {
        return Strategy::Scalar;
    }
    if (name == "batch") {
        return Strategy::Batch;
    }
    return std::nullopt;
}

} // namespace kernelbench
