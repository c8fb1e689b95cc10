#pragma once

#include <memory>
#include <vector>

#include "../strategy.hpp"
#include "grid.hpp"

namespace kernelbench::fractal {

/** @brief Escape iteration count per grid point, in grid order */
using IterationCounts = std::vector<int>;

/** @brief Modulus a point must stay strictly below to keep iterating */
inline constexpr double escape_radius = 2.0;

/**
 * @brief Escape-time iteration of z = z*z + c over index-aligned inputs
 *
 * For each i, starts from z = zs[i] and counts applications of the update
 * while |z| < 2 and the count is below max_iterations. Implementations differ
 * only in execution shape and must agree on every count.
 */
class FractalKernel {
  public:
    virtual ~FractalKernel() = default;

    virtual Strategy strategy() const noexcept = 0;

    /**
     * @brief Runs the kernel
     * @param max_iterations Iteration cap (>= 0)
     * @param zs Starting points
     * @param cs Per-point parameters, same length as zs
     * @return One count in [0, max_iterations] per point
     * @throws kernelbench::KernelError if zs and cs differ in length or
     * max_iterations is negative
     */
    virtual IterationCounts run(int max_iterations,
                                const std::vector<ComplexPoint> &zs,
                                const std::vector<ComplexPoint> &cs) const = 0;

    IterationCounts run(int max_iterations, const Grid &grid) const {
        return run(max_iterations, grid.zs, grid.cs);
    }
};

/**
 * @brief One point at a time with std::complex arithmetic
 */
class ScalarFractalKernel final : public FractalKernel {
  public:
    Strategy strategy() const noexcept override { return Strategy::Scalar; }

    using FractalKernel::run;
    IterationCounts run(int max_iterations,
                        const std::vector<ComplexPoint> &zs,
                        const std::vector<ComplexPoint> &cs) const override;
};

/**
 * @brief Whole-array passes over split real/imaginary buffers
 *
 * Each step tests every active lane, retires lanes that escaped or reached
 * the cap, compacts the survivors to the front of the buffers and updates
 * them. Retired lanes are never touched again.
 */
class BatchFractalKernel final : public FractalKernel {
  public:
    Strategy strategy() const noexcept override { return Strategy::Batch; }

    using FractalKernel::run;
    IterationCounts run(int max_iterations,
                        const std::vector<ComplexPoint> &zs,
                        const std::vector<ComplexPoint> &cs) const override;
};

std::unique_ptr<FractalKernel> make_fractal_kernel(Strategy strategy);

/** @brief Sum of all counts, the regression checksum of a run */
long long checksum(const IterationCounts &counts) noexcept;

} // namespace kernelbench::fractal
