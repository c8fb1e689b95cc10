#pragma once

#include <complex>
#include <vector>

namespace kernelbench::fractal {

using ComplexPoint = std::complex<double>;

/**
 * @brief Region of the complex plane to sample and the parameter shared by
 * every sample
 */
struct GridSpec {
    double x_low = -1.8;
    double x_high = 1.8;
    double y_low = -1.8;
    double y_high = 1.8;
    /** @brief Number of steps the x and y spans are divided into */
    int desired_width = 1000;
    ComplexPoint c{-0.62772, -0.42193};
};

/**
 * @brief Index-aligned starting points and parameters for the fractal kernel
 *
 * Points are stored row-major: row 0 is the highest y, and within a row x
 * ascends. zs[i] always pairs with cs[i].
 */
struct Grid {
    std::vector<ComplexPoint> zs;
    std::vector<ComplexPoint> cs;
    int x_count = 0;
    int y_count = 0;

    inline std::size_t size() const noexcept { return zs.size(); }
};

/**
 * @brief Accumulates low, low + step, ... while the value stays below high
 * @throws kernelbench::KernelError if step is not positive or bounds are not
 * finite
 */
std::vector<double> build_ascending_axis(double low, double high, double step);

/**
 * @brief Accumulates high, high + step, ... (step < 0) while the value stays
 * above low
 * @throws kernelbench::KernelError if step is not negative or bounds are not
 * finite
 */
std::vector<double> build_descending_axis(double high, double low,
                                          double step);

/**
 * @brief Builds the coordinate grid and parameter grid for a region
 * @throws kernelbench::KernelError if desired_width <= 0 or high <= low on
 * either axis
 */
Grid build_grid(const GridSpec &spec);

Grid build_grid(double x_low, double x_high, double y_low, double y_high,
                int desired_width, ComplexPoint c);

} // namespace kernelbench::fractal
