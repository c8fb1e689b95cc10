#include "grid.hpp"

#include <cmath>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace kernelbench::fractal {

namespace {

void check_bounds(double low, double high, const char *axis) {
    if (!std::isfinite(low) || !std::isfinite(high)) {
        throw KernelError(fmt::format("Non-finite {} bounds: [{}, {})", axis,
                                      low, high));
    }
    if (high <= low) {
        throw KernelError(
            fmt::format("Empty {} range: [{}, {})", axis, low, high));
    }
}

} // namespace

std::vector<double> build_ascending_axis(double low, double high,
                                         double step) {
    check_bounds(low, high, "axis");
    if (!(step > 0.0)) {
        throw KernelError(fmt::format("Ascending axis needs a positive step, "
                                      "got {}",
                                      step));
    }

    std::vector<double> axis;
    axis.reserve(static_cast<std::size_t>(std::ceil((high - low) / step)) + 1);
    // accumulate rather than multiply: the grid layout depends on the exact
    // sequence of rounded sums
    for (double coord = low; coord < high; coord += step) {
        axis.push_back(coord);
    }
    return axis;
}

std::vector<double> build_descending_axis(double high, double low,
                                          double step) {
    check_bounds(low, high, "axis");
    if (!(step < 0.0)) {
        throw KernelError(fmt::format("Descending axis needs a negative step, "
                                      "got {}",
                                      step));
    }

    std::vector<double> axis;
    axis.reserve(static_cast<std::size_t>(std::ceil((low - high) / step)) + 1);
    for (double coord = high; coord > low; coord += step) {
        axis.push_back(coord);
    }
    return axis;
}

Grid build_grid(const GridSpec &spec) {
    if (spec.desired_width <= 0) {
        throw KernelError("Invalid grid width: " +
                          std::to_string(spec.desired_width));
    }
    check_bounds(spec.x_low, spec.x_high, "x");
    check_bounds(spec.y_low, spec.y_high, "y");

    const double width = static_cast<double>(spec.desired_width);
    const double x_step = (spec.x_high - spec.x_low) / width;
    const double y_step = (spec.y_low - spec.y_high) / width;

    const std::vector<double> xs =
        build_ascending_axis(spec.x_low, spec.x_high, x_step);
    const std::vector<double> ys =
        build_descending_axis(spec.y_high, spec.y_low, y_step);

    Grid grid;
    grid.x_count = static_cast<int>(xs.size());
    grid.y_count = static_cast<int>(ys.size());

    const std::size_t total = xs.size() * ys.size();
    grid.zs.reserve(total);
    grid.cs.reserve(total);

    for (double y : ys) {
        for (double x : xs) {
            grid.zs.emplace_back(x, y);
            grid.cs.push_back(spec.c);
        }
    }

    LOG_DEBUG(fmt::format("Built grid {}x{} ({} points)", grid.x_count,
                          grid.y_count, total));
    return grid;
}

Grid build_grid(double x_low, double x_high, double y_low, double y_high,
                int desired_width, ComplexPoint c) {
    GridSpec spec;
    spec.x_low = x_low;
    spec.x_high = x_high;
    spec.y_low = y_low;
    spec.y_high = y_high;
    spec.desired_width = desired_width;
    spec.c = c;
    return build_grid(spec);
}

} // namespace kernelbench::fractal
