#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

#include "fractal/grid.hpp"
#include "utility/exceptions.hpp"

using namespace kernelbench;
using namespace kernelbench::fractal;

TEST_CASE("Axes accumulate the step and stop at the far bound", "[grid]") {
    const auto up = build_ascending_axis(0.0, 1.0, 0.25);
    REQUIRE(up.size() == 4);
    REQUIRE(up.front() == 0.0);
    REQUIRE(up.back() == 0.75);

    const auto down = build_descending_axis(1.0, 0.0, -0.25);
    REQUIRE(down.size() == 4);
    REQUIRE(down.front() == 1.0);
    REQUIRE(down.back() == 0.25);
}

TEST_CASE("Axes reject steps pointing the wrong way", "[grid]") {
    REQUIRE_THROWS_AS(build_ascending_axis(0.0, 1.0, 0.0), KernelError);
    REQUIRE_THROWS_AS(build_ascending_axis(0.0, 1.0, -0.1), KernelError);
    REQUIRE_THROWS_AS(build_descending_axis(1.0, 0.0, 0.1), KernelError);
    REQUIRE_THROWS_AS(
        build_ascending_axis(0.0, std::numeric_limits<double>::infinity(), 0.1),
        KernelError);
}

TEST_CASE("Grid is row-major from the highest y", "[grid]") {
    const Grid grid = build_grid(0.0, 1.0, 0.0, 1.0, 4, {0.5, -0.5});

    REQUIRE(grid.x_count == 4);
    REQUIRE(grid.y_count == 4);
    REQUIRE(grid.size() == 16);
    REQUIRE(grid.cs.size() == grid.zs.size());

    // first row: y = 1.0, x ascending
    REQUIRE(grid.zs[0] == ComplexPoint(0.0, 1.0));
    REQUIRE(grid.zs[1] == ComplexPoint(0.25, 1.0));
    REQUIRE(grid.zs[3] == ComplexPoint(0.75, 1.0));
    // second row starts again at x_low
    REQUIRE(grid.zs[4] == ComplexPoint(0.0, 0.75));
    REQUIRE(grid.zs[15] == ComplexPoint(0.75, 0.25));

    for (const auto &c : grid.cs) {
        REQUIRE(c == ComplexPoint(0.5, -0.5));
    }
}

TEST_CASE("Reference grid covers the region", "[grid]") {
    const Grid grid = build_grid(GridSpec{});

    REQUIRE(grid.x_count == 1000);
    REQUIRE(grid.y_count == 1000);
    REQUIRE(grid.size() == 1000u * 1000u);

    REQUIRE(grid.zs.front().real() == -1.8);
    REQUIRE(grid.zs.front().imag() == 1.8);
    REQUIRE(grid.zs.back().real() < 1.8);
    REQUIRE(grid.zs.back().imag() > -1.8);
    REQUIRE(grid.cs.front() == ComplexPoint(-0.62772, -0.42193));
}

TEST_CASE("Axis lengths match the span divided by the step", "[grid]") {
    struct Region {
        double x_low, x_high, y_low, y_high;
        int width;
    };
    const Region regions[] = {
        {-1.8, 1.8, -1.8, 1.8, 1000},
        {0.0, 1.0, 0.0, 1.0, 4},
        {-2.0, 2.0, -1.0, 3.0, 8},
        {0.0, 3.0, -3.0, 0.0, 3},
        {-1.5, 0.5, -0.5, 1.5, 64},
    };

    for (const auto &r : regions) {
        const Grid grid =
            build_grid(r.x_low, r.x_high, r.y_low, r.y_high, r.width, {0, 0});
        const double x_step = (r.x_high - r.x_low) / r.width;
        const double y_step = (r.y_low - r.y_high) / r.width;

        REQUIRE(grid.x_count ==
                static_cast<int>(std::ceil((r.x_high - r.x_low) / x_step)));
        REQUIRE(grid.y_count ==
                static_cast<int>(std::ceil((r.y_low - r.y_high) / y_step)));
        REQUIRE(grid.size() ==
                static_cast<std::size_t>(grid.x_count) * grid.y_count);

        // last column of the first row, first column of the last row
        REQUIRE(grid.zs[grid.x_count - 1].real() < r.x_high);
        REQUIRE(grid.zs.back().imag() > r.y_low);
    }
}

TEST_CASE("Invalid regions are rejected", "[grid]") {
    GridSpec spec;

    SECTION("zero width") {
        spec.desired_width = 0;
        REQUIRE_THROWS_AS(build_grid(spec), KernelError);
    }
    SECTION("empty x range") {
        spec.x_high = spec.x_low;
        REQUIRE_THROWS_AS(build_grid(spec), KernelError);
    }
    SECTION("inverted y range") {
        spec.y_low = 1.0;
        spec.y_high = -1.0;
        REQUIRE_THROWS_AS(build_grid(spec), KernelError);
    }
    SECTION("non-finite bound") {
        spec.x_low = std::nan("");
        REQUIRE_THROWS_AS(build_grid(spec), KernelError);
    }
}
