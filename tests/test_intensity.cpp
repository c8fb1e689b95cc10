#include <catch2/catch_test_macros.hpp>

#include "fractal/intensity.hpp"

using namespace kernelbench::fractal;

TEST_CASE("Largest count maps to 255", "[intensity]") {
    const auto pixels = to_intensity({0, 1, 2, 4});
    REQUIRE(pixels.size() == 4);
    REQUIRE(pixels[0] == 0);
    REQUIRE(pixels[1] == 64); // 63.75 rounds up
    REQUIRE(pixels[2] == 128);
    REQUIRE(pixels[3] == 255);
}

TEST_CASE("Degenerate inputs", "[intensity]") {
    REQUIRE(to_intensity({}).empty());

    const auto zeros = to_intensity({0, 0, 0});
    REQUIRE(zeros.size() == 3);
    for (auto v : zeros) {
        REQUIRE(v == 0);
    }

    const auto flat = to_intensity({7, 7});
    REQUIRE(flat[0] == 255);
    REQUIRE(flat[1] == 255);
}
