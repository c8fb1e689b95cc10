#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

#include "utility/exceptions.hpp"

using namespace kernelbench;

TEST_CASE("Every error is a KernelBenchException", "[exceptions]") {
    REQUIRE_THROWS_AS(throw KernelError("lanes"), KernelBenchException);
    REQUIRE_THROWS_AS(throw ConfigError("width"), KernelBenchException);
    REQUIRE_THROWS_AS(throw IOError("file"), KernelBenchException);
    REQUIRE_THROWS_AS(throw RenderError("texture"), KernelBenchException);
    REQUIRE_THROWS_AS(throw RenderError("texture"), std::runtime_error);
}

TEST_CASE("Messages carry their category prefix", "[exceptions]") {
    REQUIRE(std::string(KernelError("x").what()) == "Kernel error: x");
    REQUIRE(std::string(ConfigError("x").what()) == "Configuration error: x");
    REQUIRE(std::string(IOError("x").what()) == "I/O error: x");
    REQUIRE(std::string(RenderError("x").what()) == "Render error: x");
}
