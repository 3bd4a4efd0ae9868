#include <catch2/catch.hpp>
#include "cienorm/algorithms/sample_grid.hpp"
#include <limits>

using namespace cienorm;
using namespace cienorm::algorithms;
using Catch::Detail::Approx;

TEST_CASE("Sample grid generation", "[sample_grid]") {
    SECTION("Visible range at 5 nm") {
        auto grid = generateSampleGrid(380.0, 780.0, 5.0);
        REQUIRE(grid.size() == 80);
        REQUIRE(grid.front() == 380.0);
        REQUIRE(grid.back() == 775.0);
        for (std::size_t k = 0; k < grid.size(); ++k) {
            REQUIRE(grid[k] == 380.0 + 5.0 * static_cast<double>(k));
        }
    }

    SECTION("Stop that is not a multiple of step") {
        auto grid = generateSampleGrid(0.0, 10.5, 2.0);
        REQUIRE(grid.size() == 6);
        REQUIRE(grid.back() == Approx(10.0));
    }

    SECTION("Fractional step excludes stop") {
        auto grid = generateSampleGrid(0.0, 1.0, 0.1);
        REQUIRE(grid.size() == 10);
        REQUIRE(grid.back() < 1.0);
        REQUIRE(grid.back() == Approx(0.9));
    }

    SECTION("Step larger than range") {
        auto grid = generateSampleGrid(380.0, 381.0, 5.0);
        REQUIRE(grid.size() == 1);
        REQUIRE(grid[0] == 380.0);
    }

    SECTION("Size matches generated grid") {
        REQUIRE(sampleGridSize(380.0, 780.0, 5.0) == 80);
        REQUIRE(sampleGridSize(380.0, 780.0, 1.0) == 400);
    }
}

TEST_CASE("Sample grid invalid parameters", "[sample_grid]") {
    SECTION("Zero step") {
        REQUIRE_THROWS_AS(generateSampleGrid(380.0, 780.0, 0.0), InvalidRangeError);
    }

    SECTION("Negative step") {
        REQUIRE_THROWS_AS(generateSampleGrid(380.0, 780.0, -5.0), InvalidRangeError);
    }

    SECTION("Empty range") {
        REQUIRE_THROWS_AS(generateSampleGrid(780.0, 780.0, 5.0), InvalidRangeError);
    }

    SECTION("Reversed range") {
        REQUIRE_THROWS_AS(generateSampleGrid(780.0, 380.0, 5.0), InvalidRangeError);
    }

    SECTION("Non-finite arguments") {
        double inf = std::numeric_limits<double>::infinity();
        double nan = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(generateSampleGrid(380.0, inf, 5.0), InvalidRangeError);
        REQUIRE_THROWS_AS(generateSampleGrid(nan, 780.0, 5.0), InvalidRangeError);
    }

    SECTION("Step lost to floating-point rounding") {
        REQUIRE_THROWS_AS(generateSampleGrid(1e16, 1e16 + 4.0, 1.0), InvalidRangeError);
        REQUIRE_THROWS_AS(sampleGridSize(1e16, 1e16 + 4.0, 1.0), InvalidRangeError);
    }

    SECTION("Grid too large") {
        REQUIRE_THROWS_AS(generateSampleGrid(0.0, 1.0, 1e-12), InvalidRangeError);
    }
}
