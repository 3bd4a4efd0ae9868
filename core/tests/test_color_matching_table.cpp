#include <catch2/catch.hpp>
#include "cienorm/color_matching_table.hpp"
#include <utility>

using namespace cienorm;
using Catch::Detail::Approx;

TEST_CASE("ColorMatchingTable construction", "[table]") {
    SECTION("Construction with data") {
        ColorMatchingTable table({380.0, 385.0, 390.0},
                                 {0.1, 0.2, 0.3},
                                 {0.01, 0.02, 0.03},
                                 {0.5, 0.6, 0.7});
        REQUIRE(table.size() == 3);
        REQUIRE(table.wavelengthAt(1) == Approx(385.0));
        REQUIRE(table.valueAt(Channel::X, 2) == Approx(0.3));
        REQUIRE(table.valueAt(Channel::Y, 0) == Approx(0.01));
        REQUIRE(table.valueAt(Channel::Z, 1) == Approx(0.6));
    }

    SECTION("Mismatched column sizes throw") {
        REQUIRE_THROWS_AS(ColorMatchingTable({380.0, 385.0}, {0.1}, {0.1, 0.2}, {0.1, 0.2}),
                          std::invalid_argument);
    }

    SECTION("Single row is rejected") {
        REQUIRE_THROWS_AS(ColorMatchingTable({380.0}, {0.1}, {0.1}, {0.1}),
                          DataFormatError);
    }

    SECTION("Duplicate wavelength is rejected") {
        REQUIRE_THROWS_AS(ColorMatchingTable({380.0, 380.0}, {0.1, 0.2},
                                             {0.1, 0.2}, {0.1, 0.2}),
                          DataFormatError);
    }

    SECTION("Descending wavelengths are rejected") {
        REQUIRE_THROWS_AS(ColorMatchingTable({390.0, 385.0, 380.0}, {0, 0, 0},
                                             {0, 0, 0}, {0, 0, 0}),
                          DataFormatError);
    }
}

TEST_CASE("ColorMatchingTable range", "[table]") {
    ColorMatchingTable table({360.0, 500.0, 830.0}, {0, 0, 0},
                             {0.0, 0.323, 0.0}, {0, 0, 0});

    REQUIRE(table.minWavelength() == Approx(360.0));
    REQUIRE(table.maxWavelength() == Approx(830.0));

    auto range = table.wavelengthRange();
    REQUIRE(range.contains(380.0));
    REQUIRE_FALSE(range.contains(830.5));
    REQUIRE(range.span() == Approx(470.0));

    REQUIRE(&table.channel(Channel::Y) == &table.ybar());
}

TEST_CASE("ColorMatchingTable keeps its rows when moved from", "[table]") {
    ColorMatchingTable source({380.0, 385.0}, {0.1, 0.2}, {0.3, 0.4}, {0.5, 0.6});

    ColorMatchingTable moved(std::move(source));
    REQUIRE(moved.size() == 2);
    REQUIRE(source.size() == 2);
    REQUIRE(source.minWavelength() == Approx(380.0));
    REQUIRE(source.wavelengthRange().max_value == Approx(385.0));

    ColorMatchingTable assigned({400.0, 410.0}, {0, 0}, {0, 0}, {0, 0});
    assigned = std::move(moved);
    REQUIRE(assigned.minWavelength() == Approx(380.0));
    REQUIRE(moved.size() == 2);
    REQUIRE(moved.maxWavelength() == Approx(385.0));
}
