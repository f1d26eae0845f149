/**
 * @file test_element_category.cpp
 * @brief Tests for element category resolution
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rcflex/element_category.hpp"

using namespace rcflex;
using Catch::Matchers::WithinAbs;

namespace {

WallCategory make_wall(double lw, double tw, double hw, bool cracked = true) {
    WallCategory wall;
    wall.lw = lw;
    wall.tw = tw;
    wall.hw = hw;
    wall.cracked = cracked;
    return wall;
}

} // namespace

// =============================================================================
// Frame members
// =============================================================================

TEST_CASE("resolve: beam", "[ElementCategory][frame]") {
    auto p = resolve(BeamCategory{});

    REQUIRE(p.behavior == DesignBehavior::Beam);
    REQUIRE_FALSE(p.requires_pm_diagram);
    REQUIRE_FALSE(p.requires_seismic_checks);
    REQUIRE_THAT(p.stiffness_factor, WithinAbs(0.35, 1e-12));
    REQUIRE_THAT(p.default_k, WithinAbs(1.0, 1e-12));
}

TEST_CASE("resolve: seismic column", "[ElementCategory][frame]") {
    auto p = resolve(ColumnCategory{});

    REQUIRE(p.behavior == DesignBehavior::SeismicColumn);
    REQUIRE(p.requires_pm_diagram);
    REQUIRE(p.requires_column_checks);
    REQUIRE(p.requires_seismic_checks);
    REQUIRE(p.requires_confinement);
    REQUIRE_FALSE(p.requires_wall_checks);
    REQUIRE_THAT(p.stiffness_factor, WithinAbs(0.70, 1e-12));
    REQUIRE_THAT(p.default_k, WithinAbs(1.0, 1e-12));
}

TEST_CASE("resolve: gravity column", "[ElementCategory][frame]") {
    ColumnCategory column;
    column.seismic = false;
    auto p = resolve(column);

    REQUIRE(p.behavior == DesignBehavior::Column);
    REQUIRE(p.requires_pm_diagram);
    REQUIRE(p.requires_column_checks);
    REQUIRE_FALSE(p.requires_seismic_checks);
    REQUIRE_FALSE(p.requires_confinement);
}

TEST_CASE("resolve: drop beam", "[ElementCategory][frame]") {
    auto p = resolve(DropBeamCategory{});

    REQUIRE(p.behavior == DesignBehavior::DropBeam);
    REQUIRE(p.requires_pm_diagram);
    REQUIRE_THAT(p.stiffness_factor, WithinAbs(0.25, 1e-12));
}

// =============================================================================
// Wall classification
// =============================================================================

TEST_CASE("classify_wall: proportion table", "[ElementCategory][wall]") {
    REQUIRE(classify_wall(make_wall(600.0, 200.0, 3000.0)) == DesignBehavior::Column);
    REQUIRE(classify_wall(make_wall(3000.0, 200.0, 9000.0)) == DesignBehavior::Wall);
    REQUIRE(classify_wall(make_wall(1000.0, 200.0, 1500.0)) == DesignBehavior::WallPierAlternate);
    REQUIRE(classify_wall(make_wall(3000.0, 200.0, 3000.0)) == DesignBehavior::SquatWall);
}

TEST_CASE("classify_wall: boundaries", "[ElementCategory][wall]") {
    // lw/tw = 4 is no longer a column
    REQUIRE(classify_wall(make_wall(800.0, 200.0, 800.0)) == DesignBehavior::WallPierAlternate);
    // hw/lw = 2 is a wall
    REQUIRE(classify_wall(make_wall(1000.0, 200.0, 2000.0)) == DesignBehavior::Wall);
    // lw/tw = 6 still uses the alternate method
    REQUIRE(classify_wall(make_wall(1200.0, 200.0, 1200.0)) == DesignBehavior::WallPierAlternate);
}

TEST_CASE("classify_wall: pier column with custom limits", "[ElementCategory][wall]") {
    WallClassificationLimits limits;
    limits.column_aspect = 2.0;

    REQUIRE(classify_wall(make_wall(400.0, 200.0, 600.0), limits) == DesignBehavior::WallPierColumn);
    REQUIRE(classify_wall(make_wall(300.0, 200.0, 600.0), limits) == DesignBehavior::Column);

    auto p = resolve(make_wall(400.0, 200.0, 600.0), limits);
    REQUIRE(p.behavior == DesignBehavior::WallPierColumn);
    REQUIRE(p.requires_column_checks);
    REQUIRE(p.requires_confinement);
    REQUIRE_FALSE(p.requires_wall_checks);
}

TEST_CASE("resolve: slender wall", "[ElementCategory][wall]") {
    auto p = resolve(make_wall(3000.0, 200.0, 9000.0));

    REQUIRE(p.behavior == DesignBehavior::Wall);
    REQUIRE(p.requires_pm_diagram);
    REQUIRE(p.requires_wall_checks);
    REQUIRE(p.requires_seismic_checks);
    REQUIRE_FALSE(p.requires_confinement);
    REQUIRE_THAT(p.stiffness_factor, WithinAbs(0.35, 1e-12));
    REQUIRE_THAT(p.default_k, WithinAbs(0.8, 1e-12));
}

TEST_CASE("resolve: uncracked wall stiffness", "[ElementCategory][wall]") {
    auto p = resolve(make_wall(3000.0, 200.0, 9000.0, false));
    REQUIRE_THAT(p.stiffness_factor, WithinAbs(0.70, 1e-12));
}

TEST_CASE("resolve: wall pier alternate method", "[ElementCategory][wall]") {
    auto p = resolve(make_wall(1000.0, 200.0, 1500.0));

    REQUIRE(p.behavior == DesignBehavior::WallPierAlternate);
    REQUIRE(p.requires_wall_checks);
    REQUIRE(p.requires_confinement);
}

TEST_CASE("resolve: short wall segment follows column rules", "[ElementCategory][wall]") {
    auto p = resolve(make_wall(600.0, 200.0, 3000.0));

    REQUIRE(p.behavior == DesignBehavior::SeismicColumn);
    REQUIRE(p.requires_column_checks);
    REQUIRE_THAT(p.stiffness_factor, WithinAbs(0.70, 1e-12));
    REQUIRE_THAT(p.default_k, WithinAbs(1.0, 1e-12));
}

TEST_CASE("design_behavior_to_string: names", "[ElementCategory]") {
    REQUIRE(design_behavior_to_string(DesignBehavior::Beam) == "Beam");
    REQUIRE(design_behavior_to_string(DesignBehavior::WallPierAlternate) == "WallPierAlternate");
    REQUIRE(design_behavior_to_string(DesignBehavior::SquatWall) == "SquatWall");
    REQUIRE(design_behavior_to_string(DesignBehavior::DropBeam) == "DropBeam");
}
