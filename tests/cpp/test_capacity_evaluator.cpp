/**
 * @file test_capacity_evaluator.cpp
 * @brief Tests for ray-casting safety factors and the flexure check
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rcflex/capacity_evaluator.hpp"

#include <cmath>
#include <limits>

using namespace rcflex;
using Catch::Matchers::WithinAbs;

namespace {

/// Interaction curve from (phi·Mn, phi·Pn) pairs, phi = 1
InteractionCurve make_curve(const std::vector<std::pair<double, double>>& pairs) {
    std::vector<CapacityPoint> points;
    for (const auto& mp : pairs) {
        CapacityPoint p;
        p.phi = 1.0;
        p.Mn = p.phi_Mn = mp.first;
        p.Pn = p.phi_Pn = mp.second;
        points.push_back(p);
    }
    return InteractionCurve(std::move(points));
}

/// Small curve with apexes at +100 kN and -50 kN, balanced nose at (40, 50)
InteractionCurve small_curve() {
    return make_curve({{0.0, 100.0}, {40.0, 50.0}, {30.0, 0.0}, {0.0, -50.0}});
}

} // namespace

// =============================================================================
// Exact intersection
// =============================================================================

TEST_CASE("CapacityEvaluator: pure bending demand", "[CapacityEvaluator][intersection]") {
    CapacityEvaluator evaluator;
    auto rc = evaluator.safety_factor(small_curve(), 0.0, 15.0);

    REQUIRE(rc.tier == RayCastTier::Intersection);
    REQUIRE_THAT(rc.safety_factor, WithinAbs(2.0, 1e-9));
    REQUIRE_THAT(rc.capacity_distance, WithinAbs(30.0, 1e-9));
    REQUIRE(rc.inside);
}

TEST_CASE("CapacityEvaluator: demand outside the curve", "[CapacityEvaluator][intersection]") {
    CapacityEvaluator evaluator;
    auto rc = evaluator.safety_factor(small_curve(), 0.0, 60.0);

    REQUIRE(rc.tier == RayCastTier::Intersection);
    REQUIRE_THAT(rc.safety_factor, WithinAbs(0.5, 1e-9));
    REQUIRE_FALSE(rc.inside);
}

TEST_CASE("CapacityEvaluator: demand on the boundary", "[CapacityEvaluator][intersection]") {
    CapacityEvaluator evaluator;

    // Interior of the first segment
    auto on_segment = evaluator.safety_factor(small_curve(), 80.0, 16.0);
    REQUIRE_THAT(on_segment.safety_factor, WithinAbs(1.0, 1e-9));
    REQUIRE(on_segment.inside);

    // Vertex shared by two segments
    auto on_vertex = evaluator.safety_factor(small_curve(), 50.0, 40.0);
    REQUIRE_THAT(on_vertex.safety_factor, WithinAbs(1.0, 1e-9));
    REQUIRE(on_vertex.inside);
}

TEST_CASE("CapacityEvaluator: moment sign is ignored", "[CapacityEvaluator][intersection]") {
    CapacityEvaluator evaluator;
    auto pos = evaluator.safety_factor(small_curve(), 50.0, 10.0);
    auto neg = evaluator.safety_factor(small_curve(), 50.0, -10.0);

    REQUIRE_THAT(pos.safety_factor, WithinAbs(1.6, 1e-9));
    REQUIRE_THAT(neg.safety_factor, WithinAbs(pos.safety_factor, 1e-12));
}

TEST_CASE("CapacityEvaluator: axial-only demands", "[CapacityEvaluator][intersection]") {
    CapacityEvaluator evaluator;

    auto compression = evaluator.safety_factor(small_curve(), 150.0, 0.0);
    REQUIRE_THAT(compression.safety_factor, WithinAbs(100.0 / 150.0, 1e-9));

    auto tension = evaluator.safety_factor(small_curve(), -80.0, 0.0);
    REQUIRE_THAT(tension.safety_factor, WithinAbs(50.0 / 80.0, 1e-9));
}

TEST_CASE("CapacityEvaluator: safety factor scales inversely with demand", "[CapacityEvaluator][intersection]") {
    InteractionCurveBuilder builder;
    RectangularSection section(200.0, 3000.0, 30.0);
    auto curve = builder.build(section, Concrete(25.0), ReinforcingSteel(420.0), 3000.0);

    CapacityEvaluator evaluator;
    auto base = evaluator.safety_factor(curve, 1500.0, 800.0);
    REQUIRE(base.tier == RayCastTier::Intersection);

    for (double k : {0.5, 2.0, 3.0}) {
        auto scaled = evaluator.safety_factor(curve, 1500.0 * k, 800.0 * k);
        REQUIRE_THAT(scaled.safety_factor, WithinAbs(base.safety_factor / k, 1e-9));
    }
}

// =============================================================================
// Degenerate demand and fallbacks
// =============================================================================

TEST_CASE("CapacityEvaluator: zero demand", "[CapacityEvaluator][fallback]") {
    CapacityEvaluator evaluator;
    auto rc = evaluator.safety_factor(small_curve(), 0.0, 0.0);

    REQUIRE(rc.tier == RayCastTier::ZeroDemand);
    REQUIRE(std::isinf(rc.safety_factor));
    REQUIRE(rc.inside);
}

TEST_CASE("CapacityEvaluator: nearest point by angle", "[CapacityEvaluator][fallback]") {
    CapacityEvaluator evaluator;
    std::vector<Eigen::Vector2d> curve{Eigen::Vector2d(0.0, 100.0), Eigen::Vector2d(100.0, 100.0)};

    // Ray at 38.7° misses the segment; (100, 100) lies 6.3° away
    auto rc = evaluator.safety_factor(curve, 80.0, 100.0);

    REQUIRE(rc.tier == RayCastTier::AngularNearest);
    REQUIRE_THAT(rc.capacity_distance, WithinAbs(std::sqrt(20000.0), 1e-9));
    REQUIRE_THAT(rc.safety_factor, WithinAbs(std::sqrt(20000.0) / std::sqrt(16400.0), 1e-9));
    REQUIRE(rc.inside);
}

TEST_CASE("CapacityEvaluator: polygon fallback outside", "[CapacityEvaluator][fallback]") {
    CapacityEvaluator evaluator;
    std::vector<Eigen::Vector2d> curve{Eigen::Vector2d(0.0, 100.0), Eigen::Vector2d(100.0, 100.0)};

    auto rc = evaluator.safety_factor(curve, 10.0, 100.0);

    REQUIRE(rc.tier == RayCastTier::PointInPolygon);
    REQUIRE_THAT(rc.safety_factor, WithinAbs(0.5, 1e-12));
    REQUIRE_FALSE(rc.inside);
}

TEST_CASE("CapacityEvaluator: polygon fallback inside", "[CapacityEvaluator][fallback]") {
    CapacityEvaluator evaluator;
    std::vector<Eigen::Vector2d> square{
        Eigen::Vector2d(100.0, -100.0), Eigen::Vector2d(-100.0, -100.0),
        Eigen::Vector2d(-100.0, 100.0), Eigen::Vector2d(100.0, 100.0)};

    auto rc = evaluator.safety_factor(square, 10.0, 50.0);

    REQUIRE(rc.tier == RayCastTier::PointInPolygon);
    REQUIRE_THAT(rc.safety_factor, WithinAbs(1.5, 1e-12));
    REQUIRE(rc.inside);
}

TEST_CASE("CapacityEvaluator: placeholder factors are configurable", "[CapacityEvaluator][fallback][settings]") {
    CapacityEvaluatorSettings settings;
    settings.ample_safety_factor = 2.0;
    CapacityEvaluator evaluator(settings);
    std::vector<Eigen::Vector2d> square{
        Eigen::Vector2d(100.0, -100.0), Eigen::Vector2d(-100.0, -100.0),
        Eigen::Vector2d(-100.0, 100.0), Eigen::Vector2d(100.0, 100.0)};

    auto rc = evaluator.safety_factor(square, 10.0, 50.0);
    REQUIRE_THAT(rc.safety_factor, WithinAbs(2.0, 1e-12));
}

TEST_CASE("CapacityEvaluator: empty curve never throws", "[CapacityEvaluator][fallback]") {
    CapacityEvaluator evaluator;
    std::vector<Eigen::Vector2d> empty;

    RayCastResult rc;
    REQUIRE_NOTHROW(rc = evaluator.safety_factor(empty, 100.0, 10.0));
    REQUIRE(rc.tier == RayCastTier::PointInPolygon);
    REQUIRE_FALSE(rc.inside);
}

TEST_CASE("CapacityEvaluator: point in polygon", "[CapacityEvaluator][polygon]") {
    CapacityEvaluator evaluator;
    std::vector<Eigen::Vector2d> triangle{
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(10.0, 0.0), Eigen::Vector2d(0.0, 10.0)};

    REQUIRE(evaluator.point_in_polygon(2.0, 2.0, triangle));
    REQUIRE_FALSE(evaluator.point_in_polygon(8.0, 8.0, triangle));
    REQUIRE_FALSE(evaluator.point_in_polygon(-1.0, 2.0, triangle));

    std::vector<Eigen::Vector2d> segment{Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(10.0, 10.0)};
    REQUIRE_FALSE(evaluator.point_in_polygon(5.0, 5.0, segment));
}

TEST_CASE("ray_cast_tier_to_string: names", "[CapacityEvaluator]") {
    REQUIRE(ray_cast_tier_to_string(RayCastTier::ZeroDemand) == "ZeroDemand");
    REQUIRE(ray_cast_tier_to_string(RayCastTier::Intersection) == "Intersection");
    REQUIRE(ray_cast_tier_to_string(RayCastTier::AngularNearest) == "AngularNearest");
    REQUIRE(ray_cast_tier_to_string(RayCastTier::PointInPolygon) == "PointInPolygon");
}

// =============================================================================
// Moment capacity at a given axial load
// =============================================================================

TEST_CASE("CapacityEvaluator: phi Mn interpolation", "[CapacityEvaluator][phi_Mn]") {
    CapacityEvaluator evaluator;
    auto curve = small_curve();

    REQUIRE_THAT(evaluator.phi_Mn_at_P(curve, 25.0), WithinAbs(35.0, 1e-9));
    REQUIRE_THAT(evaluator.phi_Mn_at_P(curve, 75.0), WithinAbs(20.0, 1e-9));
    REQUIRE_THAT(evaluator.phi_Mn_at_P0(curve), WithinAbs(30.0, 1e-9));
}

TEST_CASE("CapacityEvaluator: phi Mn outside the axial range", "[CapacityEvaluator][phi_Mn]") {
    CapacityEvaluator evaluator;
    auto curve = small_curve();

    REQUIRE_THAT(evaluator.phi_Mn_at_P(curve, 200.0), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(evaluator.phi_Mn_at_P(curve, -100.0), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(evaluator.phi_Mn_at_P(InteractionCurve(), 10.0), WithinAbs(0.0, 1e-12));
}

TEST_CASE("CapacityEvaluator: phi Mn below a capped plateau", "[CapacityEvaluator][phi_Mn]") {
    CapacityEvaluator evaluator;
    // Apex and a wider point share the capped axial load
    auto curve = make_curve({{0.0, 100.0}, {40.0, 100.0}, {50.0, 50.0}, {0.0, -50.0}});

    // Interpolates toward the apex, the first point at phi·Pn = 100
    REQUIRE_THAT(evaluator.phi_Mn_at_P(curve, 75.0), WithinAbs(25.0, 1e-9));
    REQUIRE_THAT(evaluator.phi_Mn_at_P(curve, 100.0), WithinAbs(0.0, 1e-9));
}

// =============================================================================
// Flexure check
// =============================================================================

TEST_CASE("CapacityEvaluator: flexure check with no demands", "[CapacityEvaluator][flexure]") {
    CapacityEvaluator evaluator;
    auto check = evaluator.check_flexure(small_curve(), {});

    REQUIRE(std::isinf(check.safety_factor));
    REQUIRE(check.ok);
    REQUIRE(check.status() == "OK");
    REQUIRE(check.critical_combo == "N/A");
    REQUIRE_THAT(check.dcr(), WithinAbs(0.0, 1e-12));
    REQUIRE(check.combos.empty());
    REQUIRE_FALSE(check.warnings.has_warnings());
}

TEST_CASE("CapacityEvaluator: flexure check with zero demands", "[CapacityEvaluator][flexure]") {
    CapacityEvaluator evaluator;
    auto curve = small_curve();
    auto check = evaluator.check_flexure(curve, {DemandPoint(0.0, 0.0, "Z1"), DemandPoint(0.0, 0.0, "Z2")});

    REQUIRE(std::isinf(check.safety_factor));
    REQUIRE(check.ok);
    REQUIRE(check.status() == "OK");
    REQUIRE_THAT(check.dcr(), WithinAbs(0.0, 1e-12));

    // First combination governs when no demand has a finite SF
    REQUIRE(check.critical_combo == "Z1");
    REQUIRE_THAT(check.critical_Pu, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(check.critical_Mu, WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(check.phi_Mn_at_Pu, WithinAbs(30.0, 1e-9));

    REQUIRE(check.combos.size() == 2);
    REQUIRE(check.combos[0].tier == RayCastTier::ZeroDemand);
    REQUIRE(check.combos[0].inside);
    REQUIRE_FALSE(check.warnings.has_warnings());
}

TEST_CASE("CapacityEvaluator: zero demand does not mask a finite one", "[CapacityEvaluator][flexure]") {
    CapacityEvaluator evaluator;
    auto check = evaluator.check_flexure(small_curve(),
                                         {DemandPoint(0.0, 0.0, "Z"), DemandPoint(50.0, 10.0, "A")});

    REQUIRE(check.critical_combo == "A");
    REQUIRE_THAT(check.safety_factor, WithinAbs(1.6, 1e-9));
}

TEST_CASE("CapacityEvaluator: flexure check governing combination", "[CapacityEvaluator][flexure]") {
    CapacityEvaluator evaluator;
    std::vector<DemandPoint> demands{
        DemandPoint(50.0, 10.0, "A"),
        DemandPoint(-10.0, 5.0, "B"),
        DemandPoint(150.0, 0.0, "C"),
    };

    auto check = evaluator.check_flexure(small_curve(), demands);

    REQUIRE(check.combos.size() == 3);
    REQUIRE(check.combos[0].label == "A");
    REQUIRE_THAT(check.combos[0].safety_factor, WithinAbs(1.6, 1e-9));
    REQUIRE_THAT(check.combos[0].dcr, WithinAbs(0.625, 1e-9));
    REQUIRE_THAT(check.combos[0].phi_Mn_at_Pu, WithinAbs(40.0, 1e-9));
    REQUIRE(check.combos[1].is_tension);
    REQUIRE_THAT(check.combos[1].safety_factor, WithinAbs(30.0 / 11.0, 1e-9));

    REQUIRE(check.critical_combo == "C");
    REQUIRE_THAT(check.safety_factor, WithinAbs(100.0 / 150.0, 1e-9));
    REQUIRE_THAT(check.dcr(), WithinAbs(1.5, 1e-9));
    REQUIRE_THAT(check.critical_Pu, WithinAbs(150.0, 1e-12));
    REQUIRE_FALSE(check.ok);
    REQUIRE(check.status() == "NOT OK");

    REQUIRE_THAT(check.phi_Pn_max, WithinAbs(100.0, 1e-12));
    REQUIRE_THAT(check.phi_Pt_min, WithinAbs(-50.0, 1e-12));
    REQUIRE_THAT(check.phi_Mn_0, WithinAbs(30.0, 1e-9));

    REQUIRE(check.exceeds_axial_capacity);
    REQUIRE_FALSE(check.exceeds_tension_capacity);
    REQUIRE(check.has_tension);
    REQUIRE(check.tension_combos == 1);

    REQUIRE(check.warnings.contains(WarningCode::EXCEEDS_AXIAL_CAPACITY));
    REQUIRE(check.warnings.contains(WarningCode::NET_TENSION));
    REQUIRE_FALSE(check.warnings.contains(WarningCode::RAY_FALLBACK_POLYGON));
}

TEST_CASE("CapacityEvaluator: flexure check tension governs", "[CapacityEvaluator][flexure]") {
    CapacityEvaluator evaluator;
    auto check = evaluator.check_flexure(small_curve(), {DemandPoint(-80.0, 0.0, "T")});

    REQUIRE(check.critical_combo == "T");
    REQUIRE_THAT(check.safety_factor, WithinAbs(0.625, 1e-9));
    REQUIRE(check.exceeds_tension_capacity);
    REQUIRE_FALSE(check.exceeds_axial_capacity);
    REQUIRE(check.warnings.contains(WarningCode::EXCEEDS_TENSION_CAPACITY));
}

TEST_CASE("CapacityEvaluator: flexure check counts fallbacks", "[CapacityEvaluator][flexure]") {
    CapacityEvaluator evaluator;
    auto open_curve = make_curve({{0.0, 100.0}, {100.0, 100.0}});

    auto check = evaluator.check_flexure(open_curve, {
        DemandPoint(80.0, 100.0, "angular"),
        DemandPoint(10.0, 100.0, "polygon"),
    });

    REQUIRE(check.angular_fallbacks == 1);
    REQUIRE(check.polygon_fallbacks == 1);
    REQUIRE(check.combos[0].tier == RayCastTier::AngularNearest);
    REQUIRE(check.combos[1].tier == RayCastTier::PointInPolygon);
    REQUIRE(check.warnings.contains(WarningCode::RAY_FALLBACK_ANGULAR));
    REQUIRE(check.warnings.contains(WarningCode::RAY_FALLBACK_POLYGON));
    REQUIRE(check.critical_combo == "polygon");
    REQUIRE_THAT(check.safety_factor, WithinAbs(0.5, 1e-12));
}
