/**
 * @file test_demand_verifier.cpp
 * @brief Tests for member verification with and without slenderness effects
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rcflex/demand_verifier.hpp"

#include <cmath>

using namespace rcflex;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

/**
 * @brief Verification fixture with a simple capacity curve and a slender wall strip
 *
 * Curve (phi·Mn, phi·Pn): (0, 1000) (200, 500) (250, 0) (0, -300), phi = 1.
 * Wall strip 1000 x 200, f'c 25 MPa, k = 1.
 */
class VerifierFixture {
public:
    InteractionCurve curve;
    SlendernessAnalyzer analyzer;

    VerifierFixture() {
        std::vector<CapacityPoint> points;
        for (const auto& mp : std::vector<std::pair<double, double>>{
                 {0.0, 1000.0}, {200.0, 500.0}, {250.0, 0.0}, {0.0, -300.0}}) {
            CapacityPoint p;
            p.phi = 1.0;
            p.Mn = p.phi_Mn = mp.first;
            p.Pn = p.phi_Pn = mp.second;
            points.push_back(p);
        }
        curve = InteractionCurve(std::move(points));
    }

    SlendernessResult strip(double lu) const {
        SlendernessInput input;
        input.lu = lu;
        input.t = 200.0;
        input.b = 1000.0;
        input.k = 1.0;
        input.fc = 25.0;
        input.stiffness_factor = 0.35;
        return analyzer.analyze(input);
    }

    double delta(const SlendernessResult& s, double Pu) const {
        return 1.0 / (1.0 - Pu / (0.75 * s.Pc));
    }
};

// =============================================================================
// Without slenderness
// =============================================================================

TEST_CASE("DemandVerifier: demand inside the curve", "[DemandVerifier][basic]") {
    VerifierFixture f;
    DemandVerifier verifier;

    auto result = verifier.verify(f.curve, {DemandPoint(400.0, 100.0, "D1")});

    REQUIRE(result.status == VerificationStatus::Ok);
    REQUIRE(result.is_ok());
    REQUIRE(result.status_string() == "OK");
    REQUIRE_THAT(result.safety_factor(), WithinAbs(1000.0 / 650.0, 1e-9));
    REQUIRE_FALSE(result.slenderness_applied);
    REQUIRE(result.error.is_ok());
}

TEST_CASE("DemandVerifier: demand outside the curve", "[DemandVerifier][basic]") {
    VerifierFixture f;
    DemandVerifier verifier;

    auto result = verifier.verify(f.curve, {DemandPoint(0.0, 300.0, "D2")});

    REQUIRE(result.status == VerificationStatus::NotOk);
    REQUIRE(result.status_string() == "NOT OK");
    REQUIRE_THAT(result.safety_factor(), WithinAbs(250.0 / 300.0, 1e-9));
    REQUIRE_THAT(result.dcr(), WithinAbs(1.2, 1e-9));
    REQUIRE(result.flexure.critical_combo == "D2");
}

TEST_CASE("DemandVerifier: empty demand set", "[DemandVerifier][basic]") {
    VerifierFixture f;
    DemandVerifier verifier;

    auto result = verifier.verify(f.curve, {});

    REQUIRE(result.is_ok());
    REQUIRE(std::isinf(result.safety_factor()));
    REQUIRE(result.flexure.critical_combo == "N/A");
}

TEST_CASE("DemandVerifier: zero demand is OK", "[DemandVerifier][basic]") {
    VerifierFixture f;
    DemandVerifier verifier;

    auto result = verifier.verify(f.curve, {DemandPoint(0.0, 0.0, "ZERO")});

    REQUIRE(result.status == VerificationStatus::Ok);
    REQUIRE(result.status_string() == "OK");
    REQUIRE(std::isinf(result.safety_factor()));
    REQUIRE_THAT(result.dcr(), WithinAbs(0.0, 1e-12));
    REQUIRE(result.flexure.critical_combo == "ZERO");
    REQUIRE_THAT(result.flexure.phi_Mn_at_Pu, WithinAbs(250.0, 1e-9));
    REQUIRE(result.error.is_ok());
}

TEST_CASE("DemandVerifier: flexure warnings are forwarded", "[DemandVerifier][basic]") {
    VerifierFixture f;
    DemandVerifier verifier;

    auto result = verifier.verify(f.curve, {DemandPoint(1200.0, 0.0, "crush"), DemandPoint(-50.0, 20.0, "lift")});

    REQUIRE(result.warnings.contains(WarningCode::EXCEEDS_AXIAL_CAPACITY));
    REQUIRE(result.warnings.contains(WarningCode::NET_TENSION));
    REQUIRE_FALSE(result.is_ok());
}

TEST_CASE("DemandVerifier: unreinforced section warning", "[DemandVerifier][basic]") {
    InteractionCurveBuilder builder;
    RectangularSection section(300.0, 600.0, 40.0);
    auto curve = builder.build(section, Concrete(25.0), ReinforcingSteel(420.0), 0.0);

    DemandVerifier verifier;
    auto result = verifier.verify(curve, {DemandPoint(500.0, 50.0, "C1")});

    REQUIRE(result.warnings.contains(WarningCode::NO_REINFORCEMENT));
}

// =============================================================================
// Moment magnification
// =============================================================================

TEST_CASE("DemandVerifier: short member is verified unmagnified", "[DemandVerifier][magnify]") {
    VerifierFixture f;
    DemandVerifier verifier;
    auto slenderness = f.strip(1000.0);
    REQUIRE_FALSE(slenderness.is_slender);

    std::vector<DemandPoint> demands{DemandPoint(400.0, 100.0, "D1")};
    auto plain = verifier.verify(f.curve, demands);
    auto checked = verifier.verify(f.curve, demands, slenderness);

    REQUIRE_FALSE(checked.slenderness_applied);
    REQUIRE(checked.magnified.empty());
    REQUIRE_THAT(checked.safety_factor(), WithinAbs(plain.safety_factor(), 1e-12));
}

TEST_CASE("DemandVerifier: slender member magnifies the moment", "[DemandVerifier][magnify]") {
    VerifierFixture f;
    DemandVerifier verifier;
    auto slenderness = f.strip(4000.0);
    REQUIRE(slenderness.is_slender);

    auto result = verifier.verify(f.curve, {DemandPoint(400.0, 100.0, "D1")}, slenderness);

    REQUIRE(result.slenderness_applied);
    REQUIRE(result.treatment == SlendernessTreatment::MagnifyDemand);
    REQUIRE(result.magnified.size() == 1);

    const auto& md = result.magnified[0];
    const double delta = f.delta(slenderness, 400.0);
    REQUIRE(md.status == MagnificationStatus::Magnified);
    REQUIRE_THAT(md.delta, WithinRel(delta, 1e-12));
    REQUIRE_THAT(md.M2_min, WithinAbs(8.4, 1e-12));
    REQUIRE_FALSE(md.controls_M2_min);
    REQUIRE_THAT(md.Mc, WithinRel(delta * 100.0, 1e-12));

    CapacityEvaluator evaluator;
    auto expected = evaluator.safety_factor(f.curve, 400.0, delta * 100.0);
    REQUIRE_THAT(result.safety_factor(), WithinRel(expected.safety_factor, 1e-9));
    REQUIRE_THAT(result.flexure.critical_Mu, WithinRel(delta * 100.0, 1e-12));

    REQUIRE(result.status == VerificationStatus::Ok);
    REQUIRE(result.warnings.contains(WarningCode::SLENDER_MEMBER));
    REQUIRE_FALSE(result.warnings.contains(WarningCode::SECOND_ORDER_LIMIT_EXCEEDED));
}

TEST_CASE("DemandVerifier: minimum moment governs small moments", "[DemandVerifier][magnify]") {
    VerifierFixture f;
    DemandVerifier verifier;
    auto slenderness = f.strip(4000.0);

    auto result = verifier.verify(f.curve, {DemandPoint(400.0, 1.0, "D1")}, slenderness);

    const auto& md = result.magnified[0];
    REQUIRE(md.controls_M2_min);
    REQUIRE_THAT(md.Mc, WithinRel(f.delta(slenderness, 400.0) * 8.4, 1e-12));
    REQUIRE(result.warnings.contains(WarningCode::MINIMUM_MOMENT_CONTROLS));
}

TEST_CASE("DemandVerifier: minimum moment can be disabled", "[DemandVerifier][magnify][settings]") {
    VerifierFixture f;
    VerificationSettings settings;
    settings.apply_minimum_moment = false;
    DemandVerifier verifier(settings);
    auto slenderness = f.strip(4000.0);

    auto result = verifier.verify(f.curve, {DemandPoint(400.0, 1.0, "D1")}, slenderness);

    REQUIRE_THAT(result.magnified[0].Mc, WithinRel(f.delta(slenderness, 400.0), 1e-12));
    REQUIRE_FALSE(result.warnings.contains(WarningCode::MINIMUM_MOMENT_CONTROLS));
}

TEST_CASE("DemandVerifier: second-order limit warning", "[DemandVerifier][magnify]") {
    VerifierFixture f;
    DemandVerifier verifier;
    auto slenderness = f.strip(4000.0);
    REQUIRE(f.delta(slenderness, 1000.0) > 1.4);

    auto result = verifier.verify(f.curve, {DemandPoint(1000.0, 50.0, "D1")}, slenderness);

    REQUIRE(result.warnings.contains(WarningCode::SECOND_ORDER_LIMIT_EXCEEDED));
}

TEST_CASE("DemandVerifier: unstable combination", "[DemandVerifier][magnify]") {
    VerifierFixture f;
    DemandVerifier verifier;
    auto slenderness = f.strip(4000.0);
    REQUIRE(3000.0 > 0.75 * slenderness.Pc);

    auto result = verifier.verify(f.curve, {
        DemandPoint(400.0, 100.0, "S"),
        DemandPoint(3000.0, 10.0, "U"),
    }, slenderness);

    REQUIRE(result.status == VerificationStatus::Unstable);
    REQUIRE(result.status_string() == "UNSTABLE");
    REQUIRE_FALSE(result.is_ok());

    REQUIRE(result.unstable_combinations.size() == 1);
    REQUIRE(result.unstable_combinations[0] == "U");
    REQUIRE(result.error.code == ErrorCode::UNSTABLE_MEMBER);
    REQUIRE(result.warnings.contains(WarningCode::UNSTABLE_MAGNIFICATION));

    REQUIRE(result.magnified.size() == 2);
    REQUIRE(result.magnified[1].status == MagnificationStatus::Unstable);
    REQUIRE(std::isinf(result.magnified[1].Mc));

    // Only the stable combination is evaluated
    REQUIRE(result.flexure.combos.size() == 1);
    REQUIRE(result.flexure.combos[0].label == "S");
    REQUIRE(std::isfinite(result.safety_factor()));
    REQUIRE(result.flexure.critical_combo == "S");
}

TEST_CASE("DemandVerifier: slenderness rejection", "[DemandVerifier][reject]") {
    VerifierFixture f;
    DemandVerifier verifier;
    auto slenderness = f.strip(6000.0);
    REQUIRE(slenderness.reduction.rejected);

    auto result = verifier.verify(f.curve, {DemandPoint(100.0, 10.0, "D1")}, slenderness);

    REQUIRE(result.status == VerificationStatus::SlendernessRejected);
    REQUIRE(result.status_string() == "SLENDERNESS REJECTED");
    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.error.code == ErrorCode::SLENDERNESS_LIMIT_EXCEEDED);
    REQUIRE_THAT(result.capacity_reduction, WithinAbs(0.0, 1e-12));
    REQUIRE(result.flexure.combos.size() == 1);

    // Informational SF against the unreduced curve passes, the status does not
    REQUIRE(result.safety_factor() > 1.0);
    REQUIRE_FALSE(result.flexure.ok == result.is_ok());
}

// =============================================================================
// Capacity reduction
// =============================================================================

TEST_CASE("DemandVerifier: reduced compression capacity", "[DemandVerifier][reduce]") {
    VerifierFixture f;
    VerificationSettings settings;
    settings.slenderness_treatment = SlendernessTreatment::ReduceCapacity;
    DemandVerifier verifier(settings);
    auto slenderness = f.strip(4000.0);

    std::vector<DemandPoint> demands{DemandPoint(700.0, 0.0, "D1")};
    auto plain = verifier.verify(f.curve, demands);
    auto reduced = verifier.verify(f.curve, demands, slenderness);

    REQUIRE(plain.is_ok());
    REQUIRE_THAT(plain.safety_factor(), WithinAbs(1000.0 / 700.0, 1e-9));

    REQUIRE(reduced.slenderness_applied);
    REQUIRE(reduced.treatment == SlendernessTreatment::ReduceCapacity);
    REQUIRE_THAT(reduced.capacity_reduction, WithinAbs(0.609375, 1e-12));
    REQUIRE_THAT(reduced.flexure.phi_Pn_max, WithinAbs(609.375, 1e-9));
    REQUIRE_THAT(reduced.safety_factor(), WithinAbs(609.375 / 700.0, 1e-9));
    REQUIRE(reduced.status == VerificationStatus::NotOk);
    REQUIRE(reduced.magnified.empty());
}

TEST_CASE("DemandVerifier: reduction leaves tension capacity", "[DemandVerifier][reduce]") {
    VerifierFixture f;
    VerificationSettings settings;
    settings.slenderness_treatment = SlendernessTreatment::ReduceCapacity;
    DemandVerifier verifier(settings);

    auto result = verifier.verify(f.curve, {DemandPoint(-150.0, 0.0, "T")}, f.strip(4000.0));

    REQUIRE_THAT(result.flexure.phi_Pt_min, WithinAbs(-300.0, 1e-12));
    REQUIRE_THAT(result.safety_factor(), WithinAbs(2.0, 1e-9));
}

TEST_CASE("DemandVerifier: no reduction up to lambda 25", "[DemandVerifier][reduce]") {
    VerifierFixture f;
    VerificationSettings settings;
    settings.slenderness_treatment = SlendernessTreatment::ReduceCapacity;
    DemandVerifier verifier(settings);
    auto slenderness = f.strip(1400.0);
    REQUIRE(slenderness.is_slender);

    auto result = verifier.verify(f.curve, {DemandPoint(700.0, 0.0, "D1")}, slenderness);

    REQUIRE_FALSE(result.slenderness_applied);
    REQUIRE_THAT(result.capacity_reduction, WithinAbs(1.0, 1e-12));
    REQUIRE(result.is_ok());
}

// =============================================================================
// End to end
// =============================================================================

TEST_CASE("DemandVerifier: wall pier from combination forces", "[DemandVerifier][integration]") {
    InteractionCurveBuilder builder;
    RectangularSection section(200.0, 3000.0, 30.0);
    auto curve = builder.build(section, Concrete(25.0), ReinforcingSteel(420.0),
                               std::vector<SteelLayer>{SteelLayer(30.0, 1500.0), SteelLayer(2970.0, 1500.0)});

    CombinationForces gravity;
    gravity.name = "1.2D+1.6L";
    gravity.location = "Bottom";
    gravity.P = -2000.0;
    gravity.M3 = 500.0;

    CombinationForces overturning;
    overturning.name = "0.9D+E";
    overturning.location = "Bottom";
    overturning.P = 300.0;
    overturning.M3 = -200.0;

    auto demands = extract_demands({gravity, overturning}, MomentAxis::M3);
    DemandVerifier verifier;
    auto result = verifier.verify(curve, demands);

    REQUIRE(result.is_ok());
    REQUIRE(result.safety_factor() > 1.0);
    REQUIRE(result.flexure.combos.size() == 2);
    REQUIRE(result.flexure.combos[0].label == "1.2D+1.6L (Bottom)");
    REQUIRE(result.flexure.has_tension);
}
