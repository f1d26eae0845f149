#pragma once

#include "rcflex/capacity_evaluator.hpp"
#include "rcflex/demand.hpp"
#include "rcflex/errors.hpp"
#include "rcflex/interaction_curve.hpp"
#include "rcflex/slenderness.hpp"
#include "rcflex/warnings.hpp"
#include <string>
#include <vector>

namespace rcflex {

/**
 * @brief Overall outcome of a member verification
 */
enum class VerificationStatus {
    Ok,                   ///< Governing SF ≥ 1.0
    NotOk,                ///< Governing SF < 1.0
    Unstable,             ///< At least one combination reaches 0.75·Pc
    SlendernessRejected   ///< lambda above the admitted maximum
};

std::string verification_status_to_string(VerificationStatus status);

/**
 * @brief How slenderness effects enter the verification
 */
enum class SlendernessTreatment {
    MagnifyDemand,    ///< Mc = delta_ns·max(Mu, M2,min) per combination
    ReduceCapacity    ///< Compression side of the curve scaled by the buckling factor
};

/**
 * @brief Settings for member verification
 */
struct VerificationSettings {
    /// Slenderness effect applied when a SlendernessResult is supplied
    SlendernessTreatment slenderness_treatment = SlendernessTreatment::MagnifyDemand;

    /// Use max(Mu, M2,min) before magnification
    bool apply_minimum_moment = true;

    /// Warn when the magnified moment exceeds the second-order limit
    bool check_second_order_limit = true;
};

/**
 * @brief Demand of one combination after slenderness effects
 */
struct MagnifiedDemand {
    std::string label;
    double Pu = 0.0;              ///< [kN]
    double Mu = 0.0;              ///< First-order moment [kN·m]
    double M2_min = 0.0;          ///< [kN·m]
    double delta = 1.0;
    double Mc = 0.0;              ///< Design moment [kN·m]
    bool controls_M2_min = false;
    MagnificationStatus status = MagnificationStatus::NotRequired;
};

/**
 * @brief Result of verifying all demand points of a member
 */
struct VerificationResult {
    VerificationStatus status = VerificationStatus::Ok;

    /// Governing and per-combination flexure results (stable combinations only)
    FlexureCheck flexure;

    bool slenderness_applied = false;
    SlendernessTreatment treatment = SlendernessTreatment::MagnifyDemand;

    /// Multiplier applied to the compression side of the curve
    double capacity_reduction = 1.0;

    /// Per-combination demands after magnification (MagnifyDemand only)
    std::vector<MagnifiedDemand> magnified;

    /// Combinations with Pu ≥ 0.75·Pc
    std::vector<std::string> unstable_combinations;

    /// All warnings raised during verification
    WarningList warnings;

    /// Hard failure details (OK unless Unstable or SlendernessRejected)
    RcflexError error;

    bool is_ok() const { return status == VerificationStatus::Ok; }

    /**
     * @brief Governing safety factor of the evaluated combinations
     *
     * Only a design result when status is Ok or NotOk. For Unstable it
     * covers the stable combinations alone, and for SlendernessRejected it
     * is taken against the unreduced curve; read status and error first.
     */
    double safety_factor() const { return flexure.safety_factor; }

    /// Demand/capacity ratio of the governing combination (same caveat as safety_factor())
    double dcr() const { return flexure.dcr(); }

    std::string status_string() const { return verification_status_to_string(status); }
};

/**
 * @brief Verifies demand points of a member against its interaction curve
 *
 * Without slenderness data the demands are evaluated directly. With a
 * SlendernessResult the demands are magnified, or the curve reduced,
 * before evaluation. Instability and slenderness rejection are reported
 * as statuses; they never appear as a finite safety factor.
 *
 * Usage:
 *   DemandVerifier verifier;
 *   auto result = verifier.verify(curve, demands, slenderness);
 *   if (!result.is_ok()) { ... }
 */
class DemandVerifier {
public:
    explicit DemandVerifier(VerificationSettings settings = {},
                            CapacityEvaluatorSettings evaluator_settings = {},
                            SlendernessSettings slenderness_settings = {});

    const VerificationSettings& settings() const { return settings_; }

    const CapacityEvaluator& evaluator() const { return evaluator_; }

    /// Verify without slenderness effects
    VerificationResult verify(const InteractionCurve& curve,
                              const std::vector<DemandPoint>& demands) const;

    /// Verify with slenderness effects
    VerificationResult verify(const InteractionCurve& curve,
                              const std::vector<DemandPoint>& demands,
                              const SlendernessResult& slenderness) const;

private:
    VerificationSettings settings_;
    CapacityEvaluator evaluator_;
    SlendernessAnalyzer analyzer_;

    void finish(VerificationResult& result, const InteractionCurve& curve) const;
};

} // namespace rcflex
