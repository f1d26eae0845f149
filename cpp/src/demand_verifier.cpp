#include "rcflex/demand_verifier.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace rcflex {

std::string verification_status_to_string(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::Ok: return "OK";
        case VerificationStatus::NotOk: return "NOT OK";
        case VerificationStatus::Unstable: return "UNSTABLE";
        case VerificationStatus::SlendernessRejected: return "SLENDERNESS REJECTED";
        default: return "UNKNOWN";
    }
}

DemandVerifier::DemandVerifier(VerificationSettings settings,
                               CapacityEvaluatorSettings evaluator_settings,
                               SlendernessSettings slenderness_settings)
    : settings_(std::move(settings)),
      evaluator_(std::move(evaluator_settings)),
      analyzer_(std::move(slenderness_settings)) {}

void DemandVerifier::finish(VerificationResult& result, const InteractionCurve& curve) const {
    for (const auto& w : result.flexure.warnings.warnings) {
        result.warnings.add(w);
    }
    if (!curve.empty() && curve.phi_Pt_min() == 0.0) {
        result.warnings.add(RcflexWarning::no_reinforcement());
    }

    if (result.status == VerificationStatus::Ok && !result.flexure.ok) {
        result.status = VerificationStatus::NotOk;
    }
}

VerificationResult DemandVerifier::verify(const InteractionCurve& curve,
                                          const std::vector<DemandPoint>& demands) const {
    VerificationResult result;
    result.flexure = evaluator_.check_flexure(curve, demands);
    finish(result, curve);
    return result;
}

VerificationResult DemandVerifier::verify(const InteractionCurve& curve,
                                          const std::vector<DemandPoint>& demands,
                                          const SlendernessResult& slenderness) const {
    VerificationResult result;
    result.treatment = settings_.slenderness_treatment;

    if (slenderness.is_slender) {
        result.warnings.add(RcflexWarning::slender_member(
            slenderness.lambda_ratio, slenderness.lambda_limit));
    }

    // Rejection overrides any computed capacity
    if (slenderness.reduction.rejected) {
        result.status = VerificationStatus::SlendernessRejected;
        result.error = RcflexError::slenderness_exceeded(
            slenderness.lambda_ratio, analyzer_.settings().lambda_max);
        result.capacity_reduction = 0.0;
        result.flexure = evaluator_.check_flexure(curve, demands);
        finish(result, curve);
        return result;
    }

    if (settings_.slenderness_treatment == SlendernessTreatment::ReduceCapacity) {
        result.capacity_reduction = slenderness.reduction.factor;
        if (slenderness.buckling_ratio >= 1.0) {
            result.warnings.add(RcflexWarning::empirical_method_inapplicable(slenderness.buckling_ratio));
        }
        if (slenderness.is_slender && result.capacity_reduction < 1.0) {
            result.slenderness_applied = true;
            InteractionCurve reduced = curve.with_compression_reduction(result.capacity_reduction);
            result.flexure = evaluator_.check_flexure(reduced, demands);
            finish(result, reduced);
            return result;
        }
        result.flexure = evaluator_.check_flexure(curve, demands);
        finish(result, curve);
        return result;
    }

    // Moment magnification
    if (!slenderness.is_slender) {
        result.flexure = evaluator_.check_flexure(curve, demands);
        finish(result, curve);
        return result;
    }

    result.slenderness_applied = true;
    std::vector<DemandPoint> stable;
    stable.reserve(demands.size());
    result.magnified.reserve(demands.size());

    for (const auto& demand : demands) {
        Magnification mag = analyzer_.magnification(slenderness, demand.Pu);

        MagnifiedDemand md;
        md.label = demand.label;
        md.Pu = demand.Pu;
        md.Mu = std::abs(demand.Mu);
        md.delta = mag.delta;
        md.status = mag.status;

        if (mag.is_unstable()) {
            md.Mc = std::numeric_limits<double>::infinity();
            result.magnified.push_back(md);
            result.unstable_combinations.push_back(demand.label);
            result.warnings.add(RcflexWarning::unstable_magnification(
                demand.label, demand.Pu, slenderness.Pc));
            if (result.error.is_ok()) {
                result.error = RcflexError::unstable(demand.label, demand.Pu, slenderness.Pc);
            }
            continue;
        }

        double first_order = md.Mu;
        if (settings_.apply_minimum_moment && demand.Pu > 0.0) {
            DesignMoment dm = analyzer_.design_moment(demand.Mu, demand.Pu, slenderness.t, mag.delta);
            md.M2_min = dm.M2_min;
            md.controls_M2_min = dm.controls_M2_min;
            md.Mc = dm.Mc;
            first_order = dm.M2_design;
            if (dm.controls_M2_min) {
                result.warnings.add(RcflexWarning::minimum_moment_controls(
                    demand.label, md.Mu, dm.M2_min));
            }
        } else {
            md.Mc = mag.delta * md.Mu;
        }

        if (settings_.check_second_order_limit && first_order > 0.0) {
            SecondOrderCheck so = analyzer_.second_order_check(first_order, md.Mc);
            if (!so.ok) {
                result.warnings.add(RcflexWarning::second_order_limit_exceeded(demand.label, so.ratio));
            }
        }

        stable.emplace_back(demand.Pu, md.Mc, demand.label);
        result.magnified.push_back(std::move(md));
    }

    result.flexure = evaluator_.check_flexure(curve, stable);
    if (!result.unstable_combinations.empty()) {
        result.status = VerificationStatus::Unstable;
    }
    finish(result, curve);
    return result;
}

} // namespace rcflex
