#include "rcflex/slenderness.hpp"
#include "rcflex/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace rcflex {

namespace {

void require_positive_length(const std::string& name, double value) {
    if (!(value > 0.0)) {
        RcflexError err(ErrorCode::INVALID_MEMBER_LENGTH,
            "Member parameter '" + name + "' must be positive");
        err.details[name] = std::to_string(value);
        err.suggestion = "Check the unsupported length and effective length factor";
        throw InputError(err);
    }
}

} // namespace

std::string magnification_status_to_string(MagnificationStatus status) {
    switch (status) {
        case MagnificationStatus::NotRequired: return "NotRequired";
        case MagnificationStatus::Magnified: return "Magnified";
        case MagnificationStatus::Unstable: return "Unstable";
        default: return "Unknown";
    }
}

SlendernessAnalyzer::SlendernessAnalyzer(SlendernessSettings settings)
    : settings_(std::move(settings)) {}

EffectiveStiffness SlendernessAnalyzer::effective_stiffness(double fc, double b, double t, double factor) {
    EffectiveStiffness s;
    s.Ec = Concrete::compute_Ec(fc);
    s.Ig = b * t * t * t / 12.0;
    s.factor = factor;
    s.EI_eff = factor * s.Ec * s.Ig;
    return s;
}

SlendernessResult SlendernessAnalyzer::analyze(const SlendernessInput& input) const {
    require_positive_length("lu", input.lu);
    require_positive_length("k", input.k);
    if (!(input.t > 0.0)) {
        throw InputError(RcflexError::invalid_geometry("t", input.t));
    }
    if (!(input.b > 0.0)) {
        throw InputError(RcflexError::invalid_geometry("b", input.b));
    }
    if (!(input.fc > 0.0)) {
        throw InputError(RcflexError::invalid_material("fc", input.fc));
    }
    if (!(input.stiffness_factor > 0.0) || input.stiffness_factor > 1.0) {
        RcflexError err(ErrorCode::INVALID_STIFFNESS_FACTOR,
            "Stiffness factor must lie in (0, 1]");
        err.details["stiffness_factor"] = std::to_string(input.stiffness_factor);
        throw InputError(err);
    }

    SlendernessResult result;
    result.lu = input.lu;
    result.t = input.t;
    result.b = input.b;
    result.k = input.k;
    result.Cm = input.Cm;

    result.r = input.t / std::sqrt(12.0);
    result.lambda_ratio = input.k * input.lu / result.r;
    result.lambda_limit = input.braced ? settings_.lambda_limit_braced
                                       : settings_.lambda_limit_unbraced;
    result.is_slender = result.lambda_ratio > result.lambda_limit;

    // Euler load
    result.stiffness = effective_stiffness(input.fc, input.b, input.t, input.stiffness_factor);
    const double le = input.k * input.lu;
    result.Pc = M_PI * M_PI * result.stiffness.EI_eff / (le * le) / 1000.0;

    // Empirical buckling reduction
    result.buckling_ratio = le / (settings_.buckling_divisor * input.t);
    if (result.buckling_ratio >= 1.0) {
        result.buckling_factor = 0.0;
    } else {
        result.buckling_factor = 1.0 - result.buckling_ratio * result.buckling_ratio;
    }

    Magnification mag = magnification(result, input.Pu);
    result.delta_ns = mag.delta;
    result.status = mag.status;

    result.reduction = capacity_reduction(result);
    return result;
}

SlendernessResult SlendernessAnalyzer::analyze(const RectangularSection& section,
                                               const Concrete& concrete,
                                               double lu,
                                               const BehaviorProfile& profile,
                                               bool braced) const {
    SlendernessInput input;
    input.lu = lu;
    input.t = section.min_dimension();
    input.b = section.b < section.h ? section.h : section.b;
    input.k = profile.default_k;
    input.fc = concrete.fc;
    input.stiffness_factor = profile.stiffness_factor;
    input.braced = braced;
    return analyze(input);
}

Magnification SlendernessAnalyzer::magnification(const SlendernessResult& result, double Pu) const {
    Magnification mag;
    if (!result.is_slender || Pu <= 0.0 || result.Pc <= 0.0) {
        return mag;
    }

    const double denominator = 1.0 - Pu / (settings_.Pc_fraction * result.Pc);
    if (denominator <= 0.0) {
        mag.delta = std::numeric_limits<double>::infinity();
        mag.status = MagnificationStatus::Unstable;
        return mag;
    }

    mag.delta = std::max(result.Cm / denominator, 1.0);
    mag.status = MagnificationStatus::Magnified;
    return mag;
}

CapacityReduction SlendernessAnalyzer::capacity_reduction(const SlendernessResult& result) const {
    CapacityReduction reduction;
    if (result.lambda_ratio <= settings_.lambda_no_reduction) {
        return reduction;
    }
    if (result.lambda_ratio > settings_.lambda_max) {
        reduction.factor = 0.0;
        reduction.rejected = true;
        return reduction;
    }
    reduction.factor = std::max(result.buckling_factor, 0.0);
    return reduction;
}

CmResult SlendernessAnalyzer::Cm(double M1, double M2, bool has_transverse_loads) const {
    CmResult cm;
    cm.M1 = M1;
    cm.M2 = M2;

    if (has_transverse_loads) {
        cm.Cm = settings_.Cm_transverse;
        cm.curvature = Curvature::TransverseLoads;
        return cm;
    }

    // M2 is the larger end moment by magnitude
    if (std::abs(M1) > std::abs(M2)) {
        std::swap(cm.M1, cm.M2);
    }

    if (std::abs(cm.M2) < 1e-10) {
        cm.Cm = settings_.Cm_transverse;
        cm.curvature = Curvature::NegligibleMoment;
        return cm;
    }

    cm.ratio = cm.M1 / cm.M2;
    cm.Cm = std::max(settings_.Cm_base - settings_.Cm_factor * cm.ratio, settings_.Cm_min);

    if (cm.ratio > 0.0) {
        cm.curvature = Curvature::Double;
    } else if (cm.ratio < 0.0) {
        cm.curvature = Curvature::Single;
    } else {
        cm.curvature = Curvature::ZeroM1;
    }
    return cm;
}

double SlendernessAnalyzer::e_min(double h) const {
    return settings_.e_min_base + settings_.e_min_factor * h;
}

double SlendernessAnalyzer::M2_min(double Pu, double h) const {
    return std::abs(Pu) * e_min(h) / 1000.0;
}

DesignMoment SlendernessAnalyzer::design_moment(double M2, double Pu, double h, double delta) const {
    DesignMoment dm;
    dm.M2 = std::abs(M2);
    dm.e_min = e_min(h);
    dm.M2_min = M2_min(Pu, h);
    dm.M2_design = std::max(dm.M2, dm.M2_min);
    dm.controls_M2_min = dm.M2_min > dm.M2;
    dm.delta = delta;
    dm.Mc = std::isinf(delta) ? delta : delta * dm.M2_design;
    return dm;
}

SecondOrderCheck SlendernessAnalyzer::second_order_check(double Mu_first_order,
                                                         double Mu_second_order) const {
    SecondOrderCheck check;
    check.limit = settings_.second_order_limit;

    const double Mu1 = std::abs(Mu_first_order);
    const double Mu2 = std::abs(Mu_second_order);

    if (Mu1 == 0.0) {
        check.ratio = Mu2 == 0.0 ? 1.0 : std::numeric_limits<double>::infinity();
    } else {
        check.ratio = Mu2 / Mu1;
    }
    check.ok = check.ratio <= check.limit;
    return check;
}

} // namespace rcflex
