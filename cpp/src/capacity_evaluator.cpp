#include "rcflex/capacity_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rcflex {

std::string ray_cast_tier_to_string(RayCastTier tier) {
    switch (tier) {
        case RayCastTier::ZeroDemand: return "ZeroDemand";
        case RayCastTier::Intersection: return "Intersection";
        case RayCastTier::AngularNearest: return "AngularNearest";
        case RayCastTier::PointInPolygon: return "PointInPolygon";
        default: return "Unknown";
    }
}

double FlexureCheck::dcr() const {
    if (std::isinf(safety_factor)) return 0.0;
    if (safety_factor <= 0.0) return std::numeric_limits<double>::infinity();
    return 1.0 / safety_factor;
}

CapacityEvaluator::CapacityEvaluator(CapacityEvaluatorSettings settings)
    : settings_(std::move(settings)) {}

bool CapacityEvaluator::intersect(const std::vector<Eigen::Vector2d>& curve,
                                  const Eigen::Vector2d& direction,
                                  double& best_t) const {
    bool found = false;

    for (size_t i = 0; i + 1 < curve.size(); ++i) {
        const Eigen::Vector2d& p1 = curve[i];
        const Eigen::Vector2d edge = curve[i + 1] - p1;

        // t·direction = p1 + s·edge
        Eigen::Matrix2d A;
        A << direction(0), -edge(0),
             direction(1), -edge(1);

        double det = A.determinant();
        if (std::abs(det) < settings_.parallel_tolerance) {
            continue;
        }

        Eigen::Vector2d ts = A.inverse() * p1;
        double t = ts(0);
        double s = ts(1);

        if (t > 0.0 &&
            s >= -settings_.segment_tolerance &&
            s <= 1.0 + settings_.segment_tolerance) {
            if (!found || t < best_t) {
                best_t = t;
                found = true;
            }
        }
    }

    return found;
}

bool CapacityEvaluator::nearest_by_angle(const std::vector<Eigen::Vector2d>& curve,
                                         double demand_angle,
                                         double& distance,
                                         double& offset_deg) const {
    bool found = false;
    double best_offset = settings_.angular_tolerance_deg;

    for (const auto& point : curve) {
        double r = point.norm();
        if (r < settings_.zero_tolerance) {
            continue;
        }

        double diff = std::atan2(point(1), point(0)) - demand_angle;
        // Wrap into [-π, π]
        diff = std::atan2(std::sin(diff), std::cos(diff));
        double offset = std::abs(diff) * 180.0 / M_PI;

        if (offset <= best_offset) {
            best_offset = offset;
            distance = r;
            found = true;
        }
    }

    offset_deg = best_offset;
    return found;
}

bool CapacityEvaluator::point_in_polygon(double M, double P,
                                         const std::vector<Eigen::Vector2d>& polygon) const {
    bool inside = false;
    const size_t n = polygon.size();
    if (n < 3) {
        return false;
    }

    size_t j = n - 1;
    for (size_t i = 0; i < n; ++i) {
        const double Mi = polygon[i](0), Pi = polygon[i](1);
        const double Mj = polygon[j](0), Pj = polygon[j](1);

        if ((Pi > P) != (Pj > P)) {
            double M_cross = (Mj - Mi) * (P - Pi) / (Pj - Pi) + Mi;
            if (M < M_cross) {
                inside = !inside;
            }
        }
        j = i;
    }

    return inside;
}

RayCastResult CapacityEvaluator::safety_factor(const std::vector<Eigen::Vector2d>& curve,
                                               double Pu, double Mu) const {
    RayCastResult result;

    const Eigen::Vector2d demand(std::abs(Mu), Pu);
    const double d_demand = demand.norm();

    if (d_demand < settings_.zero_tolerance) {
        return result;
    }

    const Eigen::Vector2d direction = demand / d_demand;

    double t = 0.0;
    if (intersect(curve, direction, t)) {
        result.tier = RayCastTier::Intersection;
        result.capacity_distance = t;
        result.safety_factor = t / d_demand;
        result.inside = result.safety_factor >= settings_.inside_threshold;
        return result;
    }

    // Tier 1: nearest curve point by angle
    double distance = 0.0;
    double offset_deg = 0.0;
    if (nearest_by_angle(curve, std::atan2(demand(1), demand(0)), distance, offset_deg)) {
        result.tier = RayCastTier::AngularNearest;
        result.capacity_distance = distance;
        result.safety_factor = distance / d_demand;
        result.inside = result.safety_factor >= settings_.inside_threshold;
        return result;
    }

    // Tier 2: inside/outside only
    result.tier = RayCastTier::PointInPolygon;
    result.capacity_distance = 0.0;
    result.inside = point_in_polygon(demand(0), demand(1), curve);
    result.safety_factor = result.inside ? settings_.ample_safety_factor
                                         : settings_.insufficient_safety_factor;
    return result;
}

RayCastResult CapacityEvaluator::safety_factor(const InteractionCurve& curve,
                                               double Pu, double Mu) const {
    return safety_factor(curve.design_curve(), Pu, Mu);
}

double CapacityEvaluator::phi_Mn_at_P(const InteractionCurve& curve, double Pu) const {
    if (curve.empty()) {
        return 0.0;
    }

    const CapacityPoint* above = nullptr;   // smallest phi·Pn ≥ Pu
    const CapacityPoint* below = nullptr;   // largest phi·Pn ≤ Pu
    const CapacityPoint* closest = nullptr;

    for (const auto& p : curve.points()) {
        if (p.phi_Pn >= Pu && (!above || p.phi_Pn < above->phi_Pn)) {
            above = &p;
        }
        if (p.phi_Pn <= Pu && (!below || p.phi_Pn > below->phi_Pn)) {
            below = &p;
        }
        if (!closest || std::abs(p.phi_Pn - Pu) < std::abs(closest->phi_Pn - Pu)) {
            closest = &p;
        }
    }

    if (!above || !below) {
        return closest->phi_Mn;
    }

    const double M1 = below->phi_Mn, P1 = below->phi_Pn;
    const double M2 = above->phi_Mn, P2 = above->phi_Pn;

    if (std::abs(P2 - P1) < settings_.zero_tolerance) {
        return M1;
    }

    double phi_Mn = M1 + (M2 - M1) * (Pu - P1) / (P2 - P1);
    return std::max(0.0, phi_Mn);
}

double CapacityEvaluator::phi_Mn_at_P0(const InteractionCurve& curve) const {
    return phi_Mn_at_P(curve, 0.0);
}

FlexureCheck CapacityEvaluator::check_flexure(const InteractionCurve& curve,
                                              const std::vector<DemandPoint>& demands) const {
    FlexureCheck check;
    const auto design = curve.design_curve();

    check.combos.reserve(demands.size());
    for (const auto& demand : demands) {
        RayCastResult rc = safety_factor(design, demand.Pu, demand.Mu);

        ComboResult combo;
        combo.label = demand.label;
        combo.Pu = demand.Pu;
        combo.Mu = std::abs(demand.Mu);
        combo.safety_factor = rc.safety_factor;
        if (std::isinf(rc.safety_factor)) {
            combo.dcr = 0.0;
        } else if (rc.safety_factor <= 0.0) {
            combo.dcr = std::numeric_limits<double>::infinity();
        } else {
            combo.dcr = 1.0 / rc.safety_factor;
        }
        combo.phi_Mn_at_Pu = phi_Mn_at_P(curve, demand.Pu);
        combo.is_tension = demand.Pu < 0.0;
        combo.inside = rc.inside;
        combo.tier = rc.tier;

        if (combo.is_tension) {
            ++check.tension_combos;
        }

        if (rc.tier == RayCastTier::AngularNearest) {
            ++check.angular_fallbacks;
            double angle = std::atan2(demand.Pu, std::abs(demand.Mu)) * 180.0 / M_PI;
            check.warnings.add(RcflexWarning::ray_fallback_angular(demand.label, angle));
        } else if (rc.tier == RayCastTier::PointInPolygon) {
            ++check.polygon_fallbacks;
            check.warnings.add(RcflexWarning::ray_fallback_polygon(
                demand.label, rc.inside, rc.safety_factor));
        }

        // The first combination governs until a smaller SF is found, so a set
        // of zero demands still names a critical combination.
        if (check.combos.empty() || rc.safety_factor < check.safety_factor) {
            check.safety_factor = rc.safety_factor;
            check.critical_combo = demand.label;
            check.critical_Pu = demand.Pu;
            check.critical_Mu = std::abs(demand.Mu);
        }

        check.combos.push_back(std::move(combo));
    }

    check.ok = check.safety_factor >= 1.0;
    check.has_tension = check.tension_combos > 0;

    check.phi_Mn_0 = phi_Mn_at_P0(curve);
    check.phi_Mn_at_Pu = phi_Mn_at_P(curve, check.critical_Pu);
    check.phi_Pn_max = curve.phi_Pn_max();
    check.phi_Pt_min = curve.phi_Pt_min();

    const double tol = settings_.axial_capacity_tolerance;
    check.exceeds_axial_capacity = check.critical_Pu > check.phi_Pn_max * tol;
    check.exceeds_tension_capacity = check.critical_Pu < check.phi_Pt_min * tol;

    if (check.exceeds_axial_capacity) {
        check.warnings.add(RcflexWarning::exceeds_axial_capacity(
            check.critical_combo, check.critical_Pu, check.phi_Pn_max));
    }
    if (check.exceeds_tension_capacity) {
        check.warnings.add(RcflexWarning::exceeds_tension_capacity(
            check.critical_combo, check.critical_Pu, check.phi_Pt_min));
    }
    if (check.has_tension) {
        check.warnings.add(RcflexWarning::net_tension(check.tension_combos));
    }

    return check;
}

} // namespace rcflex
