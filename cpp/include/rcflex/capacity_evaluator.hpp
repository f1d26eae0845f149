#pragma once

#include "rcflex/demand.hpp"
#include "rcflex/interaction_curve.hpp"
#include "rcflex/warnings.hpp"
#include <Eigen/Dense>
#include <limits>
#include <string>
#include <vector>

namespace rcflex {

/**
 * @brief Method that produced a safety factor
 */
enum class RayCastTier {
    ZeroDemand,      ///< Demand at the origin, SF = +inf
    Intersection,    ///< Exact ray/segment intersection
    AngularNearest,  ///< Nearest curve point by angle (reduced precision)
    PointInPolygon   ///< Inside/outside test with placeholder SF
};

std::string ray_cast_tier_to_string(RayCastTier tier);

/**
 * @brief Settings for safety factor evaluation
 */
struct CapacityEvaluatorSettings {
    /// Demand magnitude below which the demand is treated as zero
    double zero_tolerance = 1e-6;

    /// |det| below which a segment is treated as parallel to the ray
    double parallel_tolerance = 1e-10;

    /// Slack on the segment parameter s ∈ [0, 1]
    double segment_tolerance = 0.001;

    /// SF at or above which the demand counts as inside the curve
    double inside_threshold = 0.999;

    /// Largest angular offset accepted by the nearest-by-angle fallback [deg]
    double angular_tolerance_deg = 15.0;

    /// Placeholder SF reported when the polygon test finds the demand inside
    double ample_safety_factor = 1.5;

    /// Placeholder SF reported when the polygon test finds the demand outside
    double insufficient_safety_factor = 0.5;

    /// Relative slack on the axial capacity checks
    double axial_capacity_tolerance = 1.001;
};

/**
 * @brief Safety factor of one demand against a capacity curve
 */
struct RayCastResult {
    /// Capacity distance / demand distance along the demand ray
    double safety_factor = std::numeric_limits<double>::infinity();

    /// Demand lies inside (or on) the capacity curve
    bool inside = true;

    /// Method that produced the safety factor
    RayCastTier tier = RayCastTier::ZeroDemand;

    /// Distance from the origin to the capacity boundary along the ray
    /// (0 for the polygon tier, +inf for zero demand)
    double capacity_distance = std::numeric_limits<double>::infinity();
};

/**
 * @brief Per-combination verification result
 */
struct ComboResult {
    std::string label;
    double Pu = 0.0;                ///< Axial demand [kN]
    double Mu = 0.0;                ///< Moment demand [kN·m]
    double safety_factor = 0.0;
    double dcr = 0.0;               ///< Demand/capacity ratio 1/SF
    double phi_Mn_at_Pu = 0.0;      ///< Moment capacity at this Pu [kN·m]
    bool is_tension = false;        ///< Pu < 0
    bool inside = true;
    RayCastTier tier = RayCastTier::Intersection;
};

/**
 * @brief Flexure check over a set of demand points
 */
struct FlexureCheck {
    double safety_factor = std::numeric_limits<double>::infinity();
    bool ok = true;                         ///< safety_factor ≥ 1.0

    std::string critical_combo = "N/A";     ///< Label of the governing combination ("N/A" without demands)
    double critical_Pu = 0.0;               ///< [kN]
    double critical_Mu = 0.0;               ///< [kN·m]

    double phi_Mn_0 = 0.0;                  ///< Moment capacity at P = 0 [kN·m]
    double phi_Mn_at_Pu = 0.0;              ///< Moment capacity at critical Pu [kN·m]
    double phi_Pn_max = 0.0;                ///< [kN]
    double phi_Pt_min = 0.0;                ///< [kN]

    bool exceeds_axial_capacity = false;
    bool exceeds_tension_capacity = false;
    bool has_tension = false;
    int tension_combos = 0;

    int angular_fallbacks = 0;              ///< Results from RayCastTier::AngularNearest
    int polygon_fallbacks = 0;              ///< Results from RayCastTier::PointInPolygon

    std::vector<ComboResult> combos;        ///< In demand order
    WarningList warnings;

    /// Demand/capacity ratio of the governing combination
    double dcr() const;

    std::string status() const { return ok ? "OK" : "NOT OK"; }
};

/**
 * @brief Ray-casting evaluator of demands against a P-M curve
 *
 * The safety factor of a demand (Pu, Mu) is the ratio between the distance
 * from the origin to the curve and the distance to the demand, measured
 * along the ray through the demand in (M, P) space. Mu is taken by
 * magnitude. When no segment is hit the evaluator falls back first to the
 * nearest curve point by angle, then to a point-in-polygon test with
 * placeholder factors; the tier is reported in every result.
 *
 * Evaluation never throws: degenerate inputs resolve to a fallback tier.
 */
class CapacityEvaluator {
public:
    explicit CapacityEvaluator(CapacityEvaluatorSettings settings = {});

    const CapacityEvaluatorSettings& settings() const { return settings_; }

    /**
     * @brief Safety factor against a curve given as (M, P) pairs
     *
     * @param curve Ordered capacity boundary (phi·Mn, phi·Pn) [kN·m, kN]
     * @param Pu Axial demand, + compression [kN]
     * @param Mu Moment demand [kN·m]
     */
    RayCastResult safety_factor(const std::vector<Eigen::Vector2d>& curve,
                                double Pu, double Mu) const;

    /// Safety factor against the design curve of an interaction diagram
    RayCastResult safety_factor(const InteractionCurve& curve, double Pu, double Mu) const;

    /**
     * @brief Crossing-number point-in-polygon test
     *
     * The polygon is closed implicitly between the last and first vertex.
     */
    bool point_in_polygon(double M, double P, const std::vector<Eigen::Vector2d>& polygon) const;

    /**
     * @brief Moment capacity at a given axial load
     *
     * Interpolates between the closest curve points above and below Pu.
     * Outside the curve range the moment of the point with the closest
     * phi·Pn is returned. Returns 0 for an empty curve.
     *
     * Among points tied on phi·Pn the first in curve order is taken. On the
     * 0.80·P0 plateau that is the M = 0 apex, so just below the plateau the
     * result is interpolated toward zero moment rather than toward the
     * widest plateau point.
     */
    double phi_Mn_at_P(const InteractionCurve& curve, double Pu) const;

    /// Moment capacity in pure bending (P = 0)
    double phi_Mn_at_P0(const InteractionCurve& curve) const;

    /**
     * @brief Check all demand points and report the governing one
     *
     * An empty demand set gives SF = +inf, status OK and critical combo "N/A".
     */
    FlexureCheck check_flexure(const InteractionCurve& curve,
                               const std::vector<DemandPoint>& demands) const;

private:
    CapacityEvaluatorSettings settings_;

    bool intersect(const std::vector<Eigen::Vector2d>& curve,
                   const Eigen::Vector2d& direction,
                   double& best_t) const;

    bool nearest_by_angle(const std::vector<Eigen::Vector2d>& curve,
                          double demand_angle,
                          double& distance,
                          double& offset_deg) const;
};

} // namespace rcflex
