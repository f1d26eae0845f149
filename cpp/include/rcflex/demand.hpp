#pragma once

#include <string>
#include <utility>
#include <vector>

namespace rcflex {

/**
 * @brief Single-axis demand for one load combination
 *
 * Pu is positive in compression [kN]; Mu is taken by magnitude [kN·m].
 */
struct DemandPoint {
    double Pu = 0.0;
    double Mu = 0.0;
    std::string label;

    DemandPoint() = default;
    DemandPoint(double Pu, double Mu, std::string label = "")
        : Pu(Pu), Mu(Mu), label(std::move(label)) {}
};

/**
 * @brief Element forces for one load combination at one station
 *
 * Analysis sign convention: P is positive in tension [kN]; moments [kN·m].
 */
struct CombinationForces {
    std::string name;       ///< Combination name (e.g. "1.2D+1.6L")
    std::string location;   ///< Station within the element (e.g. "Top", "Bottom")
    double P = 0.0;         ///< Axial force, + tension [kN]
    double V2 = 0.0;        ///< Shear along local 2 [kN]
    double V3 = 0.0;        ///< Shear along local 3 [kN]
    double M2 = 0.0;        ///< Moment about local 2 [kN·m]
    double M3 = 0.0;        ///< Moment about local 3 [kN·m]

    /// Label used for reporting: "name (location)"
    std::string label() const;
};

/**
 * @brief Moment component used to build single-axis demands
 */
enum class MomentAxis {
    M2,         ///< |M2|
    M3,         ///< |M3|
    Combined,   ///< |M3·cos θ + M2·sin θ| for a view angle θ
    SRSS        ///< √(M2² + M3²)
};

/**
 * @brief Envelope of a set of combinations
 */
struct ForceEnvelope {
    double P_max = 0.0;     ///< Largest P (tension) [kN]
    double P_min = 0.0;     ///< Smallest P (compression) [kN]
    double V2_max = 0.0;    ///< max |V2| [kN]
    double V3_max = 0.0;    ///< max |V3| [kN]
    double M2_max = 0.0;    ///< max |M2| [kN·m]
    double M3_max = 0.0;    ///< max |M3| [kN·m]
};

/**
 * @brief Convert one combination into a demand point
 *
 * P changes sign so that compression becomes positive.
 *
 * @param forces Combination forces in analysis sign convention
 * @param axis Moment component to use
 * @param angle_deg View angle for MomentAxis::Combined (0 = M3, 90 = M2)
 */
DemandPoint to_demand_point(const CombinationForces& forces,
                            MomentAxis axis,
                            double angle_deg = 0.0);

/// Demand points for every combination, in input order
std::vector<DemandPoint> extract_demands(const std::vector<CombinationForces>& combinations,
                                         MomentAxis axis,
                                         double angle_deg = 0.0);

/// Envelope of all combinations (all zero for an empty list)
ForceEnvelope envelope(const std::vector<CombinationForces>& combinations);

} // namespace rcflex
