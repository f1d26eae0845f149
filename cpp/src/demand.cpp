#include "rcflex/demand.hpp"

#include <algorithm>
#include <cmath>

namespace rcflex {

std::string CombinationForces::label() const {
    if (location.empty()) {
        return name;
    }
    return name + " (" + location + ")";
}

DemandPoint to_demand_point(const CombinationForces& forces,
                            MomentAxis axis,
                            double angle_deg) {
    double Mu = 0.0;
    switch (axis) {
        case MomentAxis::M2:
            Mu = std::abs(forces.M2);
            break;
        case MomentAxis::M3:
            Mu = std::abs(forces.M3);
            break;
        case MomentAxis::Combined: {
            double rad = angle_deg * M_PI / 180.0;
            Mu = std::abs(forces.M3 * std::cos(rad) + forces.M2 * std::sin(rad));
            break;
        }
        case MomentAxis::SRSS:
            Mu = std::hypot(forces.M2, forces.M3);
            break;
    }
    return DemandPoint(-forces.P, Mu, forces.label());
}

std::vector<DemandPoint> extract_demands(const std::vector<CombinationForces>& combinations,
                                         MomentAxis axis,
                                         double angle_deg) {
    std::vector<DemandPoint> demands;
    demands.reserve(combinations.size());
    for (const auto& combo : combinations) {
        demands.push_back(to_demand_point(combo, axis, angle_deg));
    }
    return demands;
}

ForceEnvelope envelope(const std::vector<CombinationForces>& combinations) {
    ForceEnvelope env;
    if (combinations.empty()) {
        return env;
    }

    env.P_max = combinations.front().P;
    env.P_min = combinations.front().P;
    for (const auto& c : combinations) {
        env.P_max = std::max(env.P_max, c.P);
        env.P_min = std::min(env.P_min, c.P);
        env.V2_max = std::max(env.V2_max, std::abs(c.V2));
        env.V3_max = std::max(env.V3_max, std::abs(c.V3));
        env.M2_max = std::max(env.M2_max, std::abs(c.M2));
        env.M3_max = std::max(env.M3_max, std::abs(c.M3));
    }
    return env;
}

} // namespace rcflex
