#include "rcflex/interaction_curve.hpp"
#include "rcflex/errors.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <set>
#include <utility>

namespace rcflex {

namespace {

constexpr double N_TO_KN = 1.0e3;
constexpr double NMM_TO_KNM = 1.0e6;

} // namespace

bool InteractionCurveSettings::operator==(const InteractionCurveSettings& other) const {
    return n_points == other.n_points &&
           epsilon_cu == other.epsilon_cu &&
           epsilon_ty == other.epsilon_ty &&
           epsilon_t_limit == other.epsilon_t_limit &&
           phi_compression == other.phi_compression &&
           phi_spiral == other.phi_spiral &&
           phi_tension == other.phi_tension &&
           spiral == other.spiral &&
           compression_cap == other.compression_cap &&
           c_max_ratio == other.c_max_ratio &&
           c_min_ratio == other.c_min_ratio &&
           c_degenerate == other.c_degenerate;
}

double phi_flexure(double epsilon_t, const InteractionCurveSettings& settings) {
    const double phi_c = settings.spiral ? settings.phi_spiral : settings.phi_compression;
    if (epsilon_t <= settings.epsilon_ty) {
        return phi_c;
    }
    if (epsilon_t >= settings.epsilon_t_limit) {
        return settings.phi_tension;
    }
    return phi_c + (settings.phi_tension - phi_c) *
           (epsilon_t - settings.epsilon_ty) /
           (settings.epsilon_t_limit - settings.epsilon_ty);
}

// =============================================================================
// InteractionCurve
// =============================================================================

InteractionCurve::InteractionCurve(std::vector<CapacityPoint> points)
    : points_(std::move(points)) {}

std::vector<Eigen::Vector2d> InteractionCurve::design_curve() const {
    std::vector<Eigen::Vector2d> curve;
    curve.reserve(points_.size());
    for (const auto& p : points_) {
        curve.emplace_back(p.phi_Mn, p.phi_Pn);
    }
    return curve;
}

std::vector<Eigen::Vector2d> InteractionCurve::nominal_curve() const {
    std::vector<Eigen::Vector2d> curve;
    curve.reserve(points_.size());
    for (const auto& p : points_) {
        curve.emplace_back(p.Mn, p.Pn);
    }
    return curve;
}

double InteractionCurve::phi_Pn_max() const {
    if (points_.empty()) return 0.0;
    double value = points_.front().phi_Pn;
    for (const auto& p : points_) {
        value = std::max(value, p.phi_Pn);
    }
    return value;
}

double InteractionCurve::phi_Pt_min() const {
    if (points_.empty()) return 0.0;
    double value = points_.front().phi_Pn;
    for (const auto& p : points_) {
        value = std::min(value, p.phi_Pn);
    }
    return value;
}

InteractionCurve InteractionCurve::with_compression_reduction(double factor) const {
    std::vector<CapacityPoint> reduced = points_;
    for (auto& p : reduced) {
        if (p.Pn > 0.0) {
            p.Pn *= factor;
        }
        if (p.phi_Pn > 0.0) {
            p.phi_Pn *= factor;
        }
    }
    return InteractionCurve(std::move(reduced));
}

std::optional<CapacityPoint> InteractionCurve::nearest_point(double Mu, double Pu) const {
    if (points_.empty()) {
        return std::nullopt;
    }

    double M_scale = 0.0;
    double P_scale = 0.0;
    for (const auto& p : points_) {
        M_scale = std::max(M_scale, std::abs(p.phi_Mn));
        P_scale = std::max(P_scale, std::abs(p.phi_Pn));
    }
    if (M_scale <= 0.0) M_scale = 1.0;
    if (P_scale <= 0.0) P_scale = 1.0;

    const Eigen::Vector2d target(std::abs(Mu) / M_scale, Pu / P_scale);

    size_t best = 0;
    double best_dist = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < points_.size(); ++i) {
        Eigen::Vector2d q(points_[i].phi_Mn / M_scale, points_[i].phi_Pn / P_scale);
        double dist = (q - target).norm();
        if (dist < best_dist) {
            best_dist = dist;
            best = i;
        }
    }
    return points_[best];
}

// =============================================================================
// InteractionCurveBuilder
// =============================================================================

InteractionCurveBuilder::InteractionCurveBuilder(InteractionCurveSettings settings)
    : settings_(std::move(settings)) {
    const auto& s = settings_;
    if (s.n_points < 1) {
        throw InputError(RcflexError::invalid_settings("n_points", s.n_points, "n_points >= 1"));
    }
    if (!(s.compression_cap > 0.0 && s.compression_cap <= 1.0)) {
        throw InputError(RcflexError::invalid_settings(
            "compression_cap", s.compression_cap, "0 < compression_cap <= 1"));
    }
    if (!(s.c_min_ratio > 0.0)) {
        throw InputError(RcflexError::invalid_settings("c_min_ratio", s.c_min_ratio, "c_min_ratio > 0"));
    }
    if (!(s.c_max_ratio > 1.0)) {
        throw InputError(RcflexError::invalid_settings("c_max_ratio", s.c_max_ratio, "c_max_ratio > 1"));
    }
    if (!(s.epsilon_cu > 0.0)) {
        throw InputError(RcflexError::invalid_settings("epsilon_cu", s.epsilon_cu, "epsilon_cu > 0"));
    }
    if (!(s.epsilon_ty < s.epsilon_t_limit)) {
        throw InputError(RcflexError::invalid_settings(
            "epsilon_ty", s.epsilon_ty, "epsilon_ty < epsilon_t_limit"));
    }
}

double InteractionCurveBuilder::squash_load(const RectangularSection& section,
                                            const Concrete& concrete,
                                            const ReinforcingSteel& steel,
                                            double As_total) {
    double P0 = 0.85 * concrete.fc * (section.Ag() - As_total) + steel.fy * As_total;
    return P0 / N_TO_KN;
}

std::vector<double> InteractionCurveBuilder::neutral_axis_depths(double d, double epsilon_y) const {
    const double ecu = settings_.epsilon_cu;
    const double c_balanced = d * ecu / (ecu + epsilon_y);
    const int n = settings_.n_points;

    std::set<double, std::greater<double>> depths;

    // Compression-dominant zone: c_max_ratio·d toward d (d itself belongs to the next zone)
    const int n1 = n / 4;
    for (int i = 0; i < n1; ++i) {
        double ratio = static_cast<double>(i) / n1;
        depths.insert(d * (settings_.c_max_ratio - (settings_.c_max_ratio - 1.0) * ratio));
    }

    // Transition zone: d down to c_b
    const int n2 = std::max(1, n / 3);
    for (int i = 0; i <= n2; ++i) {
        double ratio = static_cast<double>(i) / n2;
        depths.insert(d - (d - c_balanced) * ratio);
    }

    // Tension-controlled zone: c_b down to the floor
    const int n3 = std::max(1, n / 3);
    const double c_min = settings_.c_min_ratio * d;
    for (int i = 0; i <= n3; ++i) {
        double ratio = static_cast<double>(i) / n3;
        double c = c_balanced - (c_balanced - c_min) * ratio;
        if (c > 0.0) {
            depths.insert(c);
        }
    }

    return std::vector<double>(depths.begin(), depths.end());
}

CapacityPoint InteractionCurveBuilder::section_point(double c,
                                                     const RectangularSection& section,
                                                     const Concrete& concrete,
                                                     const ReinforcingSteel& steel,
                                                     const std::vector<SteelLayer>& layers,
                                                     double Pn_ceiling) const {
    const double h = section.h;
    const double y_centroid = h / 2.0;
    const double fc = concrete.fc;

    // Whitney stress block
    const double a = std::min(concrete.beta1 * c, h);
    const double Cc = 0.85 * fc * a * section.b;
    const double Mc = Cc * (y_centroid - a / 2.0);

    double P_steel = 0.0;
    double M_steel = 0.0;
    double epsilon_t_max = 0.0;

    for (const auto& layer : layers) {
        const double di = layer.position;
        const double eps = settings_.epsilon_cu * (di - c) / c;   // + tension
        const double fs = steel.stress(eps);

        double Fi = layer.area * fs;
        if (di <= a && fs < 0.0) {
            // Displaced concrete inside the stress block
            Fi = layer.area * (fs + 0.85 * fc);
        }

        P_steel -= Fi;
        M_steel += Fi * (di - y_centroid);

        epsilon_t_max = std::max(epsilon_t_max, eps);
    }

    double Pn = std::min(Cc + P_steel, Pn_ceiling);
    double Mn = std::abs(Mc + M_steel);

    CapacityPoint pt;
    pt.phi = phi_flexure(epsilon_t_max, settings_);
    pt.Pn = Pn / N_TO_KN;
    pt.Mn = Mn / NMM_TO_KNM;
    pt.phi_Pn = pt.phi * pt.Pn;
    pt.phi_Mn = pt.phi * pt.Mn;
    pt.c = c;
    pt.epsilon_t = epsilon_t_max;
    return pt;
}

InteractionCurve InteractionCurveBuilder::build(const RectangularSection& section,
                                                const Concrete& concrete,
                                                const ReinforcingSteel& steel,
                                                const std::vector<SteelLayer>& layers) const {
    validate_layers(layers, section.h);

    const double As_total = total_area(layers);
    double d = effective_depth(layers);
    if (d <= 0.0) {
        d = section.h - section.cover;
    }

    const double phi_c = settings_.spiral ? settings_.phi_spiral : settings_.phi_compression;
    const double Pn_ceiling = settings_.compression_cap *
        squash_load(section, concrete, steel, As_total) * N_TO_KN;

    std::vector<CapacityPoint> points;
    points.reserve(static_cast<size_t>(settings_.n_points) + 2);

    // Compression apex
    CapacityPoint apex;
    apex.Pn = Pn_ceiling / N_TO_KN;
    apex.Mn = 0.0;
    apex.phi = phi_c;
    apex.phi_Pn = phi_c * apex.Pn;
    apex.phi_Mn = 0.0;
    apex.c = std::numeric_limits<double>::infinity();
    apex.epsilon_t = 0.0;
    points.push_back(apex);

    for (double c : neutral_axis_depths(d, steel.epsilon_y())) {
        if (c <= settings_.c_degenerate) {
            continue;
        }
        points.push_back(section_point(c, section, concrete, steel, layers, Pn_ceiling));
    }

    // Tension apex
    CapacityPoint tension;
    tension.Pn = -As_total * steel.fy / N_TO_KN;
    tension.Mn = 0.0;
    tension.phi = settings_.phi_tension;
    tension.phi_Pn = settings_.phi_tension * tension.Pn;
    tension.phi_Mn = 0.0;
    tension.c = 0.0;
    tension.epsilon_t = std::numeric_limits<double>::infinity();
    points.push_back(tension);

    std::stable_sort(points.begin(), points.end(),
        [](const CapacityPoint& lhs, const CapacityPoint& rhs) {
            return lhs.phi_Pn > rhs.phi_Pn;
        });

    return InteractionCurve(std::move(points));
}

InteractionCurve InteractionCurveBuilder::build(const RectangularSection& section,
                                                const Concrete& concrete,
                                                const ReinforcingSteel& steel,
                                                double As_total) const {
    if (As_total < 0.0) {
        auto err = RcflexError::invalid_reinforcement("negative total steel area");
        err.details["As_total"] = std::to_string(As_total) + " mm²";
        throw InputError(err);
    }
    return build(section, concrete, steel,
                 two_layer_layout(section.h, section.cover, As_total));
}

} // namespace rcflex
