#pragma once

#include "rcflex/material.hpp"
#include "rcflex/section.hpp"
#include "rcflex/steel_layer.hpp"
#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace rcflex {

/**
 * @brief One point of a P-M interaction diagram
 *
 * Forces in kN, moments in kN·m. Pn is positive in compression.
 */
struct CapacityPoint {
    double Pn = 0.0;          ///< Nominal axial strength [kN]
    double Mn = 0.0;          ///< Nominal moment strength [kN·m], always ≥ 0
    double phi = 0.65;        ///< Strength reduction factor
    double phi_Pn = 0.0;      ///< Design axial strength [kN]
    double phi_Mn = 0.0;      ///< Design moment strength [kN·m]
    double c = 0.0;           ///< Neutral axis depth [mm] (+inf at the compression apex)
    double epsilon_t = 0.0;   ///< Strain in the extreme tension layer (+inf at the tension apex)
};

/**
 * @brief Settings for interaction curve generation
 */
struct InteractionCurveSettings {
    /// Requested number of neutral-axis samples across the three zones
    int n_points = 50;

    /// Ultimate concrete compressive strain
    double epsilon_cu = 0.003;

    /// Strain at or below which a section is compression-controlled
    double epsilon_ty = 0.002;

    /// Strain at or above which a section is tension-controlled
    double epsilon_t_limit = 0.005;

    /// phi for compression-controlled sections with ties
    double phi_compression = 0.65;

    /// phi for compression-controlled sections with spirals
    double phi_spiral = 0.75;

    /// phi for tension-controlled sections
    double phi_tension = 0.90;

    /// Section confined by spirals (selects phi_spiral instead of phi_compression)
    bool spiral = false;

    /// Ceiling on axial strength as a fraction of P0
    double compression_cap = 0.80;

    /// Largest sampled neutral axis depth as a multiple of d
    double c_max_ratio = 10.0;

    /// Smallest sampled neutral axis depth as a multiple of d
    double c_min_ratio = 0.05;

    /// Samples with c at or below this depth are skipped [mm]
    double c_degenerate = 1.0;

    bool operator==(const InteractionCurveSettings& other) const;
    bool operator!=(const InteractionCurveSettings& other) const { return !(*this == other); }
};

/**
 * @brief Strength reduction factor for a given tension strain
 *
 * phi_compression (or phi_spiral) at or below epsilon_ty, phi_tension at or
 * above epsilon_t_limit, linear in between.
 */
double phi_flexure(double epsilon_t, const InteractionCurveSettings& settings = {});

/**
 * @brief Immutable P-M interaction diagram
 *
 * Points run from the compression apex (Mn = 0, largest phi·Pn) to the
 * tension apex (Mn = 0, smallest phi·Pn) with phi·Pn non-increasing.
 * Adjustments return a new curve; an existing curve is never modified,
 * so curves can be shared between threads.
 */
class InteractionCurve {
public:
    InteractionCurve() = default;

    /**
     * @brief Wrap an already ordered point sequence
     * @param points Capacity points ordered by phi·Pn descending
     */
    explicit InteractionCurve(std::vector<CapacityPoint> points);

    const std::vector<CapacityPoint>& points() const { return points_; }

    size_t size() const { return points_.size(); }

    bool empty() const { return points_.empty(); }

    const CapacityPoint& operator[](size_t i) const { return points_[i]; }

    /// Design curve as (phi·Mn, phi·Pn) pairs [kN·m, kN]
    std::vector<Eigen::Vector2d> design_curve() const;

    /// Nominal curve as (Mn, Pn) pairs [kN·m, kN]
    std::vector<Eigen::Vector2d> nominal_curve() const;

    /// Maximum design axial compression phi·Pn,max [kN] (0 if empty)
    double phi_Pn_max() const;

    /// Design axial tension phi·Pt,min [kN], the most negative phi·Pn (0 if empty)
    double phi_Pt_min() const;

    /**
     * @brief Curve with the compression side scaled down
     *
     * Positive Pn and phi·Pn are multiplied by factor; tension points and
     * moments are unchanged. Used for the empirical buckling reduction.
     *
     * @param factor Reduction factor in [0, 1]
     * @return New curve, this one is left untouched
     */
    InteractionCurve with_compression_reduction(double factor) const;

    /**
     * @brief Curve point closest to a demand in normalized (M, P) space
     *
     * Moments and forces are normalized by the curve's largest |phi·Mn| and
     * |phi·Pn| before measuring distance.
     *
     * @return The nearest point, or std::nullopt for an empty curve
     */
    std::optional<CapacityPoint> nearest_point(double Mu, double Pu) const;

private:
    std::vector<CapacityPoint> points_;
};

/**
 * @brief Strain-compatibility generator of interaction curves
 *
 * Sweeps the neutral axis depth c over three zones:
 * - compression-dominant: c from c_max_ratio·d down toward d
 * - transition: c from d down to the balanced depth c_b
 * - tension-controlled: c from c_b down to c_min_ratio·d
 *
 * and evaluates the Whitney stress block plus elasto-plastic steel at each
 * depth. Moments are taken about mid-depth h/2.
 *
 * Usage:
 *   InteractionCurveBuilder builder;
 *   RectangularSection section(200.0, 3000.0, 40.0);
 *   auto curve = builder.build(section, Concrete(25.0), ReinforcingSteel(420.0), 3000.0);
 */
class InteractionCurveBuilder {
public:
    /**
     * @brief Construct a builder with the given settings
     *
     * Throws InputError(INVALID_SETTINGS) unless n_points >= 1,
     * 0 < compression_cap <= 1, c_min_ratio > 0, c_max_ratio > 1,
     * epsilon_cu > 0 and epsilon_ty < epsilon_t_limit.
     */
    explicit InteractionCurveBuilder(InteractionCurveSettings settings = {});

    const InteractionCurveSettings& settings() const { return settings_; }

    /**
     * @brief Build the curve for an explicit layer arrangement
     *
     * Throws InputError(INVALID_REINFORCEMENT) if a layer does not fit
     * the section.
     */
    InteractionCurve build(const RectangularSection& section,
                           const Concrete& concrete,
                           const ReinforcingSteel& steel,
                           const std::vector<SteelLayer>& layers) const;

    /**
     * @brief Build the curve with the default two-layer idealization
     *
     * As_total/2 at the cover and As_total/2 at h − cover.
     */
    InteractionCurve build(const RectangularSection& section,
                           const Concrete& concrete,
                           const ReinforcingSteel& steel,
                           double As_total) const;

    /**
     * @brief Nominal squash load P0 = 0.85·f'c·(Ag − As) + fy·As [kN]
     */
    static double squash_load(const RectangularSection& section,
                              const Concrete& concrete,
                              const ReinforcingSteel& steel,
                              double As_total);

    /**
     * @brief Neutral-axis depths sampled for a given effective depth
     *
     * Deduplicated and sorted descending; includes samples at or below
     * c_degenerate, which build() skips.
     */
    std::vector<double> neutral_axis_depths(double d, double epsilon_y) const;

private:
    InteractionCurveSettings settings_;

    CapacityPoint section_point(double c,
                                const RectangularSection& section,
                                const Concrete& concrete,
                                const ReinforcingSteel& steel,
                                const std::vector<SteelLayer>& layers,
                                double Pn_ceiling) const;
};

} // namespace rcflex
