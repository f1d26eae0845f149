#pragma once

#include "rcflex/element_category.hpp"
#include "rcflex/material.hpp"
#include "rcflex/section.hpp"
#include <string>

namespace rcflex {

/**
 * @brief Settings for slenderness analysis
 *
 * Defaults follow the non-sway moment magnifier method and the empirical
 * wall buckling reduction.
 */
struct SlendernessSettings {
    /// Slenderness limit for braced members
    double lambda_limit_braced = 22.0;

    /// Slenderness limit for unbraced members
    double lambda_limit_unbraced = 22.0;

    /// Slenderness at or below which the capacity is not reduced
    double lambda_no_reduction = 25.0;

    /// Slenderness above which the member is rejected
    double lambda_max = 100.0;

    /// Divisor of the empirical buckling ratio k·lu/(divisor·t)
    double buckling_divisor = 32.0;

    /// Fraction of Pc used in the magnifier denominator
    double Pc_fraction = 0.75;

    /// Cm = Cm_base − Cm_factor·M1/M2, not less than Cm_min
    double Cm_base = 0.6;
    double Cm_factor = 0.4;
    double Cm_min = 0.4;

    /// Cm with transverse loads or negligible end moments
    double Cm_transverse = 1.0;

    /// Minimum eccentricity e_min = e_min_base + e_min_factor·h [mm]
    double e_min_base = 15.0;
    double e_min_factor = 0.03;

    /// Largest admitted ratio of second-order to first-order moment
    double second_order_limit = 1.4;
};

/**
 * @brief Member data for slenderness analysis
 */
struct SlendernessInput {
    double lu = 0.0;                ///< Unsupported length [mm]
    double t = 0.0;                 ///< Section dimension in the buckling direction [mm]
    double b = 0.0;                 ///< Section dimension perpendicular to t [mm]
    double k = 0.8;                 ///< Effective length factor
    double fc = 0.0;                ///< Concrete strength f'c [MPa]
    double stiffness_factor = 0.35; ///< Cracked-section EI multiplier
    double Cm = 1.0;                ///< Equivalent moment factor
    bool braced = true;             ///< Braced against sidesway
    double Pu = 0.0;                ///< Reference axial load for delta_ns [kN]
};

/**
 * @brief Outcome of moment magnification for one axial load
 */
enum class MagnificationStatus {
    NotRequired,   ///< Member not slender or not in compression, delta = 1
    Magnified,     ///< Finite delta ≥ 1
    Unstable       ///< Pu ≥ 0.75·Pc, delta = +inf
};

std::string magnification_status_to_string(MagnificationStatus status);

struct Magnification {
    double delta = 1.0;
    MagnificationStatus status = MagnificationStatus::NotRequired;

    bool is_unstable() const { return status == MagnificationStatus::Unstable; }
};

/**
 * @brief Effective flexural stiffness (EI)eff = factor·Ec·Ig
 */
struct EffectiveStiffness {
    double Ec = 0.0;        ///< [MPa]
    double Ig = 0.0;        ///< [mm⁴]
    double factor = 0.0;
    double EI_eff = 0.0;    ///< [N·mm²]
};

/**
 * @brief Axial capacity reduction for slenderness
 */
struct CapacityReduction {
    double factor = 1.0;    ///< Multiplier on compression capacity
    bool rejected = false;  ///< lambda above lambda_max
};

/**
 * @brief Result of slenderness analysis for one member and direction
 */
struct SlendernessResult {
    double lu = 0.0;            ///< [mm]
    double t = 0.0;             ///< [mm]
    double b = 0.0;             ///< [mm]
    double k = 0.0;
    double r = 0.0;             ///< Radius of gyration t/√12 [mm]

    double lambda_ratio = 0.0;  ///< k·lu/r
    bool is_slender = false;    ///< lambda_ratio > lambda_limit
    double lambda_limit = 22.0;

    EffectiveStiffness stiffness;
    double Pc = 0.0;            ///< Critical buckling load [kN]
    double Cm = 1.0;

    double delta_ns = 1.0;      ///< Magnification at the reference Pu
    MagnificationStatus status = MagnificationStatus::NotRequired;

    double buckling_ratio = 0.0;    ///< k·lu/(32·t)
    double buckling_factor = 1.0;   ///< 1 − buckling_ratio², 0 when the ratio ≥ 1

    CapacityReduction reduction;
};

/**
 * @brief Governing first-order moment combined with minimum and magnification
 */
struct DesignMoment {
    double M2 = 0.0;            ///< |first-order moment| [kN·m]
    double e_min = 0.0;         ///< Minimum eccentricity [mm]
    double M2_min = 0.0;        ///< Pu·e_min [kN·m]
    double M2_design = 0.0;     ///< max(M2, M2_min) [kN·m]
    double delta = 1.0;
    double Mc = 0.0;            ///< delta·M2_design [kN·m] (+inf when unstable)
    bool controls_M2_min = false;
};

/**
 * @brief Curvature shape from the end-moment ratio
 */
enum class Curvature {
    Single,
    Double,
    ZeroM1,
    TransverseLoads,
    NegligibleMoment
};

struct CmResult {
    double Cm = 1.0;
    double M1 = 0.0;        ///< Smaller end moment (signed)
    double M2 = 0.0;        ///< Larger end moment (signed)
    double ratio = 0.0;     ///< M1/M2
    Curvature curvature = Curvature::ZeroM1;
};

struct SecondOrderCheck {
    double ratio = 1.0;     ///< |Mu2| / |Mu1|
    double limit = 1.4;
    bool ok = true;
};

/**
 * @brief Slenderness and buckling analysis of compression members
 *
 * Pure computations over value inputs. Invalid geometry or material throws
 * InputError; instability is a result status, never an exception.
 */
class SlendernessAnalyzer {
public:
    explicit SlendernessAnalyzer(SlendernessSettings settings = {});

    const SlendernessSettings& settings() const { return settings_; }

    /**
     * @brief Analyze a member
     *
     * Throws InputError for non-positive lu, k, t, b or fc, and for a
     * stiffness factor outside (0, 1].
     */
    SlendernessResult analyze(const SlendernessInput& input) const;

    /**
     * @brief Analyze a member from its section and category profile
     *
     * Buckling is checked about the weak axis: t = min(b, h), and the
     * profile supplies k and the stiffness factor.
     */
    SlendernessResult analyze(const RectangularSection& section,
                              const Concrete& concrete,
                              double lu,
                              const BehaviorProfile& profile,
                              bool braced = true) const;

    /**
     * @brief Magnification factor for an axial load
     *
     * delta = Cm / (1 − Pu/(0.75·Pc)), floored at 1.0.
     * Pu ≥ 0.75·Pc gives delta = +inf with status Unstable.
     */
    Magnification magnification(const SlendernessResult& result, double Pu) const;

    /**
     * @brief Compression capacity reduction
     *
     * lambda ≤ 25: no reduction. lambda > 100: rejected with factor 0.
     * Otherwise the empirical buckling factor.
     */
    CapacityReduction capacity_reduction(const SlendernessResult& result) const;

    /// Equivalent moment factor from signed end moments
    CmResult Cm(double M1, double M2, bool has_transverse_loads = false) const;

    /// Minimum eccentricity 15 + 0.03·h [mm]
    double e_min(double h) const;

    /// Minimum moment |Pu|·e_min [kN·m]
    double M2_min(double Pu, double h) const;

    /// Mc = delta·max(|M2|, M2,min)
    DesignMoment design_moment(double M2, double Pu, double h, double delta = 1.0) const;

    /// Mu(2nd order) ≤ 1.4·Mu(1st order)
    SecondOrderCheck second_order_check(double Mu_first_order, double Mu_second_order) const;

    /// (EI)eff = factor·Ec·b·t³/12
    static EffectiveStiffness effective_stiffness(double fc, double b, double t, double factor);

private:
    SlendernessSettings settings_;
};

} // namespace rcflex
