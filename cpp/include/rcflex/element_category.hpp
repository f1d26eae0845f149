#pragma once

#include <string>
#include <variant>

namespace rcflex {

/**
 * @brief Design behavior resolved for an element category
 */
enum class DesignBehavior {
    Beam,               ///< Flexure only, no P-M diagram
    Column,             ///< Column without seismic detailing
    SeismicColumn,      ///< Column in a special moment frame
    WallPierColumn,     ///< Wall pier designed with column requirements
    WallPierAlternate,  ///< Wall pier designed with the alternate method
    Wall,               ///< Slender structural wall
    SquatWall,          ///< Wall with hw/lw below the pier limit and long plan
    DropBeam            ///< Drop beam / slab band in flexure-compression
};

std::string design_behavior_to_string(DesignBehavior behavior);

// =============================================================================
// Element categories
// =============================================================================

/// Horizontal flexural member
struct BeamCategory {};

/// Column with optional seismic detailing
struct ColumnCategory {
    bool seismic = true;   ///< Part of a special moment frame
};

/**
 * @brief Vertical wall segment classified by its proportions
 *
 * lw: length in plan, tw: thickness, hw: height [mm].
 */
struct WallCategory {
    double lw = 0.0;
    double tw = 0.0;
    double hw = 0.0;
    bool cracked = true;   ///< Use the cracked-section stiffness factor
};

/// Drop beam or slab band designed in flexure-compression
struct DropBeamCategory {};

/**
 * @brief Closed set of element categories
 */
using ElementCategory = std::variant<BeamCategory, ColumnCategory, WallCategory, DropBeamCategory>;

/**
 * @brief Behavior and derived flags for an element category
 */
struct BehaviorProfile {
    DesignBehavior behavior = DesignBehavior::Beam;

    bool requires_pm_diagram = false;      ///< Flexure-compression check with a P-M curve
    bool requires_seismic_checks = false;  ///< Seismic detailing rules apply
    bool requires_column_checks = false;   ///< Column detailing rules apply
    bool requires_wall_checks = false;     ///< Wall detailing rules apply
    bool requires_confinement = false;     ///< Transverse confinement required

    double stiffness_factor = 0.35;        ///< Cracked-section EI multiplier on Ec·Ig
    double default_k = 1.0;                ///< Default effective length factor
};

/// Wall proportion limits used to classify wall segments
struct WallClassificationLimits {
    double column_aspect = 4.0;      ///< lw/tw below which the segment is a column
    double pier_hw_lw = 2.0;         ///< hw/lw below which the segment is a pier or squat wall
    double pier_column = 2.5;        ///< lw/tw at or below which a pier follows column rules
    double pier_alternate = 6.0;     ///< lw/tw at or below which a pier uses the alternate method
};

/**
 * @brief Classify a wall segment from its proportions
 *
 * | lw/tw   | hw/lw  | behavior           |
 * |---------|--------|--------------------|
 * | < 4     | any    | Column             |
 * | ≥ 4     | ≥ 2.0  | Wall               |
 * | ≤ 2.5   | < 2.0  | WallPierColumn     |
 * | ≤ 6.0   | < 2.0  | WallPierAlternate  |
 * | > 6.0   | < 2.0  | SquatWall          |
 *
 * The lw/tw ≤ 2.5 pier row is only reachable with a custom column_aspect.
 */
DesignBehavior classify_wall(const WallCategory& wall,
                             const WallClassificationLimits& limits = {});

/**
 * @brief Resolve the behavior profile of an element category
 */
BehaviorProfile resolve(const ElementCategory& category,
                        const WallClassificationLimits& limits = {});

} // namespace rcflex
