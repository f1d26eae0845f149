#include "rcflex/element_category.hpp"

namespace rcflex {

namespace {

constexpr double WALL_CRACKED_STIFFNESS = 0.35;
constexpr double WALL_UNCRACKED_STIFFNESS = 0.70;
constexpr double COLUMN_STIFFNESS = 0.70;
constexpr double BEAM_STIFFNESS = 0.35;
constexpr double FLAT_SLAB_STIFFNESS = 0.25;

constexpr double K_WALL = 0.8;
constexpr double K_FRAME = 1.0;

BehaviorProfile column_profile(bool seismic) {
    BehaviorProfile p;
    p.behavior = seismic ? DesignBehavior::SeismicColumn : DesignBehavior::Column;
    p.requires_pm_diagram = true;
    p.requires_seismic_checks = seismic;
    p.requires_column_checks = true;
    p.requires_confinement = seismic;
    p.stiffness_factor = COLUMN_STIFFNESS;
    p.default_k = K_FRAME;
    return p;
}

struct ProfileResolver {
    const WallClassificationLimits& limits;

    BehaviorProfile operator()(const BeamCategory&) const {
        BehaviorProfile p;
        p.behavior = DesignBehavior::Beam;
        p.stiffness_factor = BEAM_STIFFNESS;
        p.default_k = K_FRAME;
        return p;
    }

    BehaviorProfile operator()(const ColumnCategory& column) const {
        return column_profile(column.seismic);
    }

    BehaviorProfile operator()(const WallCategory& wall) const {
        const DesignBehavior behavior = classify_wall(wall, limits);
        if (behavior == DesignBehavior::Column) {
            return column_profile(true);
        }

        BehaviorProfile p;
        p.behavior = behavior;
        p.requires_pm_diagram = true;
        p.requires_seismic_checks = true;
        p.stiffness_factor = wall.cracked ? WALL_CRACKED_STIFFNESS : WALL_UNCRACKED_STIFFNESS;
        p.default_k = K_WALL;

        switch (behavior) {
            case DesignBehavior::WallPierColumn:
                p.requires_column_checks = true;
                p.requires_confinement = true;
                break;
            case DesignBehavior::WallPierAlternate:
                p.requires_wall_checks = true;
                p.requires_confinement = true;
                break;
            default:
                p.requires_wall_checks = true;
                break;
        }
        return p;
    }

    BehaviorProfile operator()(const DropBeamCategory&) const {
        BehaviorProfile p;
        p.behavior = DesignBehavior::DropBeam;
        p.requires_pm_diagram = true;
        p.stiffness_factor = FLAT_SLAB_STIFFNESS;
        p.default_k = K_FRAME;
        return p;
    }
};

} // namespace

std::string design_behavior_to_string(DesignBehavior behavior) {
    switch (behavior) {
        case DesignBehavior::Beam: return "Beam";
        case DesignBehavior::Column: return "Column";
        case DesignBehavior::SeismicColumn: return "SeismicColumn";
        case DesignBehavior::WallPierColumn: return "WallPierColumn";
        case DesignBehavior::WallPierAlternate: return "WallPierAlternate";
        case DesignBehavior::Wall: return "Wall";
        case DesignBehavior::SquatWall: return "SquatWall";
        case DesignBehavior::DropBeam: return "DropBeam";
        default: return "Unknown";
    }
}

DesignBehavior classify_wall(const WallCategory& wall, const WallClassificationLimits& limits) {
    const double lw_tw = wall.tw > 0.0 ? wall.lw / wall.tw : 0.0;
    const double hw_lw = wall.lw > 0.0 ? wall.hw / wall.lw : 0.0;

    if (lw_tw < limits.column_aspect) {
        return DesignBehavior::Column;
    }
    if (hw_lw >= limits.pier_hw_lw) {
        return DesignBehavior::Wall;
    }
    if (lw_tw <= limits.pier_column) {
        return DesignBehavior::WallPierColumn;
    }
    if (lw_tw <= limits.pier_alternate) {
        return DesignBehavior::WallPierAlternate;
    }
    return DesignBehavior::SquatWall;
}

BehaviorProfile resolve(const ElementCategory& category, const WallClassificationLimits& limits) {
    return std::visit(ProfileResolver{limits}, category);
}

} // namespace rcflex
