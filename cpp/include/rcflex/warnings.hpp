/**
 * @file warnings.hpp
 * @brief Warning system for reduced-precision or noteworthy design results.
 *
 * Warnings indicate conditions that don't prevent a verification
 * but change how much the result can be trusted or which upstream
 * rules should be triggered.
 */

#ifndef RCFLEX_WARNINGS_HPP
#define RCFLEX_WARNINGS_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace rcflex {

/**
 * @brief Warning codes for verification diagnostics.
 */
enum class WarningCode {
    // === Capacity Evaluation Warnings (100-199) ===

    /// Ray did not intersect the curve; nearest point by angle was used
    RAY_FALLBACK_ANGULAR = 100,

    /// Ray did not intersect the curve; point-in-polygon placeholder SF was used
    RAY_FALLBACK_POLYGON = 101,

    /// Demand axial load exceeds the maximum axial compression capacity
    EXCEEDS_AXIAL_CAPACITY = 102,

    /// Demand axial load exceeds the axial tension capacity
    EXCEEDS_TENSION_CAPACITY = 103,

    /// At least one combination puts the member in net tension
    NET_TENSION = 104,

    // === Slenderness Warnings (200-299) ===

    /// Member is slender; second-order effects were considered
    SLENDER_MEMBER = 200,

    /// Magnification is unbounded (Pu >= 0.75 Pc)
    UNSTABLE_MAGNIFICATION = 201,

    /// Minimum moment M2,min governs the design moment
    MINIMUM_MOMENT_CONTROLS = 202,

    /// Second-order moment exceeds 1.4 times the first-order moment
    SECOND_ORDER_LIMIT_EXCEEDED = 203,

    /// k lu / 32 t >= 1, the empirical buckling factor is zero
    EMPIRICAL_METHOD_INAPPLICABLE = 204,

    // === Section Warnings (300-399) ===

    /// Section has no longitudinal reinforcement
    NO_REINFORCEMENT = 300
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Informational, likely acceptable
    Low = 0,

    /// Review recommended
    Medium = 1,

    /// Result precision or validity is compromised
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::RAY_FALLBACK_ANGULAR: return "RAY_FALLBACK_ANGULAR";
        case WarningCode::RAY_FALLBACK_POLYGON: return "RAY_FALLBACK_POLYGON";
        case WarningCode::EXCEEDS_AXIAL_CAPACITY: return "EXCEEDS_AXIAL_CAPACITY";
        case WarningCode::EXCEEDS_TENSION_CAPACITY: return "EXCEEDS_TENSION_CAPACITY";
        case WarningCode::NET_TENSION: return "NET_TENSION";
        case WarningCode::SLENDER_MEMBER: return "SLENDER_MEMBER";
        case WarningCode::UNSTABLE_MAGNIFICATION: return "UNSTABLE_MAGNIFICATION";
        case WarningCode::MINIMUM_MOMENT_CONTROLS: return "MINIMUM_MOMENT_CONTROLS";
        case WarningCode::SECOND_ORDER_LIMIT_EXCEEDED: return "SECOND_ORDER_LIMIT_EXCEEDED";
        case WarningCode::EMPIRICAL_METHOD_INAPPLICABLE: return "EMPIRICAL_METHOD_INAPPLICABLE";
        case WarningCode::NO_REINFORCEMENT: return "NO_REINFORCEMENT";
        default: return "UNKNOWN_WARNING";
    }
}

inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for rcflex.
 */
struct RcflexWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Load combination labels involved in the warning
    std::vector<std::string> combinations;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested action
    std::string suggestion;

    RcflexWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (!combinations.empty()) {
            result += "\n  Combinations: ";
            for (size_t i = 0; i < combinations.size(); ++i) {
                if (i > 0) result += ", ";
                result += combinations[i];
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Nearest-by-angle fallback was used for a combination.
     */
    static RcflexWarning ray_fallback_angular(const std::string& combo, double angle_deg) {
        RcflexWarning warn(WarningCode::RAY_FALLBACK_ANGULAR, WarningSeverity::Medium,
            "Demand ray did not intersect the capacity curve; nearest point by angle used");
        warn.combinations.push_back(combo);
        warn.details["angular_offset_deg"] = std::to_string(angle_deg);
        warn.suggestion = "Safety factor has reduced precision; increase the number of curve points";
        return warn;
    }

    /**
     * @brief Point-in-polygon fallback was used for a combination.
     */
    static RcflexWarning ray_fallback_polygon(const std::string& combo, bool inside, double sf) {
        RcflexWarning warn(WarningCode::RAY_FALLBACK_POLYGON, WarningSeverity::High,
            "Demand ray did not intersect the capacity curve; placeholder safety factor used");
        warn.combinations.push_back(combo);
        warn.details["inside"] = inside ? "true" : "false";
        warn.details["safety_factor"] = std::to_string(sf);
        warn.suggestion = "The reported safety factor is a fixed engineering placeholder, "
                          "not a computed value; review the capacity curve";
        return warn;
    }

    static RcflexWarning exceeds_axial_capacity(const std::string& combo, double Pu, double phi_Pn_max) {
        RcflexWarning warn(WarningCode::EXCEEDS_AXIAL_CAPACITY, WarningSeverity::High,
            "Axial demand exceeds the maximum axial compression capacity");
        warn.combinations.push_back(combo);
        warn.details["Pu"] = std::to_string(Pu) + " kN";
        warn.details["phi_Pn_max"] = std::to_string(phi_Pn_max) + " kN";
        return warn;
    }

    static RcflexWarning exceeds_tension_capacity(const std::string& combo, double Pu, double phi_Pt_min) {
        RcflexWarning warn(WarningCode::EXCEEDS_TENSION_CAPACITY, WarningSeverity::High,
            "Axial demand exceeds the axial tension capacity");
        warn.combinations.push_back(combo);
        warn.details["Pu"] = std::to_string(Pu) + " kN";
        warn.details["phi_Pt_min"] = std::to_string(phi_Pt_min) + " kN";
        return warn;
    }

    static RcflexWarning net_tension(int count) {
        RcflexWarning warn(WarningCode::NET_TENSION, WarningSeverity::Low,
            "Member is in net tension under some combinations");
        warn.details["tension_combinations"] = std::to_string(count);
        return warn;
    }

    static RcflexWarning slender_member(double lambda, double limit) {
        RcflexWarning warn(WarningCode::SLENDER_MEMBER, WarningSeverity::Low,
            "Member is slender; second-order effects considered");
        warn.details["lambda"] = std::to_string(lambda);
        warn.details["lambda_limit"] = std::to_string(limit);
        return warn;
    }

    static RcflexWarning unstable_magnification(const std::string& combo, double Pu, double Pc) {
        RcflexWarning warn(WarningCode::UNSTABLE_MAGNIFICATION, WarningSeverity::High,
            "Moment magnification is unbounded (Pu >= 0.75 Pc)");
        warn.combinations.push_back(combo);
        warn.details["Pu"] = std::to_string(Pu) + " kN";
        warn.details["Pc"] = std::to_string(Pc) + " kN";
        return warn;
    }

    static RcflexWarning minimum_moment_controls(const std::string& combo, double Mu, double M2_min) {
        RcflexWarning warn(WarningCode::MINIMUM_MOMENT_CONTROLS, WarningSeverity::Low,
            "Minimum moment M2,min governs the design moment");
        warn.combinations.push_back(combo);
        warn.details["Mu"] = std::to_string(Mu) + " kN·m";
        warn.details["M2_min"] = std::to_string(M2_min) + " kN·m";
        return warn;
    }

    static RcflexWarning second_order_limit_exceeded(const std::string& combo, double ratio) {
        RcflexWarning warn(WarningCode::SECOND_ORDER_LIMIT_EXCEEDED, WarningSeverity::High,
            "Second-order moment exceeds 1.4 times the first-order moment");
        warn.combinations.push_back(combo);
        warn.details["ratio"] = std::to_string(ratio);
        warn.suggestion = "Structural system is potentially unstable; increase stiffness";
        return warn;
    }

    static RcflexWarning empirical_method_inapplicable(double ratio) {
        RcflexWarning warn(WarningCode::EMPIRICAL_METHOD_INAPPLICABLE, WarningSeverity::Medium,
            "Wall too slender for the empirical buckling method");
        warn.details["k_lu_over_32t"] = std::to_string(ratio);
        return warn;
    }

    static RcflexWarning no_reinforcement() {
        RcflexWarning warn(WarningCode::NO_REINFORCEMENT, WarningSeverity::Medium,
            "Section has no longitudinal reinforcement; tension capacity is zero");
        return warn;
    }
};

/**
 * @brief Collection of warnings from a verification.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<RcflexWarning> warnings;

    void add(const RcflexWarning& warning) {
        warnings.push_back(warning);
    }

    void add(RcflexWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Check whether a warning with the given code was recorded.
     */
    bool contains(WarningCode code) const {
        for (const auto& w : warnings) {
            if (w.code == code) return true;
        }
        return false;
    }

    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Get all warnings with given severity or higher.
     */
    std::vector<RcflexWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<RcflexWarning> result;
        for (const auto& w : warnings) {
            if (static_cast<int>(w.severity) >= static_cast<int>(min_severity)) {
                result.push_back(w);
            }
        }
        return result;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace rcflex

#endif  // RCFLEX_WARNINGS_HPP
