/**
 * @file errors.hpp
 * @brief Structured error handling for rcflex.
 *
 * This file defines error codes and error structures for reporting
 * invalid input and hard design failures in a machine-readable format.
 * Input validation failures are thrown as InputError; failures found
 * during verification are returned inside result objects.
 */

#ifndef RCFLEX_ERRORS_HPP
#define RCFLEX_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace rcflex {

/**
 * @brief Error codes for rcflex failures.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Geometry Errors (100-199) ===

    /// Section dimension is zero or negative
    INVALID_GEOMETRY = 100,

    /// Cover is negative or leaves no room for reinforcement
    INVALID_COVER = 101,

    /// Member length or effective length factor is not positive
    INVALID_MEMBER_LENGTH = 102,

    // === Material Errors (200-299) ===

    /// Concrete or steel strength is zero or negative
    INVALID_MATERIAL = 200,

    /// Stiffness factor outside (0, 1]
    INVALID_STIFFNESS_FACTOR = 201,

    // === Reinforcement Errors (300-399) ===

    /// Layer with negative area or position outside the section
    INVALID_REINFORCEMENT = 300,

    /// Layout parameters cannot produce a layer arrangement
    INVALID_LAYOUT = 301,

    // === Stability Errors (400-499) ===

    /// Slenderness ratio exceeds the maximum admitted by the design method
    SLENDERNESS_LIMIT_EXCEEDED = 400,

    /// Axial load reaches the critical buckling load
    UNSTABLE_MEMBER = 401,

    // === Configuration Errors (500-599) ===

    /// Calculation setting outside its admissible range
    INVALID_SETTINGS = 500,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case ErrorCode::INVALID_COVER: return "INVALID_COVER";
        case ErrorCode::INVALID_MEMBER_LENGTH: return "INVALID_MEMBER_LENGTH";
        case ErrorCode::INVALID_MATERIAL: return "INVALID_MATERIAL";
        case ErrorCode::INVALID_STIFFNESS_FACTOR: return "INVALID_STIFFNESS_FACTOR";
        case ErrorCode::INVALID_REINFORCEMENT: return "INVALID_REINFORCEMENT";
        case ErrorCode::INVALID_LAYOUT: return "INVALID_LAYOUT";
        case ErrorCode::SLENDERNESS_LIMIT_EXCEEDED: return "SLENDERNESS_LIMIT_EXCEEDED";
        case ErrorCode::UNSTABLE_MEMBER: return "UNSTABLE_MEMBER";
        case ErrorCode::INVALID_SETTINGS: return "INVALID_SETTINGS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for rcflex.
 *
 * Contains machine-readable error code, human-readable message,
 * and diagnostic key-value details.
 */
struct RcflexError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    RcflexError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    RcflexError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a non-positive section dimension.
     */
    static RcflexError invalid_geometry(const std::string& name, double value) {
        RcflexError err(ErrorCode::INVALID_GEOMETRY,
            "Section dimension '" + name + "' must be positive");
        err.details[name] = std::to_string(value) + " mm";
        err.suggestion = "Check section dimensions and units (mm expected)";
        return err;
    }

    /**
     * @brief Create error for a non-positive material strength.
     */
    static RcflexError invalid_material(const std::string& name, double value) {
        RcflexError err(ErrorCode::INVALID_MATERIAL,
            "Material property '" + name + "' must be positive");
        err.details[name] = std::to_string(value) + " MPa";
        err.suggestion = "Check material strengths and units (MPa expected)";
        return err;
    }

    /**
     * @brief Create error for a reinforcement layer that does not fit the section.
     */
    static RcflexError invalid_reinforcement(const std::string& reason) {
        RcflexError err(ErrorCode::INVALID_REINFORCEMENT,
            "Invalid reinforcement: " + reason);
        err.suggestion = "Layer positions are measured from the compression face "
                         "and must lie within [0, h]; areas must be non-negative";
        return err;
    }

    /**
     * @brief Create error for a calculation setting outside its admissible range.
     */
    static RcflexError invalid_settings(const std::string& name, double value,
                                        const std::string& requirement) {
        RcflexError err(ErrorCode::INVALID_SETTINGS,
            "Setting '" + name + "' must satisfy " + requirement);
        err.details[name] = std::to_string(value);
        err.suggestion = "Start from the default settings and change one value at a time";
        return err;
    }

    /**
     * @brief Create error for a member beyond the slenderness limit.
     */
    static RcflexError slenderness_exceeded(double lambda, double lambda_max) {
        RcflexError err(ErrorCode::SLENDERNESS_LIMIT_EXCEEDED,
            "Slenderness ratio exceeds the maximum admitted by the design method");
        err.details["lambda"] = std::to_string(lambda);
        err.details["lambda_max"] = std::to_string(lambda_max);
        err.suggestion = "Increase the section thickness or add lateral bracing "
                         "to reduce the unsupported length";
        return err;
    }

    /**
     * @brief Create error for an axial load at or beyond 0.75 Pc.
     */
    static RcflexError unstable(const std::string& combo, double Pu, double Pc) {
        RcflexError err(ErrorCode::UNSTABLE_MEMBER,
            "Axial load reaches the critical buckling load (Pu >= 0.75 Pc)");
        err.details["combination"] = combo;
        err.details["Pu"] = std::to_string(Pu) + " kN";
        err.details["Pc"] = std::to_string(Pc) + " kN";
        err.suggestion = "The member is unstable under this combination; "
                         "increase stiffness or reduce the effective length";
        return err;
    }
};

/**
 * @brief Exception thrown for invalid geometry, material or reinforcement input.
 *
 * Carries the structured error so callers can map it to request-level errors.
 */
class InputError : public std::invalid_argument {
public:
    explicit InputError(RcflexError error)
        : std::invalid_argument(error.to_string()), error_(std::move(error)) {}

    const RcflexError& error() const { return error_; }

    ErrorCode code() const { return error_.code; }

private:
    RcflexError error_;
};

}  // namespace rcflex

#endif  // RCFLEX_ERRORS_HPP
