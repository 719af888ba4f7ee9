/**
 * @file errors.hpp
 * @brief Structured error handling for rcbeam.
 *
 * Input validation failures are reported as a machine-readable error
 * record carried by an InvalidGeometryError exception.
 */

#ifndef RCBEAM_ERRORS_HPP
#define RCBEAM_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rcbeam {

/**
 * @brief Error codes for rejected section inputs.
 */
enum class ErrorCode {
    /// No error - input accepted
    OK = 0,

    // === Material Errors (100-199) ===

    /// Concrete compressive strength fc' is not positive
    INVALID_CONCRETE_STRENGTH = 100,

    /// Steel yield strength fy is not positive
    INVALID_YIELD_STRENGTH = 101,

    /// Steel modulus Es is not positive
    INVALID_STEEL_MODULUS = 102,

    // === Geometry Errors (200-299) ===

    /// Width, total depth or effective depth is not positive
    INVALID_GEOMETRY = 200,

    // === Reinforcement Errors (300-399) ===

    /// Bar count or bar area is negative
    INVALID_REINFORCEMENT = 300,

    // === Parameter Errors (400-499) ===

    /// beta1 or epsilon_cu is not positive
    INVALID_PARAMETER = 400,

    // === Generic Errors (900-999) ===

    /// Several fields were rejected at once
    MULTIPLE_INVALID_FIELDS = 900,

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_CONCRETE_STRENGTH: return "INVALID_CONCRETE_STRENGTH";
        case ErrorCode::INVALID_YIELD_STRENGTH: return "INVALID_YIELD_STRENGTH";
        case ErrorCode::INVALID_STEEL_MODULUS: return "INVALID_STEEL_MODULUS";
        case ErrorCode::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case ErrorCode::INVALID_REINFORCEMENT: return "INVALID_REINFORCEMENT";
        case ErrorCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case ErrorCode::MULTIPLE_INVALID_FIELDS: return "MULTIPLE_INVALID_FIELDS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for a rejected input.
 *
 * Lists every offending field together with the value it had,
 * so the presentation layer can flag all of them at once.
 */
struct CalculationError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Names of the rejected input fields
    std::vector<std::string> invalid_fields;

    /// Field name -> offending value
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    CalculationError()
        : code(ErrorCode::OK), message("OK") {}

    CalculationError(ErrorCode code, const std::string& message)
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

        if (!invalid_fields.empty()) {
            result += "\n  Invalid fields: ";
            for (size_t i = 0; i < invalid_fields.size(); ++i) {
                if (i > 0) result += ", ";
                result += invalid_fields[i];
                auto it = details.find(invalid_fields[i]);
                if (it != details.end()) {
                    result += " = " + it->second;
                }
            }
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a non-positive magnitude.
     */
    static CalculationError non_positive(ErrorCode code, const std::string& field,
                                         double value) {
        CalculationError err(code, "Input '" + field + "' must be finite and positive");
        err.invalid_fields.push_back(field);
        err.details[field] = std::to_string(value);
        err.suggestion = "Enter a positive value for " + field + ".";
        return err;
    }

    /**
     * @brief Create error for a negative or non-finite reinforcement quantity.
     */
    static CalculationError negative_reinforcement(const std::string& field, double value) {
        CalculationError err(ErrorCode::INVALID_REINFORCEMENT,
            "Input '" + field + "' must be finite and not negative");
        err.invalid_fields.push_back(field);
        err.details[field] = std::to_string(value);
        err.suggestion = "Use zero bars only to inspect an unreinforced section.";
        return err;
    }

    /**
     * @brief Combine several single-field errors into one record.
     *
     * A single error is returned unchanged.
     */
    static CalculationError combine(const std::vector<CalculationError>& errors) {
        if (errors.empty()) return CalculationError();
        if (errors.size() == 1) return errors.front();

        CalculationError err(ErrorCode::MULTIPLE_INVALID_FIELDS,
            std::to_string(errors.size()) + " inputs were rejected");
        for (const auto& e : errors) {
            err.invalid_fields.insert(err.invalid_fields.end(),
                                      e.invalid_fields.begin(), e.invalid_fields.end());
            err.details.insert(e.details.begin(), e.details.end());
        }
        err.suggestion = "Correct every listed field and recalculate.";
        return err;
    }
};

/**
 * @brief Thrown when a section input is rejected.
 *
 * No result is produced; the input must be corrected.
 */
class InvalidGeometryError : public std::invalid_argument {
public:
    explicit InvalidGeometryError(CalculationError error)
        : std::invalid_argument(error.to_string()), error_(std::move(error)) {}

    const CalculationError& error() const noexcept { return error_; }

private:
    CalculationError error_;
};

}  // namespace rcbeam

#endif  // RCBEAM_ERRORS_HPP
