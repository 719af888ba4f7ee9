/**
 * @file warnings.hpp
 * @brief Warning system for questionable section inputs and results.
 *
 * Warnings indicate potential issues that don't prevent the calculation
 * but may indicate input errors or a section that needs redesign.
 */

#ifndef RCBEAM_WARNINGS_HPP
#define RCBEAM_WARNINGS_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace rcbeam {

/**
 * @brief Warning codes for questionable inputs and results.
 */
enum class WarningCode {
    // === Geometry Warnings (100-199) ===

    /// Effective depth is at or beyond the total depth (d >= h)
    STEEL_OUTSIDE_SECTION = 100,

    // === Property Warnings (200-299) ===

    /// fc' magnitude is implausible for the selected unit system
    POSSIBLE_UNIT_ERROR = 200,

    /// Supplied beta1 differs from the ACI 318 value for fc'
    BETA1_MISMATCH = 201,

    // === Reinforcement Warnings (300-399) ===

    /// No tension steel; strain state is undefined
    NO_REINFORCEMENT = 300,

    /// Tension steel does not reach yield at ultimate
    STEEL_NOT_YIELDING = 301,

    /// Steel area is below the code minimum
    BELOW_MINIMUM_STEEL = 302
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates an input error
    High = 2
};

inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::STEEL_OUTSIDE_SECTION: return "STEEL_OUTSIDE_SECTION";
        case WarningCode::POSSIBLE_UNIT_ERROR: return "POSSIBLE_UNIT_ERROR";
        case WarningCode::BETA1_MISMATCH: return "BETA1_MISMATCH";
        case WarningCode::NO_REINFORCEMENT: return "NO_REINFORCEMENT";
        case WarningCode::STEEL_NOT_YIELDING: return "STEEL_NOT_YIELDING";
        case WarningCode::BELOW_MINIMUM_STEEL: return "BELOW_MINIMUM_STEEL";
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
 * @brief Structured warning information for a calculation.
 */
struct CalculationWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    CalculationWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    static CalculationWarning steel_outside_section(double d, double h) {
        CalculationWarning warn(WarningCode::STEEL_OUTSIDE_SECTION, WarningSeverity::High,
            "Effective depth d is not inside the section depth h");
        warn.details["d"] = std::to_string(d);
        warn.details["h"] = std::to_string(h);
        warn.suggestion = "Check d and h; the tension steel must lie above the bottom face";
        return warn;
    }

    static CalculationWarning possible_unit_error(double fc_prime, const std::string& system) {
        CalculationWarning warn(WarningCode::POSSIBLE_UNIT_ERROR, WarningSeverity::Medium,
            "Concrete strength is implausible for the selected unit system");
        warn.details["fc_prime"] = std::to_string(fc_prime);
        warn.details["unit_system"] = system;
        warn.suggestion = system == "imperial"
            ? "Imperial inputs expect fc' in psi (e.g. 4000), not MPa"
            : "SI inputs expect fc' in MPa (e.g. 28), not psi";
        return warn;
    }

    static CalculationWarning beta1_mismatch(double supplied, double derived) {
        CalculationWarning warn(WarningCode::BETA1_MISMATCH, WarningSeverity::Low,
            "beta1 differs from the ACI 318 value for this fc'");
        warn.details["beta1_supplied"] = std::to_string(supplied);
        warn.details["beta1_aci"] = std::to_string(derived);
        warn.suggestion = "Ignore if the override is intentional";
        return warn;
    }

    static CalculationWarning no_reinforcement() {
        CalculationWarning warn(WarningCode::NO_REINFORCEMENT, WarningSeverity::High,
            "Section has no tension steel; strain state is undefined and Mn = 0");
        warn.suggestion = "Add tension bars (n_bars > 0, bar_area > 0)";
        return warn;
    }

    static CalculationWarning steel_not_yielding(double epsilon_s, double epsilon_y) {
        CalculationWarning warn(WarningCode::STEEL_NOT_YIELDING, WarningSeverity::Medium,
            "Tension steel does not yield; section is over-reinforced");
        warn.details["epsilon_s"] = std::to_string(epsilon_s);
        warn.details["epsilon_y"] = std::to_string(epsilon_y);
        warn.suggestion = "Reduce steel area or increase section width or depth";
        return warn;
    }

    static CalculationWarning below_minimum_steel(double as, double as_min) {
        CalculationWarning warn(WarningCode::BELOW_MINIMUM_STEEL, WarningSeverity::Medium,
            "Steel area is below the code minimum");
        warn.details["As"] = std::to_string(as);
        warn.details["As_min"] = std::to_string(as_min);
        warn.suggestion = "Increase the number or size of bars";
        return warn;
    }
};

/**
 * @brief Collection of warnings raised by one calculation.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<CalculationWarning> warnings;

    void add(const CalculationWarning& warning) {
        warnings.push_back(warning);
    }

    void add(CalculationWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Check whether a warning with the given code was raised.
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
    std::vector<CalculationWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<CalculationWarning> result;
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

}  // namespace rcbeam

#endif  // RCBEAM_WARNINGS_HPP
