#pragma once

#include <string>

namespace rcbeam {

/**
 * @brief Unit system of a calculation
 *
 * Each system is self-consistent in its native units:
 * - Imperial: psi, in, in², lb, lb-in
 * - SI: MPa, mm, mm², N, N-mm
 *
 * Selecting a system changes the default input set and the minimum steel
 * formula constants. No conversion is ever performed between systems.
 */
enum class UnitSystem {
    Imperial = 0,
    SI = 1
};

/**
 * @brief Display labels for every quantity reported by the engine
 */
struct UnitLabels {
    std::string length;          ///< in / mm
    std::string area;            ///< in^2 / mm^2
    std::string force;           ///< lb / N
    std::string force_k;         ///< kips / kN
    std::string stress;          ///< psi / MPa
    std::string moment;          ///< lb-in / N-mm
    std::string moment_k;        ///< k-in / N-mm
    std::string moment_display;  ///< k-ft / kN-m
};

/**
 * @brief Scale factors from native units to reported display units
 *
 * Native value divided by the factor gives the display value.
 */
struct DisplayScale {
    double force;           ///< lb -> kips, N -> kN
    double moment_k;        ///< lb-in -> k-in, N-mm -> N-mm
    double moment_display;  ///< lb-in -> k-ft, N-mm -> kN-m
};

namespace display_scale {
    constexpr double IMPERIAL_FORCE = 1000.0;
    constexpr double IMPERIAL_MOMENT_K = 1000.0;
    constexpr double IMPERIAL_MOMENT_DISPLAY = 12000.0;
    constexpr double SI_FORCE = 1000.0;
    constexpr double SI_MOMENT_K = 1.0;
    constexpr double SI_MOMENT_DISPLAY = 1.0e6;
}

/**
 * @brief Get the display labels for a unit system
 */
UnitLabels unit_labels(UnitSystem system);

/**
 * @brief Get the display scale factors for a unit system
 */
DisplayScale display_scale_for(UnitSystem system);

/**
 * @brief Lower-case name of the unit system ("imperial" or "si")
 */
std::string to_string(UnitSystem system);

/**
 * @brief Parse a unit system name
 *
 * Accepts "imperial" or "si" in any letter case.
 *
 * @throws std::invalid_argument for any other name
 */
UnitSystem parse_unit_system(const std::string& name);

} // namespace rcbeam
