#pragma once

#include "rcbeam/errors.hpp"
#include "rcbeam/section_input.hpp"
#include "rcbeam/settings.hpp"
#include "rcbeam/units.hpp"
#include "rcbeam/warnings.hpp"

#include <optional>
#include <string>

namespace rcbeam {

/**
 * @brief Whether the strain distribution at ultimate is defined
 *
 * Undefined only when there is no tension steel (As == 0), which puts
 * the neutral axis at the extreme compression fibre (c == 0).
 */
enum class StrainState {
    Defined = 0,
    Undefined = 1
};

/**
 * @brief ACI 318 classification by net tensile strain epsilon_t
 */
enum class SectionClassification {
    TensionControlled = 0,      ///< epsilon_t >= 0.005
    Transition = 1,             ///< 0.002 < epsilon_t < 0.005
    CompressionControlled = 2,  ///< epsilon_t <= 0.002
    Undefined = 3               ///< No tension steel
};

std::string to_string(StrainState state);
std::string to_string(SectionClassification classification);

/**
 * @brief Result of one flexural capacity calculation
 *
 * All native quantities use the units of the input's unit system
 * (forces [lb or N], moments [lb-in or N-mm]). The *_display fields are
 * scaled by the factors in rcbeam/units.hpp.
 */
struct SectionResult {
    UnitSystem unit_system = UnitSystem::Imperial;

    double As = 0.0;          ///< Total tension steel area
    double T = 0.0;           ///< Tension force at yield, As * fy
    double a = 0.0;           ///< Depth of equivalent stress block
    double c = 0.0;           ///< Neutral axis depth
    double epsilon_y = 0.0;   ///< Steel yield strain, fy / Es

    StrainState strain_state = StrainState::Defined;
    std::optional<double> epsilon_s;  ///< Steel strain at ultimate (empty if undefined)
    bool steel_yields = false;        ///< epsilon_s >= epsilon_y
    double fs = 0.0;                  ///< Steel stress used for Mn

    double lever_arm = 0.0;   ///< d - a/2
    double Mn = 0.0;          ///< Nominal moment strength

    double As_min = 0.0;      ///< Minimum steel area per ACI 318
    bool as_min_ok = false;   ///< As >= As_min

    std::optional<double> epsilon_t;  ///< Net tensile strain (empty if undefined)
    SectionClassification classification = SectionClassification::Undefined;
    double phi = 0.0;         ///< Strength reduction factor
    double Mu = 0.0;          ///< Design moment strength, phi * Mn

    double T_display = 0.0;   ///< T in kips / kN
    double Mn_k = 0.0;        ///< Mn in k-in / N-mm
    double Mn_display = 0.0;  ///< Mn in k-ft / kN-m
    double Mu_display = 0.0;  ///< Mu in k-ft / kN-m

    WarningList warnings;     ///< Soft-validation warnings

    bool is_degenerate() const { return strain_state == StrainState::Undefined; }

    /**
     * @brief Field-by-field exact comparison
     *
     * Warnings are compared by code sequence.
     */
    bool operator==(const SectionResult& other) const;
    bool operator!=(const SectionResult& other) const { return !(*this == other); }
};

/**
 * @brief Flexural capacity of a singly-reinforced rectangular section
 *
 * Whitney rectangular stress block per ACI 318. The calculation is a pure
 * function of the input and the settings; a BeamSection holds no
 * per-call state and may be shared between threads.
 *
 * Steps, in order:
 * 1. As = n_bars * bar_area
 * 2. T = As * fy
 * 3. a = As * fy / (0.85 * fc' * b)   (always with fy, never re-iterated)
 * 4. c = a / beta1
 * 5. epsilon_y = fy / Es
 * 6. epsilon_s = epsilon_cu * (d - c) / c   (undefined when c == 0)
 * 7. fs = fy if epsilon_s >= epsilon_y, else epsilon_s * Es
 * 8. Mn = As * fs * (d - a/2)
 * 9. As_min and the minimum steel check
 * 10. phi, Mu and display conversions
 *
 * Example:
 * @code
 * BeamSection section;
 * SectionResult r = section.compute(default_section_input(UnitSystem::Imperial));
 * // r.Mn_display == 239.79 k-ft
 * @endcode
 */
class BeamSection {
public:
    explicit BeamSection(const CalculationSettings& settings = CalculationSettings());

    /**
     * @brief Compute the flexural capacity of a section
     *
     * @param input Section input record
     * @return SectionResult All derived quantities
     * @throws InvalidGeometryError if any required magnitude is non-positive
     *         or a reinforcement quantity is negative
     */
    SectionResult compute(const SectionInput& input) const;

    /**
     * @brief Check an input without computing
     *
     * Rejects fc', fy, Es, beta1, epsilon_cu, b, h, d <= 0 and
     * n_bars, bar_area < 0. Zero reinforcement is accepted and gives
     * the degenerate strain state.
     *
     * @return CalculationError OK if the input is accepted
     */
    static CalculationError validate(const SectionInput& input);

    /**
     * @brief Minimum tension steel area per ACI 318
     *
     * Imperial: max(3 * sqrt(fc') / fy * b * d, 200 / fy * b * d)
     * SI:       max(0.25 * sqrt(fc') / fy * b * d, 1.4 / fy * b * d)
     */
    static double minimum_steel_area(const SectionInput& input);

    /**
     * @brief Strength reduction factor for a net tensile strain
     *
     * phi_tension for epsilon_t >= tension_controlled_strain,
     * phi_compression for epsilon_t <= compression_controlled_strain,
     * linear in between.
     */
    double strength_reduction_factor(double epsilon_t) const;

    SectionClassification classify(double epsilon_t) const;

    const CalculationSettings& settings() const { return settings_; }

private:
    CalculationSettings settings_;

    void collect_warnings(const SectionInput& input, SectionResult& result) const;
};

/**
 * @brief Compute with default settings
 *
 * @throws InvalidGeometryError if the input is rejected
 */
SectionResult compute(const SectionInput& input);

} // namespace rcbeam
