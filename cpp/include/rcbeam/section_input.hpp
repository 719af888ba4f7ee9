#pragma once

#include "rcbeam/units.hpp"

namespace rcbeam {

/**
 * @brief Input record for a singly-reinforced rectangular section
 *
 * All magnitudes are in the native units of unit_system:
 * - Imperial: stresses [psi], lengths [in], areas [in²]
 * - SI: stresses [MPa], lengths [mm], areas [mm²]
 *
 * The record is a plain value. It is validated by BeamSection::compute,
 * not on construction, so exploratory values can be assembled freely.
 */
struct SectionInput {
    double fc_prime = 0.0;    ///< Concrete compressive strength
    double fy = 0.0;          ///< Steel yield strength
    double es = 0.0;          ///< Steel modulus of elasticity
    double beta1 = 0.85;      ///< Stress block factor (caller-supplied)
    double epsilon_cu = 0.003; ///< Ultimate concrete strain

    double b = 0.0;           ///< Section width
    double h = 0.0;           ///< Total section depth
    double d = 0.0;           ///< Effective depth to tension steel centroid

    int n_bars = 0;           ///< Number of tension bars
    double bar_area = 0.0;    ///< Area of one bar

    UnitSystem unit_system = UnitSystem::Imperial;

    /**
     * @brief Total tension steel area, As = n_bars * bar_area
     */
    double steel_area() const { return n_bars * bar_area; }

    /**
     * @brief Copy of this input with beta1 derived from fc' per ACI 318
     *
     * @throws std::invalid_argument if fc_prime <= 0
     */
    SectionInput with_derived_beta1() const;

    bool operator==(const SectionInput& other) const;
    bool operator!=(const SectionInput& other) const { return !(*this == other); }
};

/**
 * @brief Canonical default input for a unit system
 *
 * Imperial: fc'=4000 psi, fy=60000 psi, Es=29e6 psi, beta1=0.85,
 *           epsilon_cu=0.003, b=12 in, h=20 in, d=17.5 in, 4 bars of 0.79 in².
 * SI:       fc'=20 MPa, fy=420 MPa, Es=200000 MPa, beta1=0.85,
 *           epsilon_cu=0.003, b=250 mm, h=565 mm, d=500 mm, 3 bars of 510 mm².
 */
SectionInput default_section_input(UnitSystem system);

/**
 * @brief Change the unit system of an input
 *
 * This is a destructive reset: the result is the default input of the
 * target system. Current values are discarded, never converted.
 */
SectionInput switch_unit_system(const SectionInput& current, UnitSystem target);

} // namespace rcbeam
