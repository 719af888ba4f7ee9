#pragma once

#include "rcbeam/units.hpp"

namespace rcbeam {

/**
 * @brief Material relations for concrete and reinforcing steel
 *
 * Stresses are in the native stress unit of the unit system
 * (psi for Imperial, MPa for SI). Strains are dimensionless.
 */
namespace material {

/// fc' at or below which beta1 = 0.85 [psi]
constexpr double BETA1_LOWER_FC_IMPERIAL = 4000.0;
/// fc' at or above which beta1 = 0.65 [psi]
constexpr double BETA1_UPPER_FC_IMPERIAL = 8000.0;
/// fc' at or below which beta1 = 0.85 [MPa]
constexpr double BETA1_LOWER_FC_SI = 28.0;
/// fc' at or above which beta1 = 0.65 [MPa]
constexpr double BETA1_UPPER_FC_SI = 55.0;

constexpr double BETA1_MAX = 0.85;
constexpr double BETA1_MIN = 0.65;

/**
 * @brief Stress block factor beta1 per ACI 318
 *
 * Imperial: 0.85 for fc' <= 4000 psi, 0.65 for fc' >= 8000 psi,
 *           0.85 - 0.05 * (fc' - 4000) / 1000 in between.
 * SI:       0.85 for fc' <= 28 MPa, 0.65 for fc' >= 55 MPa,
 *           0.85 - 0.05 * (fc' - 28) / 7 in between.
 *
 * The engine does not call this; beta1 is a caller-supplied input.
 *
 * @param fc_prime Concrete compressive strength [psi or MPa]
 * @param system Unit system fc_prime is expressed in
 * @return double beta1 (dimensionless)
 * @throws std::invalid_argument if fc_prime <= 0
 */
double compute_beta1(double fc_prime, UnitSystem system);

/**
 * @brief Yield strain of reinforcing steel, epsilon_y = fy / Es
 */
double yield_strain(double fy, double es);

} // namespace material

} // namespace rcbeam
