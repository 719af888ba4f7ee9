#pragma once

#include "rcbeam/beam_section.hpp"
#include "rcbeam/section_input.hpp"
#include "rcbeam/settings.hpp"

#include <Eigen/Dense>

namespace rcbeam {

/**
 * @brief Sampled strain and stress distribution over the section depth
 *
 * Depth y is measured down from the extreme compression fibre (y = 0)
 * to the bottom face (y = h). Strains are compression positive, so the
 * tension steel strain appears as -epsilon_s.
 *
 * This is plain data for diagram collaborators; it has no effect on
 * the capacity calculation.
 */
struct SectionProfile {
    Eigen::VectorXd depth;            ///< Sample depths y [in or mm]
    Eigen::VectorXd strain;           ///< Linear strain at y, epsilon_cu * (c - y) / c
    Eigen::VectorXd concrete_stress;  ///< Whitney block stress at y [psi or MPa]

    double neutral_axis_depth = 0.0;  ///< c
    double block_depth = 0.0;         ///< a
    double block_stress = 0.0;        ///< stress_block_intensity * fc'

    double steel_depth = 0.0;         ///< d
    double steel_strain = 0.0;        ///< epsilon_s (tension positive)
    double steel_stress = 0.0;        ///< fs

    /// Compression resultant C = block_stress * a * b, acting at a/2
    double compression_force = 0.0;
    /// Tension resultant As * fs, acting at d
    double tension_force = 0.0;
    /// Distance between the two resultants, d - a/2
    double lever_arm = 0.0;

    Eigen::Index size() const { return depth.size(); }
};

/**
 * @brief Sample the strain and stress distribution of a computed section
 *
 * @param input The input that produced result
 * @param result Result of BeamSection::compute for input
 * @param n_points Number of samples from y = 0 to y = h (at least 2)
 * @param settings Settings of the BeamSection that produced result
 * @return SectionProfile Sampled distribution
 * @throws std::invalid_argument if n_points < 2 or the strain state is undefined
 */
SectionProfile sample_profile(const SectionInput& input, const SectionResult& result,
                              int n_points = 51,
                              const CalculationSettings& settings = CalculationSettings());

} // namespace rcbeam
