#pragma once

namespace rcbeam {

/**
 * @brief Settings for the flexural capacity calculation
 *
 * Defaults reproduce ACI 318 for a singly-reinforced rectangular section.
 */
struct CalculationSettings {
    /// Intensity of the equivalent rectangular stress block, as a fraction of fc'
    double stress_block_intensity = 0.85;

    /// Strength reduction factor for tension-controlled sections
    double phi_tension_controlled = 0.90;

    /// Strength reduction factor for compression-controlled sections
    /// (tied transverse reinforcement)
    double phi_compression_controlled = 0.65;

    /// Net tensile strain at or above which the section is tension-controlled
    double tension_controlled_strain = 0.005;

    /// Net tensile strain at or below which the section is compression-controlled
    double compression_controlled_strain = 0.002;

    /// Attach soft-validation warnings to each result
    bool collect_warnings = true;
};

} // namespace rcbeam
