#include "rcbeam/section_profile.hpp"

#include <stdexcept>

namespace rcbeam {

SectionProfile sample_profile(const SectionInput& input, const SectionResult& result,
                              int n_points, const CalculationSettings& settings) {
    if (n_points < 2) {
        throw std::invalid_argument("sample_profile: at least 2 sample points are required");
    }
    if (result.is_degenerate()) {
        throw std::invalid_argument(
            "sample_profile: strain state is undefined (section has no tension steel)");
    }

    SectionProfile profile;
    profile.neutral_axis_depth = result.c;
    profile.block_depth = result.a;
    profile.block_stress = settings.stress_block_intensity * input.fc_prime;
    profile.steel_depth = input.d;
    profile.steel_strain = *result.epsilon_s;
    profile.steel_stress = result.fs;

    profile.depth = Eigen::VectorXd::LinSpaced(n_points, 0.0, input.h);

    // Plane sections: strain varies linearly from epsilon_cu at the top fibre
    const double curvature = input.epsilon_cu / result.c;
    profile.strain = (result.c - profile.depth.array()) * curvature;

    profile.concrete_stress =
        (profile.depth.array() <= result.a).cast<double>().matrix() * profile.block_stress;

    profile.compression_force = profile.block_stress * result.a * input.b;
    profile.tension_force = result.As * result.fs;
    profile.lever_arm = result.lever_arm;

    return profile;
}

} // namespace rcbeam
