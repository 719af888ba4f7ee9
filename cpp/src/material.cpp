#include "rcbeam/material.hpp"

#include <stdexcept>

namespace rcbeam {
namespace material {

double compute_beta1(double fc_prime, UnitSystem system) {
    if (!(fc_prime > 0.0)) {
        throw std::invalid_argument("compute_beta1: fc' must be positive");
    }

    if (system == UnitSystem::Imperial) {
        if (fc_prime <= BETA1_LOWER_FC_IMPERIAL) return BETA1_MAX;
        if (fc_prime >= BETA1_UPPER_FC_IMPERIAL) return BETA1_MIN;
        return BETA1_MAX - 0.05 * (fc_prime - BETA1_LOWER_FC_IMPERIAL) / 1000.0;
    }

    if (fc_prime <= BETA1_LOWER_FC_SI) return BETA1_MAX;
    if (fc_prime >= BETA1_UPPER_FC_SI) return BETA1_MIN;
    return BETA1_MAX - 0.05 * (fc_prime - BETA1_LOWER_FC_SI) / 7.0;
}

double yield_strain(double fy, double es) {
    return fy / es;
}

} // namespace material
} // namespace rcbeam
