#include "rcbeam/section_input.hpp"
#include "rcbeam/material.hpp"
#include "rcbeam/logging.hpp"

namespace rcbeam {

SectionInput SectionInput::with_derived_beta1() const {
    SectionInput copy = *this;
    copy.beta1 = material::compute_beta1(fc_prime, unit_system);
    return copy;
}

bool SectionInput::operator==(const SectionInput& other) const {
    return fc_prime == other.fc_prime && fy == other.fy && es == other.es &&
           beta1 == other.beta1 && epsilon_cu == other.epsilon_cu &&
           b == other.b && h == other.h && d == other.d &&
           n_bars == other.n_bars && bar_area == other.bar_area &&
           unit_system == other.unit_system;
}

SectionInput default_section_input(UnitSystem system) {
    SectionInput input;
    input.unit_system = system;
    input.beta1 = 0.85;
    input.epsilon_cu = 0.003;

    if (system == UnitSystem::Imperial) {
        input.fc_prime = 4000.0;
        input.fy = 60000.0;
        input.es = 29000000.0;
        input.b = 12.0;
        input.h = 20.0;
        input.d = 17.5;
        input.n_bars = 4;
        input.bar_area = 0.79;
    } else {
        input.fc_prime = 20.0;
        input.fy = 420.0;
        input.es = 200000.0;
        input.b = 250.0;
        input.h = 565.0;
        input.d = 500.0;
        input.n_bars = 3;
        input.bar_area = 510.0;
    }
    return input;
}

SectionInput switch_unit_system(const SectionInput& current, UnitSystem target) {
    if (current.unit_system != target) {
        logger()->debug("Unit system switched from {} to {}; inputs reset to defaults",
                        to_string(current.unit_system), to_string(target));
    }
    return default_section_input(target);
}

} // namespace rcbeam
