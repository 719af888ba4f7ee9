#include "rcbeam/units.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rcbeam {

UnitLabels unit_labels(UnitSystem system) {
    if (system == UnitSystem::Imperial) {
        return UnitLabels{"in", "in^2", "lb", "kips", "psi", "lb-in", "k-in", "k-ft"};
    }
    return UnitLabels{"mm", "mm^2", "N", "kN", "MPa", "N-mm", "N-mm", "kN-m"};
}

DisplayScale display_scale_for(UnitSystem system) {
    if (system == UnitSystem::Imperial) {
        return DisplayScale{display_scale::IMPERIAL_FORCE,
                            display_scale::IMPERIAL_MOMENT_K,
                            display_scale::IMPERIAL_MOMENT_DISPLAY};
    }
    return DisplayScale{display_scale::SI_FORCE,
                        display_scale::SI_MOMENT_K,
                        display_scale::SI_MOMENT_DISPLAY};
}

std::string to_string(UnitSystem system) {
    switch (system) {
        case UnitSystem::Imperial: return "imperial";
        case UnitSystem::SI: return "si";
        default: return "unknown";
    }
}

UnitSystem parse_unit_system(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "imperial") {
        return UnitSystem::Imperial;
    }
    if (lowered == "si") {
        return UnitSystem::SI;
    }
    throw std::invalid_argument("Unknown unit system: '" + name +
                                "' (expected 'imperial' or 'si')");
}

} // namespace rcbeam
