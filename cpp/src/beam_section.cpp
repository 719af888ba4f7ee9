#include "rcbeam/beam_section.hpp"
#include "rcbeam/logging.hpp"
#include "rcbeam/material.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace rcbeam {

namespace {

// Below this fc' an Imperial input was most likely entered in MPa [psi]
constexpr double MIN_PLAUSIBLE_FC_IMPERIAL = 1000.0;
// Above this fc' an SI input was most likely entered in psi [MPa]
constexpr double MAX_PLAUSIBLE_FC_SI = 150.0;
// Allowed difference between supplied and ACI beta1 before warning
constexpr double BETA1_TOLERANCE = 0.01;

void require_positive(std::vector<CalculationError>& errors, ErrorCode code,
                      const char* field, double value) {
    // Rejects NaN and infinity as well as non-positive values
    if (!(std::isfinite(value) && value > 0.0)) {
        errors.push_back(CalculationError::non_positive(code, field, value));
    }
}

} // namespace

std::string to_string(StrainState state) {
    switch (state) {
        case StrainState::Defined: return "Defined";
        case StrainState::Undefined: return "Undefined";
        default: return "Unknown";
    }
}

std::string to_string(SectionClassification classification) {
    switch (classification) {
        case SectionClassification::TensionControlled: return "TensionControlled";
        case SectionClassification::Transition: return "Transition";
        case SectionClassification::CompressionControlled: return "CompressionControlled";
        case SectionClassification::Undefined: return "Undefined";
        default: return "Unknown";
    }
}

bool SectionResult::operator==(const SectionResult& other) const {
    if (warnings.count() != other.warnings.count()) return false;
    for (size_t i = 0; i < warnings.count(); ++i) {
        if (warnings.warnings[i].code != other.warnings.warnings[i].code) return false;
    }

    return unit_system == other.unit_system &&
           As == other.As && T == other.T && a == other.a && c == other.c &&
           epsilon_y == other.epsilon_y &&
           strain_state == other.strain_state &&
           epsilon_s == other.epsilon_s &&
           steel_yields == other.steel_yields && fs == other.fs &&
           lever_arm == other.lever_arm && Mn == other.Mn &&
           As_min == other.As_min && as_min_ok == other.as_min_ok &&
           epsilon_t == other.epsilon_t &&
           classification == other.classification &&
           phi == other.phi && Mu == other.Mu &&
           T_display == other.T_display && Mn_k == other.Mn_k &&
           Mn_display == other.Mn_display && Mu_display == other.Mu_display;
}

BeamSection::BeamSection(const CalculationSettings& settings)
    : settings_(settings) {}

CalculationError BeamSection::validate(const SectionInput& input) {
    std::vector<CalculationError> errors;

    require_positive(errors, ErrorCode::INVALID_CONCRETE_STRENGTH, "fc_prime", input.fc_prime);
    require_positive(errors, ErrorCode::INVALID_YIELD_STRENGTH, "fy", input.fy);
    require_positive(errors, ErrorCode::INVALID_STEEL_MODULUS, "es", input.es);
    require_positive(errors, ErrorCode::INVALID_PARAMETER, "beta1", input.beta1);
    require_positive(errors, ErrorCode::INVALID_PARAMETER, "epsilon_cu", input.epsilon_cu);
    require_positive(errors, ErrorCode::INVALID_GEOMETRY, "b", input.b);
    require_positive(errors, ErrorCode::INVALID_GEOMETRY, "h", input.h);
    require_positive(errors, ErrorCode::INVALID_GEOMETRY, "d", input.d);

    if (input.n_bars < 0) {
        errors.push_back(CalculationError::negative_reinforcement("n_bars", input.n_bars));
    }
    if (!(std::isfinite(input.bar_area) && input.bar_area >= 0.0)) {
        errors.push_back(CalculationError::negative_reinforcement("bar_area", input.bar_area));
    }

    return CalculationError::combine(errors);
}

double BeamSection::minimum_steel_area(const SectionInput& input) {
    const double bd = input.b * input.d;
    const double sqrt_fc = std::sqrt(input.fc_prime);

    double term_sqrt_fc = 0.0;
    double term_floor = 0.0;
    if (input.unit_system == UnitSystem::Imperial) {
        term_sqrt_fc = (3.0 * sqrt_fc / input.fy) * bd;
        term_floor = (200.0 / input.fy) * bd;
    } else {
        term_sqrt_fc = (0.25 * sqrt_fc / input.fy) * bd;
        term_floor = (1.4 / input.fy) * bd;
    }
    return std::max(term_sqrt_fc, term_floor);
}

double BeamSection::strength_reduction_factor(double epsilon_t) const {
    const double eps_tc = settings_.tension_controlled_strain;
    const double eps_cc = settings_.compression_controlled_strain;
    const double phi_t = settings_.phi_tension_controlled;
    const double phi_c = settings_.phi_compression_controlled;

    if (epsilon_t >= eps_tc) return phi_t;
    if (epsilon_t <= eps_cc) return phi_c;
    return phi_c + (phi_t - phi_c) * (epsilon_t - eps_cc) / (eps_tc - eps_cc);
}

SectionClassification BeamSection::classify(double epsilon_t) const {
    if (epsilon_t >= settings_.tension_controlled_strain) {
        return SectionClassification::TensionControlled;
    }
    if (epsilon_t <= settings_.compression_controlled_strain) {
        return SectionClassification::CompressionControlled;
    }
    return SectionClassification::Transition;
}

SectionResult BeamSection::compute(const SectionInput& input) const {
    CalculationError error = validate(input);
    if (error.is_error()) {
        logger()->debug("Section input rejected: {}", error.message);
        throw InvalidGeometryError(error);
    }

    SectionResult result;
    result.unit_system = input.unit_system;

    // Forces and stress block, with the steel assumed at yield
    result.As = input.steel_area();
    result.T = result.As * input.fy;
    result.a = (result.As * input.fy) /
               (settings_.stress_block_intensity * input.fc_prime * input.b);
    result.c = result.a / input.beta1;
    result.epsilon_y = material::yield_strain(input.fy, input.es);

    if (result.c > 0.0) {
        const double eps_s = input.epsilon_cu * (input.d - result.c) / result.c;
        result.strain_state = StrainState::Defined;
        result.epsilon_s = eps_s;
        result.steel_yields = eps_s >= result.epsilon_y;
        result.fs = result.steel_yields ? input.fy : eps_s * input.es;
        result.lever_arm = input.d - result.a / 2.0;
        // a stays at its yield-based value even on the elastic branch
        result.Mn = result.As * result.fs * result.lever_arm;

        result.epsilon_t = eps_s;
        result.classification = classify(eps_s);
        result.phi = strength_reduction_factor(eps_s);
    } else {
        // No tension steel: the neutral axis sits at the top fibre
        result.strain_state = StrainState::Undefined;
        result.epsilon_s.reset();
        result.steel_yields = false;
        result.fs = 0.0;
        result.lever_arm = input.d;
        result.Mn = 0.0;

        result.epsilon_t.reset();
        result.classification = SectionClassification::Undefined;
        result.phi = settings_.phi_tension_controlled;
    }
    result.Mu = result.phi * result.Mn;

    result.As_min = minimum_steel_area(input);
    result.as_min_ok = result.As >= result.As_min;

    const DisplayScale scale = display_scale_for(input.unit_system);
    result.T_display = result.T / scale.force;
    result.Mn_k = result.Mn / scale.moment_k;
    result.Mn_display = result.Mn / scale.moment_display;
    result.Mu_display = result.Mu / scale.moment_display;

    if (settings_.collect_warnings) {
        collect_warnings(input, result);
    }

    auto log = logger();
    log->debug("As={} T={} a={} c={} eps_y={} state={}",
               result.As, result.T, result.a, result.c, result.epsilon_y,
               to_string(result.strain_state));
    log->debug("fs={} Mn={} ({} {}) As_min={} ok={} phi={}",
               result.fs, result.Mn, result.Mn_display,
               unit_labels(input.unit_system).moment_display,
               result.As_min, result.as_min_ok, result.phi);

    return result;
}

void BeamSection::collect_warnings(const SectionInput& input, SectionResult& result) const {
    WarningList& warnings = result.warnings;

    if (input.d >= input.h) {
        warnings.add(CalculationWarning::steel_outside_section(input.d, input.h));
    }

    const bool implausible_fc = input.unit_system == UnitSystem::Imperial
        ? input.fc_prime < MIN_PLAUSIBLE_FC_IMPERIAL
        : input.fc_prime > MAX_PLAUSIBLE_FC_SI;
    if (implausible_fc) {
        warnings.add(CalculationWarning::possible_unit_error(
            input.fc_prime, to_string(input.unit_system)));
    }

    const double aci_beta1 = material::compute_beta1(input.fc_prime, input.unit_system);
    if (std::abs(aci_beta1 - input.beta1) > BETA1_TOLERANCE) {
        warnings.add(CalculationWarning::beta1_mismatch(input.beta1, aci_beta1));
    }

    if (result.is_degenerate()) {
        warnings.add(CalculationWarning::no_reinforcement());
    } else if (!result.steel_yields) {
        warnings.add(CalculationWarning::steel_not_yielding(*result.epsilon_s, result.epsilon_y));
    }

    if (!result.as_min_ok) {
        warnings.add(CalculationWarning::below_minimum_steel(result.As, result.As_min));
    }

    // Warnings are returned in the result; the log only traces them
    auto log = logger();
    for (const auto& w : warnings.warnings) {
        log->debug("{}", w.to_string());
    }
}

SectionResult compute(const SectionInput& input) {
    static const BeamSection section;
    return section.compute(input);
}

} // namespace rcbeam
