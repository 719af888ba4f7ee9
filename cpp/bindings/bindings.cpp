#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/operators.h>

#include "rcbeam/units.hpp"
#include "rcbeam/material.hpp"
#include "rcbeam/section_input.hpp"
#include "rcbeam/settings.hpp"
#include "rcbeam/errors.hpp"
#include "rcbeam/warnings.hpp"
#include "rcbeam/beam_section.hpp"
#include "rcbeam/section_profile.hpp"
#include "rcbeam/logging.hpp"

namespace py = pybind11;

/**
 * rcbeam C++ Python bindings module.
 * Exposes the flexural capacity engine to the Python presentation layer.
 */
PYBIND11_MODULE(_rcbeam_cpp, m) {
    m.doc() = "rcbeam C++ core module - ACI 318 flexural capacity of rectangular sections";

    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Units
    // ========================================================================

    py::enum_<rcbeam::UnitSystem>(m, "UnitSystem",
        "Unit system of a calculation (no conversion between systems)")
        .value("Imperial", rcbeam::UnitSystem::Imperial, "psi, in, lb")
        .value("SI", rcbeam::UnitSystem::SI, "MPa, mm, N")
        .export_values();

    py::class_<rcbeam::UnitLabels>(m, "UnitLabels", "Display labels for a unit system")
        .def_readonly("length", &rcbeam::UnitLabels::length)
        .def_readonly("area", &rcbeam::UnitLabels::area)
        .def_readonly("force", &rcbeam::UnitLabels::force)
        .def_readonly("force_k", &rcbeam::UnitLabels::force_k)
        .def_readonly("stress", &rcbeam::UnitLabels::stress)
        .def_readonly("moment", &rcbeam::UnitLabels::moment)
        .def_readonly("moment_k", &rcbeam::UnitLabels::moment_k)
        .def_readonly("moment_display", &rcbeam::UnitLabels::moment_display);

    m.def("unit_labels", &rcbeam::unit_labels, py::arg("system"),
          "Get the display labels for a unit system");

    m.def("parse_unit_system", &rcbeam::parse_unit_system, py::arg("name"),
          "Parse 'imperial' or 'si' (case-insensitive)");

    m.def("compute_beta1", &rcbeam::material::compute_beta1,
          py::arg("fc_prime"), py::arg("system"),
          "Stress block factor beta1 per ACI 318 for the given fc'");

    // ========================================================================
    // Input and settings
    // ========================================================================

    py::class_<rcbeam::SectionInput>(m, "SectionInput",
        "Input record for a singly-reinforced rectangular section")
        .def(py::init<>())
        .def_readwrite("fc_prime", &rcbeam::SectionInput::fc_prime, "Concrete strength [psi or MPa]")
        .def_readwrite("fy", &rcbeam::SectionInput::fy, "Steel yield strength [psi or MPa]")
        .def_readwrite("es", &rcbeam::SectionInput::es, "Steel modulus [psi or MPa]")
        .def_readwrite("beta1", &rcbeam::SectionInput::beta1, "Stress block factor")
        .def_readwrite("epsilon_cu", &rcbeam::SectionInput::epsilon_cu, "Ultimate concrete strain")
        .def_readwrite("b", &rcbeam::SectionInput::b, "Width [in or mm]")
        .def_readwrite("h", &rcbeam::SectionInput::h, "Total depth [in or mm]")
        .def_readwrite("d", &rcbeam::SectionInput::d, "Effective depth [in or mm]")
        .def_readwrite("n_bars", &rcbeam::SectionInput::n_bars, "Number of tension bars")
        .def_readwrite("bar_area", &rcbeam::SectionInput::bar_area, "Area per bar [in² or mm²]")
        .def_readwrite("unit_system", &rcbeam::SectionInput::unit_system, "Unit system")
        .def("steel_area", &rcbeam::SectionInput::steel_area, "Total steel area As")
        .def("with_derived_beta1", &rcbeam::SectionInput::with_derived_beta1,
             "Copy with beta1 derived from fc'")
        .def(py::self == py::self)
        .def("__repr__", [](const rcbeam::SectionInput& in) {
            return "<SectionInput " + rcbeam::to_string(in.unit_system) +
                   " b=" + std::to_string(in.b) +
                   " d=" + std::to_string(in.d) +
                   " As=" + std::to_string(in.steel_area()) + ">";
        });

    m.def("default_section_input", &rcbeam::default_section_input, py::arg("system"),
          "Canonical default input for a unit system");

    m.def("switch_unit_system", &rcbeam::switch_unit_system,
          py::arg("current"), py::arg("target"),
          "Reset to the target system's defaults (values are not converted)");

    py::class_<rcbeam::CalculationSettings>(m, "CalculationSettings",
        "Settings for the flexural capacity calculation")
        .def(py::init<>())
        .def_readwrite("stress_block_intensity", &rcbeam::CalculationSettings::stress_block_intensity)
        .def_readwrite("phi_tension_controlled", &rcbeam::CalculationSettings::phi_tension_controlled)
        .def_readwrite("phi_compression_controlled", &rcbeam::CalculationSettings::phi_compression_controlled)
        .def_readwrite("tension_controlled_strain", &rcbeam::CalculationSettings::tension_controlled_strain)
        .def_readwrite("compression_controlled_strain", &rcbeam::CalculationSettings::compression_controlled_strain)
        .def_readwrite("collect_warnings", &rcbeam::CalculationSettings::collect_warnings);

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<rcbeam::ErrorCode>(m, "ErrorCode", "Error codes for rejected inputs")
        .value("OK", rcbeam::ErrorCode::OK)
        .value("INVALID_CONCRETE_STRENGTH", rcbeam::ErrorCode::INVALID_CONCRETE_STRENGTH)
        .value("INVALID_YIELD_STRENGTH", rcbeam::ErrorCode::INVALID_YIELD_STRENGTH)
        .value("INVALID_STEEL_MODULUS", rcbeam::ErrorCode::INVALID_STEEL_MODULUS)
        .value("INVALID_GEOMETRY", rcbeam::ErrorCode::INVALID_GEOMETRY)
        .value("INVALID_REINFORCEMENT", rcbeam::ErrorCode::INVALID_REINFORCEMENT)
        .value("INVALID_PARAMETER", rcbeam::ErrorCode::INVALID_PARAMETER)
        .value("MULTIPLE_INVALID_FIELDS", rcbeam::ErrorCode::MULTIPLE_INVALID_FIELDS)
        .value("UNKNOWN_ERROR", rcbeam::ErrorCode::UNKNOWN_ERROR);

    py::class_<rcbeam::CalculationError>(m, "CalculationError",
        "Structured information for a rejected input")
        .def_readonly("code", &rcbeam::CalculationError::code)
        .def_readonly("message", &rcbeam::CalculationError::message)
        .def_readonly("invalid_fields", &rcbeam::CalculationError::invalid_fields)
        .def_readonly("details", &rcbeam::CalculationError::details)
        .def_readonly("suggestion", &rcbeam::CalculationError::suggestion)
        .def("is_ok", &rcbeam::CalculationError::is_ok)
        .def("is_error", &rcbeam::CalculationError::is_error)
        .def("code_string", &rcbeam::CalculationError::code_string)
        .def("to_string", &rcbeam::CalculationError::to_string);

    py::register_exception<rcbeam::InvalidGeometryError>(m, "InvalidGeometryError",
                                                         PyExc_ValueError);

    py::enum_<rcbeam::WarningCode>(m, "WarningCode", "Warning codes for questionable inputs")
        .value("STEEL_OUTSIDE_SECTION", rcbeam::WarningCode::STEEL_OUTSIDE_SECTION)
        .value("POSSIBLE_UNIT_ERROR", rcbeam::WarningCode::POSSIBLE_UNIT_ERROR)
        .value("BETA1_MISMATCH", rcbeam::WarningCode::BETA1_MISMATCH)
        .value("NO_REINFORCEMENT", rcbeam::WarningCode::NO_REINFORCEMENT)
        .value("STEEL_NOT_YIELDING", rcbeam::WarningCode::STEEL_NOT_YIELDING)
        .value("BELOW_MINIMUM_STEEL", rcbeam::WarningCode::BELOW_MINIMUM_STEEL);

    py::enum_<rcbeam::WarningSeverity>(m, "WarningSeverity", "Warning severity levels")
        .value("Low", rcbeam::WarningSeverity::Low)
        .value("Medium", rcbeam::WarningSeverity::Medium)
        .value("High", rcbeam::WarningSeverity::High);

    py::class_<rcbeam::CalculationWarning>(m, "CalculationWarning",
        "Structured warning information")
        .def_readonly("code", &rcbeam::CalculationWarning::code)
        .def_readonly("severity", &rcbeam::CalculationWarning::severity)
        .def_readonly("message", &rcbeam::CalculationWarning::message)
        .def_readonly("details", &rcbeam::CalculationWarning::details)
        .def_readonly("suggestion", &rcbeam::CalculationWarning::suggestion)
        .def("to_string", &rcbeam::CalculationWarning::to_string);

    py::class_<rcbeam::WarningList>(m, "WarningList", "Warnings raised by one calculation")
        .def_readonly("warnings", &rcbeam::WarningList::warnings)
        .def("has_warnings", &rcbeam::WarningList::has_warnings)
        .def("count", &rcbeam::WarningList::count)
        .def("contains", &rcbeam::WarningList::contains, py::arg("code"))
        .def("summary", &rcbeam::WarningList::summary);

    // ========================================================================
    // Engine
    // ========================================================================

    py::enum_<rcbeam::StrainState>(m, "StrainState")
        .value("Defined", rcbeam::StrainState::Defined)
        .value("Undefined", rcbeam::StrainState::Undefined);

    py::enum_<rcbeam::SectionClassification>(m, "SectionClassification")
        .value("TensionControlled", rcbeam::SectionClassification::TensionControlled)
        .value("Transition", rcbeam::SectionClassification::Transition)
        .value("CompressionControlled", rcbeam::SectionClassification::CompressionControlled)
        .value("Undefined", rcbeam::SectionClassification::Undefined);

    py::class_<rcbeam::SectionResult>(m, "SectionResult", "Result of one calculation")
        .def_readonly("unit_system", &rcbeam::SectionResult::unit_system)
        .def_readonly("As", &rcbeam::SectionResult::As)
        .def_readonly("T", &rcbeam::SectionResult::T)
        .def_readonly("a", &rcbeam::SectionResult::a)
        .def_readonly("c", &rcbeam::SectionResult::c)
        .def_readonly("epsilon_y", &rcbeam::SectionResult::epsilon_y)
        .def_readonly("strain_state", &rcbeam::SectionResult::strain_state)
        .def_readonly("epsilon_s", &rcbeam::SectionResult::epsilon_s)
        .def_readonly("steel_yields", &rcbeam::SectionResult::steel_yields)
        .def_readonly("fs", &rcbeam::SectionResult::fs)
        .def_readonly("lever_arm", &rcbeam::SectionResult::lever_arm)
        .def_readonly("Mn", &rcbeam::SectionResult::Mn)
        .def_readonly("As_min", &rcbeam::SectionResult::As_min)
        .def_readonly("as_min_ok", &rcbeam::SectionResult::as_min_ok)
        .def_readonly("epsilon_t", &rcbeam::SectionResult::epsilon_t)
        .def_readonly("classification", &rcbeam::SectionResult::classification)
        .def_readonly("phi", &rcbeam::SectionResult::phi)
        .def_readonly("Mu", &rcbeam::SectionResult::Mu)
        .def_readonly("T_display", &rcbeam::SectionResult::T_display)
        .def_readonly("Mn_k", &rcbeam::SectionResult::Mn_k)
        .def_readonly("Mn_display", &rcbeam::SectionResult::Mn_display)
        .def_readonly("Mu_display", &rcbeam::SectionResult::Mu_display)
        .def_readonly("warnings", &rcbeam::SectionResult::warnings)
        .def("is_degenerate", &rcbeam::SectionResult::is_degenerate)
        .def("__repr__", [](const rcbeam::SectionResult& r) {
            return "<SectionResult Mn=" + std::to_string(r.Mn_display) +
                   " " + rcbeam::unit_labels(r.unit_system).moment_display +
                   " as_min_ok=" + (r.as_min_ok ? std::string("True") : std::string("False")) + ">";
        });

    py::class_<rcbeam::BeamSection>(m, "BeamSection",
        "Flexural capacity of a singly-reinforced rectangular section (ACI 318)")
        .def(py::init<const rcbeam::CalculationSettings&>(),
             py::arg("settings") = rcbeam::CalculationSettings())
        .def("compute", &rcbeam::BeamSection::compute, py::arg("input"),
             "Compute the section capacity; raises InvalidGeometryError on rejected input")
        .def_static("validate", &rcbeam::BeamSection::validate, py::arg("input"),
                    "Check an input without computing")
        .def_static("minimum_steel_area", &rcbeam::BeamSection::minimum_steel_area,
                    py::arg("input"), "Minimum steel area per ACI 318")
        .def("strength_reduction_factor", &rcbeam::BeamSection::strength_reduction_factor,
             py::arg("epsilon_t"))
        .def_property_readonly("settings", &rcbeam::BeamSection::settings);

    m.def("compute", py::overload_cast<const rcbeam::SectionInput&>(&rcbeam::compute),
          py::arg("input"), "Compute with default settings");

    py::class_<rcbeam::SectionProfile>(m, "SectionProfile",
        "Sampled strain and stress distribution over the section depth")
        .def_readonly("depth", &rcbeam::SectionProfile::depth)
        .def_readonly("strain", &rcbeam::SectionProfile::strain)
        .def_readonly("concrete_stress", &rcbeam::SectionProfile::concrete_stress)
        .def_readonly("neutral_axis_depth", &rcbeam::SectionProfile::neutral_axis_depth)
        .def_readonly("block_depth", &rcbeam::SectionProfile::block_depth)
        .def_readonly("block_stress", &rcbeam::SectionProfile::block_stress)
        .def_readonly("steel_depth", &rcbeam::SectionProfile::steel_depth)
        .def_readonly("steel_strain", &rcbeam::SectionProfile::steel_strain)
        .def_readonly("steel_stress", &rcbeam::SectionProfile::steel_stress)
        .def_readonly("compression_force", &rcbeam::SectionProfile::compression_force)
        .def_readonly("tension_force", &rcbeam::SectionProfile::tension_force)
        .def_readonly("lever_arm", &rcbeam::SectionProfile::lever_arm);

    m.def("sample_profile", &rcbeam::sample_profile,
          py::arg("input"), py::arg("result"), py::arg("n_points") = 51,
          py::arg("settings") = rcbeam::CalculationSettings(),
          "Sample strain and stress over the depth for diagrams");

    m.def("set_log_level", [](const std::string& level) {
              rcbeam::set_log_level(spdlog::level::from_str(level));
          },
          py::arg("level"), "Set rcbeam log level ('debug', 'info', 'warn', ...)");
}
