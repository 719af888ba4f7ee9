/**
 * @file test_section_input.cpp
 * @brief C++ tests for default inputs, unit switching, units and beta1
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rcbeam/material.hpp"
#include "rcbeam/section_input.hpp"
#include "rcbeam/units.hpp"

#include <stdexcept>

using namespace rcbeam;
using Catch::Matchers::WithinAbs;

TEST_CASE("Imperial default input", "[SectionInput][defaults]") {
    SectionInput in = default_section_input(UnitSystem::Imperial);

    REQUIRE(in.unit_system == UnitSystem::Imperial);
    REQUIRE(in.fc_prime == 4000.0);
    REQUIRE(in.fy == 60000.0);
    REQUIRE(in.es == 29000000.0);
    REQUIRE(in.beta1 == 0.85);
    REQUIRE(in.epsilon_cu == 0.003);
    REQUIRE(in.b == 12.0);
    REQUIRE(in.h == 20.0);
    REQUIRE(in.d == 17.5);
    REQUIRE(in.n_bars == 4);
    REQUIRE(in.bar_area == 0.79);
    REQUIRE_THAT(in.steel_area(), WithinAbs(3.16, 1e-12));
}

TEST_CASE("SI default input", "[SectionInput][defaults]") {
    SectionInput in = default_section_input(UnitSystem::SI);

    REQUIRE(in.unit_system == UnitSystem::SI);
    REQUIRE(in.fc_prime == 20.0);
    REQUIRE(in.fy == 420.0);
    REQUIRE(in.es == 200000.0);
    REQUIRE(in.beta1 == 0.85);
    REQUIRE(in.epsilon_cu == 0.003);
    REQUIRE(in.b == 250.0);
    REQUIRE(in.h == 565.0);
    REQUIRE(in.d == 500.0);
    REQUIRE(in.n_bars == 3);
    REQUIRE(in.bar_area == 510.0);
    REQUIRE(in.steel_area() == 1530.0);
}

TEST_CASE("Switching unit system resets to defaults", "[SectionInput][units]") {
    SectionInput edited = default_section_input(UnitSystem::Imperial);
    edited.b = 16.0;
    edited.fc_prime = 5000.0;
    edited.n_bars = 6;

    SECTION("Values are replaced, not converted") {
        SectionInput si = switch_unit_system(edited, UnitSystem::SI);
        REQUIRE(si == default_section_input(UnitSystem::SI));
        REQUIRE(si.b == 250.0);
    }

    SECTION("Switching back gives Imperial defaults, not the edited values") {
        SectionInput back = switch_unit_system(switch_unit_system(edited, UnitSystem::SI),
                                               UnitSystem::Imperial);
        REQUIRE(back == default_section_input(UnitSystem::Imperial));
        REQUIRE(back != edited);
    }

    SECTION("Selecting the current system also resets") {
        REQUIRE(switch_unit_system(edited, UnitSystem::Imperial) ==
                default_section_input(UnitSystem::Imperial));
    }
}

TEST_CASE("beta1 per ACI 318 in Imperial units", "[material][beta1]") {
    REQUIRE(material::compute_beta1(3000.0, UnitSystem::Imperial) == 0.85);
    REQUIRE(material::compute_beta1(4000.0, UnitSystem::Imperial) == 0.85);
    REQUIRE_THAT(material::compute_beta1(5000.0, UnitSystem::Imperial), WithinAbs(0.80, 1e-12));
    REQUIRE_THAT(material::compute_beta1(6000.0, UnitSystem::Imperial), WithinAbs(0.75, 1e-12));
    REQUIRE(material::compute_beta1(8000.0, UnitSystem::Imperial) == 0.65);
    REQUIRE(material::compute_beta1(10000.0, UnitSystem::Imperial) == 0.65);
}

TEST_CASE("beta1 per ACI 318 in SI units", "[material][beta1]") {
    REQUIRE(material::compute_beta1(20.0, UnitSystem::SI) == 0.85);
    REQUIRE(material::compute_beta1(28.0, UnitSystem::SI) == 0.85);
    REQUIRE_THAT(material::compute_beta1(35.0, UnitSystem::SI), WithinAbs(0.80, 1e-12));
    REQUIRE(material::compute_beta1(55.0, UnitSystem::SI) == 0.65);
    REQUIRE(material::compute_beta1(70.0, UnitSystem::SI) == 0.65);
}

TEST_CASE("beta1 rejects non-positive strength", "[material][beta1]") {
    REQUIRE_THROWS_AS(material::compute_beta1(0.0, UnitSystem::SI), std::invalid_argument);
    REQUIRE_THROWS_AS(material::compute_beta1(-4000.0, UnitSystem::Imperial), std::invalid_argument);
}

TEST_CASE("Derived beta1 replaces only beta1", "[SectionInput][beta1]") {
    SectionInput in = default_section_input(UnitSystem::Imperial);
    in.fc_prime = 6000.0;
    in.beta1 = 0.5;

    SectionInput derived = in.with_derived_beta1();
    REQUIRE_THAT(derived.beta1, WithinAbs(0.75, 1e-12));
    REQUIRE(derived.fc_prime == in.fc_prime);
    REQUIRE(derived.d == in.d);
    REQUIRE(in.beta1 == 0.5);
}

TEST_CASE("Yield strain", "[material]") {
    REQUIRE_THAT(material::yield_strain(60000.0, 29.0e6), WithinAbs(0.0020690, 1e-7));
    REQUIRE_THAT(material::yield_strain(420.0, 200000.0), WithinAbs(0.0021, 1e-15));
}

TEST_CASE("Unit labels", "[units]") {
    UnitLabels imperial = unit_labels(UnitSystem::Imperial);
    REQUIRE(imperial.length == "in");
    REQUIRE(imperial.area == "in^2");
    REQUIRE(imperial.force == "lb");
    REQUIRE(imperial.force_k == "kips");
    REQUIRE(imperial.stress == "psi");
    REQUIRE(imperial.moment == "lb-in");
    REQUIRE(imperial.moment_k == "k-in");
    REQUIRE(imperial.moment_display == "k-ft");

    UnitLabels si = unit_labels(UnitSystem::SI);
    REQUIRE(si.length == "mm");
    REQUIRE(si.area == "mm^2");
    REQUIRE(si.force == "N");
    REQUIRE(si.force_k == "kN");
    REQUIRE(si.stress == "MPa");
    REQUIRE(si.moment == "N-mm");
    REQUIRE(si.moment_k == "N-mm");
    REQUIRE(si.moment_display == "kN-m");
}

TEST_CASE("Display scale factors", "[units]") {
    DisplayScale imperial = display_scale_for(UnitSystem::Imperial);
    REQUIRE(imperial.force == 1000.0);
    REQUIRE(imperial.moment_k == 1000.0);
    REQUIRE(imperial.moment_display == 12000.0);

    DisplayScale si = display_scale_for(UnitSystem::SI);
    REQUIRE(si.force == 1000.0);
    REQUIRE(si.moment_k == 1.0);
    REQUIRE(si.moment_display == 1.0e6);
}

TEST_CASE("Unit system names", "[units]") {
    REQUIRE(to_string(UnitSystem::Imperial) == "imperial");
    REQUIRE(to_string(UnitSystem::SI) == "si");

    REQUIRE(parse_unit_system("imperial") == UnitSystem::Imperial);
    REQUIRE(parse_unit_system("Imperial") == UnitSystem::Imperial);
    REQUIRE(parse_unit_system("SI") == UnitSystem::SI);
    REQUIRE(parse_unit_system("si") == UnitSystem::SI);
    REQUIRE_THROWS_AS(parse_unit_system("metric"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_unit_system(""), std::invalid_argument);
}
