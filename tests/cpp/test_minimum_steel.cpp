/**
 * @file test_minimum_steel.cpp
 * @brief C++ tests for the ACI 318 minimum tension steel check
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "rcbeam/beam_section.hpp"
#include "rcbeam/section_input.hpp"

#include <cmath>

using namespace rcbeam;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Imperial As_min for the example section", "[minimum][imperial]") {
    SectionInput input = default_section_input(UnitSystem::Imperial);
    double as_min = BeamSection::minimum_steel_area(input);

    REQUIRE_THAT(as_min, WithinAbs(0.70, 0.01));

    // 200 / fy governs over 3 * sqrt(fc') / fy for fc' = 4000 psi
    double floor_term = 200.0 / input.fy * input.b * input.d;
    double sqrt_term = 3.0 * std::sqrt(input.fc_prime) / input.fy * input.b * input.d;
    REQUIRE(floor_term > sqrt_term);
    REQUIRE_THAT(as_min, WithinRel(floor_term, 1e-15));

    SectionResult r = BeamSection().compute(input);
    REQUIRE(r.As_min == as_min);
    REQUIRE(r.as_min_ok);
}

TEST_CASE("Imperial As_min governed by sqrt(fc') for high strength concrete", "[minimum][imperial]") {
    SectionInput input = default_section_input(UnitSystem::Imperial);
    input.fc_prime = 6000.0;

    double expected = 3.0 * std::sqrt(6000.0) / 60000.0 * 12.0 * 17.5;
    REQUIRE_THAT(BeamSection::minimum_steel_area(input), WithinRel(expected, 1e-15));
    REQUIRE_THAT(BeamSection::minimum_steel_area(input), WithinAbs(0.8133, 1e-3));
}

TEST_CASE("SI As_min", "[minimum][si]") {
    SectionInput input = default_section_input(UnitSystem::SI);

    SECTION("1.4 / fy governs for fc' = 20 MPa") {
        REQUIRE_THAT(BeamSection::minimum_steel_area(input),
                     WithinRel(1.4 / 420.0 * 250.0 * 500.0, 1e-15));
        REQUIRE_THAT(BeamSection::minimum_steel_area(input), WithinAbs(416.67, 0.01));
    }

    SECTION("0.25 * sqrt(fc') / fy governs for fc' = 40 MPa") {
        input.fc_prime = 40.0;
        double expected = 0.25 * std::sqrt(40.0) / 420.0 * 250.0 * 500.0;
        REQUIRE_THAT(BeamSection::minimum_steel_area(input), WithinRel(expected, 1e-15));
    }
}

TEST_CASE("As_min is non-decreasing in b*d", "[minimum][property]") {
    for (UnitSystem system : {UnitSystem::Imperial, UnitSystem::SI}) {
        SectionInput input = default_section_input(system);
        const double b0 = input.b;
        const double d0 = input.d;

        double previous = 0.0;
        for (int i = 1; i <= 20; ++i) {
            // Grow b and d together so b*d strictly increases
            input.b = b0 * (0.25 * i);
            input.d = d0 * (0.5 + 0.05 * i);
            double current = BeamSection::minimum_steel_area(input);
            REQUIRE(current >= previous);
            previous = current;
        }
    }
}

TEST_CASE("Minimum steel check flag", "[minimum]") {
    BeamSection section;
    SectionInput input = default_section_input(UnitSystem::Imperial);

    SECTION("Exactly at the minimum passes") {
        input.n_bars = 1;
        input.bar_area = BeamSection::minimum_steel_area(input);
        SectionResult r = section.compute(input);
        REQUIRE(r.as_min_ok);
    }

    SECTION("Just below the minimum fails") {
        input.n_bars = 1;
        input.bar_area = 0.99 * BeamSection::minimum_steel_area(input);
        SectionResult r = section.compute(input);
        REQUIRE_FALSE(r.as_min_ok);
    }
}
