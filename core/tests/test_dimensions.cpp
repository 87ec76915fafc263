// =============================================================================
// Test: Temperature, Time and Mass Families
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "measura/v1/core.hpp"
#include "measura/v1/literals.hpp"

#include <string_view>
#include <type_traits>

using namespace measura::v1;
using Catch::Approx;

TEST_CASE("v1 unit tables", "[v1][dimensions]") {
    SECTION("Every family declares its base first") {
        STATIC_REQUIRE(unit_traits<ForceUnit>::units.front() == ForceUnit::Newton);
        STATIC_REQUIRE(unit_traits<TemperatureUnit>::units.front() == TemperatureUnit::Kelvin);
        STATIC_REQUIRE(unit_traits<TimeUnit>::units.front() == TimeUnit::Second);
        STATIC_REQUIRE(unit_traits<MassUnit>::units.front() == MassUnit::Kilogram);
    }

    SECTION("Base units have factor one") {
        STATIC_REQUIRE(base_factor(ForceUnit::Newton) == 1.0);
        STATIC_REQUIRE(base_factor(TemperatureUnit::Kelvin) == 1.0);
        STATIC_REQUIRE(base_factor(TimeUnit::Second) == 1.0);
        STATIC_REQUIRE(base_factor(MassUnit::Kilogram) == 1.0);
        STATIC_REQUIRE(is_base_unit(MassUnit::Kilogram));
        STATIC_REQUIRE_FALSE(is_base_unit(MassUnit::Gram));
    }

    SECTION("Symbols") {
        REQUIRE(symbol_of(ForceUnit::Kilopound) == std::string_view("kip"));
        REQUIRE(symbol_of(TemperatureUnit::Rankine) == std::string_view("degR"));
        REQUIRE(symbol_of(TimeUnit::Minute) == std::string_view("min"));
        REQUIRE(symbol_of(MassUnit::Ounce) == std::string_view("oz"));
        REQUIRE(Mass::tonne(1.0).symbol() == std::string_view("t"));
    }

    SECTION("Dimension ids") {
        STATIC_REQUIRE(Force::dimension == DimensionId::Force);
        STATIC_REQUIRE(Temperature::dimension == DimensionId::Temperature);
        STATIC_REQUIRE(Time::dimension == DimensionId::Time);
        STATIC_REQUIRE(Mass::dimension == DimensionId::Mass);
        REQUIRE(to_string(DimensionId::Temperature) == std::string_view("temperature"));
    }
}

TEST_CASE("v1 temperature", "[v1][dimensions][temperature]") {
    REQUIRE(Temperature::rankine(9.0).to_base_unit() == Approx(5.0));
    REQUIRE(Temperature::millikelvin(1500.0).to_base_unit() == Approx(1.5));
    REQUIRE(Temperature::kelvin(300.0).in(TemperatureUnit::Rankine) == Approx(540.0));

    SECTION("Addition collapses to kelvin") {
        const auto t = 300.0_K + 18.0_degR;
        REQUIRE(t.unit() == TemperatureUnit::Kelvin);
        REQUIRE(t.magnitude() == Approx(310.0));
    }

    SECTION("Celsius helpers") {
        REQUIRE(to_celsius(Temperature::kelvin(273.15)) == Approx(0.0).margin(1e-12));
        REQUIRE(from_celsius(100.0).to_base_unit() == Approx(373.15));
        REQUIRE(from_celsius(-273.15).to_base_unit() == Approx(0.0).margin(1e-12));
        REQUIRE(from_celsius(25.0).unit() == TemperatureUnit::Kelvin);
    }

    SECTION("Fahrenheit helpers") {
        REQUIRE(to_fahrenheit(Temperature::kelvin(273.15)) == Approx(32.0));
        REQUIRE(to_fahrenheit(from_celsius(100.0)) == Approx(212.0));
        REQUIRE(from_fahrenheit(-40.0).to_base_unit() == Approx(233.15));
        REQUIRE(to_celsius(from_fahrenheit(-40.0)) == Approx(-40.0));
        REQUIRE(from_fahrenheit(98.6).unit() == TemperatureUnit::Kelvin);
    }

    SECTION("Helpers follow the kernel") {
        const auto t = from_celsius(20.0f);
        STATIC_REQUIRE(std::is_same_v<decltype(t), const TemperatureF>);
        REQUIRE(t.to_base_unit() == Approx(293.15f));
    }
}

TEST_CASE("v1 time", "[v1][dimensions][time]") {
    REQUIRE(Time::minute(1.0).to_base_unit() == 60.0);
    REQUIRE(Time::hour(2.0).to_base_unit() == 7200.0);
    REQUIRE(Time::day(1.0).to_base_unit() == 86400.0);
    REQUIRE(Time::millisecond(250.0).to_base_unit() == Approx(0.25));

    SECTION("Mixed sum") {
        const auto t = 1_h + 30_min + 15_s;
        REQUIRE(t.unit() == TimeUnit::Second);
        REQUIRE(t.to_base_unit() == 5415.0);
        REQUIRE(t.in(TimeUnit::Minute) == Approx(90.25));
    }

    SECTION("Scaling") {
        REQUIRE((factor(7.0) * 1_d).in(TimeUnit::Hour) == Approx(168.0));
        REQUIRE((1_h / factor(4.0)).in(TimeUnit::Minute) == Approx(15.0));
    }

    SECTION("Ordering across units") {
        REQUIRE(1_d > 23_h);
        REQUIRE(1500_ms > 1_s);
        REQUIRE(60_min == 1_h);
    }
}

TEST_CASE("v1 mass", "[v1][dimensions][mass]") {
    REQUIRE(Mass::gram(1500.0).to_base_unit() == Approx(1.5));
    REQUIRE(Mass::tonne(2.0).to_base_unit() == 2000.0);
    REQUIRE(Mass::pound(1.0).to_base_unit() == 0.45359237);
    REQUIRE(Mass::ounce(16.0).to_base_unit() == Approx(0.45359237));

    SECTION("Pound to ounce") {
        REQUIRE(Mass::pound(1.0).in(MassUnit::Ounce) == Approx(16.0));
        REQUIRE(Mass::pound(2.0).as(MassUnit::Ounce).unit() == MassUnit::Ounce);
    }

    SECTION("Difference collapses to kilogram") {
        const auto m = 1_t - 250_kg;
        REQUIRE(m.unit() == MassUnit::Kilogram);
        REQUIRE(m.magnitude() == 750.0);
    }

    SECTION("Fixed-point mass") {
        using M = GenericMass<Fixed16>;
        const auto sum = M::kilogram(Fixed16(1.5)) + M::gram(Fixed16(500.0));
        REQUIRE(sum.to_base_unit().to_double() == Approx(2.0).margin(1e-2));
    }
}

TEST_CASE("v1 as() round trip for every unit", "[v1][dimensions][conversion]") {
    for (const ForceUnit u : unit_traits<ForceUnit>::units) {
        const auto x = Force(u, 2.75);
        REQUIRE(x.as(ForceUnit::Newton).as(u).magnitude() == Approx(2.75));
    }
    for (const TemperatureUnit u : unit_traits<TemperatureUnit>::units) {
        const auto x = Temperature(u, 2.75);
        REQUIRE(x.as(TemperatureUnit::Kelvin).as(u).magnitude() == Approx(2.75));
    }
    for (const TimeUnit u : unit_traits<TimeUnit>::units) {
        const auto x = Time(u, 2.75);
        REQUIRE(x.as(TimeUnit::Second).as(u).magnitude() == Approx(2.75));
    }
    for (const MassUnit u : unit_traits<MassUnit>::units) {
        const auto x = Mass(u, 2.75);
        REQUIRE(x.as(MassUnit::Kilogram).as(u).magnitude() == Approx(2.75));
    }
}
