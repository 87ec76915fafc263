#pragma once

// =============================================================================
// Measura v1 - User-Defined Literals
// =============================================================================
// Double-kernel literals for every unit variant, e.g. 1.0_kip, 20_min.
// The scale factor literal _x lives in scale_factor.hpp.
// =============================================================================

#include "measura/v1/dimensions/force.hpp"
#include "measura/v1/dimensions/mass.hpp"
#include "measura/v1/dimensions/temperature.hpp"
#include "measura/v1/dimensions/time.hpp"

namespace measura::v1 {

inline namespace literals {
    // Force
    constexpr Force operator""_N(long double v) { return Force::newton(static_cast<double>(v)); }
    constexpr Force operator""_N(unsigned long long v) { return Force::newton(static_cast<double>(v)); }
    constexpr Force operator""_kip(long double v) { return Force::kilopound(static_cast<double>(v)); }
    constexpr Force operator""_kip(unsigned long long v) { return Force::kilopound(static_cast<double>(v)); }
    constexpr Force operator""_kN(long double v) { return Force::kilonewton(static_cast<double>(v)); }
    constexpr Force operator""_kN(unsigned long long v) { return Force::kilonewton(static_cast<double>(v)); }
    constexpr Force operator""_lbf(long double v) { return Force::pound_force(static_cast<double>(v)); }
    constexpr Force operator""_lbf(unsigned long long v) { return Force::pound_force(static_cast<double>(v)); }
    constexpr Force operator""_dyn(long double v) { return Force::dyne(static_cast<double>(v)); }
    constexpr Force operator""_dyn(unsigned long long v) { return Force::dyne(static_cast<double>(v)); }

    // Temperature
    constexpr Temperature operator""_K(long double v) { return Temperature::kelvin(static_cast<double>(v)); }
    constexpr Temperature operator""_K(unsigned long long v) { return Temperature::kelvin(static_cast<double>(v)); }
    constexpr Temperature operator""_degR(long double v) { return Temperature::rankine(static_cast<double>(v)); }
    constexpr Temperature operator""_degR(unsigned long long v) { return Temperature::rankine(static_cast<double>(v)); }
    constexpr Temperature operator""_mK(long double v) { return Temperature::millikelvin(static_cast<double>(v)); }
    constexpr Temperature operator""_mK(unsigned long long v) { return Temperature::millikelvin(static_cast<double>(v)); }

    // Time
    constexpr Time operator""_s(long double v) { return Time::second(static_cast<double>(v)); }
    constexpr Time operator""_s(unsigned long long v) { return Time::second(static_cast<double>(v)); }
    constexpr Time operator""_ms(long double v) { return Time::millisecond(static_cast<double>(v)); }
    constexpr Time operator""_ms(unsigned long long v) { return Time::millisecond(static_cast<double>(v)); }
    constexpr Time operator""_min(long double v) { return Time::minute(static_cast<double>(v)); }
    constexpr Time operator""_min(unsigned long long v) { return Time::minute(static_cast<double>(v)); }
    constexpr Time operator""_h(long double v) { return Time::hour(static_cast<double>(v)); }
    constexpr Time operator""_h(unsigned long long v) { return Time::hour(static_cast<double>(v)); }
    constexpr Time operator""_d(long double v) { return Time::day(static_cast<double>(v)); }
    constexpr Time operator""_d(unsigned long long v) { return Time::day(static_cast<double>(v)); }

    // Mass
    constexpr Mass operator""_kg(long double v) { return Mass::kilogram(static_cast<double>(v)); }
    constexpr Mass operator""_kg(unsigned long long v) { return Mass::kilogram(static_cast<double>(v)); }
    constexpr Mass operator""_g(long double v) { return Mass::gram(static_cast<double>(v)); }
    constexpr Mass operator""_g(unsigned long long v) { return Mass::gram(static_cast<double>(v)); }
    constexpr Mass operator""_t(long double v) { return Mass::tonne(static_cast<double>(v)); }
    constexpr Mass operator""_t(unsigned long long v) { return Mass::tonne(static_cast<double>(v)); }
    constexpr Mass operator""_lb(long double v) { return Mass::pound(static_cast<double>(v)); }
    constexpr Mass operator""_lb(unsigned long long v) { return Mass::pound(static_cast<double>(v)); }
    constexpr Mass operator""_oz(long double v) { return Mass::ounce(static_cast<double>(v)); }
    constexpr Mass operator""_oz(unsigned long long v) { return Mass::ounce(static_cast<double>(v)); }
}

}  // namespace measura::v1
