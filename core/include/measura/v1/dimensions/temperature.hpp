#pragma once

// =============================================================================
// Measura v1 - Temperature
// =============================================================================
// Base unit: kelvin. Only scales with a zero at absolute zero are unit
// variants. Celsius and Fahrenheit carry an offset and are reached through
// the explicit helpers at the bottom of this header instead.
// =============================================================================

#include "measura/v1/quantity.hpp"

#include <array>
#include <string_view>

namespace measura::v1 {

enum class TemperatureUnit : int {
    Kelvin = 0,
    Rankine,
    Millikelvin
};

template<>
struct unit_traits<TemperatureUnit> {
    static constexpr DimensionId dimension = DimensionId::Temperature;
    static constexpr TemperatureUnit base = TemperatureUnit::Kelvin;
    static constexpr std::array<TemperatureUnit, 3> units = {
        TemperatureUnit::Kelvin, TemperatureUnit::Rankine, TemperatureUnit::Millikelvin
    };

    [[nodiscard]] static constexpr double factor(TemperatureUnit u) noexcept {
        switch (u) {
            case TemperatureUnit::Kelvin: return 1.0;
            case TemperatureUnit::Rankine: return 5.0 / 9.0;
            case TemperatureUnit::Millikelvin: return 1e-3;
        }
        return 1.0;
    }

    [[nodiscard]] static constexpr std::string_view symbol(TemperatureUnit u) noexcept {
        switch (u) {
            case TemperatureUnit::Kelvin: return "K";
            case TemperatureUnit::Rankine: return "degR";
            case TemperatureUnit::Millikelvin: return "mK";
        }
        return "?";
    }

    [[nodiscard]] static constexpr std::string_view name(TemperatureUnit u) noexcept {
        switch (u) {
            case TemperatureUnit::Kelvin: return "kelvin";
            case TemperatureUnit::Rankine: return "rankine";
            case TemperatureUnit::Millikelvin: return "millikelvin";
        }
        return "unknown";
    }
};

template<NumericKernel T = Real>
class GenericTemperature : public QuantityBase<GenericTemperature<T>, TemperatureUnit, T> {
public:
    using Base = QuantityBase<GenericTemperature<T>, TemperatureUnit, T>;

    template<NumericKernel U>
    using rebind = GenericTemperature<U>;

    constexpr GenericTemperature() = default;
    constexpr GenericTemperature(TemperatureUnit unit, const T& magnitude) : Base(unit, magnitude) {}

    [[nodiscard]] static constexpr GenericTemperature kelvin(const T& v) {
        return {TemperatureUnit::Kelvin, v};
    }
    [[nodiscard]] static constexpr GenericTemperature rankine(const T& v) {
        return {TemperatureUnit::Rankine, v};
    }
    [[nodiscard]] static constexpr GenericTemperature millikelvin(const T& v) {
        return {TemperatureUnit::Millikelvin, v};
    }
};

using Temperature = GenericTemperature<Real>;
using TemperatureF = GenericTemperature<RealS>;

// =============================================================================
// Offset Scales
// =============================================================================

inline constexpr double celsius_offset = 273.15;
inline constexpr double fahrenheit_offset = 459.67;

template<NumericKernel T>
[[nodiscard]] constexpr T to_celsius(const GenericTemperature<T>& t) {
    return subtract(t.to_base_unit(), kernel_constant<T>(celsius_offset));
}

template<NumericKernel T>
[[nodiscard]] constexpr GenericTemperature<T> from_celsius(const T& celsius) {
    return GenericTemperature<T>::kelvin(add(celsius, kernel_constant<T>(celsius_offset)));
}

template<NumericKernel T>
[[nodiscard]] constexpr T to_fahrenheit(const GenericTemperature<T>& t) {
    return subtract(t.in(TemperatureUnit::Rankine), kernel_constant<T>(fahrenheit_offset));
}

template<NumericKernel T>
[[nodiscard]] constexpr GenericTemperature<T> from_fahrenheit(const T& fahrenheit) {
    return GenericTemperature<T>::rankine(add(fahrenheit, kernel_constant<T>(fahrenheit_offset)))
        .as(TemperatureUnit::Kelvin);
}

namespace detail {
    static_assert(Quantity<Temperature>);
    static_assert(Temperature::kelvin(373.15).to_base_unit() == 373.15);
}

}  // namespace measura::v1
