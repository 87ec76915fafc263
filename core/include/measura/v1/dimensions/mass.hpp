#pragma once

// =============================================================================
// Measura v1 - Mass
// =============================================================================
// Base unit: kilogram. Pound and ounce are the international avoirdupois
// definitions (1 lb = 0.45359237 kg exactly).
// =============================================================================

#include "measura/v1/quantity.hpp"

#include <array>
#include <string_view>

namespace measura::v1 {

enum class MassUnit : int {
    Kilogram = 0,
    Gram,
    Tonne,
    Pound,
    Ounce
};

template<>
struct unit_traits<MassUnit> {
    static constexpr DimensionId dimension = DimensionId::Mass;
    static constexpr MassUnit base = MassUnit::Kilogram;
    static constexpr std::array<MassUnit, 5> units = {
        MassUnit::Kilogram, MassUnit::Gram, MassUnit::Tonne, MassUnit::Pound, MassUnit::Ounce
    };

    [[nodiscard]] static constexpr double factor(MassUnit u) noexcept {
        switch (u) {
            case MassUnit::Kilogram: return 1.0;
            case MassUnit::Gram: return 1e-3;
            case MassUnit::Tonne: return 1e3;
            case MassUnit::Pound: return 0.45359237;
            case MassUnit::Ounce: return 0.028349523125;
        }
        return 1.0;
    }

    [[nodiscard]] static constexpr std::string_view symbol(MassUnit u) noexcept {
        switch (u) {
            case MassUnit::Kilogram: return "kg";
            case MassUnit::Gram: return "g";
            case MassUnit::Tonne: return "t";
            case MassUnit::Pound: return "lb";
            case MassUnit::Ounce: return "oz";
        }
        return "?";
    }

    [[nodiscard]] static constexpr std::string_view name(MassUnit u) noexcept {
        switch (u) {
            case MassUnit::Kilogram: return "kilogram";
            case MassUnit::Gram: return "gram";
            case MassUnit::Tonne: return "tonne";
            case MassUnit::Pound: return "pound";
            case MassUnit::Ounce: return "ounce";
        }
        return "unknown";
    }
};

template<NumericKernel T = Real>
class GenericMass : public QuantityBase<GenericMass<T>, MassUnit, T> {
public:
    using Base = QuantityBase<GenericMass<T>, MassUnit, T>;

    template<NumericKernel U>
    using rebind = GenericMass<U>;

    constexpr GenericMass() = default;
    constexpr GenericMass(MassUnit unit, const T& magnitude) : Base(unit, magnitude) {}

    [[nodiscard]] static constexpr GenericMass kilogram(const T& v) { return {MassUnit::Kilogram, v}; }
    [[nodiscard]] static constexpr GenericMass gram(const T& v) { return {MassUnit::Gram, v}; }
    [[nodiscard]] static constexpr GenericMass tonne(const T& v) { return {MassUnit::Tonne, v}; }
    [[nodiscard]] static constexpr GenericMass pound(const T& v) { return {MassUnit::Pound, v}; }
    [[nodiscard]] static constexpr GenericMass ounce(const T& v) { return {MassUnit::Ounce, v}; }
};

using Mass = GenericMass<Real>;
using MassF = GenericMass<RealS>;

namespace detail {
    static_assert(Quantity<Mass>);
    static_assert(Mass::tonne(2.0).to_base_unit() == 2000.0);
}

}  // namespace measura::v1
