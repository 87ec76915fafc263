#pragma once

// =============================================================================
// Measura v1 - Force
// =============================================================================
// Base unit: newton. Kilopound uses the international avoirdupois pound-force
// (1 kip = 1000 lbf = 4448.221615255 N).
// =============================================================================

#include "measura/v1/quantity.hpp"

#include <array>
#include <string_view>

namespace measura::v1 {

enum class ForceUnit : int {
    Newton = 0,
    Kilopound,
    Kilonewton,
    PoundForce,
    Dyne
};

template<>
struct unit_traits<ForceUnit> {
    static constexpr DimensionId dimension = DimensionId::Force;
    static constexpr ForceUnit base = ForceUnit::Newton;
    static constexpr std::array<ForceUnit, 5> units = {
        ForceUnit::Newton, ForceUnit::Kilopound, ForceUnit::Kilonewton,
        ForceUnit::PoundForce, ForceUnit::Dyne
    };

    [[nodiscard]] static constexpr double factor(ForceUnit u) noexcept {
        switch (u) {
            case ForceUnit::Newton: return 1.0;
            case ForceUnit::Kilopound: return 4448.221615255;
            case ForceUnit::Kilonewton: return 1e3;
            case ForceUnit::PoundForce: return 4.4482216152605;
            case ForceUnit::Dyne: return 1e-5;
        }
        return 1.0;
    }

    [[nodiscard]] static constexpr std::string_view symbol(ForceUnit u) noexcept {
        switch (u) {
            case ForceUnit::Newton: return "N";
            case ForceUnit::Kilopound: return "kip";
            case ForceUnit::Kilonewton: return "kN";
            case ForceUnit::PoundForce: return "lbf";
            case ForceUnit::Dyne: return "dyn";
        }
        return "?";
    }

    [[nodiscard]] static constexpr std::string_view name(ForceUnit u) noexcept {
        switch (u) {
            case ForceUnit::Newton: return "newton";
            case ForceUnit::Kilopound: return "kilopound";
            case ForceUnit::Kilonewton: return "kilonewton";
            case ForceUnit::PoundForce: return "pound-force";
            case ForceUnit::Dyne: return "dyne";
        }
        return "unknown";
    }
};

template<NumericKernel T = Real>
class GenericForce : public QuantityBase<GenericForce<T>, ForceUnit, T> {
public:
    using Base = QuantityBase<GenericForce<T>, ForceUnit, T>;

    template<NumericKernel U>
    using rebind = GenericForce<U>;

    constexpr GenericForce() = default;
    constexpr GenericForce(ForceUnit unit, const T& magnitude) : Base(unit, magnitude) {}

    [[nodiscard]] static constexpr GenericForce newton(const T& v) { return {ForceUnit::Newton, v}; }
    [[nodiscard]] static constexpr GenericForce kilopound(const T& v) { return {ForceUnit::Kilopound, v}; }
    [[nodiscard]] static constexpr GenericForce kilonewton(const T& v) { return {ForceUnit::Kilonewton, v}; }
    [[nodiscard]] static constexpr GenericForce pound_force(const T& v) { return {ForceUnit::PoundForce, v}; }
    [[nodiscard]] static constexpr GenericForce dyne(const T& v) { return {ForceUnit::Dyne, v}; }
};

using Force = GenericForce<Real>;
using ForceF = GenericForce<RealS>;

namespace detail {
    static_assert(Quantity<Force>);
    static_assert(TaggedQuantity<ForceF>);
    static_assert(Force::kilopound(1.0).to_base_unit() == 4448.221615255);
    static_assert(Force::from_base_unit(3.0).unit() == ForceUnit::Newton);
}

}  // namespace measura::v1
