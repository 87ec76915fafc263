#pragma once

// =============================================================================
// Measura v1 - Quantity Contract and Generic Algebra
// =============================================================================
// This header defines:
// - DimensionId and the unit_traits customization point (per-dimension tables)
// - The Quantity concept every dimension family satisfies
// - QuantityBase<Derived, Unit, T>, the CRTP storage for a unit-tagged value
// - Generic +, -, unary -, ScaleFactor * and / written once for all families
// - Physical comparison, approx_equal and kernel_cast
// =============================================================================

#include "measura/v1/numeric_kernel.hpp"
#include "measura/v1/scale_factor.hpp"

#include <algorithm>
#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace measura::v1 {

// =============================================================================
// Dimension Identification
// =============================================================================

enum class DimensionId : int {
    Force = 0,
    Temperature,
    Time,
    Mass
};

inline constexpr std::array<DimensionId, 4> all_dimensions = {
    DimensionId::Force, DimensionId::Temperature, DimensionId::Time, DimensionId::Mass
};

[[nodiscard]] inline constexpr std::string_view to_string(DimensionId d) noexcept {
    switch (d) {
        case DimensionId::Force: return "force";
        case DimensionId::Temperature: return "temperature";
        case DimensionId::Time: return "time";
        case DimensionId::Mass: return "mass";
    }
    return "unknown";
}

// =============================================================================
// Unit Traits - Primary Template
// =============================================================================

/// Specializations describe one closed unit enumeration:
///   dimension, base, units (declaration order), factor(u), symbol(u), name(u)
/// factor(u) is the multiplier taking a magnitude in u to the base unit.
template<typename Unit>
struct unit_traits;

template<typename U>
concept UnitSet = std::is_enum_v<U> && requires(U u) {
    { unit_traits<U>::dimension } -> std::convertible_to<DimensionId>;
    { unit_traits<U>::base } -> std::convertible_to<U>;
    { unit_traits<U>::units.size() } -> std::convertible_to<std::size_t>;
    { unit_traits<U>::factor(u) } -> std::same_as<double>;
    { unit_traits<U>::symbol(u) } -> std::same_as<std::string_view>;
    { unit_traits<U>::name(u) } -> std::same_as<std::string_view>;
};

/// Conversion factor of unit u into its base unit
template<UnitSet U>
[[nodiscard]] constexpr double base_factor(U u) noexcept {
    return unit_traits<U>::factor(u);
}

template<UnitSet U>
[[nodiscard]] constexpr bool is_base_unit(U u) noexcept {
    return u == unit_traits<U>::base;
}

template<UnitSet U>
[[nodiscard]] constexpr std::string_view symbol_of(U u) noexcept {
    return unit_traits<U>::symbol(u);
}

// =============================================================================
// Quantity Concept
// =============================================================================

/// Empty base that makes measura::v1 an associated namespace, so the generic
/// operators below are found by argument-dependent lookup from any scope.
/// QuantityBase derives from it; a family written directly against the
/// Quantity concept in another namespace should derive from it as well.
struct QuantityFamily {};

/// A measurement in one of a closed set of units of one dimension.
/// to_base_unit() maps to the canonical representation; from_base_unit()
/// reconstructs the base-unit variant.
template<typename Q>
concept Quantity = requires {
    typename Q::number_type;
    requires NumericKernel<typename Q::number_type>;
} && requires(const Q q, const typename Q::number_type v) {
    { q.to_base_unit() } -> std::same_as<typename Q::number_type>;
    { Q::from_base_unit(v) } -> std::same_as<Q>;
};

/// A Quantity whose variants are described by unit_traits
template<typename Q>
concept TaggedQuantity = Quantity<Q> && requires(const Q q) {
    typename Q::unit_type;
    requires UnitSet<typename Q::unit_type>;
    { q.unit() } -> std::same_as<typename Q::unit_type>;
    { q.magnitude() } -> std::convertible_to<typename Q::number_type>;
};

// =============================================================================
// CRTP Base for Dimension Families
// =============================================================================

template<typename Derived, UnitSet Unit, NumericKernel T>
class QuantityBase : public QuantityFamily {
public:
    using number_type = T;
    using unit_type = Unit;
    using traits = unit_traits<Unit>;

    static constexpr DimensionId dimension = traits::dimension;
    static constexpr Unit base_unit = traits::base;

    /// Active unit tag
    [[nodiscard]] constexpr Unit unit() const noexcept { return unit_; }

    /// Payload, expressed in unit()
    [[nodiscard]] constexpr const T& magnitude() const noexcept { return magnitude_; }

    [[nodiscard]] constexpr T to_base_unit() const {
        if (unit_ == base_unit) {
            return magnitude_;
        }
        return multiply(kernel_constant<T>(traits::factor(unit_)), magnitude_);
    }

    /// Always yields the base-unit variant
    [[nodiscard]] static constexpr Derived from_base_unit(const T& value) {
        return Derived(base_unit, value);
    }

    /// Same physical value re-expressed in the requested unit
    [[nodiscard]] constexpr Derived as(Unit target) const {
        if (target == unit_) {
            return derived();
        }
        if (target == base_unit) {
            return from_base_unit(to_base_unit());
        }
        return Derived(target, divide(to_base_unit(), kernel_constant<T>(traits::factor(target))));
    }

    /// Magnitude of this value in the requested unit
    [[nodiscard]] constexpr T in(Unit target) const { return as(target).magnitude(); }

    [[nodiscard]] constexpr bool is_base() const noexcept { return unit_ == base_unit; }

    [[nodiscard]] constexpr std::string_view symbol() const noexcept { return traits::symbol(unit_); }

protected:
    constexpr QuantityBase() = default;
    constexpr QuantityBase(Unit unit, const T& magnitude) : unit_(unit), magnitude_(magnitude) {}

    [[nodiscard]] constexpr const Derived& derived() const noexcept {
        return static_cast<const Derived&>(*this);
    }

private:
    Unit unit_ = traits::base;
    T magnitude_{};
};

// =============================================================================
// Generic Arithmetic (defined once for every Quantity)
// =============================================================================

template<Quantity Q>
[[nodiscard]] constexpr Q operator+(const Q& lhs, const Q& rhs) {
    return Q::from_base_unit(add(lhs.to_base_unit(), rhs.to_base_unit()));
}

template<Quantity Q>
[[nodiscard]] constexpr Q operator-(const Q& lhs, const Q& rhs) {
    return Q::from_base_unit(subtract(lhs.to_base_unit(), rhs.to_base_unit()));
}

template<Quantity Q>
[[nodiscard]] constexpr Q operator-(const Q& value) {
    return Q::from_base_unit(negate(value.to_base_unit()));
}

// Scale factor and quantity must share the kernel
template<Quantity Q, NumericKernel K>
    requires std::same_as<K, typename Q::number_type>
[[nodiscard]] constexpr Q operator*(const ScaleFactor<K>& f, const Q& q) {
    return Q::from_base_unit(f.apply(q.to_base_unit()));
}

template<Quantity Q, NumericKernel K>
    requires std::same_as<K, typename Q::number_type>
[[nodiscard]] constexpr Q operator*(const Q& q, const ScaleFactor<K>& f) {
    return Q::from_base_unit(f.apply(q.to_base_unit()));
}

/// No zero-divisor guard: the kernel's own division semantics apply
template<Quantity Q, NumericKernel K>
    requires std::same_as<K, typename Q::number_type>
[[nodiscard]] constexpr Q operator/(const Q& q, const ScaleFactor<K>& f) {
    return Q::from_base_unit(f.apply_inverse(q.to_base_unit()));
}

/// Ratio of two quantities of the same dimension, as a plain factor
template<Quantity Q>
[[nodiscard]] constexpr ScaleFactor<typename Q::number_type> ratio(const Q& num, const Q& den) {
    return ScaleFactor<typename Q::number_type>(divide(num.to_base_unit(), den.to_base_unit()));
}

// =============================================================================
// Comparison (physical: compares base-unit magnitudes, not unit tags)
// =============================================================================

template<Quantity Q>
    requires std::equality_comparable<typename Q::number_type>
[[nodiscard]] constexpr bool operator==(const Q& lhs, const Q& rhs) {
    return lhs.to_base_unit() == rhs.to_base_unit();
}

template<Quantity Q>
    requires std::three_way_comparable<typename Q::number_type>
[[nodiscard]] constexpr auto operator<=>(const Q& lhs, const Q& rhs) {
    return std::compare_three_way{}(lhs.to_base_unit(), rhs.to_base_unit());
}

/// |a - b| <= abs_tol + rel_tol * max(|a|, |b|), in base units
template<Quantity Q>
    requires std::totally_ordered<typename Q::number_type>
[[nodiscard]] constexpr bool approx_equal(
    const Q& a, const Q& b,
    double abs_tol = KernelTraits<typename Q::number_type>::default_abstol,
    double rel_tol = KernelTraits<typename Q::number_type>::default_reltol) {
    using T = typename Q::number_type;
    const T av = a.to_base_unit();
    const T bv = b.to_base_unit();
    const T diff = kernel_abs(subtract(av, bv));
    const T scale = std::max(kernel_abs(av), kernel_abs(bv));
    const T tol = add(kernel_constant<T>(abs_tol), multiply(kernel_constant<T>(rel_tol), scale));
    return !(tol < diff);
}

// =============================================================================
// Kernel Rebinding
// =============================================================================

/// Same unit tag and magnitude, stored in kernel U. Families expose
/// `template<NumericKernel U> using rebind = Family<U>`.
template<NumericKernel U, TaggedQuantity Q>
    requires requires { typename Q::template rebind<U>; } &&
             std::constructible_from<double, typename Q::number_type>
[[nodiscard]] constexpr auto kernel_cast(const Q& q) {
    using Target = typename Q::template rebind<U>;
    return Target(q.unit(), kernel_constant<U>(static_cast<double>(q.magnitude())));
}

// =============================================================================
// Stream Output
// =============================================================================

/// "<magnitude> <symbol>", locale-independent symbols
template<TaggedQuantity Q>
std::ostream& operator<<(std::ostream& os, const Q& q) {
    return os << q.magnitude() << ' ' << symbol_of(q.unit());
}

}  // namespace measura::v1
