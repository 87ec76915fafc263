#pragma once

// =============================================================================
// Measura v1 - Scale Factor
// =============================================================================
// Unitless multiplier tagged with the kernel it scales. A ScaleFactor is the
// only thing that may multiply or divide a quantity; a bare kernel value may
// not, and neither can ever be added to one.
// =============================================================================

#include "measura/v1/numeric_kernel.hpp"

#include <type_traits>

namespace measura::v1 {

template<NumericKernel T>
class ScaleFactor {
public:
    using kernel_type = T;

    constexpr explicit ScaleFactor(T value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : value_(value) {}

    [[nodiscard]] constexpr const T& value() const noexcept { return value_; }

    /// Scale a base-unit magnitude
    [[nodiscard]] constexpr T apply(const T& base) const { return multiply(value_, base); }

    /// Inverse scale of a base-unit magnitude
    [[nodiscard]] constexpr T apply_inverse(const T& base) const { return divide(base, value_); }

    [[nodiscard]] constexpr ScaleFactor operator*(const ScaleFactor& rhs) const {
        return ScaleFactor(multiply(value_, rhs.value_));
    }

    [[nodiscard]] constexpr ScaleFactor operator/(const ScaleFactor& rhs) const {
        return ScaleFactor(divide(value_, rhs.value_));
    }

    [[nodiscard]] constexpr ScaleFactor operator-() const { return ScaleFactor(negate(value_)); }

    [[nodiscard]] constexpr bool operator==(const ScaleFactor&) const = default;

private:
    T value_;
};

template<typename T>
ScaleFactor(T) -> ScaleFactor<T>;

// Factor * kernel value, value * factor, value / factor
template<NumericKernel T>
[[nodiscard]] constexpr T operator*(const ScaleFactor<T>& f, const T& value) {
    return f.apply(value);
}

template<NumericKernel T>
[[nodiscard]] constexpr T operator*(const T& value, const ScaleFactor<T>& f) {
    return f.apply(value);
}

template<NumericKernel T>
[[nodiscard]] constexpr T operator/(const T& value, const ScaleFactor<T>& f) {
    return f.apply_inverse(value);
}

namespace detail {
    /// Explicit kernel if given; otherwise a floating argument keeps its own
    /// type and an integer one falls back to Real
    template<typename T, typename V>
    using factor_kernel_t = std::conditional_t<
        std::is_void_v<T>,
        std::conditional_t<std::is_floating_point_v<V>, V, Real>,
        T>;
}

/// Build a factor from any arithmetic literal: factor(2.5f) scales float
/// quantities, factor<Fixed32>(2) a fixed-point one
template<typename T = void, typename V>
    requires std::is_arithmetic_v<V> && NumericKernel<detail::factor_kernel_t<T, V>>
[[nodiscard]] constexpr ScaleFactor<detail::factor_kernel_t<T, V>> factor(V value) noexcept {
    using K = detail::factor_kernel_t<T, V>;
    return ScaleFactor<K>(kernel_constant<K>(static_cast<double>(value)));
}

/// Overload keeping an existing kernel value as is
template<NumericKernel T>
    requires (!std::is_arithmetic_v<T>)
[[nodiscard]] constexpr ScaleFactor<T> factor(const T& value) noexcept {
    return ScaleFactor<T>(value);
}

template<typename F>
struct is_scale_factor : std::false_type {};

template<typename T>
struct is_scale_factor<ScaleFactor<T>> : std::true_type {};

template<typename F>
inline constexpr bool is_scale_factor_v = is_scale_factor<F>::value;

inline namespace literals {
    /// 2.5_x -> ScaleFactor<double>
    constexpr ScaleFactor<double> operator""_x(long double v) {
        return ScaleFactor<double>(static_cast<double>(v));
    }
    constexpr ScaleFactor<double> operator""_x(unsigned long long v) {
        return ScaleFactor<double>(static_cast<double>(v));
    }
}

namespace detail {
    static_assert((factor(4.0) * 2.5) == 10.0);
    static_assert((10.0 / factor(4.0)) == 2.5);
    static_assert(is_scale_factor_v<decltype(3.0_x)>);
    static_assert(!is_scale_factor_v<double>);
    static_assert(std::is_same_v<decltype(factor(2.0f)), ScaleFactor<float>>);
    static_assert(std::is_same_v<decltype(factor(2)), ScaleFactor<double>>);
    static_assert(std::is_same_v<decltype(factor<float>(2.0)), ScaleFactor<float>>);
}

}  // namespace measura::v1
