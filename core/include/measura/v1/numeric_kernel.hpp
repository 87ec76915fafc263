#pragma once

// =============================================================================
// Measura v1 - Numeric Kernel
// =============================================================================
// This header provides the scalar foundation every quantity is built on:
// - MathGroup / MathBody / NumericKernel capability concepts
// - Configurable Real type (double/float) via precision policy
// - KernelTraits for comparison tolerances
// - FixedPoint<FracBits> kernel for integer-only targets
// =============================================================================

#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <ostream>
#include <type_traits>

namespace measura::v1 {

// =============================================================================
// Capability Concepts
// =============================================================================

/// Additive group: closed under +, - and unary -
template<typename T>
concept MathGroup = std::regular<T> && requires(const T a, const T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { -a } -> std::convertible_to<T>;
};

/// Multiplicative body: closed under * and /
template<typename T>
concept MathBody = requires(const T a, const T b) {
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/// Scalar a quantity can be stored in. Conversion factors are materialised
/// from double constants, so the kernel must be constructible from one.
/// Built-in integers are excluded: their division truncates.
template<typename T>
concept NumericKernel = MathGroup<T> && MathBody<T> && std::constructible_from<T, double> &&
                        !std::integral<T>;

// =============================================================================
// Kernel Operations
// =============================================================================
// Named forms of the capability set. Generic code goes through these so a
// kernel only has to provide the operators.

template<NumericKernel T>
[[nodiscard]] constexpr T add(const T& a, const T& b) noexcept(noexcept(a + b)) {
    return static_cast<T>(a + b);
}

template<NumericKernel T>
[[nodiscard]] constexpr T subtract(const T& a, const T& b) noexcept(noexcept(a - b)) {
    return static_cast<T>(a - b);
}

template<NumericKernel T>
[[nodiscard]] constexpr T negate(const T& a) noexcept(noexcept(-a)) {
    return static_cast<T>(-a);
}

template<NumericKernel T>
[[nodiscard]] constexpr T multiply(const T& a, const T& b) noexcept(noexcept(a * b)) {
    return static_cast<T>(a * b);
}

template<NumericKernel T>
[[nodiscard]] constexpr T divide(const T& a, const T& b) noexcept(noexcept(a / b)) {
    return static_cast<T>(a / b);
}

/// Materialise a double constant (conversion factor, tolerance) in kernel T
template<NumericKernel T>
[[nodiscard]] constexpr T kernel_constant(double value) noexcept {
    return static_cast<T>(value);
}

// =============================================================================
// Real Type Configuration
// =============================================================================

/// Precision policy for selecting floating-point type
enum class Precision {
    Single,  // float  - 32-bit
    Double   // double - 64-bit, default
};

template<Precision P>
struct RealSelector {
    using type = double;
};

template<>
struct RealSelector<Precision::Single> {
    using type = float;
};

template<Precision P>
using RealT = typename RealSelector<P>::type;

using RealD = RealT<Precision::Double>;
using RealS = RealT<Precision::Single>;

/// Default kernel
using Real = RealD;

[[nodiscard]] inline constexpr const char* to_string(Precision p) noexcept {
    switch (p) {
        case Precision::Single: return "single";
        case Precision::Double: return "double";
    }
    return "unknown";
}

// =============================================================================
// FixedPoint<FracBits> - Q-format kernel
// =============================================================================

/// Signed fixed-point number with FracBits fractional bits in 64-bit storage.
/// Products and quotients are formed in long double and rounded to nearest.
/// Every operation saturates at max()/lowest() instead of wrapping. A zero
/// divisor saturates to the largest magnitude carrying the dividend's
/// sign (zero stays zero).
template<int FracBits>
    requires (FracBits > 0 && FracBits < 62)
class FixedPoint {
public:
    using raw_type = std::int64_t;

    static constexpr int frac_bits = FracBits;
    static constexpr raw_type one_raw = raw_type{1} << FracBits;
    static constexpr raw_type raw_max = std::numeric_limits<raw_type>::max();
    // Symmetric range: lowest() == -max()
    static constexpr raw_type raw_lowest = std::numeric_limits<raw_type>::min() + 1;

    constexpr FixedPoint() noexcept = default;

    constexpr explicit FixedPoint(double value) noexcept
        : raw_(round_to_raw(static_cast<long double>(value) * one_raw)) {}

    constexpr explicit FixedPoint(int value) noexcept
        : raw_(round_to_raw(static_cast<long double>(value) * one_raw)) {}

    [[nodiscard]] static constexpr FixedPoint from_raw(raw_type raw) noexcept {
        FixedPoint f;
        f.raw_ = raw;
        return f;
    }

    [[nodiscard]] constexpr raw_type raw() const noexcept { return raw_; }

    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(static_cast<long double>(raw_) / one_raw);
    }

    constexpr explicit operator double() const noexcept { return to_double(); }

    /// Smallest representable step
    [[nodiscard]] static constexpr FixedPoint resolution() noexcept { return from_raw(1); }

    [[nodiscard]] static constexpr FixedPoint max() noexcept { return from_raw(raw_max); }

    [[nodiscard]] static constexpr FixedPoint lowest() noexcept { return from_raw(raw_lowest); }

    [[nodiscard]] constexpr FixedPoint operator+(const FixedPoint& rhs) const noexcept {
        const raw_type b = rhs.raw_;
        if (b > 0 && raw_ > raw_max - b) return max();
        if (b < 0 && raw_ < raw_lowest - b) return lowest();
        return from_raw(raw_ + b);
    }

    [[nodiscard]] constexpr FixedPoint operator-(const FixedPoint& rhs) const noexcept {
        const raw_type b = rhs.raw_;
        if (b < 0 && raw_ > raw_max + b) return max();
        if (b > 0 && raw_ < raw_lowest + b) return lowest();
        return from_raw(raw_ - b);
    }

    [[nodiscard]] constexpr FixedPoint operator-() const noexcept {
        // Only a hand-built from_raw(INT64_MIN) has no positive counterpart
        return raw_ < raw_lowest ? max() : from_raw(-raw_);
    }

    [[nodiscard]] constexpr FixedPoint operator*(const FixedPoint& rhs) const noexcept {
        const long double product = static_cast<long double>(raw_) * rhs.raw_;
        return from_raw(round_to_raw(product / one_raw));
    }

    [[nodiscard]] constexpr FixedPoint operator/(const FixedPoint& rhs) const noexcept {
        if (rhs.raw_ == 0) {
            if (raw_ == 0) return FixedPoint{};
            return raw_ > 0 ? max() : lowest();
        }
        const long double quotient = static_cast<long double>(raw_) * one_raw / rhs.raw_;
        return from_raw(round_to_raw(quotient));
    }

    [[nodiscard]] constexpr bool operator==(const FixedPoint&) const noexcept = default;
    [[nodiscard]] constexpr auto operator<=>(const FixedPoint&) const noexcept = default;

private:
    [[nodiscard]] static constexpr raw_type round_to_raw(long double x) noexcept {
        constexpr long double hi = static_cast<long double>(raw_max);
        constexpr long double lo = static_cast<long double>(raw_lowest);
        if (x >= hi) return raw_max;
        if (x <= lo) return raw_lowest;
        return static_cast<raw_type>(x >= 0.0L ? x + 0.5L : x - 0.5L);
    }

    raw_type raw_ = 0;
};

template<int FracBits>
std::ostream& operator<<(std::ostream& os, const FixedPoint<FracBits>& v) {
    return os << v.to_double();
}

/// Q31.32
using Fixed32 = FixedPoint<32>;
/// Q47.16, wider integer range
using Fixed16 = FixedPoint<16>;

// =============================================================================
// Kernel Traits
// =============================================================================

/// Primary template - tolerances for approximate quantity comparison
template<typename T>
struct KernelTraits {
    static constexpr bool is_floating = false;
    static constexpr double default_abstol = 0.0;
    static constexpr double default_reltol = 0.0;
};

template<std::floating_point T>
struct KernelTraits<T> {
    static constexpr bool is_floating = true;
    static constexpr T epsilon = std::numeric_limits<T>::epsilon();
    static constexpr double default_abstol = (sizeof(T) == 4) ? 1e-5 : 1e-9;
    static constexpr double default_reltol = (sizeof(T) == 4) ? 1e-5 : 1e-12;
};

template<int FracBits>
struct KernelTraits<FixedPoint<FracBits>> {
    static constexpr bool is_floating = false;
    // Two steps of rounding per conversion
    static constexpr double default_abstol = 4.0 / static_cast<double>(std::int64_t{1} << FracBits);
    static constexpr double default_reltol = 0.0;
};

/// Absolute value within the kernel (no <cmath>, works for FixedPoint)
template<NumericKernel T>
    requires std::totally_ordered<T>
[[nodiscard]] constexpr T kernel_abs(const T& v) noexcept {
    return v < T{} ? negate(v) : v;
}

// =============================================================================
// Static Assertions
// =============================================================================

namespace detail {
    static_assert(NumericKernel<double>);
    static_assert(NumericKernel<float>);
    static_assert(NumericKernel<Fixed32>);
    static_assert(NumericKernel<Fixed16>);
    static_assert(!NumericKernel<bool*>);
    static_assert(!NumericKernel<int>);

    static_assert(std::is_same_v<RealT<Precision::Single>, float>);
    static_assert(std::is_same_v<Real, double>);

    static_assert((Fixed16(1.5) + Fixed16(2.25)).to_double() == 3.75);
    static_assert((Fixed16(3.0) * Fixed16(-0.5)).to_double() == -1.5);
    static_assert((Fixed16(1.0) / Fixed16(4.0)).to_double() == 0.25);
    static_assert(Fixed16(2.0) / Fixed16(0.0) == Fixed16::max());
    static_assert(Fixed16::max() + Fixed16(1.0) == Fixed16::max());
    static_assert(Fixed16::lowest() - Fixed16(1.0) == Fixed16::lowest());
    static_assert(-Fixed16::lowest() == Fixed16::max());
}

}  // namespace measura::v1
