#pragma once

// =============================================================================
// Measura v1 - Time
// =============================================================================

#include "measura/v1/quantity.hpp"

#include <array>
#include <string_view>

namespace measura::v1 {

enum class TimeUnit : int {
    Second = 0,
    Millisecond,
    Minute,
    Hour,
    Day
};

template<>
struct unit_traits<TimeUnit> {
    static constexpr DimensionId dimension = DimensionId::Time;
    static constexpr TimeUnit base = TimeUnit::Second;
    static constexpr std::array<TimeUnit, 5> units = {
        TimeUnit::Second, TimeUnit::Millisecond, TimeUnit::Minute, TimeUnit::Hour, TimeUnit::Day
    };

    [[nodiscard]] static constexpr double factor(TimeUnit u) noexcept {
        switch (u) {
            case TimeUnit::Second: return 1.0;
            case TimeUnit::Millisecond: return 1e-3;
            case TimeUnit::Minute: return 60.0;
            case TimeUnit::Hour: return 3600.0;
            case TimeUnit::Day: return 86400.0;
        }
        return 1.0;
    }

    [[nodiscard]] static constexpr std::string_view symbol(TimeUnit u) noexcept {
        switch (u) {
            case TimeUnit::Second: return "s";
            case TimeUnit::Millisecond: return "ms";
            case TimeUnit::Minute: return "min";
            case TimeUnit::Hour: return "h";
            case TimeUnit::Day: return "d";
        }
        return "?";
    }

    [[nodiscard]] static constexpr std::string_view name(TimeUnit u) noexcept {
        switch (u) {
            case TimeUnit::Second: return "second";
            case TimeUnit::Millisecond: return "millisecond";
            case TimeUnit::Minute: return "minute";
            case TimeUnit::Hour: return "hour";
            case TimeUnit::Day: return "day";
        }
        return "unknown";
    }
};

template<NumericKernel T = Real>
class GenericTime : public QuantityBase<GenericTime<T>, TimeUnit, T> {
public:
    using Base = QuantityBase<GenericTime<T>, TimeUnit, T>;

    template<NumericKernel U>
    using rebind = GenericTime<U>;

    constexpr GenericTime() = default;
    constexpr GenericTime(TimeUnit unit, const T& magnitude) : Base(unit, magnitude) {}

    [[nodiscard]] static constexpr GenericTime second(const T& v) { return {TimeUnit::Second, v}; }
    [[nodiscard]] static constexpr GenericTime millisecond(const T& v) { return {TimeUnit::Millisecond, v}; }
    [[nodiscard]] static constexpr GenericTime minute(const T& v) { return {TimeUnit::Minute, v}; }
    [[nodiscard]] static constexpr GenericTime hour(const T& v) { return {TimeUnit::Hour, v}; }
    [[nodiscard]] static constexpr GenericTime day(const T& v) { return {TimeUnit::Day, v}; }
};

using Time = GenericTime<Real>;
using TimeF = GenericTime<RealS>;

namespace detail {
    static_assert(Quantity<Time>);
    static_assert(Time::hour(2.0).to_base_unit() == 7200.0);
}

}  // namespace measura::v1
