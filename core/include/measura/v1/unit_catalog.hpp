#pragma once

// =============================================================================
// Measura v1 - Unit Catalog
// =============================================================================
// Runtime view of the compile-time unit tables. Configuration loaders and the
// command line tool resolve declared unit symbols here; typed code never needs
// it. Lookup is exact (symbol) or case-insensitive (long name); nothing is
// parsed or inferred.
// =============================================================================

#include "measura/v1/dimensions/force.hpp"
#include "measura/v1/dimensions/mass.hpp"
#include "measura/v1/dimensions/temperature.hpp"
#include "measura/v1/dimensions/time.hpp"

#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace measura::v1 {

// =============================================================================
// Result Types (portable alternative to std::expected)
// =============================================================================

enum class CatalogError {
    UnknownDimension,
    UnknownUnit,
    DimensionMismatch
};

[[nodiscard]] inline constexpr const char* to_string(CatalogError err) noexcept {
    switch (err) {
        case CatalogError::UnknownDimension: return "UnknownDimension";
        case CatalogError::UnknownUnit: return "UnknownUnit";
        case CatalogError::DimensionMismatch: return "DimensionMismatch";
        default: return "Unknown";
    }
}

template<typename T>
struct Result {
    std::optional<T> value;
    CatalogError error = CatalogError::UnknownUnit;

    [[nodiscard]] bool has_value() const { return value.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }
    [[nodiscard]] T& operator*() { return *value; }
    [[nodiscard]] const T& operator*() const { return *value; }
    [[nodiscard]] T* operator->() { return &*value; }
    [[nodiscard]] const T* operator->() const { return &*value; }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(CatalogError err) {
        Result r;
        r.error = err;
        return r;
    }
};

// =============================================================================
// Unit Descriptor
// =============================================================================

struct UnitDescriptor {
    DimensionId dimension = DimensionId::Force;
    int code = 0;                 // underlying value of the unit enumerator
    std::string_view symbol;
    std::string_view name;
    double factor = 1.0;          // magnitude in this unit -> base unit
    bool is_base = false;

    [[nodiscard]] bool operator==(const UnitDescriptor& other) const {
        return dimension == other.dimension && code == other.code;
    }
};

/// Descriptor of a compile-time unit
template<UnitSet U>
[[nodiscard]] constexpr UnitDescriptor describe(U u) noexcept {
    using traits = unit_traits<U>;
    return UnitDescriptor{
        traits::dimension,
        static_cast<int>(static_cast<std::underlying_type_t<U>>(u)),
        traits::symbol(u),
        traits::name(u),
        traits::factor(u),
        u == traits::base
    };
}

// =============================================================================
// Dimension Dispatch
// =============================================================================

/// Calls f(std::type_identity<Family<T>>{}) for the family of dimension d
template<NumericKernel T, typename F>
decltype(auto) dispatch_dimension(DimensionId d, F&& f) {
    switch (d) {
        case DimensionId::Force:
            return std::forward<F>(f)(std::type_identity<GenericForce<T>>{});
        case DimensionId::Temperature:
            return std::forward<F>(f)(std::type_identity<GenericTemperature<T>>{});
        case DimensionId::Time:
            return std::forward<F>(f)(std::type_identity<GenericTime<T>>{});
        case DimensionId::Mass:
            break;
    }
    return std::forward<F>(f)(std::type_identity<GenericMass<T>>{});
}

// =============================================================================
// Unit Catalog
// =============================================================================

class UnitCatalog {
public:
    /// Process-wide catalog, built on first use and immutable afterwards
    [[nodiscard]] static const UnitCatalog& instance();

    [[nodiscard]] std::span<const UnitDescriptor> all() const noexcept { return units_; }

    /// Units of one dimension, in declaration order (base first)
    [[nodiscard]] std::span<const UnitDescriptor> units(DimensionId dimension) const;

    [[nodiscard]] const UnitDescriptor& base_of(DimensionId dimension) const;

    /// Exact symbol match, else case-insensitive long-name match
    [[nodiscard]] Result<UnitDescriptor> find(DimensionId dimension, std::string_view key) const;

    /// Resolve "force", "Temperature", ... to a DimensionId
    [[nodiscard]] static Result<DimensionId> parse_dimension(std::string_view text);

    /// Runtime conversion; same arithmetic as QuantityBase::to_base_unit
    [[nodiscard]] static double to_base(const UnitDescriptor& unit, double magnitude) noexcept;

    [[nodiscard]] static double from_base(const UnitDescriptor& unit, double base_value) noexcept;

private:
    UnitCatalog();

    std::vector<UnitDescriptor> units_;
    // [first, last) into units_ per DimensionId
    std::vector<std::pair<std::size_t, std::size_t>> ranges_;
};

/// Typed quantity from a runtime descriptor
template<TaggedQuantity Q>
[[nodiscard]] Result<Q> make_quantity(const UnitDescriptor& unit, const typename Q::number_type& magnitude) {
    using U = typename Q::unit_type;
    if (unit.dimension != unit_traits<U>::dimension) {
        return Result<Q>::failure(CatalogError::DimensionMismatch);
    }
    return Result<Q>::success(Q(static_cast<U>(unit.code), magnitude));
}

}  // namespace measura::v1
