#include "measura/v1/unit_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace measura::v1 {

namespace {

template<UnitSet U>
void append_units(std::vector<UnitDescriptor>& out) {
    for (const U u : unit_traits<U>::units) {
        out.push_back(describe(u));
    }
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::size_t dimension_index(DimensionId d) {
    return static_cast<std::size_t>(static_cast<int>(d));
}

}  // namespace

UnitCatalog::UnitCatalog() {
    ranges_.resize(all_dimensions.size());
    for (const DimensionId d : all_dimensions) {
        const std::size_t first = units_.size();
        switch (d) {
            case DimensionId::Force: append_units<ForceUnit>(units_); break;
            case DimensionId::Temperature: append_units<TemperatureUnit>(units_); break;
            case DimensionId::Time: append_units<TimeUnit>(units_); break;
            case DimensionId::Mass: append_units<MassUnit>(units_); break;
        }
        ranges_[dimension_index(d)] = {first, units_.size()};
    }
}

const UnitCatalog& UnitCatalog::instance() {
    static const UnitCatalog catalog;
    return catalog;
}

std::span<const UnitDescriptor> UnitCatalog::units(DimensionId dimension) const {
    const auto index = dimension_index(dimension);
    if (index >= ranges_.size()) {
        throw std::out_of_range("Invalid dimension id: " + std::to_string(static_cast<int>(dimension)));
    }
    const auto [first, last] = ranges_[index];
    return std::span<const UnitDescriptor>(units_).subspan(first, last - first);
}

const UnitDescriptor& UnitCatalog::base_of(DimensionId dimension) const {
    const auto list = units(dimension);
    const auto it = std::find_if(list.begin(), list.end(),
                                 [](const UnitDescriptor& u) { return u.is_base; });
    return *it;
}

Result<UnitDescriptor> UnitCatalog::find(DimensionId dimension, std::string_view key) const {
    const auto index = dimension_index(dimension);
    if (index >= ranges_.size()) {
        return Result<UnitDescriptor>::failure(CatalogError::UnknownDimension);
    }

    const auto list = units(dimension);
    for (const auto& u : list) {
        if (u.symbol == key) {
            return Result<UnitDescriptor>::success(u);
        }
    }
    for (const auto& u : list) {
        if (iequals(u.name, key)) {
            return Result<UnitDescriptor>::success(u);
        }
    }

    // Known symbol of another dimension is reported separately
    for (const auto& u : units_) {
        if (u.dimension != dimension && (u.symbol == key || iequals(u.name, key))) {
            return Result<UnitDescriptor>::failure(CatalogError::DimensionMismatch);
        }
    }
    return Result<UnitDescriptor>::failure(CatalogError::UnknownUnit);
}

Result<DimensionId> UnitCatalog::parse_dimension(std::string_view text) {
    for (const DimensionId d : all_dimensions) {
        if (iequals(to_string(d), text)) {
            return Result<DimensionId>::success(d);
        }
    }
    return Result<DimensionId>::failure(CatalogError::UnknownDimension);
}

double UnitCatalog::to_base(const UnitDescriptor& unit, double magnitude) noexcept {
    if (unit.is_base) {
        return magnitude;
    }
    return multiply(kernel_constant<double>(unit.factor), magnitude);
}

double UnitCatalog::from_base(const UnitDescriptor& unit, double base_value) noexcept {
    if (unit.is_base) {
        return base_value;
    }
    return divide(base_value, kernel_constant<double>(unit.factor));
}

}  // namespace measura::v1
