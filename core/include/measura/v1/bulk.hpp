#pragma once

// =============================================================================
// Measura v1 - Bulk Conversion
// =============================================================================
// Range operations over quantities of one dimension. Base-unit magnitudes are
// gathered into an Eigen column vector so callers can hand them straight to
// linear algebra code. Inputs are only read; every function is pure.
// =============================================================================

#include "measura/v1/quantity.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <limits>
#include <span>
#include <vector>

namespace measura::v1 {

template<std::floating_point T>
using BaseVector = Eigen::Matrix<T, Eigen::Dynamic, 1>;

/// Base-unit magnitudes of a range, element for element
template<Quantity Q>
    requires std::floating_point<typename Q::number_type>
[[nodiscard]] BaseVector<typename Q::number_type> to_base_units(std::span<const Q> values) {
    BaseVector<typename Q::number_type> out(static_cast<Eigen::Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = values[i].to_base_unit();
    }
    return out;
}

/// Base-unit variants from a vector of base magnitudes
template<Quantity Q>
    requires std::floating_point<typename Q::number_type>
[[nodiscard]] std::vector<Q> from_base_units(const BaseVector<typename Q::number_type>& base) {
    std::vector<Q> out;
    out.reserve(static_cast<std::size_t>(base.size()));
    for (Eigen::Index i = 0; i < base.size(); ++i) {
        out.push_back(Q::from_base_unit(base(i)));
    }
    return out;
}

template<Quantity Q>
    requires std::floating_point<typename Q::number_type>
[[nodiscard]] BaseVector<typename Q::number_type> to_base_units(const std::vector<Q>& values) {
    return to_base_units(std::span<const Q>(values));
}

/// Sum through the generic + (base variant; zero for an empty range)
template<Quantity Q>
[[nodiscard]] Q total(std::span<const Q> values) {
    Q sum = Q::from_base_unit(typename Q::number_type{});
    for (const auto& v : values) {
        sum = sum + v;
    }
    return sum;
}

template<Quantity Q>
[[nodiscard]] Q total(const std::vector<Q>& values) {
    return total(std::span<const Q>(values));
}

template<Quantity Q, NumericKernel K>
    requires std::same_as<K, typename Q::number_type>
[[nodiscard]] std::vector<Q> scale_all(std::span<const Q> values, const ScaleFactor<K>& f) {
    std::vector<Q> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.push_back(f * v);
    }
    return out;
}

/// Largest absolute deviation between two equally sized ranges, base units
template<Quantity Q>
    requires std::floating_point<typename Q::number_type>
[[nodiscard]] typename Q::number_type max_deviation(std::span<const Q> a, std::span<const Q> b) {
    using T = typename Q::number_type;
    if (a.size() != b.size() || a.empty()) {
        return a.size() == b.size() ? T{0} : std::numeric_limits<T>::infinity();
    }
    return (to_base_units(a) - to_base_units(b)).cwiseAbs().maxCoeff();
}

}  // namespace measura::v1
