#pragma once

// =============================================================================
// Measura v1 - Units of Measure
// =============================================================================
// Umbrella header. It provides:
// - Numeric kernel concepts (float, double, fixed point)
// - Scale factors for unitless scaling
// - The Quantity contract with its generic algebra
// - Force, Temperature, Time and Mass families
// - Unit literals, the runtime unit catalog and bulk conversion
// =============================================================================

#include "measura/v1/numeric_kernel.hpp"
#include "measura/v1/scale_factor.hpp"
#include "measura/v1/quantity.hpp"
#include "measura/v1/dimensions/force.hpp"
#include "measura/v1/dimensions/temperature.hpp"
#include "measura/v1/dimensions/time.hpp"
#include "measura/v1/dimensions/mass.hpp"
#include "measura/v1/literals.hpp"
#include "measura/v1/unit_catalog.hpp"
#include "measura/v1/bulk.hpp"

// Convenience namespace alias
namespace measura1 = measura::v1;
