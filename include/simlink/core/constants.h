#pragma once
/**
 * @file constants.h
 * @brief Protocol and unit conversion constants
 */

#include "simlink/core/types.h"

namespace simlink::constants {

// ============================================================================
// Resource IDs
// ============================================================================

/// First ID handed out (and the wrap target)
constexpr ResourceId RESOURCE_ID_FIRST = 1;

/// Highest ID handed out before wrapping
constexpr ResourceId RESOURCE_ID_CEILING = 900;

// ============================================================================
// Timing Defaults
// ============================================================================

/// Delay before a fire-and-forget write releases its definition
constexpr Milliseconds DEFAULT_WRITE_CLEANUP_DELAY{500};

/// Default timeout for correlated requests (0 disables)
constexpr Milliseconds DEFAULT_REQUEST_TIMEOUT{10000};

/// Default timeout for a single airport detail fetch
constexpr Milliseconds DEFAULT_DETAIL_TIMEOUT{5000};

// ============================================================================
// Facility Protocol
// ============================================================================

/// Facility list type for airports
constexpr UInt32 FACILITY_LIST_TYPE_AIRPORT = 0;

/// Facility definition ID used for airport detail fetches
constexpr ResourceId FACILITY_AIRPORT_DEFINITION = 1000;

/// Default search radius for nearby airport queries (nautical miles)
constexpr Real DEFAULT_NEARBY_RADIUS_NM = 200.0;

// ============================================================================
// Unit Conversions
// ============================================================================

constexpr Real KM_PER_NM = 1.852;
constexpr Real FEET_PER_METER = 3.28084;
constexpr Real PI = 3.14159265358979323846;
constexpr Real DEG_TO_RAD = PI / 180.0;
constexpr Real RAD_TO_DEG = 180.0 / PI;

/// Mean Earth radius used for great-circle distances (km)
constexpr Real EARTH_RADIUS_KM = 6371.0;

} // namespace simlink::constants
