#pragma once
/**
 * @file simlink.h
 * @brief Main include file for SimLink
 *
 * SimLink - Client-side mediation layer for flight simulator protocols
 *
 * Include this single header to access all public SimLink APIs.
 */

#include "simlink/core/types.h"
#include "simlink/core/error.h"
#include "simlink/core/deferred.h"
#include "simlink/core/logging.h"

#include "simlink/transport/transport.h"

#include "simlink/property/property_catalog.h"
#include "simlink/property/property_codec.h"

#include "simlink/facility/facility_types.h"
#include "simlink/facility/special_query.h"

#include "simlink/api/config.h"
#include "simlink/api/orchestrator.h"

/**
 * @namespace simlink
 * @brief Root namespace for all SimLink components
 */
namespace simlink {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace simlink
