#pragma once
/**
 * @file facility_tables.h
 * @brief Label tables for enumerated facility fields
 *
 * Indices match the simulator's assignments. An index outside a table
 * yields nullopt rather than an error.
 */

#include "simlink/core/types.h"
#include <optional>
#include <string>

namespace simlink::facility {

/// Runway surface (0..31, 254 = "unknown")
std::optional<std::string> runway_surface(Int32 index);

/// Runway number ("none", "1".."36", compass points, "last")
std::optional<std::string> runway_number(Int32 index);

/// Runway designator ("none", "left", "right", ...)
std::optional<std::string> runway_designator(Int32 index);

/// ILS/approach facility type (sparse: 0, 65, 78, 86, 87)
std::optional<std::string> ils_type(Int32 index);

} // namespace simlink::facility
