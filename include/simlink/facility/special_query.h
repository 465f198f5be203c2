#pragma once
/**
 * @file special_query.h
 * @brief Airport queries addressed by special variable names
 *
 * Recognized names (underscores may replace spaces):
 * - "ALL AIRPORTS"
 * - "NEARBY AIRPORTS" or "NEARBY AIRPORTS:<nm>"
 * - "AIRPORT:<icao>"
 */

#include "simlink/core/constants.h"
#include "simlink/facility/facility_types.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace simlink::facility {

struct AllAirports {};

struct NearbyAirports {
    Real radius_nm{constants::DEFAULT_NEARBY_RADIUS_NM};
};

struct AirportByIcao {
    std::string icao;
};

using SpecialQuery = std::variant<AllAirports, NearbyAirports, AirportByIcao>;

/**
 * @brief Result matching the query alternative
 */
using SpecialResult = std::variant<std::vector<Airport>,
                                   std::vector<NearbyAirport>,
                                   std::optional<Airport>>;

/**
 * @brief Parse a special variable name
 * @return nullopt if the name is not a special query or its argument is invalid
 */
std::optional<SpecialQuery> parse_special_query(
    const std::string& name,
    Real default_radius_nm = constants::DEFAULT_NEARBY_RADIUS_NM);

/// parse_special_query() would accept the name
bool is_special_query(const std::string& name);

} // namespace simlink::facility
