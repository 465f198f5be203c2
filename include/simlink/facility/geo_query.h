#pragma once
/**
 * @file geo_query.h
 * @brief Great-circle distance and airport lookups
 */

#include "simlink/facility/facility_types.h"
#include <optional>
#include <string>
#include <vector>

namespace simlink::facility {

/**
 * @brief Great-circle distance between two points (haversine)
 *
 * @param lat1, lon1, lat2, lon2 Positions in radians
 * @return Distance in kilometers on a 6371 km sphere
 */
Real great_circle_distance_km(Real lat1, Real lon1, Real lat2, Real lon2) noexcept;

/**
 * @brief Read-only queries over an airport set
 */
class GeoQuery {
public:
    explicit GeoQuery(const std::vector<Airport>& airports) : airports_(airports) {}

    /**
     * @brief Airports within a radius of a position
     *
     * @param latitude, longitude Reference position in degrees
     * @param radius_nm Search radius in nautical miles (inclusive)
     * @return Matches annotated with their distance, nearest first; ties keep
     *         database order
     */
    std::vector<NearbyAirport> nearby(Real latitude, Real longitude, Real radius_nm) const;

    /**
     * @brief First airport whose ICAO code matches exactly
     */
    std::optional<Airport> by_icao(const std::string& icao) const;

private:
    const std::vector<Airport>& airports_;
};

} // namespace simlink::facility
