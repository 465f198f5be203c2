/**
 * @file geo_query.cpp
 * @brief Geospatial airport queries
 */

#include "simlink/facility/geo_query.h"
#include "simlink/core/constants.h"
#include <algorithm>
#include <cmath>

namespace simlink::facility {

Real great_circle_distance_km(Real lat1, Real lon1, Real lat2, Real lon2) noexcept {
    // Haversine formula
    Real dlat = lat2 - lat1;
    Real dlon = lon2 - lon1;

    Real sin_dlat_2 = std::sin(dlat / 2.0);
    Real sin_dlon_2 = std::sin(dlon / 2.0);

    Real a = sin_dlat_2 * sin_dlat_2 +
             std::cos(lat1) * std::cos(lat2) * sin_dlon_2 * sin_dlon_2;
    // Rounding can leave a just outside [0, 1] near the antipode
    a = std::clamp(a, 0.0, 1.0);

    Real c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return constants::EARTH_RADIUS_KM * c;
}

std::vector<NearbyAirport> GeoQuery::nearby(Real latitude, Real longitude, Real radius_nm) const {
    const Real radius_km = radius_nm * constants::KM_PER_NM;
    const Real lat = latitude * constants::DEG_TO_RAD;
    const Real lon = longitude * constants::DEG_TO_RAD;

    std::vector<NearbyAirport> found;
    for (const auto& airport : airports_) {
        Real d = great_circle_distance_km(lat, lon,
                                          airport.latitude * constants::DEG_TO_RAD,
                                          airport.longitude * constants::DEG_TO_RAD);
        if (d <= radius_km) {
            found.push_back({airport, d / constants::KM_PER_NM});
        }
    }

    std::stable_sort(found.begin(), found.end(),
        [](const NearbyAirport& a, const NearbyAirport& b) {
            return a.distance_nm < b.distance_nm;
        });
    return found;
}

std::optional<Airport> GeoQuery::by_icao(const std::string& icao) const {
    auto it = std::find_if(airports_.begin(), airports_.end(),
        [&icao](const Airport& airport) { return airport.icao == icao; });
    if (it == airports_.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace simlink::facility
