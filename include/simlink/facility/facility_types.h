#pragma once
/**
 * @file facility_types.h
 * @brief Airport database records
 *
 * Units follow the simulator's facility data after conversion:
 * positions in degrees, airport/runway altitude in feet, runway length,
 * width and pattern altitude in meters, slopes in degrees.
 */

#include "simlink/core/types.h"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace simlink::facility {

/**
 * @brief ILS details for one runway end
 */
struct IlsInfo {
    std::optional<std::string> type;
    std::string icao;
    std::string region;

    bool operator==(const IlsInfo&) const = default;
};

/**
 * @brief Approach information for one runway end
 *
 * Labels are absent when the simulator reports an index outside the known
 * tables.
 */
struct Approach {
    std::optional<std::string> designation;  ///< left/right/center/...
    std::optional<std::string> marking;      ///< runway number or compass point
    IlsInfo ils;

    bool operator==(const Approach&) const = default;
};

struct Runway {
    Real latitude{0.0};
    Real longitude{0.0};
    Real altitude{0.0};            ///< feet
    Real heading{0.0};             ///< degrees
    Real length{0.0};              ///< meters
    Real width{0.0};               ///< meters
    Real pattern_altitude{0.0};    ///< meters
    Real slope{0.0};               ///< degrees
    Real slope_true{0.0};          ///< degrees
    std::optional<std::string> surface;
    std::array<Approach, 2> approach{};  ///< primary, secondary

    bool operator==(const Runway&) const = default;
};

struct Airport {
    std::string icao;
    Real latitude{0.0};
    Real longitude{0.0};
    Real altitude{0.0};            ///< feet
    Real declination{0.0};         ///< magnetic variation, degrees
    std::string name;
    std::string name64;
    std::string region;
    Int32 runway_count{0};
    std::vector<Runway> runways;

    bool operator==(const Airport&) const = default;
};

/**
 * @brief One facility-list entry (summary, before detail fetch)
 */
struct AirportSummary {
    std::string icao;
    std::string region;
    Real latitude{0.0};
    Real longitude{0.0};
    Real altitude{0.0};            ///< meters, as reported by the list

    bool operator==(const AirportSummary&) const = default;
};

/**
 * @brief Airport annotated with its distance from a reference point
 */
struct NearbyAirport {
    Airport airport;
    Real distance_nm{0.0};
};

/**
 * @brief Reference position for radius searches (degrees)
 */
struct Position {
    Real latitude{0.0};
    Real longitude{0.0};
};

} // namespace simlink::facility
