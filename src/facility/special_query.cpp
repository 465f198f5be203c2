/**
 * @file special_query.cpp
 * @brief Special variable name parsing
 */

#include "simlink/facility/special_query.h"
#include "simlink/property/property_codec.h"

namespace simlink::facility {

namespace {

constexpr const char* ALL_AIRPORTS = "ALL AIRPORTS";
constexpr const char* NEARBY_AIRPORTS = "NEARBY AIRPORTS";
constexpr const char* AIRPORT_PREFIX = "AIRPORT:";

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::optional<SpecialQuery> parse_special_query(const std::string& name, Real default_radius_nm) {
    const std::string normalized = property::sim_name(name);

    if (normalized == ALL_AIRPORTS) {
        return AllAirports{};
    }

    if (starts_with(normalized, NEARBY_AIRPORTS)) {
        std::string rest = normalized.substr(std::string(NEARBY_AIRPORTS).size());
        if (rest.empty()) {
            return NearbyAirports{default_radius_nm};
        }
        if (rest[0] != ':') {
            return std::nullopt;
        }
        std::optional<Real> radius = property::parse_number(rest.substr(1));
        if (!radius || *radius < 0.0) {
            return std::nullopt;
        }
        return NearbyAirports{*radius};
    }

    if (starts_with(normalized, AIRPORT_PREFIX)) {
        std::string icao = normalized.substr(std::string(AIRPORT_PREFIX).size());
        if (icao.empty()) {
            return std::nullopt;
        }
        return AirportByIcao{icao};
    }

    return std::nullopt;
}

bool is_special_query(const std::string& name) {
    return parse_special_query(name).has_value();
}

} // namespace simlink::facility
