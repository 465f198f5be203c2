/**
 * @file facility_tables.cpp
 * @brief Facility label tables
 */

#include "simlink/facility/facility_tables.h"
#include <array>
#include <string_view>

namespace simlink::facility {

namespace {

constexpr std::array<std::string_view, 32> RUNWAY_SURFACES = {
    "concrete", "grass", "water fsx", "grass bumpy",
    "asphalt", "short grass", "long grass", "hard turf",
    "snow", "ice", "urban", "forest",
    "dirt", "coral", "gravel", "oil treated",
    "steel mats", "bituminus", "brick", "macadam",
    "planks", "sand", "shale", "tarmac",
    "wright flyer track", "ocean", "water", "pond",
    "lake", "river", "waste water", "paint"
};

constexpr Int32 SURFACE_UNKNOWN = 254;

// 0 = none, 1..36 numbered, then compass points
constexpr std::array<std::string_view, 9> RUNWAY_COMPASS = {
    "north", "northeast", "east", "southeast",
    "south", "southwest", "west", "northwest", "last"
};

constexpr Int32 RUNWAY_NUMBER_MAX = 36;

constexpr std::array<std::string_view, 8> RUNWAY_DESIGNATORS = {
    "none", "left", "right", "center", "water", "a", "b", "last"
};

template <SizeT N>
std::optional<std::string> lookup(const std::array<std::string_view, N>& table, Int32 index) {
    if (index < 0 || static_cast<SizeT>(index) >= N) {
        return std::nullopt;
    }
    return std::string(table[static_cast<SizeT>(index)]);
}

} // namespace

std::optional<std::string> runway_surface(Int32 index) {
    if (index == SURFACE_UNKNOWN) {
        return std::string("unknown");
    }
    return lookup(RUNWAY_SURFACES, index);
}

std::optional<std::string> runway_number(Int32 index) {
    if (index < 0) {
        return std::nullopt;
    }
    if (index == 0) {
        return std::string("none");
    }
    if (index <= RUNWAY_NUMBER_MAX) {
        return std::to_string(index);
    }
    return lookup(RUNWAY_COMPASS, index - RUNWAY_NUMBER_MAX - 1);
}

std::optional<std::string> runway_designator(Int32 index) {
    return lookup(RUNWAY_DESIGNATORS, index);
}

std::optional<std::string> ils_type(Int32 index) {
    switch (index) {
        case 0: return std::string("none");
        case 65: return std::string("airport");
        case 78: return std::string("NDB");
        case 86: return std::string("VOR");
        case 87: return std::string("waypoint");
        default: return std::nullopt;
    }
}

} // namespace simlink::facility
