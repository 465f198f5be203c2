/**
 * @file record_decoder.cpp
 * @brief Facility record decoding
 */

#include "simlink/facility/record_decoder.h"
#include "simlink/core/constants.h"
#include "simlink/core/logging.h"
#include "simlink/facility/facility_tables.h"

namespace simlink::facility {

using transport::FacilityDataType;

const std::vector<std::string>& airport_detail_fields() {
    static const std::vector<std::string> fields = {
        "OPEN AIRPORT",
        "LATITUDE", "LONGITUDE", "ALTITUDE", "MAGVAR",
        "NAME", "NAME64", "REGION", "N_RUNWAYS",

        "OPEN RUNWAY",
        "LATITUDE", "LONGITUDE", "ALTITUDE",
        "HEADING", "LENGTH", "WIDTH", "PATTERN_ALTITUDE",
        "SLOPE", "TRUE_SLOPE", "SURFACE",
        "PRIMARY_NUMBER", "PRIMARY_DESIGNATOR", "PRIMARY_ILS_TYPE",
        "PRIMARY_ILS_ICAO", "PRIMARY_ILS_REGION",
        "SECONDARY_NUMBER", "SECONDARY_DESIGNATOR", "SECONDARY_ILS_TYPE",
        "SECONDARY_ILS_ICAO", "SECONDARY_ILS_REGION",
        "CLOSE RUNWAY",

        "CLOSE AIRPORT"
    };
    return fields;
}

// ============================================================================
// Detail Records
// ============================================================================

bool decode_airport_header(core::ByteReader& reader, Airport& airport) {
    Airport decoded = airport;
    decoded.latitude = reader.read_f64();
    decoded.longitude = reader.read_f64();
    decoded.altitude = reader.read_f64() * constants::FEET_PER_METER;
    decoded.declination = reader.read_f32();
    decoded.name = reader.read_fixed_string(32);
    decoded.name64 = reader.read_fixed_string(64);
    decoded.region = reader.read_fixed_string(8);
    decoded.runway_count = reader.read_i32();

    if (!reader.ok()) {
        return false;
    }
    airport = std::move(decoded);
    return true;
}

namespace {

Approach decode_approach(core::ByteReader& reader) {
    Approach approach;
    approach.marking = runway_number(reader.read_i32());
    approach.designation = runway_designator(reader.read_i32());
    approach.ils.type = ils_type(reader.read_i32());
    approach.ils.icao = reader.read_fixed_string(8);
    approach.ils.region = reader.read_fixed_string(8);
    return approach;
}

} // namespace

std::optional<Runway> decode_runway(core::ByteReader& reader) {
    Runway runway;
    runway.latitude = reader.read_f64();
    runway.longitude = reader.read_f64();
    runway.altitude = reader.read_f64() * constants::FEET_PER_METER;
    runway.heading = reader.read_f32();
    runway.length = reader.read_f32();
    runway.width = reader.read_f32();
    runway.pattern_altitude = reader.read_f32();
    runway.slope = reader.read_f32() * constants::RAD_TO_DEG;
    runway.slope_true = reader.read_f32() * constants::RAD_TO_DEG;
    runway.surface = runway_surface(reader.read_i32());
    runway.approach[0] = decode_approach(reader);
    runway.approach[1] = decode_approach(reader);

    if (!reader.ok()) {
        return std::nullopt;
    }
    return runway;
}

// ============================================================================
// Facility List
// ============================================================================

std::optional<std::vector<AirportSummary>> decode_facility_list(const std::vector<UInt8>& payload) {
    if (payload.size() % FACILITY_LIST_ENTRY_SIZE != 0) {
        return std::nullopt;
    }

    core::ByteReader reader(payload);
    std::vector<AirportSummary> entries;
    entries.reserve(payload.size() / FACILITY_LIST_ENTRY_SIZE);

    while (!reader.exhausted()) {
        AirportSummary entry;
        entry.icao = reader.read_fixed_string(6);
        entry.region = reader.read_fixed_string(3);
        entry.latitude = reader.read_f64();
        entry.longitude = reader.read_f64();
        entry.altitude = reader.read_f64();
        entries.push_back(std::move(entry));
    }

    if (!reader.ok()) {
        return std::nullopt;
    }
    return entries;
}

// ============================================================================
// AirportBuilder
// ============================================================================

AirportBuilder::AirportBuilder(std::string icao) {
    airport_.icao = std::move(icao);
}

bool AirportBuilder::add_record(FacilityDataType type, const std::vector<UInt8>& record) {
    core::ByteReader reader(record);

    switch (type) {
        case FacilityDataType::Airport:
            if (!decode_airport_header(reader, airport_)) {
                SIMLINK_LOG_WARN("Truncated airport record for {} ({} bytes)",
                                 airport_.icao, record.size());
                ++malformed_;
                return false;
            }
            return true;

        case FacilityDataType::Runway: {
            std::optional<Runway> runway = decode_runway(reader);
            if (!runway) {
                SIMLINK_LOG_WARN("Truncated runway record for {} ({} bytes)",
                                 airport_.icao, record.size());
                ++malformed_;
                return false;
            }
            airport_.runways.push_back(std::move(*runway));
            return true;
        }

        default:
            return true;
    }
}

} // namespace simlink::facility
