#pragma once
/**
 * @file record_decoder.h
 * @brief Decoding of facility list entries and facility detail records
 *
 * Record layouts (little-endian, packed):
 *
 * Facility list entry (33 bytes):
 *   char[6] icao, char[3] region, f64 lat, f64 lon, f64 alt (m)
 *
 * Airport detail record:
 *   f64 lat, f64 lon, f64 alt (m), f32 magvar, char[32] name,
 *   char[64] name64, char[8] region, i32 runway count
 *
 * Runway detail record:
 *   f64 lat, f64 lon, f64 alt (m), f32 heading, f32 length, f32 width,
 *   f32 pattern altitude, f32 slope (rad), f32 true slope (rad),
 *   i32 surface, then for primary and secondary end:
 *   i32 number, i32 designator, i32 ILS type, char[8] ILS icao,
 *   char[8] ILS region
 *
 * The field order follows airport_detail_fields(), which is the facility
 * definition registered with the simulator.
 */

#include "simlink/core/byte_codec.h"
#include "simlink/facility/facility_types.h"
#include "simlink/transport/transport.h"
#include <optional>
#include <string>
#include <vector>

namespace simlink::facility {

// ============================================================================
// Record Sizes
// ============================================================================

constexpr SizeT FACILITY_LIST_ENTRY_SIZE = 6 + 3 + 3 * 8;
constexpr SizeT AIRPORT_RECORD_SIZE = 3 * 8 + 4 + 32 + 64 + 8 + 4;
constexpr SizeT APPROACH_BLOCK_SIZE = 3 * 4 + 8 + 8;
constexpr SizeT RUNWAY_RECORD_SIZE = 3 * 8 + 6 * 4 + 4 + 2 * APPROACH_BLOCK_SIZE;

/**
 * @brief Facility definition fields, in registration order
 */
const std::vector<std::string>& airport_detail_fields();

// ============================================================================
// Decoders
// ============================================================================

/**
 * @brief Decode an airport detail record into @p airport
 *
 * Leaves the ICAO code and the runway list untouched.
 *
 * @return false if the record is truncated
 */
bool decode_airport_header(core::ByteReader& reader, Airport& airport);

/**
 * @brief Decode one runway detail record
 * @return nullopt if the record is truncated
 */
std::optional<Runway> decode_runway(core::ByteReader& reader);

/**
 * @brief Decode the entries of one facility list page
 * @return nullopt if the payload is not a whole number of entries
 */
std::optional<std::vector<AirportSummary>> decode_facility_list(const std::vector<UInt8>& payload);

// ============================================================================
// AirportBuilder
// ============================================================================

/**
 * @brief Accumulates the detail records of one airport
 *
 * Records of unknown type are ignored. A truncated record is skipped and
 * counted in malformed_records().
 */
class AirportBuilder {
public:
    explicit AirportBuilder(std::string icao);

    /**
     * @brief Decode one detail record
     * @return false if the record was truncated
     */
    bool add_record(transport::FacilityDataType type, const std::vector<UInt8>& record);

    Airport build() const { return airport_; }
    const Airport& airport() const { return airport_; }
    SizeT malformed_records() const { return malformed_; }

private:
    Airport airport_;
    SizeT malformed_{0};
};

} // namespace simlink::facility
