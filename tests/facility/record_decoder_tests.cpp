/**
 * @file record_decoder_tests.cpp
 * @brief Unit tests for facility record decoding and label tables
 */

#include <gtest/gtest.h>
#include "simlink/facility/record_decoder.h"
#include "simlink/facility/facility_tables.h"
#include "simlink/core/constants.h"
#include "../support/test_support.h"

using namespace simlink;
using namespace simlink::facility;
using namespace simlink::testing;
using transport::FacilityDataType;

class RecordDecoderTest : public ::testing::Test {};

// ============================================================================
// Label Tables
// ============================================================================

TEST_F(RecordDecoderTest, RunwaySurfaceTable) {
    EXPECT_EQ(runway_surface(0), "concrete");
    EXPECT_EQ(runway_surface(4), "asphalt");
    EXPECT_EQ(runway_surface(31), "paint");
    EXPECT_EQ(runway_surface(254), "unknown");
    EXPECT_FALSE(runway_surface(32).has_value());
    EXPECT_FALSE(runway_surface(-1).has_value());
}

TEST_F(RecordDecoderTest, RunwayNumberTable) {
    EXPECT_EQ(runway_number(0), "none");
    EXPECT_EQ(runway_number(1), "1");
    EXPECT_EQ(runway_number(36), "36");
    EXPECT_EQ(runway_number(37), "north");
    EXPECT_EQ(runway_number(44), "northwest");
    EXPECT_EQ(runway_number(45), "last");
    EXPECT_FALSE(runway_number(46).has_value());
    EXPECT_FALSE(runway_number(-5).has_value());
}

TEST_F(RecordDecoderTest, DesignatorAndIlsTables) {
    EXPECT_EQ(runway_designator(0), "none");
    EXPECT_EQ(runway_designator(3), "center");
    EXPECT_FALSE(runway_designator(8).has_value());

    EXPECT_EQ(ils_type(0), "none");
    EXPECT_EQ(ils_type(78), "NDB");
    EXPECT_EQ(ils_type(86), "VOR");
    EXPECT_FALSE(ils_type(1).has_value());
}

// ============================================================================
// Facility List
// ============================================================================

TEST_F(RecordDecoderTest, DecodesFacilityListPage) {
    auto page = encode_list_page({"KSEA", "KBFI"});
    ASSERT_EQ(page.size(), 2 * FACILITY_LIST_ENTRY_SIZE);

    auto entries = decode_facility_list(page);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0].icao, "KSEA");
    EXPECT_EQ((*entries)[0].region, "K1");
    EXPECT_DOUBLE_EQ((*entries)[0].latitude, 47.0);
    EXPECT_EQ((*entries)[1].icao, "KBFI");
    EXPECT_DOUBLE_EQ((*entries)[1].longitude, -122.1);
}

TEST_F(RecordDecoderTest, RejectsPartialListEntry) {
    auto page = encode_list_page({"KSEA"});
    page.pop_back();
    EXPECT_FALSE(decode_facility_list(page).has_value());
    EXPECT_TRUE(decode_facility_list({})->empty());
}

// ============================================================================
// Detail Records
// ============================================================================

TEST_F(RecordDecoderTest, DetailFieldListIsBracketed) {
    const auto& fields = airport_detail_fields();
    ASSERT_EQ(fields.size(), 32u);
    EXPECT_EQ(fields.front(), "OPEN AIRPORT");
    EXPECT_EQ(fields.back(), "CLOSE AIRPORT");
}

TEST_F(RecordDecoderTest, DecodesAirportHeader) {
    auto record = encode_airport_record(47.449, -122.309, 100.0, 15.5, "SEATTLE-TACOMA", "K1", 3);
    ASSERT_EQ(record.size(), AIRPORT_RECORD_SIZE);

    AirportBuilder builder("KSEA");
    EXPECT_TRUE(builder.add_record(FacilityDataType::Airport, record));

    const Airport& airport = builder.airport();
    EXPECT_EQ(airport.icao, "KSEA");
    EXPECT_DOUBLE_EQ(airport.latitude, 47.449);
    EXPECT_DOUBLE_EQ(airport.longitude, -122.309);
    EXPECT_NEAR(airport.altitude, 328.084, 1e-6);
    EXPECT_DOUBLE_EQ(airport.declination, 15.5);
    EXPECT_EQ(airport.name, "SEATTLE-TACOMA");
    EXPECT_EQ(airport.name64, "SEATTLE-TACOMA International");
    EXPECT_EQ(airport.region, "K1");
    EXPECT_EQ(airport.runway_count, 3);
}

TEST_F(RecordDecoderTest, DecodesRunway) {
    RunwayFields fields;
    fields.slope_rad = 0.01;
    fields.primary_ils_type = 65;
    auto record = encode_runway_record(fields);
    ASSERT_EQ(record.size(), RUNWAY_RECORD_SIZE);

    core::ByteReader reader(record);
    auto runway = decode_runway(reader);
    ASSERT_TRUE(runway.has_value());
    EXPECT_DOUBLE_EQ(runway->heading, 163.0);
    EXPECT_DOUBLE_EQ(runway->length, 3627.0);
    EXPECT_NEAR(runway->altitude, 328.084, 1e-6);
    EXPECT_NEAR(runway->slope, 0.01 * constants::RAD_TO_DEG, 1e-4);
    EXPECT_EQ(runway->surface, "asphalt");

    EXPECT_EQ(runway->approach[0].marking, "16");
    EXPECT_EQ(runway->approach[0].designation, "left");
    EXPECT_EQ(runway->approach[0].ils.type, "airport");
    EXPECT_EQ(runway->approach[0].ils.icao, "ISNQ");
    EXPECT_EQ(runway->approach[1].marking, "34");
    EXPECT_EQ(runway->approach[1].designation, "right");
    EXPECT_EQ(runway->approach[1].ils.icao, "IBEJ");
}

TEST_F(RecordDecoderTest, UnknownLabelsDecodeAsAbsent) {
    RunwayFields fields;
    fields.surface = 99;
    fields.secondary_designator = 12;
    fields.secondary_ils_type = 3;
    auto record = encode_runway_record(fields);

    core::ByteReader reader(record);
    auto runway = decode_runway(reader);
    ASSERT_TRUE(runway.has_value());
    EXPECT_FALSE(runway->surface.has_value());
    EXPECT_FALSE(runway->approach[1].designation.has_value());
    EXPECT_FALSE(runway->approach[1].ils.type.has_value());
}

TEST_F(RecordDecoderTest, BuilderCollectsRunwaysAndSkipsMalformed) {
    AirportBuilder builder("KSEA");
    builder.add_record(FacilityDataType::Airport,
                       encode_airport_record(47.4, -122.3, 130.0, 15.0, "SEATAC", "K1", 2));
    EXPECT_TRUE(builder.add_record(FacilityDataType::Runway, encode_runway_record({})));

    auto truncated = encode_runway_record({});
    truncated.resize(truncated.size() - 4);
    EXPECT_FALSE(builder.add_record(FacilityDataType::Runway, truncated));
    EXPECT_TRUE(builder.add_record(FacilityDataType::Other, {1, 2, 3}));

    Airport airport = builder.build();
    EXPECT_EQ(airport.runways.size(), 1u);
    EXPECT_EQ(airport.runway_count, 2);
    EXPECT_EQ(builder.malformed_records(), 1u);
}

TEST_F(RecordDecoderTest, TruncatedHeaderLeavesAirportUntouched) {
    auto record = encode_airport_record(47.4, -122.3, 130.0, 15.0, "SEATAC", "K1", 2);
    record.resize(20);

    AirportBuilder builder("KSEA");
    EXPECT_FALSE(builder.add_record(FacilityDataType::Airport, record));
    EXPECT_DOUBLE_EQ(builder.airport().latitude, 0.0);
    EXPECT_EQ(builder.airport().icao, "KSEA");
}
