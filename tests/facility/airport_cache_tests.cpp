/**
 * @file airport_cache_tests.cpp
 * @brief Unit tests for airport database acquisition
 */

#include <gtest/gtest.h>
#include "simlink/facility/airport_cache.h"
#include "simlink/facility/snapshot_codec.h"
#include "simlink/transport/mock_transport.h"
#include "../support/test_support.h"

using namespace simlink;
using namespace simlink::facility;
using namespace simlink::transport;
using simlink::testing::ManualClock;
using simlink::testing::ScratchDir;

class AirportCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport.open("test");
        transport.clear_calls();
        settings.cache_path = dir.file("airport.db.gz");
        settings.detail_timeout = Milliseconds(1000);
        cache = std::make_unique<AirportCache>(transport, ids, scheduler, settings);
    }

    ResourceId list_request_id() const {
        return transport.last(CallKind::RequestFacilityList)->id;
    }

    void deliver_list(const std::vector<std::string>& icaos) {
        cache->on_event(InboundEvent::facility_list_page(
            list_request_id(), 0, 1, simlink::testing::encode_list_page(icaos)));
    }

    /// Answer the outstanding detail request with one airport and one runway
    void answer_detail() {
        ASSERT_NE(transport.last(CallKind::RequestFacilityDetail), nullptr);
        // Copy: the detail-end triggers the next request, which grows the call log
        TransportCall call = *transport.last(CallKind::RequestFacilityDetail);
        cache->on_event(InboundEvent::facility_detail(
            call.id, FacilityDataType::Airport,
            simlink::testing::encode_airport_record(47.0, -122.0, 100.0, 15.0,
                                                    call.name + " FIELD", "K1", 1)));
        cache->on_event(InboundEvent::facility_detail(
            call.id, FacilityDataType::Runway, simlink::testing::encode_runway_record({})));
        cache->on_event(InboundEvent::facility_detail_end(call.id));
    }

    ScratchDir dir;
    ManualClock clock;
    core::Scheduler scheduler{clock.fn()};
    MockTransport transport;
    resource::ResourceIdAllocator ids;
    AirportSettings settings;
    std::unique_ptr<AirportCache> cache;
};

TEST_F(AirportCacheTest, StartRegistersDefinitionAndRequestsList) {
    EXPECT_TRUE(cache->start());
    EXPECT_EQ(cache->state(), CacheState::Listing);
    EXPECT_EQ(transport.count(CallKind::AddToFacilityDefinition), airport_detail_fields().size());
    EXPECT_EQ(transport.last(CallKind::AddToFacilityDefinition)->id,
              constants::FACILITY_AIRPORT_DEFINITION);
    EXPECT_EQ(transport.count(CallKind::RequestFacilityList), 1u);

    // Second start while running is a no-op
    EXPECT_TRUE(cache->start());
    EXPECT_EQ(transport.count(CallKind::RequestFacilityList), 1u);
}

TEST_F(AirportCacheTest, ListingCompletesOnlyOnLastPage) {
    cache->start();
    ResourceId request = list_request_id();

    cache->on_event(InboundEvent::facility_list_page(
        request, 0, 3, simlink::testing::encode_list_page({"KSEA", "KBFI"})));
    EXPECT_EQ(cache->state(), CacheState::Listing);
    cache->on_event(InboundEvent::facility_list_page(
        request, 1, 3, simlink::testing::encode_list_page({"KPAE"})));
    EXPECT_EQ(cache->state(), CacheState::Listing);
    EXPECT_EQ(transport.count(CallKind::RequestFacilityDetail), 0u);

    cache->on_event(InboundEvent::facility_list_page(
        request, 2, 3, simlink::testing::encode_list_page({"KRNT"})));
    EXPECT_EQ(cache->state(), CacheState::Fetching);
    EXPECT_EQ(cache->live_count(), 4u);
    EXPECT_FALSE(ids.is_reserved(request));
}

TEST_F(AirportCacheTest, IgnoresEventsForOtherRequests) {
    cache->start();
    EXPECT_FALSE(cache->on_event(InboundEvent::facility_list_page(
        list_request_id() + 100, 0, 1, simlink::testing::encode_list_page({"KSEA"}))));
    EXPECT_FALSE(cache->on_event(InboundEvent::facility_detail_end(list_request_id())));
    EXPECT_FALSE(cache->on_event(InboundEvent::data(list_request_id(), {})));
    EXPECT_EQ(cache->state(), CacheState::Listing);
}

TEST_F(AirportCacheTest, FetchesDetailsOneAtATimeAndPersists) {
    std::vector<std::pair<SizeT, SizeT>> progress;
    cache->set_progress_callback([&](SizeT done, SizeT total) { progress.emplace_back(done, total); });
    bool ready = false;
    cache->ready().then([&](const Done&) { ready = true; });

    cache->start();
    deliver_list({"KSEA", "KBFI", "KPAE"});

    for (const char* icao : {"KSEA", "KBFI", "KPAE"}) {
        ASSERT_EQ(cache->state(), CacheState::Fetching);
        EXPECT_EQ(transport.last(CallKind::RequestFacilityDetail)->name, icao);
        EXPECT_EQ(transport.last(CallKind::RequestFacilityDetail)->secondary_id,
                  constants::FACILITY_AIRPORT_DEFINITION);
        answer_detail();
    }

    EXPECT_TRUE(ready);
    EXPECT_TRUE(cache->is_ready());
    EXPECT_FALSE(cache->loaded_from_snapshot());
    EXPECT_EQ(transport.count(CallKind::RequestFacilityDetail), 3u);
    ASSERT_EQ(cache->airports().size(), 3u);
    EXPECT_EQ(cache->airports()[1].icao, "KBFI");
    EXPECT_EQ(cache->airports()[1].name, "KBFI FIELD");
    EXPECT_EQ(cache->airports()[1].runways.size(), 1u);
    EXPECT_EQ(progress.back(), (std::pair<SizeT, SizeT>{3, 3}));
    EXPECT_EQ(ids.reserved_count(), 0u);

    auto snapshot = load_snapshot(settings.cache_path);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(*snapshot, cache->airports());
}

TEST_F(AirportCacheTest, ReusesSnapshotInsteadOfFetching) {
    Airport saved;
    saved.icao = "KSEA";
    saved.name = "FROM SNAPSHOT";
    ASSERT_TRUE(save_snapshot(settings.cache_path, {saved}));

    cache->start();
    deliver_list({"KSEA"});

    EXPECT_TRUE(cache->is_ready());
    EXPECT_TRUE(cache->loaded_from_snapshot());
    EXPECT_FALSE(cache->stale());
    EXPECT_EQ(transport.count(CallKind::RequestFacilityDetail), 0u);
    ASSERT_EQ(cache->airports().size(), 1u);
    EXPECT_EQ(cache->airports()[0].name, "FROM SNAPSHOT");
}

TEST_F(AirportCacheTest, MismatchedSnapshotIsUsedAndFlaggedStale) {
    Airport saved;
    saved.icao = "KSEA";
    ASSERT_TRUE(save_snapshot(settings.cache_path, {saved}));

    cache->start();
    deliver_list({"KSEA", "KBFI"});

    EXPECT_TRUE(cache->is_ready());
    EXPECT_TRUE(cache->stale());
    EXPECT_EQ(cache->live_count(), 2u);
    EXPECT_EQ(cache->airports().size(), 1u);
}

TEST_F(AirportCacheTest, DetailTimeoutSkipsAirport) {
    cache->start();
    deliver_list({"KSEA", "KBFI"});
    ResourceId stuck = transport.last(CallKind::RequestFacilityDetail)->id;

    clock.advance(Milliseconds(1000));
    scheduler.run_due();

    EXPECT_FALSE(ids.is_reserved(stuck));
    EXPECT_EQ(cache->skipped(), 1u);
    EXPECT_EQ(transport.last(CallKind::RequestFacilityDetail)->name, "KBFI");

    // Late answer to the skipped request is not consumed
    EXPECT_FALSE(cache->on_event(InboundEvent::facility_detail_end(stuck)));

    answer_detail();
    EXPECT_TRUE(cache->is_ready());
    ASSERT_EQ(cache->airports().size(), 1u);
    EXPECT_EQ(cache->airports()[0].icao, "KBFI");
}

TEST_F(AirportCacheTest, RefusedListRequestFails) {
    transport.fail_calls(CallKind::RequestFacilityList, TransportResult::SendFailed);
    ErrorCode code{};
    cache->ready().on_error([&](const SimError& e) { code = e.code(); });

    EXPECT_FALSE(cache->start());
    EXPECT_EQ(cache->state(), CacheState::Failed);
    EXPECT_EQ(code, ErrorCode::TransportFailure);
    EXPECT_EQ(ids.reserved_count(), 0u);
}

TEST_F(AirportCacheTest, QueriesAnswerFromDatabase) {
    cache->start();
    deliver_list({"KSEA", "KBFI"});
    answer_detail();
    answer_detail();
    ASSERT_TRUE(cache->is_ready());

    auto all = std::get<std::vector<Airport>>(cache->query(AllAirports{}));
    EXPECT_EQ(all.size(), 2u);

    auto one = std::get<std::optional<Airport>>(cache->query(AirportByIcao{"KBFI"}));
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->icao, "KBFI");

    auto nearby = std::get<std::vector<NearbyAirport>>(
        cache->query(NearbyAirports{10.0}, Position{47.0, -122.0}));
    EXPECT_EQ(nearby.size(), 2u);
    EXPECT_NEAR(nearby[0].distance_nm, 0.0, 1e-9);
}
