/**
 * @file orchestrator_tests.cpp
 * @brief Tests for the SimLink facade over a mock transport
 */

#include <gtest/gtest.h>
#include "simlink/api/orchestrator.h"
#include "simlink/transport/mock_transport.h"
#include "../support/test_support.h"

using namespace simlink;
using namespace simlink::api;
using namespace simlink::transport;
using simlink::testing::ManualClock;
using simlink::testing::ScratchDir;

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = config::MediatorConfig::defaults();
        config.logging.level = "error";
        config.airports.enabled = false;
        config.airports.cache_path = dir.file("airport.db.gz");
    }

    /// Build the orchestrator; the fixture keeps raw pointers to the mocks
    void create(bool dedicated_facility = false) {
        auto main = std::make_unique<MockTransport>();
        transport = main.get();
        transport->set_responder([this](const TransportCall& call, MockTransport& mock) {
            respond(call, mock);
        });

        std::unique_ptr<MockTransport> facility;
        if (dedicated_facility) {
            facility = std::make_unique<MockTransport>();
            facility_transport = facility.get();
            facility_transport->set_responder([this](const TransportCall& call, MockTransport& mock) {
                respond(call, mock);
            });
        }

        sim = std::make_unique<Orchestrator>(std::move(main), config, std::move(facility),
                                             clock.fn());
    }

    /// Simulator side: answers data, list and detail requests
    void respond(const TransportCall& call, MockTransport& mock) {
        switch (call.kind) {
            case CallKind::RequestDataOnce:
                if (answer_data) {
                    mock.inject(InboundEvent::data(call.id, data_payload));
                }
                break;
            case CallKind::RequestFacilityList:
                mock.inject(InboundEvent::facility_list_page(
                    call.id, 0, 1, simlink::testing::encode_list_page({"KSEA", "KBFI"})));
                break;
            case CallKind::RequestFacilityDetail:
                mock.inject(InboundEvent::facility_detail(
                    call.id, FacilityDataType::Airport,
                    simlink::testing::encode_airport_record(
                        call.name == "KSEA" ? 47.45 : 47.53, -122.30, 100.0, 15.0,
                        call.name, "K1", 0)));
                mock.inject(InboundEvent::facility_detail_end(call.id));
                break;
            default:
                break;
        }
    }

    static std::vector<UInt8> f64_payload(std::initializer_list<Real> values) {
        core::ByteWriter writer;
        for (Real v : values) {
            writer.write_f64(v);
        }
        return writer.take();
    }

    void connect() {
        auto result = sim->connect();
        ASSERT_TRUE(result.has_value());
    }

    void poll_times(int count) {
        for (int i = 0; i < count; ++i) {
            sim->poll();
        }
    }

    void advance(Milliseconds delta) {
        clock.advance(delta);
        sim->poll();
    }

    ScratchDir dir;
    ManualClock clock;
    config::MediatorConfig config;
    MockTransport* transport{nullptr};
    MockTransport* facility_transport{nullptr};
    std::unique_ptr<Orchestrator> sim;

    bool answer_data{true};
    std::vector<UInt8> data_payload;
};

// ============================================================================
// Connection
// ============================================================================

TEST_F(OrchestratorTest, ConnectSubscribesAirportRangeNotifications) {
    create();
    connect();

    EXPECT_TRUE(sim->is_connected());
    EXPECT_EQ(transport->app_name(), "SimLink");
    const TransportCall* subscribe = transport->last(CallKind::SubscribeToFacilityList);
    ASSERT_NE(subscribe, nullptr);
    EXPECT_EQ(subscribe->id, 1u);
    EXPECT_EQ(subscribe->secondary_id, 2u);
    EXPECT_EQ(transport->count(CallKind::RequestFacilityList), 0u);
}

TEST_F(OrchestratorTest, LoggerKeepsFirstInitialization) {
    ASSERT_TRUE(Logger::is_initialized());
    auto level = Logger::get_logger()->level();

    config.logging.level = level == spdlog::level::trace ? "critical" : "trace";
    create();
    EXPECT_EQ(Logger::get_logger()->level(), level);
}

TEST_F(OrchestratorTest, ConnectRetriesUntilOpen) {
    create();
    transport->fail_next_opens(2);

    std::vector<UInt32> retries_left;
    bool connected = false;
    ConnectOptions options;
    options.retries = 3;
    options.retry_interval = Milliseconds(100);
    options.on_retry = [&](UInt32 remaining, Milliseconds interval) {
        retries_left.push_back(remaining);
        EXPECT_EQ(interval, Milliseconds(100));
    };
    options.on_connect = [&] { connected = true; };

    auto result = sim->connect(options);
    EXPECT_FALSE(result.is_settled());
    EXPECT_EQ(retries_left, std::vector<UInt32>{2});

    advance(Milliseconds(100));
    EXPECT_EQ(retries_left, (std::vector<UInt32>{2, 1}));
    EXPECT_FALSE(result.is_settled());

    advance(Milliseconds(100));
    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(connected);
    EXPECT_EQ(retries_left.size(), 2u);
}

TEST_F(OrchestratorTest, ConnectFailsWhenRetriesRunOut) {
    create();
    transport->fail_next_opens(10);

    int retry_calls = 0;
    ConnectOptions options;
    options.retries = 1;
    options.retry_interval = Milliseconds(50);
    options.on_retry = [&](UInt32, Milliseconds) { ++retry_calls; };

    auto result = sim->connect(options);
    advance(Milliseconds(50));

    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::ConnectionFailed);
    EXPECT_EQ(retry_calls, 1);
    EXPECT_FALSE(sim->is_connected());
}

TEST_F(OrchestratorTest, ConnectUsesConfiguredRetries) {
    config.connection.retries = 1;
    config.connection.retry_interval = Milliseconds(20);
    create();
    transport->fail_next_opens(1);

    auto result = sim->connect();
    EXPECT_FALSE(result.is_settled());
    advance(Milliseconds(20));
    EXPECT_TRUE(result.has_value());
}

// ============================================================================
// Properties
// ============================================================================

TEST_F(OrchestratorTest, RequestsBeforeConnectAreRejected) {
    create();
    EXPECT_EQ(sim->get({"PLANE_ALTITUDE"}).error().code(), ErrorCode::NotConnected);
    EXPECT_EQ(sim->set("PLANE_ALTITUDE", Real(1.0)).error().code(), ErrorCode::NotConnected);
    EXPECT_EQ(sim->trigger("PAUSE_ON").error().code(), ErrorCode::NotConnected);
}

TEST_F(OrchestratorTest, GetRoundTrip) {
    create();
    connect();
    data_payload = f64_payload({3500.0, 120.5});

    auto result = sim->get({"PLANE_ALTITUDE", "AIRSPEED_INDICATED"});
    auto defines = transport->calls_of(CallKind::DefineProperty);
    ASSERT_EQ(defines.size(), 2u);
    EXPECT_EQ(defines[0].name, "PLANE ALTITUDE");
    EXPECT_EQ(defines[0].units, "feet");
    EXPECT_EQ(defines[1].name, "AIRSPEED INDICATED");
    ASSERT_NE(transport->last(CallKind::RequestDataOnce), nullptr);
    TransportCall request = *transport->last(CallKind::RequestDataOnce);
    EXPECT_EQ(request.id, defines[0].id);
    EXPECT_EQ(request.secondary_id, defines[0].id);

    sim->poll();
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(std::get<Real>(result.value().at("PLANE_ALTITUDE")), 3500.0);
    EXPECT_DOUBLE_EQ(std::get<Real>(result.value().at("AIRSPEED_INDICATED")), 120.5);

    // Definition cleared and ID returned; only the range IDs stay reserved
    EXPECT_EQ(transport->last(CallKind::ClearDefinition)->id, request.id);
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}

TEST_F(OrchestratorTest, ConcurrentGetsResolveIndependently) {
    create();
    connect();
    answer_data = false;

    auto first = sim->get({"PLANE_ALTITUDE"});
    auto second = sim->get({"PLANE_ALTITUDE"});
    auto requests = transport->calls_of(CallKind::RequestDataOnce);
    ASSERT_EQ(requests.size(), 2u);
    ASSERT_NE(requests[0].id, requests[1].id);

    transport->inject(InboundEvent::data(requests[1].id, f64_payload({2.0})));
    transport->inject(InboundEvent::data(requests[0].id, f64_payload({1.0})));
    sim->poll();

    EXPECT_DOUBLE_EQ(std::get<Real>(first.value().at("PLANE_ALTITUDE")), 1.0);
    EXPECT_DOUBLE_EQ(std::get<Real>(second.value().at("PLANE_ALTITUDE")), 2.0);
}

TEST_F(OrchestratorTest, GetUnknownPropertyNamesIt) {
    create();
    connect();

    auto result = sim->get({"PLANE_ALTITUDE", "WARP_FACTOR"});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownProperty);
    EXPECT_EQ(result.error().subject(), "WARP FACTOR");
    EXPECT_EQ(transport->count(CallKind::RequestDataOnce), 0u);
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}

TEST_F(OrchestratorTest, GetTimesOut) {
    config.requests.timeout = Milliseconds(300);
    create();
    connect();
    answer_data = false;

    auto result = sim->get({"PLANE_ALTITUDE"});
    advance(Milliseconds(300));
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}

TEST_F(OrchestratorTest, ShortDataResponseFailsDecode) {
    create();
    connect();
    data_payload = {1, 2, 3};

    auto result = sim->get({"PLANE_ALTITUDE"});
    sim->poll();
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::DecodeFailed);
}

TEST_F(OrchestratorTest, SetWritesAndResolvesAfterCleanupDelay) {
    create();
    connect();

    auto result = sim->set("PLANE_ALTITUDE", std::string("1500"));
    ASSERT_NE(transport->last(CallKind::WriteData), nullptr);
    TransportCall write = *transport->last(CallKind::WriteData);
    core::ByteReader reader(write.payload);
    EXPECT_DOUBLE_EQ(reader.read_f64(), 1500.0);
    EXPECT_EQ(sim->correlator().writes_in_flight(), 1u);
    EXPECT_FALSE(result.is_settled());

    advance(Milliseconds(500));
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(transport->last(CallKind::ClearDefinition)->id, write.id);
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}

TEST_F(OrchestratorTest, SetUnknownPropertyRejectsAndReleasesId) {
    create();
    connect();

    auto result = sim->set("NOT_A_SIMVAR", Real(1.0));
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownProperty);
    EXPECT_EQ(result.error().subject(), "NOT A SIMVAR");
    EXPECT_NE(std::string(result.error().what()).find("NOT A SIMVAR"), std::string::npos);
    EXPECT_EQ(transport->count(CallKind::WriteData), 0u);
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}

TEST_F(OrchestratorTest, SetRejectsUnrepresentableValue) {
    create();
    connect();

    auto result = sim->set("PLANE ALTITUDE", std::string("very high"));
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidValue);
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}

TEST_F(OrchestratorTest, ConfiguredPropertiesAreKnown) {
    config.properties.push_back({"FUEL TOTAL QUANTITY", "gallons", DataType::Float64});
    create();
    connect();
    data_payload = f64_payload({52.0});

    auto result = sim->get({"FUEL_TOTAL_QUANTITY"});
    sim->poll();
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(std::get<Real>(result.value().at("FUEL_TOTAL_QUANTITY")), 52.0);
}

// ============================================================================
// Schedule
// ============================================================================

TEST_F(OrchestratorTest, ScheduleRepeatsUntilStopped) {
    create();
    connect();
    data_payload = f64_payload({1000.0});

    int ticks = 0;
    ScheduleToken token = sim->schedule([&](const property::PropertyValues&) { ++ticks; },
                                        Milliseconds(1000), {"PLANE_ALTITUDE"});
    EXPECT_TRUE(token.active());

    sim->poll();
    EXPECT_EQ(ticks, 1);

    advance(Milliseconds(1000));    // timer fires, get issued
    sim->poll();                    // response delivered
    EXPECT_EQ(ticks, 2);

    token.stop();
    EXPECT_FALSE(token.active());
    advance(Milliseconds(1000));
    poll_times(2);
    EXPECT_EQ(ticks, 2);
    EXPECT_EQ(transport->count(CallKind::RequestDataOnce), 2u);
}

TEST_F(OrchestratorTest, StopDuringInFlightGetRunsHandlerOnce) {
    create();
    connect();
    data_payload = f64_payload({1000.0});

    int ticks = 0;
    ScheduleToken token = sim->schedule([&](const property::PropertyValues&) { ++ticks; },
                                        Milliseconds(100), {"PLANE_ALTITUDE"});
    token.stop();
    sim->poll();
    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(sim->scheduler().pending(), 0u);
}

TEST_F(OrchestratorTest, ScheduleStopsOnUnknownProperty) {
    create();
    connect();

    ScheduleToken token = sim->schedule([](const property::PropertyValues&) {},
                                        Milliseconds(100), {"BOGUS_VAR"});
    EXPECT_FALSE(token.active());
    EXPECT_EQ(sim->scheduler().pending(), 0u);
}

// ============================================================================
// Events
// ============================================================================

TEST_F(OrchestratorTest, SystemEventsReachListeners) {
    create();
    connect();

    std::vector<UInt32> seen;
    sim->on("Pause", [&](const events::EventData& data) { seen.push_back(data.value); });
    sim->on("Pause", [&](const events::EventData& data) { seen.push_back(data.value + 100); });
    ASSERT_EQ(transport->count(CallKind::SubscribeToEvent), 1u);
    ResourceId id = transport->last(CallKind::SubscribeToEvent)->id;

    transport->inject(InboundEvent::system_event(id, 1));
    sim->poll();
    EXPECT_EQ(seen, (std::vector<UInt32>{1, 101}));
}

TEST_F(OrchestratorTest, AirportRangeEventsDeliverSummaries) {
    create();
    std::vector<facility::AirportSummary> entered;
    sim->on(AIRPORTS_IN_RANGE_EVENT, [&](const events::EventData& data) { entered = data.airports; });
    connect();

    transport->inject(InboundEvent::facility_list_page(
        1, 0, 1, simlink::testing::encode_list_page({"KSEA", "KBFI"})));
    sim->poll();
    ASSERT_EQ(entered.size(), 2u);
    EXPECT_EQ(entered[1].icao, "KBFI");
    EXPECT_EQ(sim->anomalies(), 0u);
}

TEST_F(OrchestratorTest, TriggerMapsAndTransmits) {
    create();
    connect();

    auto result = sim->trigger("PARKING_BRAKES", 1);
    const TransportCall* map = transport->last(CallKind::MapClientEvent);
    const TransportCall* transmit = transport->last(CallKind::TransmitClientEvent);
    ASSERT_NE(map, nullptr);
    ASSERT_NE(transmit, nullptr);
    EXPECT_EQ(map->name, "PARKING_BRAKES");
    EXPECT_EQ(transmit->id, map->id);
    EXPECT_EQ(transmit->value, 1u);

    advance(Milliseconds(500));
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}

TEST_F(OrchestratorTest, UnmatchedMessagesAreCounted) {
    create();
    connect();

    transport->inject(InboundEvent::data(77, {}));
    transport->inject(InboundEvent::system_event(78, 0));
    transport->inject(InboundEvent::facility_detail_end(79));
    sim->poll();
    EXPECT_EQ(sim->anomalies(), 3u);
}

// ============================================================================
// Airports
// ============================================================================

TEST_F(OrchestratorTest, SpecialQueriesNeedReadyDatabase) {
    create();
    connect();

    auto not_ready = sim->get_special("ALL_AIRPORTS");
    ASSERT_TRUE(not_ready.has_error());
    EXPECT_EQ(not_ready.error().code(), ErrorCode::NotReady);

    auto unknown = sim->get_special("SOME AIRPORTS");
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.error().code(), ErrorCode::UnknownProperty);
}

TEST_F(OrchestratorTest, BuildsAirportDatabaseAndAnswersQueries) {
    config.airports.enabled = true;
    create();
    bool ready = false;
    sim->airports_ready().then([&](const Done&) { ready = true; });
    connect();

    for (int i = 0; i < 5 && !ready; ++i) {
        sim->poll();
    }
    ASSERT_TRUE(ready);
    EXPECT_EQ(sim->airport_cache().airports().size(), 2u);

    auto all = sim->get_special("ALL AIRPORTS");
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(std::get<std::vector<facility::Airport>>(all.value()).size(), 2u);

    auto one = sim->get_special("AIRPORT:KBFI");
    ASSERT_TRUE(one.has_value());
    auto airport = std::get<std::optional<facility::Airport>>(one.value());
    ASSERT_TRUE(airport.has_value());
    EXPECT_EQ(airport->name, "KBFI");

    // Aircraft over KSEA; KBFI is about 4.8 NM north
    data_payload = f64_payload({47.45, -122.30});
    auto nearby = sim->get_special("NEARBY_AIRPORTS:3");
    EXPECT_FALSE(nearby.is_settled());
    sim->poll();
    ASSERT_TRUE(nearby.has_value());
    auto found = std::get<std::vector<facility::NearbyAirport>>(nearby.value());
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].airport.icao, "KSEA");
}

TEST_F(OrchestratorTest, DedicatedFacilityConnectionClosesWhenReady) {
    config.airports.enabled = true;
    create(true);
    connect();

    EXPECT_TRUE(facility_transport->is_open());
    EXPECT_EQ(facility_transport->app_name(), "SimLink airports");
    EXPECT_EQ(transport->count(CallKind::RequestFacilityList), 0u);
    EXPECT_EQ(facility_transport->count(CallKind::RequestFacilityList), 1u);

    poll_times(3);
    EXPECT_TRUE(sim->airport_cache().is_ready());
    EXPECT_FALSE(facility_transport->is_open());
    EXPECT_TRUE(transport->is_open());
}

TEST_F(OrchestratorTest, NearbyAirportsRejectsNonNumericPosition) {
    config.airports.enabled = true;
    config.properties.push_back({"PLANE LATITUDE", "", DataType::String8});
    create();
    connect();
    for (int i = 0; i < 5 && !sim->airport_cache().is_ready(); ++i) {
        sim->poll();
    }
    ASSERT_TRUE(sim->airport_cache().is_ready());

    core::ByteWriter writer;
    writer.write_fixed_string("north", 8);
    writer.write_f64(-122.30);
    data_payload = writer.take();

    auto nearby = sim->get_special("NEARBY_AIRPORTS:3");
    sim->poll();
    ASSERT_TRUE(nearby.has_error());
    EXPECT_EQ(nearby.error().code(), ErrorCode::DecodeFailed);
    EXPECT_EQ(nearby.error().subject(), "PLANE LATITUDE");
    EXPECT_EQ(sim->ids().reserved_count(), 2u);
}
