#pragma once
/**
 * @file mock_transport.h
 * @brief In-process transport for testing and development
 *
 * Records every primitive call and delivers injected inbound events on the
 * next poll(). An optional responder runs after each recorded call, which
 * lets a test script simulator replies (for example answering every
 * request_data_once with a payload).
 */

#include "simlink/transport/transport.h"
#include <deque>
#include <string>
#include <vector>

namespace simlink::transport {

/**
 * @brief Primitive recorded by MockTransport
 */
enum class CallKind : UInt8 {
    Open,
    Close,
    SubscribeToEvent,
    MapClientEvent,
    TransmitClientEvent,
    DefineProperty,
    ClearDefinition,
    RequestDataOnce,
    WriteData,
    SubscribeToFacilityList,
    RequestFacilityList,
    AddToFacilityDefinition,
    RequestFacilityDetail
};

/**
 * @brief One recorded call
 *
 * Field use per kind:
 * - SubscribeToEvent / MapClientEvent: id, name
 * - TransmitClientEvent: id, value
 * - DefineProperty: id (definition), name, units, data_type
 * - ClearDefinition: id
 * - RequestDataOnce: id (request), secondary_id (definition)
 * - WriteData: id (definition), payload
 * - SubscribeToFacilityList: value (type), id (in range), secondary_id (out of range)
 * - RequestFacilityList: value (type), id (request)
 * - AddToFacilityDefinition: id (definition), name (field)
 * - RequestFacilityDetail: id (request), secondary_id (definition), name (icao)
 */
struct TransportCall {
    CallKind kind{CallKind::Open};
    ResourceId id{INVALID_RESOURCE_ID};
    ResourceId secondary_id{INVALID_RESOURCE_ID};
    UInt32 value{0};
    std::string name;
    std::string units;
    DataType data_type{DataType::Float64};
    std::vector<UInt8> payload;
};

class MockTransport : public ITransport {
public:
    using Responder = std::function<void(const TransportCall&, MockTransport&)>;

    MockTransport() = default;
    ~MockTransport() override = default;

    // ========================================================================
    // ITransport
    // ========================================================================

    TransportResult open(const std::string& app_name) override;
    void close() override;
    bool is_open() const override { return open_; }

    TransportResult subscribe_to_event(ResourceId event_id, const std::string& name) override;
    TransportResult map_client_event(ResourceId event_id, const std::string& name) override;
    TransportResult transmit_client_event(ResourceId event_id, UInt32 value) override;

    TransportResult define_property(ResourceId definition_id, const std::string& name,
                                    const std::string& units, DataType type) override;
    TransportResult clear_definition(ResourceId definition_id) override;
    TransportResult request_data_once(ResourceId request_id, ResourceId definition_id) override;
    TransportResult write_data(ResourceId definition_id,
                               const std::vector<UInt8>& payload) override;

    TransportResult subscribe_to_facility_list(UInt32 type, ResourceId in_range_id,
                                               ResourceId out_of_range_id) override;
    TransportResult request_facility_list(UInt32 type, ResourceId request_id) override;
    TransportResult add_to_facility_definition(ResourceId definition_id,
                                               const std::string& field) override;
    TransportResult request_facility_detail(ResourceId definition_id, ResourceId request_id,
                                            const std::string& icao) override;

    SizeT poll(const InboundSink& sink) override;

    // ========================================================================
    // Scripting
    // ========================================================================

    /// Make the next @p count open() calls fail
    void fail_next_opens(SizeT count) { open_failures_ = count; }

    /// Make every call of @p kind fail with @p result
    void fail_calls(CallKind kind, TransportResult result);

    /// Queue an inbound event for the next poll()
    void inject(InboundEvent event);

    void set_responder(Responder responder) { responder_ = std::move(responder); }

    // ========================================================================
    // Inspection
    // ========================================================================

    const std::vector<TransportCall>& calls() const { return calls_; }
    SizeT count(CallKind kind) const;
    std::vector<TransportCall> calls_of(CallKind kind) const;
    const TransportCall* last(CallKind kind) const;
    void clear_calls() { calls_.clear(); }
    SizeT queued() const { return inbound_.size(); }
    const std::string& app_name() const { return app_name_; }

private:
    TransportResult record(TransportCall call);

    bool open_{false};
    std::string app_name_;
    SizeT open_failures_{0};
    std::vector<std::pair<CallKind, TransportResult>> failures_;
    std::vector<TransportCall> calls_;
    std::deque<InboundEvent> inbound_;
    Responder responder_;
};

} // namespace simlink::transport
