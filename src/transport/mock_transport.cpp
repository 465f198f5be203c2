/**
 * @file mock_transport.cpp
 * @brief Mock transport implementation for testing
 *
 * Simulates the simulator side of the protocol without a running simulator.
 * Calls are recorded in order; inbound events are delivered FIFO on poll().
 */

#include "simlink/transport/mock_transport.h"
#include <algorithm>

namespace simlink::transport {

TransportResult MockTransport::record(TransportCall call) {
    for (const auto& [kind, result] : failures_) {
        if (kind == call.kind) {
            calls_.push_back(std::move(call));
            return result;
        }
    }

    if (!open_ && call.kind != CallKind::Open && call.kind != CallKind::Close) {
        calls_.push_back(std::move(call));
        return TransportResult::NotOpen;
    }

    calls_.push_back(std::move(call));
    if (responder_) {
        // Copy: the responder may issue calls that grow calls_
        TransportCall recorded = calls_.back();
        responder_(recorded, *this);
    }
    return TransportResult::Success;
}

// ============================================================================
// Lifecycle
// ============================================================================

TransportResult MockTransport::open(const std::string& app_name) {
    TransportCall call;
    call.kind = CallKind::Open;
    call.name = app_name;

    if (open_) {
        calls_.push_back(std::move(call));
        return TransportResult::AlreadyOpen;
    }
    if (open_failures_ > 0) {
        --open_failures_;
        calls_.push_back(std::move(call));
        return TransportResult::OpenFailed;
    }

    open_ = true;
    app_name_ = app_name;
    return record(std::move(call));
}

void MockTransport::close() {
    TransportCall call;
    call.kind = CallKind::Close;
    calls_.push_back(std::move(call));
    open_ = false;
}

// ============================================================================
// Events
// ============================================================================

TransportResult MockTransport::subscribe_to_event(ResourceId event_id, const std::string& name) {
    TransportCall call;
    call.kind = CallKind::SubscribeToEvent;
    call.id = event_id;
    call.name = name;
    return record(std::move(call));
}

TransportResult MockTransport::map_client_event(ResourceId event_id, const std::string& name) {
    TransportCall call;
    call.kind = CallKind::MapClientEvent;
    call.id = event_id;
    call.name = name;
    return record(std::move(call));
}

TransportResult MockTransport::transmit_client_event(ResourceId event_id, UInt32 value) {
    TransportCall call;
    call.kind = CallKind::TransmitClientEvent;
    call.id = event_id;
    call.value = value;
    return record(std::move(call));
}

// ============================================================================
// Data Definitions
// ============================================================================

TransportResult MockTransport::define_property(ResourceId definition_id, const std::string& name,
                                               const std::string& units, DataType type) {
    TransportCall call;
    call.kind = CallKind::DefineProperty;
    call.id = definition_id;
    call.name = name;
    call.units = units;
    call.data_type = type;
    return record(std::move(call));
}

TransportResult MockTransport::clear_definition(ResourceId definition_id) {
    TransportCall call;
    call.kind = CallKind::ClearDefinition;
    call.id = definition_id;
    return record(std::move(call));
}

TransportResult MockTransport::request_data_once(ResourceId request_id, ResourceId definition_id) {
    TransportCall call;
    call.kind = CallKind::RequestDataOnce;
    call.id = request_id;
    call.secondary_id = definition_id;
    return record(std::move(call));
}

TransportResult MockTransport::write_data(ResourceId definition_id,
                                          const std::vector<UInt8>& payload) {
    TransportCall call;
    call.kind = CallKind::WriteData;
    call.id = definition_id;
    call.payload = payload;
    return record(std::move(call));
}

// ============================================================================
// Facilities
// ============================================================================

TransportResult MockTransport::subscribe_to_facility_list(UInt32 type, ResourceId in_range_id,
                                                          ResourceId out_of_range_id) {
    TransportCall call;
    call.kind = CallKind::SubscribeToFacilityList;
    call.value = type;
    call.id = in_range_id;
    call.secondary_id = out_of_range_id;
    return record(std::move(call));
}

TransportResult MockTransport::request_facility_list(UInt32 type, ResourceId request_id) {
    TransportCall call;
    call.kind = CallKind::RequestFacilityList;
    call.value = type;
    call.id = request_id;
    return record(std::move(call));
}

TransportResult MockTransport::add_to_facility_definition(ResourceId definition_id,
                                                          const std::string& field) {
    TransportCall call;
    call.kind = CallKind::AddToFacilityDefinition;
    call.id = definition_id;
    call.name = field;
    return record(std::move(call));
}

TransportResult MockTransport::request_facility_detail(ResourceId definition_id,
                                                       ResourceId request_id,
                                                       const std::string& icao) {
    TransportCall call;
    call.kind = CallKind::RequestFacilityDetail;
    call.id = request_id;
    call.secondary_id = definition_id;
    call.name = icao;
    return record(std::move(call));
}

// ============================================================================
// Inbound
// ============================================================================

SizeT MockTransport::poll(const InboundSink& sink) {
    // Only deliver what was queued before this poll; handlers may inject more
    SizeT available = inbound_.size();
    SizeT delivered = 0;
    while (delivered < available && !inbound_.empty()) {
        InboundEvent event = std::move(inbound_.front());
        inbound_.pop_front();
        sink(event);
        ++delivered;
    }
    return delivered;
}

void MockTransport::inject(InboundEvent event) {
    inbound_.push_back(std::move(event));
}

void MockTransport::fail_calls(CallKind kind, TransportResult result) {
    failures_.emplace_back(kind, result);
}

// ============================================================================
// Inspection
// ============================================================================

SizeT MockTransport::count(CallKind kind) const {
    return static_cast<SizeT>(std::count_if(calls_.begin(), calls_.end(),
        [kind](const TransportCall& call) { return call.kind == kind; }));
}

std::vector<TransportCall> MockTransport::calls_of(CallKind kind) const {
    std::vector<TransportCall> result;
    for (const auto& call : calls_) {
        if (call.kind == kind) {
            result.push_back(call);
        }
    }
    return result;
}

const TransportCall* MockTransport::last(CallKind kind) const {
    for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
        if (it->kind == kind) {
            return &*it;
        }
    }
    return nullptr;
}

} // namespace simlink::transport
