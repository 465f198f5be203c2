/**
 * @file transport.cpp
 * @brief Transport enums and inbound event factories
 */

#include "simlink/transport/transport.h"
#include <algorithm>
#include <cctype>

namespace simlink::transport {

const char* transport_result_to_string(TransportResult result) {
    switch (result) {
        case TransportResult::Success: return "Success";
        case TransportResult::OpenFailed: return "OpenFailed";
        case TransportResult::AlreadyOpen: return "AlreadyOpen";
        case TransportResult::NotOpen: return "NotOpen";
        case TransportResult::ConnectionClosed: return "ConnectionClosed";
        case TransportResult::InvalidArgument: return "InvalidArgument";
        case TransportResult::SendFailed: return "SendFailed";
        case TransportResult::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

const char* data_type_to_string(DataType type) {
    switch (type) {
        case DataType::Int32: return "INT32";
        case DataType::Int64: return "INT64";
        case DataType::Float32: return "FLOAT32";
        case DataType::Float64: return "FLOAT64";
        case DataType::String8: return "STRING8";
        case DataType::String32: return "STRING32";
        case DataType::String64: return "STRING64";
        case DataType::String128: return "STRING128";
        case DataType::String256: return "STRING256";
        case DataType::String260: return "STRING260";
        default: return "Unknown";
    }
}

std::optional<DataType> data_type_from_string(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "INT32") return DataType::Int32;
    if (upper == "INT64") return DataType::Int64;
    if (upper == "FLOAT32") return DataType::Float32;
    if (upper == "FLOAT64") return DataType::Float64;
    if (upper == "STRING8") return DataType::String8;
    if (upper == "STRING32") return DataType::String32;
    if (upper == "STRING64") return DataType::String64;
    if (upper == "STRING128") return DataType::String128;
    if (upper == "STRING256") return DataType::String256;
    if (upper == "STRING260") return DataType::String260;
    return std::nullopt;
}

SizeT data_type_size(DataType type) {
    switch (type) {
        case DataType::Int32: return 4;
        case DataType::Int64: return 8;
        case DataType::Float32: return 4;
        case DataType::Float64: return 8;
        case DataType::String8: return 8;
        case DataType::String32: return 32;
        case DataType::String64: return 64;
        case DataType::String128: return 128;
        case DataType::String256: return 256;
        case DataType::String260: return 260;
        default: return 0;
    }
}

bool is_string_type(DataType type) {
    switch (type) {
        case DataType::String8:
        case DataType::String32:
        case DataType::String64:
        case DataType::String128:
        case DataType::String256:
        case DataType::String260:
            return true;
        default:
            return false;
    }
}

const char* inbound_kind_to_string(InboundKind kind) {
    switch (kind) {
        case InboundKind::Data: return "Data";
        case InboundKind::FacilityListPage: return "FacilityListPage";
        case InboundKind::FacilityDetailField: return "FacilityDetailField";
        case InboundKind::FacilityDetailEnd: return "FacilityDetailEnd";
        case InboundKind::SystemEvent: return "SystemEvent";
        case InboundKind::Exception: return "Exception";
        default: return "Unknown";
    }
}

// ============================================================================
// InboundEvent Factories
// ============================================================================

InboundEvent InboundEvent::data(ResourceId request_id, std::vector<UInt8> bytes) {
    InboundEvent event;
    event.kind = InboundKind::Data;
    event.id = request_id;
    event.payload = std::move(bytes);
    return event;
}

InboundEvent InboundEvent::facility_list_page(ResourceId request_id, UInt32 entry_number,
                                              UInt32 out_of, std::vector<UInt8> entries) {
    InboundEvent event;
    event.kind = InboundKind::FacilityListPage;
    event.id = request_id;
    event.entry_number = entry_number;
    event.out_of = out_of;
    event.payload = std::move(entries);
    return event;
}

InboundEvent InboundEvent::facility_detail(ResourceId request_id, FacilityDataType type,
                                           std::vector<UInt8> record) {
    InboundEvent event;
    event.kind = InboundKind::FacilityDetailField;
    event.id = request_id;
    event.facility_type = type;
    event.payload = std::move(record);
    return event;
}

InboundEvent InboundEvent::facility_detail_end(ResourceId request_id) {
    InboundEvent event;
    event.kind = InboundKind::FacilityDetailEnd;
    event.id = request_id;
    return event;
}

InboundEvent InboundEvent::system_event(ResourceId event_id, UInt32 data) {
    InboundEvent event;
    event.kind = InboundKind::SystemEvent;
    event.id = event_id;
    event.value = data;
    return event;
}

InboundEvent InboundEvent::exception(UInt32 code, std::string description) {
    InboundEvent event;
    event.kind = InboundKind::Exception;
    event.value = code;
    event.text = std::move(description);
    return event;
}

} // namespace simlink::transport
