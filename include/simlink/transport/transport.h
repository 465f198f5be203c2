#pragma once
/**
 * @file transport.h
 * @brief Transport abstraction for the simulator's binary protocol
 *
 * The byte-level connection, handshake and framing live behind ITransport.
 * SimLink only relies on the request primitives below and on the inbound
 * event stream delivered through poll().
 */

#include "simlink/core/types.h"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simlink::transport {

//==============================================================================
// Transport Result Codes
//==============================================================================

/**
 * @brief Result codes for transport primitives
 */
enum class TransportResult : UInt8 {
    Success = 0,

    // Connection errors
    OpenFailed,
    AlreadyOpen,
    NotOpen,
    ConnectionClosed,

    // Request errors
    InvalidArgument,
    SendFailed,

    // General errors
    InternalError
};

/**
 * @brief Convert TransportResult to string
 */
const char* transport_result_to_string(TransportResult result);

//==============================================================================
// Data Types
//==============================================================================

/**
 * @brief Wire datatype of a defined property
 */
enum class DataType : UInt8 {
    Int32,
    Int64,
    Float32,
    Float64,
    String8,
    String32,
    String64,
    String128,
    String256,
    String260
};

const char* data_type_to_string(DataType type);

/**
 * @brief Parse a datatype name ("FLOAT64", "float64", "STRING32", ...)
 */
std::optional<DataType> data_type_from_string(std::string_view name);

/// Encoded size in bytes
SizeT data_type_size(DataType type);

bool is_string_type(DataType type);

//==============================================================================
// Inbound Events
//==============================================================================

/**
 * @brief Kind of inbound message
 */
enum class InboundKind : UInt8 {
    Data,                   ///< Response to request_data_once
    FacilityListPage,       ///< One page of a facility list
    FacilityDetailField,    ///< One record of a facility detail response
    FacilityDetailEnd,      ///< End of a facility detail response
    SystemEvent,            ///< Subscribed event notification
    Exception               ///< Protocol-level error report
};

const char* inbound_kind_to_string(InboundKind kind);

/**
 * @brief Record type inside a facility detail response
 */
enum class FacilityDataType : UInt8 {
    Airport = 0,
    Runway = 1,
    Other = 255
};

/**
 * @brief Message delivered by ITransport::poll()
 *
 * `id` is the request ID for responses and the event ID for notifications.
 */
struct InboundEvent {
    InboundKind kind{InboundKind::Data};
    ResourceId id{INVALID_RESOURCE_ID};

    /// Raw bytes (Data, FacilityListPage entries, FacilityDetailField record)
    std::vector<UInt8> payload;

    /// SystemEvent data word, or Exception code
    UInt32 value{0};

    /// FacilityListPage pagination
    UInt32 entry_number{0};
    UInt32 out_of{0};

    /// FacilityDetailField record type
    FacilityDataType facility_type{FacilityDataType::Other};

    /// Exception description
    std::string text;

    static InboundEvent data(ResourceId request_id, std::vector<UInt8> bytes);
    static InboundEvent facility_list_page(ResourceId request_id, UInt32 entry_number,
                                           UInt32 out_of, std::vector<UInt8> entries);
    static InboundEvent facility_detail(ResourceId request_id, FacilityDataType type,
                                        std::vector<UInt8> record);
    static InboundEvent facility_detail_end(ResourceId request_id);
    static InboundEvent system_event(ResourceId event_id, UInt32 data);
    static InboundEvent exception(UInt32 code, std::string description);
};

//==============================================================================
// Transport Interface
//==============================================================================

/**
 * @brief Simulator transport interface
 *
 * Every primitive is non-blocking and reports only whether the request was
 * handed to the simulator. Responses arrive later through poll().
 */
class ITransport {
public:
    using InboundSink = std::function<void(const InboundEvent&)>;

    virtual ~ITransport() = default;

    //==========================================================================
    // Lifecycle
    //==========================================================================

    virtual TransportResult open(const std::string& app_name) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    //==========================================================================
    // Events
    //==========================================================================

    virtual TransportResult subscribe_to_event(ResourceId event_id, const std::string& name) = 0;

    virtual TransportResult map_client_event(ResourceId event_id, const std::string& name) = 0;

    virtual TransportResult transmit_client_event(ResourceId event_id, UInt32 value) = 0;

    //==========================================================================
    // Data Definitions
    //==========================================================================

    virtual TransportResult define_property(ResourceId definition_id,
                                            const std::string& name,
                                            const std::string& units,
                                            DataType type) = 0;

    virtual TransportResult clear_definition(ResourceId definition_id) = 0;

    virtual TransportResult request_data_once(ResourceId request_id,
                                              ResourceId definition_id) = 0;

    virtual TransportResult write_data(ResourceId definition_id,
                                       const std::vector<UInt8>& payload) = 0;

    //==========================================================================
    // Facilities
    //==========================================================================

    virtual TransportResult subscribe_to_facility_list(UInt32 type,
                                                       ResourceId in_range_id,
                                                       ResourceId out_of_range_id) = 0;

    virtual TransportResult request_facility_list(UInt32 type, ResourceId request_id) = 0;

    virtual TransportResult add_to_facility_definition(ResourceId definition_id,
                                                       const std::string& field) = 0;

    virtual TransportResult request_facility_detail(ResourceId definition_id,
                                                    ResourceId request_id,
                                                    const std::string& icao) = 0;

    //==========================================================================
    // Inbound
    //==========================================================================

    /**
     * @brief Deliver every pending inbound message to @p sink
     * @return Number of messages delivered
     */
    virtual SizeT poll(const InboundSink& sink) = 0;
};

} // namespace simlink::transport
