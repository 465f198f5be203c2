#pragma once
/**
 * @file event_multiplexer.h
 * @brief Fan-out of protocol event subscriptions to local listeners
 *
 * The simulator delivers one notification per subscribed event ID and
 * offers no notion of multiple handlers, so each logical event name is
 * subscribed exactly once and every local listener hangs off that single
 * Subscription.
 *
 * Subscriptions are never torn down at the protocol level: removing the last
 * listener leaves the Subscription (and its ID) in place until the
 * multiplexer is destroyed.
 *
 * Each Subscription caches the most recent payload. A listener added to an
 * existing Subscription is called synchronously with that value, so late
 * joiners see the current state without waiting for the next notification.
 */

#include "simlink/facility/facility_types.h"
#include "simlink/resource/id_allocator.h"
#include "simlink/transport/transport.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace simlink::events {

// ============================================================================
// Event Payload
// ============================================================================

/**
 * @brief Payload delivered to listeners
 */
struct EventData {
    UInt32 value{0};                                   ///< event data word
    std::vector<facility::AirportSummary> airports;    ///< airport range events only
};

using EventListener = std::function<void(const EventData&)>;

// ============================================================================
// Subscription
// ============================================================================

struct Subscription {
    std::string name;
    ResourceId protocol_id{INVALID_RESOURCE_ID};
    std::optional<EventData> last_value;
    std::vector<std::pair<ListenerId, EventListener>> listeners;
    bool local{false};  ///< protocol subscription performed elsewhere
};

// ============================================================================
// Event Multiplexer
// ============================================================================

class EventMultiplexer {
public:
    EventMultiplexer(transport::ITransport& transport, resource::ResourceIdAllocator& ids);

    EventMultiplexer(const EventMultiplexer&) = delete;
    EventMultiplexer& operator=(const EventMultiplexer&) = delete;

    /**
     * @brief Register a listener for a logical event name
     *
     * The first registration for @p name allocates an ID and subscribes.
     *
     * @return Listener ID, or INVALID_LISTENER_ID if the subscribe failed
     */
    ListenerId add_listener(const std::string& name, EventListener handler);

    /**
     * @brief Remove a listener
     * @return true if the listener was registered under @p name
     */
    bool remove_listener(const std::string& name, ListenerId id);

    /**
     * @brief Deliver a notification for a protocol ID
     *
     * Stores @p data as the last value and calls listeners in registration
     * order.
     *
     * @return false if no Subscription owns @p id
     */
    bool dispatch(ResourceId id, const EventData& data);

    /// dispatch() keyed by logical name
    bool dispatch_named(const std::string& name, const EventData& data);

    /**
     * @brief Bind a name to an ID subscribed outside the multiplexer
     *
     * Used for facility range notifications whose protocol subscription is
     * a single call covering two IDs.
     */
    void register_local(const std::string& name, ResourceId id);

    bool owns(ResourceId id) const { return names_by_id_.count(id) != 0; }
    const Subscription* find(const std::string& name) const;
    SizeT subscription_count() const { return subscriptions_.size(); }
    SizeT listener_count(const std::string& name) const;

private:
    bool deliver(Subscription& subscription, const EventData& data);

    transport::ITransport& transport_;
    resource::ResourceIdAllocator& ids_;
    std::unordered_map<std::string, Subscription> subscriptions_;
    std::unordered_map<ResourceId, std::string> names_by_id_;
    ListenerId next_listener_id_{1};
};

} // namespace simlink::events
