/**
 * @file event_multiplexer.cpp
 * @brief Event multiplexer implementation
 */

#include "simlink/events/event_multiplexer.h"
#include "simlink/core/logging.h"
#include <algorithm>

namespace simlink::events {

using transport::TransportResult;

EventMultiplexer::EventMultiplexer(transport::ITransport& transport,
                                   resource::ResourceIdAllocator& ids)
    : transport_(transport)
    , ids_(ids) {
}

// ============================================================================
// Listener Registration
// ============================================================================

ListenerId EventMultiplexer::add_listener(const std::string& name, EventListener handler) {
    if (!handler) {
        return INVALID_LISTENER_ID;
    }

    auto it = subscriptions_.find(name);
    if (it == subscriptions_.end()) {
        ResourceId event_id = ids_.next_id();
        TransportResult result = transport_.subscribe_to_event(event_id, name);
        if (result != TransportResult::Success) {
            SIMLINK_LOG_ERROR("Subscribing to event '{}' failed: {}",
                              name, transport::transport_result_to_string(result));
            ids_.release_id(event_id);
            return INVALID_LISTENER_ID;
        }

        Subscription subscription;
        subscription.name = name;
        subscription.protocol_id = event_id;
        ListenerId id = next_listener_id_++;
        subscription.listeners.emplace_back(id, std::move(handler));

        names_by_id_[event_id] = name;
        subscriptions_.emplace(name, std::move(subscription));
        SIMLINK_LOG_DEBUG("Subscribed event '{}' as id {}", name, event_id);
        return id;
    }

    Subscription& subscription = it->second;
    ListenerId id = next_listener_id_++;
    subscription.listeners.emplace_back(id, handler);

    // Replay the most recent value to the late joiner
    if (subscription.last_value) {
        EventData replay = *subscription.last_value;
        handler(replay);
    }
    return id;
}

bool EventMultiplexer::remove_listener(const std::string& name, ListenerId id) {
    auto it = subscriptions_.find(name);
    if (it == subscriptions_.end()) {
        return false;
    }

    auto& listeners = it->second.listeners;
    auto pos = std::find_if(listeners.begin(), listeners.end(),
        [id](const auto& entry) { return entry.first == id; });
    if (pos == listeners.end()) {
        return false;
    }
    listeners.erase(pos);
    return true;
}

void EventMultiplexer::register_local(const std::string& name, ResourceId id) {
    auto it = subscriptions_.find(name);
    if (it != subscriptions_.end()) {
        names_by_id_.erase(it->second.protocol_id);
        it->second.protocol_id = id;
        it->second.local = true;
    } else {
        Subscription subscription;
        subscription.name = name;
        subscription.protocol_id = id;
        subscription.local = true;
        subscriptions_.emplace(name, std::move(subscription));
    }
    names_by_id_[id] = name;
}

// ============================================================================
// Dispatch
// ============================================================================

bool EventMultiplexer::dispatch(ResourceId id, const EventData& data) {
    auto name_it = names_by_id_.find(id);
    if (name_it == names_by_id_.end()) {
        SIMLINK_LOG_WARN("Event for id {} has no subscription; dropped", id);
        return false;
    }
    return deliver(subscriptions_.at(name_it->second), data);
}

bool EventMultiplexer::dispatch_named(const std::string& name, const EventData& data) {
    auto it = subscriptions_.find(name);
    if (it == subscriptions_.end()) {
        SIMLINK_LOG_WARN("Event '{}' has no subscription; dropped", name);
        return false;
    }
    return deliver(it->second, data);
}

bool EventMultiplexer::deliver(Subscription& subscription, const EventData& data) {
    subscription.last_value = data;

    // Listeners may add or remove listeners while being called
    auto listeners = subscription.listeners;
    for (auto& entry : listeners) {
        entry.second(data);
    }
    return true;
}

// ============================================================================
// Inspection
// ============================================================================

const Subscription* EventMultiplexer::find(const std::string& name) const {
    auto it = subscriptions_.find(name);
    return it == subscriptions_.end() ? nullptr : &it->second;
}

SizeT EventMultiplexer::listener_count(const std::string& name) const {
    const Subscription* subscription = find(name);
    return subscription ? subscription->listeners.size() : 0;
}

} // namespace simlink::events
