#pragma once
/**
 * @file orchestrator.h
 * @brief Public SimLink facade
 *
 * The Orchestrator owns every registry of one simulator connection: the
 * timer queue, the resource ID allocator, the event multiplexer, the
 * request correlator and the airport cache. Nothing is process-wide.
 *
 * All work happens on the caller's thread. Inbound messages and timers are
 * only processed inside poll(), so an application drives SimLink from its
 * own loop:
 *
 * @code
 *   auto transport = std::make_unique<MyTransport>();
 *   simlink::api::Orchestrator sim(std::move(transport), config);
 *
 *   sim.connect().then([&](const simlink::Done&) {
 *       sim.get({"PLANE_ALTITUDE"}).then([](const auto& values) { ... });
 *   });
 *
 *   while (running) {
 *       sim.poll();
 *       std::this_thread::sleep_for(std::chrono::milliseconds(10));
 *   }
 * @endcode
 */

#include "simlink/api/config.h"
#include "simlink/core/deferred.h"
#include "simlink/core/scheduler.h"
#include "simlink/events/event_multiplexer.h"
#include "simlink/facility/airport_cache.h"
#include "simlink/facility/special_query.h"
#include "simlink/property/property_catalog.h"
#include "simlink/property/property_codec.h"
#include "simlink/request/request_correlator.h"
#include "simlink/resource/id_allocator.h"
#include "simlink/transport/transport.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace simlink::api {

/// Airports entering the simulator's reality bubble
constexpr const char* AIRPORTS_IN_RANGE_EVENT = "AirportsInRange";

/// Airports leaving the simulator's reality bubble
constexpr const char* AIRPORTS_OUT_OF_RANGE_EVENT = "AirportsOutOfRange";

// ============================================================================
// Connect Options
// ============================================================================

struct ConnectOptions {
    UInt32 retries{0};                   ///< attempts after the first
    Milliseconds retry_interval{1000};
    std::function<void()> on_connect;

    /// Called before each retry with the retries left after it
    std::function<void(UInt32, Milliseconds)> on_retry;
};

// ============================================================================
// Schedule Token
// ============================================================================

/**
 * @brief Handle for a schedule() loop
 *
 * stop() prevents further ticks. A get already in flight still completes
 * and its handler runs once.
 */
class ScheduleToken {
public:
    ScheduleToken() = default;

    void stop() {
        if (running_) {
            *running_ = false;
        }
    }

    bool active() const { return running_ && *running_; }

private:
    friend class Orchestrator;
    explicit ScheduleToken(std::shared_ptr<bool> running) : running_(std::move(running)) {}

    std::shared_ptr<bool> running_;
};

// ============================================================================
// Orchestrator
// ============================================================================

class Orchestrator {
public:
    using ScheduleHandler = std::function<void(const property::PropertyValues&)>;

    /**
     * @brief Create a mediator over a transport
     *
     * @param transport Connection to the simulator
     * @param config Mediator configuration
     * @param facility_transport Optional dedicated connection for the airport
     *        database build; opened on connect and closed once the cache is
     *        ready
     * @param clock Clock for the timer queue (steady clock if empty)
     */
    explicit Orchestrator(std::unique_ptr<transport::ITransport> transport,
                          config::MediatorConfig config = config::MediatorConfig::defaults(),
                          std::unique_ptr<transport::ITransport> facility_transport = nullptr,
                          core::Scheduler::ClockFn clock = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ========================================================================
    // Connection
    // ========================================================================

    /// Connect with the retry policy from the configuration
    Deferred<Done> connect();

    /**
     * @brief Open the transport, retrying on failure
     *
     * On success subscribes the airport range notifications and starts the
     * airport cache. Rejects with ConnectionFailed once retries run out.
     */
    Deferred<Done> connect(ConnectOptions options);

    void disconnect();
    bool is_connected() const { return connected_; }

    // ========================================================================
    // Properties
    // ========================================================================

    /**
     * @brief Read one or more properties
     *
     * Names may use underscores for spaces. The result is keyed by code-safe
     * name ("PLANE_ALTITUDE").
     */
    Deferred<property::PropertyValues> get(const std::vector<std::string>& names);

    /**
     * @brief Write a property
     *
     * Resolves once the write cleanup delay has elapsed; the protocol has no
     * write acknowledgment.
     */
    Deferred<Done> set(const std::string& name, const property::PropertyValue& value);

    /**
     * @brief Read properties repeatedly
     *
     * Each tick gets @p names, hands the values to @p handler, then waits
     * @p interval before the next tick.
     */
    ScheduleToken schedule(ScheduleHandler handler, Milliseconds interval,
                           std::vector<std::string> names);

    /**
     * @brief Answer an airport special variable
     *
     * Rejects with NotReady until the airport database is available and
     * with UnknownProperty for unrecognized names.
     */
    Deferred<facility::SpecialResult> get_special(const std::string& name);

    // ========================================================================
    // Events
    // ========================================================================

    ListenerId on(const std::string& name, events::EventListener handler);
    bool off(const std::string& name, ListenerId id);

    /**
     * @brief Fire a simulator event
     */
    Deferred<Done> trigger(const std::string& name, UInt32 value = 0);

    // ========================================================================
    // Processing
    // ========================================================================

    /**
     * @brief Process inbound messages and due timers
     * @return Number of messages and timers processed
     */
    SizeT poll();

    // ========================================================================
    // Accessors
    // ========================================================================

    Deferred<Done> airports_ready() const { return cache_.ready(); }
    const facility::AirportCache& airport_cache() const { return cache_; }
    facility::AirportCache& airport_cache() { return cache_; }

    property::PropertyCatalog& catalog() { return catalog_; }
    core::Scheduler& scheduler() { return scheduler_; }
    const resource::ResourceIdAllocator& ids() const { return ids_; }
    const request::RequestCorrelator& correlator() const { return correlator_; }
    const config::MediatorConfig& config() const { return config_; }

    /// Inbound messages that matched nothing
    SizeT anomalies() const { return anomalies_; }

private:
    void attempt_connect(ConnectOptions options, Deferred<Done> result);
    void on_connected();
    void run_schedule(ScheduleHandler handler, Milliseconds interval,
                      std::vector<std::string> names, std::shared_ptr<bool> running);
    void route(const transport::InboundEvent& event);
    void anomaly(const transport::InboundEvent& event);
    void clear_definition(ResourceId id);

    config::MediatorConfig config_;
    std::unique_ptr<transport::ITransport> transport_;
    std::unique_ptr<transport::ITransport> facility_transport_;

    property::PropertyCatalog catalog_;
    core::Scheduler scheduler_;
    resource::ResourceIdAllocator ids_;
    events::EventMultiplexer multiplexer_;
    request::RequestCorrelator correlator_;
    facility::AirportCache cache_;

    ResourceId in_range_id_{INVALID_RESOURCE_ID};
    ResourceId out_of_range_id_{INVALID_RESOURCE_ID};
    bool connected_{false};
    SizeT anomalies_{0};
};

} // namespace simlink::api
