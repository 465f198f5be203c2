#pragma once
/**
 * @file airport_cache.h
 * @brief Acquisition and persistence of the simulator's airport database
 *
 * Building the database is a two-stage walk over the facility protocol:
 *
 * 1. Listing: one facility-list request, answered by pages of
 *    AirportSummary entries. The last page is the one whose entry number
 *    reaches out_of - 1.
 * 2. Fetching: one detail request per listed airport, strictly one at a
 *    time. Each answer is a run of airport/runway records closed by a
 *    detail-end message.
 *
 * If a snapshot is present after listing, it replaces the fetch stage. A
 * snapshot whose size differs from the live list is still used, with a
 * warning. A freshly fetched database is written back as a new snapshot.
 *
 * @code
 *   Idle -> Listing -> Ready                        (snapshot loaded)
 *   Idle -> Listing -> Fetching -> Ready            (rebuilt, persisted)
 *   any  -> Failed                                  (transport refused a request)
 * @endcode
 */

#include "simlink/core/constants.h"
#include "simlink/core/deferred.h"
#include "simlink/core/scheduler.h"
#include "simlink/facility/record_decoder.h"
#include "simlink/facility/special_query.h"
#include "simlink/resource/id_allocator.h"
#include "simlink/transport/transport.h"
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace simlink::facility {

// ============================================================================
// Settings
// ============================================================================

struct AirportSettings {
    bool enabled{true};
    std::string cache_path{"airport.db.gz"};   ///< empty disables persistence
    Real default_radius_nm{constants::DEFAULT_NEARBY_RADIUS_NM};
    Milliseconds detail_timeout{constants::DEFAULT_DETAIL_TIMEOUT};  ///< 0 waits indefinitely
};

// ============================================================================
// Cache State
// ============================================================================

enum class CacheState : UInt8 {
    Idle,
    Listing,
    Fetching,
    Ready,
    Failed
};

const char* cache_state_to_string(CacheState state);

// ============================================================================
// AirportCache
// ============================================================================

class AirportCache {
public:
    /// Called after each airport of the fetch stage (done, total)
    using ProgressCallback = std::function<void(SizeT, SizeT)>;

    AirportCache(transport::ITransport& transport,
                 resource::ResourceIdAllocator& ids,
                 core::Scheduler& scheduler,
                 AirportSettings settings = {});
    ~AirportCache();

    AirportCache(const AirportCache&) = delete;
    AirportCache& operator=(const AirportCache&) = delete;

    /**
     * @brief Begin acquisition
     *
     * Registers the airport facility definition (once) and requests the
     * facility list. Has no effect while acquisition is running or done.
     *
     * @return false if the transport refused a request
     */
    bool start();

    /**
     * @brief Consume an inbound event belonging to the cache
     * @return false if the event is not addressed to the cache
     */
    bool on_event(const transport::InboundEvent& event);

    /// Settles when the cache becomes Ready (or Failed)
    Deferred<Done> ready() const { return ready_; }

    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    /**
     * @brief Answer a special query
     *
     * @param query Parsed special query
     * @param position Reference position, used by NearbyAirports only
     */
    SpecialResult query(const SpecialQuery& query, const Position& position = {}) const;

    CacheState state() const { return state_; }
    bool is_ready() const { return state_ == CacheState::Ready; }
    const std::vector<Airport>& airports() const { return airports_; }
    const AirportSettings& settings() const { return settings_; }

    /// Number of airports the simulator listed
    SizeT live_count() const { return live_count_; }

    bool loaded_from_snapshot() const { return loaded_from_snapshot_; }

    /// Snapshot in use does not match the live airport count
    bool stale() const { return loaded_from_snapshot_ && airports_.size() != live_count_; }

    /// Airports dropped by the fetch stage (timeout or refused request)
    SizeT skipped() const { return skipped_; }

private:
    bool register_definition();
    void on_list_page(const transport::InboundEvent& event);
    void finish_listing();
    void fetch_next();
    void finish_detail();
    void on_detail_timeout(ResourceId request_id);
    void report_progress();
    void become_ready();
    void fail(const std::string& message);

    transport::ITransport& transport_;
    resource::ResourceIdAllocator& ids_;
    core::Scheduler& scheduler_;
    AirportSettings settings_;

    CacheState state_{CacheState::Idle};
    bool definition_registered_{false};
    Deferred<Done> ready_;
    ProgressCallback progress_;

    // Listing
    ResourceId list_request_id_{INVALID_RESOURCE_ID};
    std::vector<AirportSummary> listed_;
    SizeT live_count_{0};

    // Fetching
    std::deque<std::string> work_queue_;
    SizeT total_{0};
    SizeT processed_{0};
    SizeT skipped_{0};
    ResourceId detail_request_id_{INVALID_RESOURCE_ID};
    TimerId detail_timer_{INVALID_TIMER_ID};
    std::optional<AirportBuilder> builder_;

    std::vector<Airport> airports_;
    bool loaded_from_snapshot_{false};
};

} // namespace simlink::facility
