/**
 * @file airport_cache.cpp
 * @brief Airport database acquisition and persistence
 */

#include "simlink/facility/airport_cache.h"
#include "simlink/core/logging.h"
#include "simlink/facility/geo_query.h"
#include "simlink/facility/snapshot_codec.h"
#include <type_traits>

namespace simlink::facility {

using transport::InboundEvent;
using transport::InboundKind;
using transport::TransportResult;

const char* cache_state_to_string(CacheState state) {
    switch (state) {
        case CacheState::Idle: return "Idle";
        case CacheState::Listing: return "Listing";
        case CacheState::Fetching: return "Fetching";
        case CacheState::Ready: return "Ready";
        case CacheState::Failed: return "Failed";
        default: return "Unknown";
    }
}

AirportCache::AirportCache(transport::ITransport& transport,
                           resource::ResourceIdAllocator& ids,
                           core::Scheduler& scheduler,
                           AirportSettings settings)
    : transport_(transport)
    , ids_(ids)
    , scheduler_(scheduler)
    , settings_(std::move(settings)) {
}

AirportCache::~AirportCache() {
    if (detail_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(detail_timer_);
    }
}

// ============================================================================
// Startup
// ============================================================================

bool AirportCache::register_definition() {
    if (definition_registered_) {
        return true;
    }
    for (const auto& field : airport_detail_fields()) {
        TransportResult result = transport_.add_to_facility_definition(
            constants::FACILITY_AIRPORT_DEFINITION, field);
        if (result != TransportResult::Success) {
            fail("Registering facility field '" + field + "' failed: " +
                 transport::transport_result_to_string(result));
            return false;
        }
    }
    definition_registered_ = true;
    return true;
}

bool AirportCache::start() {
    if (state_ == CacheState::Listing || state_ == CacheState::Fetching ||
        state_ == CacheState::Ready) {
        return true;
    }
    if (state_ == CacheState::Failed) {
        // A failed run settled ready_; a retry needs a fresh one
        ready_ = Deferred<Done>();
    }

    if (!register_definition()) {
        return false;
    }

    listed_.clear();
    list_request_id_ = ids_.next_id();
    TransportResult result = transport_.request_facility_list(
        constants::FACILITY_LIST_TYPE_AIRPORT, list_request_id_);
    if (result != TransportResult::Success) {
        ids_.release_id(list_request_id_);
        list_request_id_ = INVALID_RESOURCE_ID;
        fail(std::string("Requesting the airport list failed: ") +
             transport::transport_result_to_string(result));
        return false;
    }

    state_ = CacheState::Listing;
    SIMLINK_LOG_INFO("Requesting airport list (request {})", list_request_id_);
    return true;
}

// ============================================================================
// Inbound Events
// ============================================================================

bool AirportCache::on_event(const InboundEvent& event) {
    switch (event.kind) {
        case InboundKind::FacilityListPage:
            if (state_ != CacheState::Listing || event.id != list_request_id_) {
                return false;
            }
            on_list_page(event);
            return true;

        case InboundKind::FacilityDetailField:
            if (state_ != CacheState::Fetching || event.id != detail_request_id_) {
                return false;
            }
            builder_->add_record(event.facility_type, event.payload);
            return true;

        case InboundKind::FacilityDetailEnd:
            if (state_ != CacheState::Fetching || event.id != detail_request_id_) {
                return false;
            }
            finish_detail();
            return true;

        default:
            return false;
    }
}

// ============================================================================
// Listing
// ============================================================================

void AirportCache::on_list_page(const InboundEvent& event) {
    std::optional<std::vector<AirportSummary>> page = decode_facility_list(event.payload);
    if (page) {
        listed_.insert(listed_.end(), page->begin(), page->end());
    } else {
        SIMLINK_LOG_WARN("Airport list page {} of {} is malformed ({} bytes); skipped",
                         event.entry_number, event.out_of, event.payload.size());
    }

    SIMLINK_LOG_DEBUG("Airport list page {}/{} ({} airports so far)",
                      event.entry_number + 1, event.out_of, listed_.size());

    if (static_cast<Int64>(event.entry_number) >= static_cast<Int64>(event.out_of) - 1) {
        ids_.release_id(list_request_id_);
        list_request_id_ = INVALID_RESOURCE_ID;
        finish_listing();
    }
}

void AirportCache::finish_listing() {
    live_count_ = listed_.size();
    SIMLINK_LOG_INFO("Simulator reports {} airports", live_count_);

    if (!settings_.cache_path.empty()) {
        if (std::optional<std::vector<Airport>> snapshot = load_snapshot(settings_.cache_path)) {
            airports_ = std::move(*snapshot);
            loaded_from_snapshot_ = true;
            listed_.clear();
            if (airports_.size() != live_count_) {
                SIMLINK_LOG_WARN("Simulator has {} airports, snapshot has {}; "
                                 "the airport snapshot may be out of date",
                                 live_count_, airports_.size());
            }
            SIMLINK_LOG_INFO("Loaded {} airports from {}", airports_.size(), settings_.cache_path);
            become_ready();
            return;
        }
    }

    SIMLINK_LOG_INFO("No usable airport snapshot; building a new one");
    airports_.clear();
    airports_.reserve(listed_.size());
    loaded_from_snapshot_ = false;
    for (auto& summary : listed_) {
        work_queue_.push_back(std::move(summary.icao));
    }
    listed_.clear();

    total_ = work_queue_.size();
    processed_ = 0;
    skipped_ = 0;
    state_ = CacheState::Fetching;
    fetch_next();
}

// ============================================================================
// Fetching
// ============================================================================

void AirportCache::fetch_next() {
    while (!work_queue_.empty()) {
        std::string icao = std::move(work_queue_.front());
        work_queue_.pop_front();

        ResourceId request_id = ids_.next_id();
        TransportResult result = transport_.request_facility_detail(
            constants::FACILITY_AIRPORT_DEFINITION, request_id, icao);
        if (result != TransportResult::Success) {
            SIMLINK_LOG_WARN("Detail request for {} failed: {}; skipped",
                             icao, transport::transport_result_to_string(result));
            ids_.release_id(request_id);
            ++skipped_;
            ++processed_;
            report_progress();
            continue;
        }

        detail_request_id_ = request_id;
        builder_.emplace(std::move(icao));
        if (settings_.detail_timeout.count() > 0) {
            detail_timer_ = scheduler_.call_after(settings_.detail_timeout, [this, request_id] {
                on_detail_timeout(request_id);
            });
        }
        return;
    }

    // Queue drained
    if (!settings_.cache_path.empty()) {
        if (!save_snapshot(settings_.cache_path, airports_)) {
            SIMLINK_LOG_WARN("Airport snapshot not saved; serving in-memory database");
        }
    }
    if (skipped_ > 0) {
        SIMLINK_LOG_WARN("{} of {} airports skipped during build", skipped_, total_);
    }
    become_ready();
}

void AirportCache::finish_detail() {
    if (detail_timer_ != INVALID_TIMER_ID) {
        scheduler_.cancel(detail_timer_);
        detail_timer_ = INVALID_TIMER_ID;
    }
    ids_.release_id(detail_request_id_);
    detail_request_id_ = INVALID_RESOURCE_ID;

    airports_.push_back(builder_->build());
    builder_.reset();

    ++processed_;
    report_progress();
    fetch_next();
}

void AirportCache::on_detail_timeout(ResourceId request_id) {
    detail_timer_ = INVALID_TIMER_ID;
    if (state_ != CacheState::Fetching || request_id != detail_request_id_) {
        return;
    }

    SIMLINK_LOG_WARN("Detail fetch for {} timed out after {} ms; skipped",
                     builder_->airport().icao, settings_.detail_timeout.count());
    ids_.release_id(detail_request_id_);
    detail_request_id_ = INVALID_RESOURCE_ID;
    builder_.reset();

    ++skipped_;
    ++processed_;
    report_progress();
    fetch_next();
}

void AirportCache::report_progress() {
    SIMLINK_LOG_TRACE("Airport build {}/{}", processed_, total_);
    if (progress_) {
        progress_(processed_, total_);
    }
}

// ============================================================================
// Completion
// ============================================================================

void AirportCache::become_ready() {
    state_ = CacheState::Ready;
    SIMLINK_LOG_INFO("Airport database ready ({} airports)", airports_.size());
    ready_.resolve(Done{});
}

void AirportCache::fail(const std::string& message) {
    state_ = CacheState::Failed;
    SIMLINK_LOG_ERROR("Airport cache failed: {}", message);
    ready_.reject(SimError(ErrorCode::TransportFailure, "airports", message));
}

// ============================================================================
// Queries
// ============================================================================

SpecialResult AirportCache::query(const SpecialQuery& query, const Position& position) const {
    GeoQuery geo(airports_);
    return std::visit([&](const auto& q) -> SpecialResult {
        using Q = std::decay_t<decltype(q)>;
        if constexpr (std::is_same_v<Q, AllAirports>) {
            return airports_;
        } else if constexpr (std::is_same_v<Q, NearbyAirports>) {
            return geo.nearby(position.latitude, position.longitude, q.radius_nm);
        } else {
            return geo.by_icao(q.icao);
        }
    }, query);
}

} // namespace simlink::facility
