/**
 * @file request_correlator.cpp
 * @brief Request correlator implementation
 */

#include "simlink/request/request_correlator.h"
#include "simlink/core/logging.h"
#include <string>

namespace simlink::request {

RequestCorrelator::RequestCorrelator(resource::ResourceIdAllocator& ids,
                                     core::Scheduler& scheduler)
    : ids_(ids)
    , scheduler_(scheduler) {
}

// ============================================================================
// Correlated Requests
// ============================================================================

void RequestCorrelator::begin(IssueFn issue, PendingRequest pending, Milliseconds timeout) {
    const ResourceId id = ids_.next_id();

    // Register before issuing so a response can never precede its entry
    pending_.emplace(id, std::move(pending));

    if (std::optional<SimError> error = issue(id)) {
        SIMLINK_LOG_DEBUG("Request {} not issued: {}", id, error->what());
        fail(id, *error);
        return;
    }

    auto it = pending_.find(id);
    if (it != pending_.end() && timeout.count() > 0) {
        it->second.timeout_timer = scheduler_.call_after(timeout, [this, id, timeout] {
            SIMLINK_LOG_WARN("Request {} timed out after {} ms", id, timeout.count());
            fail(id, SimError(ErrorCode::Timeout, std::to_string(id),
                              "Request " + std::to_string(id) + " timed out"));
        });
    }
}

std::optional<RequestCorrelator::PendingRequest> RequestCorrelator::take(ResourceId id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingRequest pending = std::move(it->second);
    pending_.erase(it);

    if (pending.timeout_timer != INVALID_TIMER_ID) {
        scheduler_.cancel(pending.timeout_timer);
    }
    if (pending.cleanup) {
        pending.cleanup(id);
    }
    ids_.release_id(id);
    return pending;
}

bool RequestCorrelator::on_response(const transport::InboundEvent& event) {
    std::optional<PendingRequest> pending = take(event.id);
    if (!pending) {
        return false;
    }
    pending->complete(event);
    return true;
}

void RequestCorrelator::fail(ResourceId id, const SimError& error) {
    if (std::optional<PendingRequest> pending = take(id)) {
        pending->fail(error);
    }
}

bool RequestCorrelator::cancel(ResourceId id) {
    if (!is_pending(id)) {
        return false;
    }
    fail(id, SimError(ErrorCode::Cancelled, std::to_string(id),
                      "Request " + std::to_string(id) + " cancelled"));
    return true;
}

// ============================================================================
// Fire-and-forget Writes
// ============================================================================

Deferred<Done> RequestCorrelator::fire_and_forget(IssueFn issue, Milliseconds cleanup_delay,
                                                  CleanupFn cleanup) {
    Deferred<Done> result;
    const ResourceId id = ids_.next_id();

    if (std::optional<SimError> error = issue(id)) {
        if (cleanup) {
            cleanup(id);
        }
        ids_.release_id(id);
        result.reject(*error);
        return result;
    }

    ++writes_in_flight_;
    scheduler_.call_after(cleanup_delay, [this, id, result, cleanup = std::move(cleanup)]() mutable {
        --writes_in_flight_;
        ids_.release_id(id);
        if (cleanup) {
            cleanup(id);
        }
        result.resolve(Done{});
    });
    return result;
}

} // namespace simlink::request
