#pragma once
/**
 * @file request_correlator.h
 * @brief Correlation of one-shot requests with their responses
 *
 * Every request reserves a resource ID for its lifetime. Responses are
 * matched strictly by ID; at most one request is pending per ID, so
 * concurrent requests never cross-resolve.
 *
 * Completion paths (each runs cleanup, releases the ID, settles once):
 * - matching response  -> resolve with on_match(response)
 * - issue() error      -> reject with that error
 * - timeout            -> reject with ErrorCode::Timeout
 * - cancel()           -> reject with ErrorCode::Cancelled
 *
 * Writes have no acknowledgment in the protocol. fire_and_forget() assumes
 * completion after a fixed delay that must exceed the simulator's worst-case
 * processing latency.
 */

#include "simlink/core/deferred.h"
#include "simlink/core/scheduler.h"
#include "simlink/resource/id_allocator.h"
#include "simlink/transport/transport.h"
#include <functional>
#include <optional>
#include <unordered_map>

namespace simlink::request {

/**
 * @brief Performs the protocol call(s) for a reserved ID
 * @return An error to abort the request, or nullopt once issued
 */
using IssueFn = std::function<std::optional<SimError>(ResourceId)>;

/// Runs on every completion path, before the ID is released
using CleanupFn = std::function<void(ResourceId)>;

struct RequestOptions {
    Milliseconds timeout{0};   ///< 0 waits indefinitely
    CleanupFn cleanup;
};

class RequestCorrelator {
public:
    RequestCorrelator(resource::ResourceIdAllocator& ids, core::Scheduler& scheduler);

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /**
     * @brief Issue a correlated request
     *
     * @param issue Protocol call, invoked with the reserved ID
     * @param on_match Converts the matching response into the result; may
     *        throw SimError to reject instead
     * @param options Timeout and cleanup
     */
    template <typename T>
    Deferred<T> request(IssueFn issue,
                        std::function<T(const transport::InboundEvent&)> on_match,
                        RequestOptions options = {}) {
        Deferred<T> result;

        PendingRequest pending;
        pending.complete = [result, on_match = std::move(on_match)](
                               const transport::InboundEvent& event) mutable {
            try {
                result.resolve(on_match(event));
            } catch (const SimError& error) {
                result.reject(error);
            }
        };
        pending.fail = [result](const SimError& error) mutable {
            result.reject(error);
        };
        pending.cleanup = std::move(options.cleanup);

        begin(std::move(issue), std::move(pending), options.timeout);
        return result;
    }

    /**
     * @brief Issue a write with timer-based completion
     *
     * The deferred resolves after @p cleanup_delay, when the ID is released.
     */
    Deferred<Done> fire_and_forget(IssueFn issue, Milliseconds cleanup_delay,
                                   CleanupFn cleanup = {});

    /**
     * @brief Route a response to its pending request
     * @return false if no request is pending for the event's ID
     */
    bool on_response(const transport::InboundEvent& event);

    /**
     * @brief Abandon a pending request
     * @return true if the request was pending
     */
    bool cancel(ResourceId id);

    bool is_pending(ResourceId id) const { return pending_.count(id) != 0; }
    SizeT pending_count() const { return pending_.size(); }
    SizeT writes_in_flight() const { return writes_in_flight_; }

private:
    struct PendingRequest {
        std::function<void(const transport::InboundEvent&)> complete;
        std::function<void(const SimError&)> fail;
        CleanupFn cleanup;
        TimerId timeout_timer{INVALID_TIMER_ID};
    };

    void begin(IssueFn issue, PendingRequest pending, Milliseconds timeout);
    void fail(ResourceId id, const SimError& error);
    std::optional<PendingRequest> take(ResourceId id);

    resource::ResourceIdAllocator& ids_;
    core::Scheduler& scheduler_;
    std::unordered_map<ResourceId, PendingRequest> pending_;
    SizeT writes_in_flight_{0};
};

} // namespace simlink::request
