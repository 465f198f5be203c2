#pragma once
/**
 * @file id_allocator.h
 * @brief Bounded allocator for protocol resource IDs
 *
 * The simulator shares one small ID space between event subscriptions, data
 * definitions and requests. IDs are handed out from a rolling counter that
 * wraps at the ceiling and skips reserved values, so released IDs are
 * recycled in roughly FIFO order.
 *
 * Precondition: callers never hold every ID in the range at once. When the
 * reserved set covers the whole range next_id() does not return.
 */

#include "simlink/core/constants.h"
#include <unordered_set>

namespace simlink::resource {

class ResourceIdAllocator {
public:
    ResourceIdAllocator();
    ResourceIdAllocator(ResourceId first, ResourceId ceiling);

    ResourceIdAllocator(const ResourceIdAllocator&) = delete;
    ResourceIdAllocator& operator=(const ResourceIdAllocator&) = delete;

    /**
     * @brief Reserve and return the next free ID
     */
    ResourceId next_id();

    /**
     * @brief Return an ID to the pool (no-op if not reserved)
     */
    void release_id(ResourceId id);

    bool is_reserved(ResourceId id) const { return reserved_.count(id) != 0; }
    SizeT reserved_count() const { return reserved_.size(); }

    ResourceId first() const { return first_; }
    ResourceId ceiling() const { return ceiling_; }

private:
    ResourceId first_;
    ResourceId ceiling_;
    ResourceId counter_;
    std::unordered_set<ResourceId> reserved_;
};

} // namespace simlink::resource
