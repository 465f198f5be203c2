/**
 * @file id_allocator.cpp
 * @brief Resource ID allocator implementation
 */

#include "simlink/resource/id_allocator.h"

namespace simlink::resource {

ResourceIdAllocator::ResourceIdAllocator()
    : ResourceIdAllocator(constants::RESOURCE_ID_FIRST, constants::RESOURCE_ID_CEILING) {
}

ResourceIdAllocator::ResourceIdAllocator(ResourceId first, ResourceId ceiling)
    : first_(first)
    , ceiling_(ceiling < first ? first : ceiling)
    , counter_(first) {
}

ResourceId ResourceIdAllocator::next_id() {
    for (;;) {
        if (counter_ > ceiling_) {
            counter_ = first_;
        }
        ResourceId id = counter_++;
        if (reserved_.insert(id).second) {
            return id;
        }
    }
}

void ResourceIdAllocator::release_id(ResourceId id) {
    reserved_.erase(id);
}

} // namespace simlink::resource
