/**
 * @file id_allocator_tests.cpp
 * @brief Unit tests for the resource ID allocator
 */

#include <gtest/gtest.h>
#include "simlink/resource/id_allocator.h"
#include <random>
#include <set>

using namespace simlink;
using namespace simlink::resource;

class IdAllocatorTest : public ::testing::Test {};

TEST_F(IdAllocatorTest, DefaultRange) {
    ResourceIdAllocator ids;
    EXPECT_EQ(ids.first(), 1u);
    EXPECT_EQ(ids.ceiling(), 900u);
    EXPECT_EQ(ids.next_id(), 1u);
    EXPECT_EQ(ids.next_id(), 2u);
    EXPECT_EQ(ids.reserved_count(), 2u);
}

TEST_F(IdAllocatorTest, WrapsToFirstAfterCeiling) {
    ResourceIdAllocator ids(1, 3);
    EXPECT_EQ(ids.next_id(), 1u);
    EXPECT_EQ(ids.next_id(), 2u);
    EXPECT_EQ(ids.next_id(), 3u);

    ids.release_id(1);
    EXPECT_EQ(ids.next_id(), 1u);
}

TEST_F(IdAllocatorTest, SkipsReservedIds) {
    ResourceIdAllocator ids(1, 4);
    ResourceId a = ids.next_id();   // 1
    ResourceId b = ids.next_id();   // 2
    ids.next_id();                  // 3
    ids.next_id();                  // 4
    ids.release_id(b);

    // Counter wraps to 1, which is still held by a
    EXPECT_EQ(ids.next_id(), b);
    EXPECT_TRUE(ids.is_reserved(a));
}

TEST_F(IdAllocatorTest, ReleaseIsIdempotent) {
    ResourceIdAllocator ids;
    ResourceId id = ids.next_id();
    ids.release_id(id);
    ids.release_id(id);
    ids.release_id(999);
    EXPECT_FALSE(ids.is_reserved(id));
    EXPECT_EQ(ids.reserved_count(), 0u);
}

TEST_F(IdAllocatorTest, NeverReturnsReservedId) {
    ResourceIdAllocator ids(1, 50);
    std::set<ResourceId> held;
    std::mt19937 rng(1234);

    for (int step = 0; step < 5000; ++step) {
        bool allocate = held.size() < 10 || (held.size() < 45 && (rng() % 2 == 0));
        if (allocate) {
            ResourceId id = ids.next_id();
            ASSERT_GE(id, 1u);
            ASSERT_LE(id, 50u);
            ASSERT_EQ(held.count(id), 0u) << "ID " << id << " returned while reserved";
            held.insert(id);
        } else {
            auto it = held.begin();
            std::advance(it, rng() % held.size());
            ids.release_id(*it);
            held.erase(it);
        }
        ASSERT_EQ(ids.reserved_count(), held.size());
    }
}
