#pragma once
/**
 * @file types.h
 * @brief Core type definitions for SimLink
 *
 * This file defines fundamental types used throughout the library,
 * including numeric types, protocol identifiers and clock types.
 */

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <limits>

namespace simlink {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type
 *
 * Double precision, matching the simulator's 64-bit position fields.
 */
using Real = double;

using Float32 = float;
using Float64 = double;

// Integer types
using Int8   = std::int8_t;
using Int16  = std::int16_t;
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Protocol Identifiers
// ============================================================================

/**
 * @brief Protocol-level numeric ID (event, definition and request IDs)
 *
 * The simulator shares one small ID space between subscriptions, data
 * definitions and requests.
 */
using ResourceId = UInt32;

/// Never issued by the allocator
constexpr ResourceId INVALID_RESOURCE_ID = 0;

/**
 * @brief Handle for a registered event listener
 */
using ListenerId = UInt64;

constexpr ListenerId INVALID_LISTENER_ID = 0;

/**
 * @brief Handle for a scheduled timer
 */
using TimerId = UInt64;

constexpr TimerId INVALID_TIMER_ID = 0;

// ============================================================================
// Time
// ============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Completion Marker
// ============================================================================

/**
 * @brief Value type for operations that complete without a result
 */
struct Done {
    constexpr bool operator==(const Done&) const noexcept { return true; }
};

} // namespace simlink
