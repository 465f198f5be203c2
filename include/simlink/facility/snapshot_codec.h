#pragma once
/**
 * @file snapshot_codec.h
 * @brief Airport database snapshot format
 *
 * A snapshot is the serialized airport list, gzip-compressed:
 *
 * @code
 *   char[4] magic "SLAP"
 *   u16     format version
 *   u32     airport count
 *   airport[count]
 * @endcode
 *
 * Strings are u32 length-prefixed; optional labels carry a presence byte.
 * A snapshot with a different magic or version is rejected and the
 * database is rebuilt.
 */

#include "simlink/facility/facility_types.h"
#include <optional>
#include <string>
#include <vector>

namespace simlink::facility {

constexpr char SNAPSHOT_MAGIC[4] = {'S', 'L', 'A', 'P'};
constexpr UInt16 SNAPSHOT_VERSION = 1;

// ============================================================================
// Serialization
// ============================================================================

std::vector<UInt8> serialize_airports(const std::vector<Airport>& airports);

/**
 * @brief Parse a serialized airport list
 * @return nullopt on bad magic, unsupported version or truncation
 */
std::optional<std::vector<Airport>> deserialize_airports(const std::vector<UInt8>& data);

// ============================================================================
// Compression (zlib, gzip framing)
// ============================================================================

std::optional<std::vector<UInt8>> gzip_compress(const std::vector<UInt8>& data);

std::optional<std::vector<UInt8>> gzip_decompress(const std::vector<UInt8>& data);

// ============================================================================
// Files
// ============================================================================

/**
 * @brief Write a compressed snapshot, creating parent directories
 * @return false on failure (logged)
 */
bool save_snapshot(const std::string& path, const std::vector<Airport>& airports);

/**
 * @brief Read a compressed snapshot
 * @return nullopt if missing or unreadable (logged)
 */
std::optional<std::vector<Airport>> load_snapshot(const std::string& path);

} // namespace simlink::facility
