/**
 * @file snapshot_codec.cpp
 * @brief Airport snapshot serialization and gzip compression
 */

#include "simlink/facility/snapshot_codec.h"
#include "simlink/core/byte_codec.h"
#include "simlink/core/logging.h"
#include <zlib.h>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace simlink::facility {

namespace {

// zlib windowBits: 15 + 16 selects gzip framing, 15 + 32 auto-detects
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int AUTO_WINDOW_BITS = 15 + 32;
constexpr int MEMORY_LEVEL = 8;
constexpr SizeT CHUNK_SIZE = 64 * 1024;

// Sanity bound for a corrupt count field
constexpr UInt32 MAX_RUNWAYS = 1024;

void write_label(core::ByteWriter& writer, const std::optional<std::string>& label) {
    writer.write_u8(label ? 1 : 0);
    if (label) {
        writer.write_string(*label);
    }
}

std::optional<std::string> read_label(core::ByteReader& reader) {
    if (reader.read_u8() == 0) {
        return std::nullopt;
    }
    return reader.read_string();
}

void write_approach(core::ByteWriter& writer, const Approach& approach) {
    write_label(writer, approach.designation);
    write_label(writer, approach.marking);
    write_label(writer, approach.ils.type);
    writer.write_string(approach.ils.icao);
    writer.write_string(approach.ils.region);
}

Approach read_approach(core::ByteReader& reader) {
    Approach approach;
    approach.designation = read_label(reader);
    approach.marking = read_label(reader);
    approach.ils.type = read_label(reader);
    approach.ils.icao = reader.read_string();
    approach.ils.region = reader.read_string();
    return approach;
}

void write_runway(core::ByteWriter& writer, const Runway& runway) {
    writer.write_f64(runway.latitude);
    writer.write_f64(runway.longitude);
    writer.write_f64(runway.altitude);
    writer.write_f64(runway.heading);
    writer.write_f64(runway.length);
    writer.write_f64(runway.width);
    writer.write_f64(runway.pattern_altitude);
    writer.write_f64(runway.slope);
    writer.write_f64(runway.slope_true);
    write_label(writer, runway.surface);
    write_approach(writer, runway.approach[0]);
    write_approach(writer, runway.approach[1]);
}

Runway read_runway(core::ByteReader& reader) {
    Runway runway;
    runway.latitude = reader.read_f64();
    runway.longitude = reader.read_f64();
    runway.altitude = reader.read_f64();
    runway.heading = reader.read_f64();
    runway.length = reader.read_f64();
    runway.width = reader.read_f64();
    runway.pattern_altitude = reader.read_f64();
    runway.slope = reader.read_f64();
    runway.slope_true = reader.read_f64();
    runway.surface = read_label(reader);
    runway.approach[0] = read_approach(reader);
    runway.approach[1] = read_approach(reader);
    return runway;
}

} // namespace

// ============================================================================
// Serialization
// ============================================================================

std::vector<UInt8> serialize_airports(const std::vector<Airport>& airports) {
    core::ByteWriter writer;
    writer.write_bytes(reinterpret_cast<const UInt8*>(SNAPSHOT_MAGIC), sizeof(SNAPSHOT_MAGIC));
    writer.write_u16(SNAPSHOT_VERSION);
    writer.write_u32(static_cast<UInt32>(airports.size()));

    for (const auto& airport : airports) {
        writer.write_string(airport.icao);
        writer.write_f64(airport.latitude);
        writer.write_f64(airport.longitude);
        writer.write_f64(airport.altitude);
        writer.write_f64(airport.declination);
        writer.write_string(airport.name);
        writer.write_string(airport.name64);
        writer.write_string(airport.region);
        writer.write_i32(airport.runway_count);
        writer.write_u32(static_cast<UInt32>(airport.runways.size()));
        for (const auto& runway : airport.runways) {
            write_runway(writer, runway);
        }
    }
    return writer.take();
}

std::optional<std::vector<Airport>> deserialize_airports(const std::vector<UInt8>& data) {
    core::ByteReader reader(data);

    char magic[sizeof(SNAPSHOT_MAGIC)];
    for (char& c : magic) {
        c = static_cast<char>(reader.read_u8());
    }
    if (!reader.ok() || std::memcmp(magic, SNAPSHOT_MAGIC, sizeof(magic)) != 0) {
        SIMLINK_LOG_WARN("Airport snapshot has no valid header");
        return std::nullopt;
    }

    UInt16 version = reader.read_u16();
    if (version != SNAPSHOT_VERSION) {
        SIMLINK_LOG_WARN("Airport snapshot version {} unsupported (expected {})",
                         version, SNAPSHOT_VERSION);
        return std::nullopt;
    }

    UInt32 count = reader.read_u32();
    std::vector<Airport> airports;

    for (UInt32 i = 0; i < count && reader.ok(); ++i) {
        Airport airport;
        airport.icao = reader.read_string();
        airport.latitude = reader.read_f64();
        airport.longitude = reader.read_f64();
        airport.altitude = reader.read_f64();
        airport.declination = reader.read_f64();
        airport.name = reader.read_string();
        airport.name64 = reader.read_string();
        airport.region = reader.read_string();
        airport.runway_count = reader.read_i32();

        UInt32 runways = reader.read_u32();
        if (runways > MAX_RUNWAYS) {
            SIMLINK_LOG_WARN("Airport snapshot entry {} claims {} runways", i, runways);
            return std::nullopt;
        }
        for (UInt32 r = 0; r < runways && reader.ok(); ++r) {
            airport.runways.push_back(read_runway(reader));
        }
        airports.push_back(std::move(airport));
    }

    if (!reader.ok()) {
        SIMLINK_LOG_WARN("Airport snapshot is truncated");
        return std::nullopt;
    }
    return airports;
}

// ============================================================================
// Compression
// ============================================================================

std::optional<std::vector<UInt8>> gzip_compress(const std::vector<UInt8>& data) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS,
                     MEMORY_LEVEL, Z_DEFAULT_STRATEGY) != Z_OK) {
        SIMLINK_LOG_ERROR("deflateInit2 failed");
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<UInt8> output;
    UInt8 chunk[CHUNK_SIZE];
    int status = Z_OK;
    do {
        stream.next_out = chunk;
        stream.avail_out = static_cast<uInt>(CHUNK_SIZE);
        status = deflate(&stream, Z_FINISH);
        if (status == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            SIMLINK_LOG_ERROR("deflate failed");
            return std::nullopt;
        }
        output.insert(output.end(), chunk, chunk + (CHUNK_SIZE - stream.avail_out));
    } while (status != Z_STREAM_END);

    deflateEnd(&stream);
    return output;
}

std::optional<std::vector<UInt8>> gzip_decompress(const std::vector<UInt8>& data) {
    z_stream stream{};
    if (inflateInit2(&stream, AUTO_WINDOW_BITS) != Z_OK) {
        SIMLINK_LOG_ERROR("inflateInit2 failed");
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<UInt8> output;
    UInt8 chunk[CHUNK_SIZE];
    int status = Z_OK;
    do {
        stream.next_out = chunk;
        stream.avail_out = static_cast<uInt>(CHUNK_SIZE);
        status = inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END) {
            SIMLINK_LOG_WARN("inflate failed: {}", stream.msg ? stream.msg : zError(status));
            inflateEnd(&stream);
            return std::nullopt;
        }
        output.insert(output.end(), chunk, chunk + (CHUNK_SIZE - stream.avail_out));
    } while (status != Z_STREAM_END);

    inflateEnd(&stream);
    return output;
}

// ============================================================================
// Files
// ============================================================================

bool save_snapshot(const std::string& path, const std::vector<Airport>& airports) {
    std::optional<std::vector<UInt8>> compressed = gzip_compress(serialize_airports(airports));
    if (!compressed) {
        return false;
    }

    std::error_code ec;
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            SIMLINK_LOG_ERROR("Cannot create directory for {}: {}", path, ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        SIMLINK_LOG_ERROR("Cannot open {} for writing", path);
        return false;
    }
    file.write(reinterpret_cast<const char*>(compressed->data()),
               static_cast<std::streamsize>(compressed->size()));
    if (!file) {
        SIMLINK_LOG_ERROR("Writing airport snapshot {} failed", path);
        return false;
    }

    SIMLINK_LOG_INFO("Saved {} airports to {} ({} bytes)",
                     airports.size(), path, compressed->size());
    return true;
}

std::optional<std::vector<Airport>> load_snapshot(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        SIMLINK_LOG_INFO("No airport snapshot at {}", path);
        return std::nullopt;
    }

    std::vector<UInt8> compressed((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
    if (file.bad()) {
        SIMLINK_LOG_ERROR("Reading airport snapshot {} failed", path);
        return std::nullopt;
    }

    std::optional<std::vector<UInt8>> data = gzip_decompress(compressed);
    if (!data) {
        SIMLINK_LOG_WARN("Airport snapshot {} is not valid gzip data", path);
        return std::nullopt;
    }
    return deserialize_airports(*data);
}

} // namespace simlink::facility
