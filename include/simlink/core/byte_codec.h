#pragma once
/**
 * @file byte_codec.h
 * @brief Little-endian cursor reader/writer for simulator payloads
 *
 * The simulator transmits all multi-byte values in little-endian order with
 * no padding. Strings are fixed-width, NUL-padded fields.
 *
 * ByteReader uses a sticky failure flag: a read past the end returns a zero
 * value and marks the reader failed, so a decoder can read a whole record
 * and check ok() once at the end.
 */

#include "simlink/core/types.h"
#include <string>
#include <string_view>
#include <vector>

namespace simlink::core {

// ============================================================================
// ByteReader
// ============================================================================

class ByteReader {
public:
    ByteReader(const UInt8* data, SizeT size) noexcept
        : data_(data), size_(size) {}

    explicit ByteReader(const std::vector<UInt8>& buffer) noexcept
        : data_(buffer.data()), size_(buffer.size()) {}

    UInt8 read_u8();
    UInt16 read_u16();
    UInt32 read_u32();
    Int32 read_i32();
    Int64 read_i64();
    Real read_f32();
    Real read_f64();

    /**
     * @brief Read a fixed-width string field
     *
     * Consumes exactly @p width bytes; the result stops at the first NUL.
     */
    std::string read_fixed_string(SizeT width);

    /// Read a u32 length-prefixed string
    std::string read_string();

    /// Skip bytes without decoding
    void skip(SizeT count);

    bool ok() const noexcept { return ok_; }
    SizeT position() const noexcept { return position_; }
    SizeT remaining() const noexcept { return size_ - position_; }
    bool exhausted() const noexcept { return position_ >= size_; }

private:
    bool take(UInt8* out, SizeT count);

    const UInt8* data_;
    SizeT size_;
    SizeT position_{0};
    bool ok_{true};
};

// ============================================================================
// ByteWriter
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;

    void write_u8(UInt8 value);
    void write_u16(UInt16 value);
    void write_u32(UInt32 value);
    void write_i32(Int32 value);
    void write_i64(Int64 value);
    void write_f32(Real value);
    void write_f64(Real value);

    /// Write a NUL-padded field, truncating @p value to @p width bytes
    void write_fixed_string(std::string_view value, SizeT width);

    /// Write a u32 length-prefixed string
    void write_string(std::string_view value);

    void write_bytes(const UInt8* data, SizeT size);

    const std::vector<UInt8>& data() const noexcept { return buffer_; }
    std::vector<UInt8> take() noexcept { return std::move(buffer_); }
    SizeT size() const noexcept { return buffer_.size(); }

private:
    std::vector<UInt8> buffer_;
};

} // namespace simlink::core
