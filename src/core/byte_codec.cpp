/**
 * @file byte_codec.cpp
 * @brief Little-endian reader/writer implementation
 */

#include "simlink/core/byte_codec.h"
#include <cstring>

namespace simlink::core {

namespace {
    // Assemble an unsigned value from little-endian bytes
    template <typename T>
    inline T load_le(const UInt8* bytes) {
        T value = 0;
        for (SizeT i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(bytes[i]) << (i * 8);
        }
        return value;
    }

    template <typename T>
    inline void store_le(std::vector<UInt8>& buffer, T value) {
        for (SizeT i = 0; i < sizeof(T); ++i) {
            buffer.push_back(static_cast<UInt8>((value >> (i * 8)) & 0xFF));
        }
    }
}

// ============================================================================
// ByteReader
// ============================================================================

bool ByteReader::take(UInt8* out, SizeT count) {
    if (!ok_ || count > remaining()) {
        ok_ = false;
        position_ = size_;
        std::memset(out, 0, count);
        return false;
    }
    std::memcpy(out, data_ + position_, count);
    position_ += count;
    return true;
}

UInt8 ByteReader::read_u8() {
    UInt8 byte = 0;
    take(&byte, 1);
    return byte;
}

UInt16 ByteReader::read_u16() {
    UInt8 bytes[2];
    take(bytes, sizeof(bytes));
    return load_le<UInt16>(bytes);
}

UInt32 ByteReader::read_u32() {
    UInt8 bytes[4];
    take(bytes, sizeof(bytes));
    return load_le<UInt32>(bytes);
}

Int32 ByteReader::read_i32() {
    return static_cast<Int32>(read_u32());
}

Int64 ByteReader::read_i64() {
    UInt8 bytes[8];
    take(bytes, sizeof(bytes));
    return static_cast<Int64>(load_le<UInt64>(bytes));
}

Real ByteReader::read_f32() {
    UInt32 bits = read_u32();
    float f;
    std::memcpy(&f, &bits, sizeof(float));
    return static_cast<Real>(f);
}

Real ByteReader::read_f64() {
    UInt8 bytes[8];
    take(bytes, sizeof(bytes));
    UInt64 bits = load_le<UInt64>(bytes);
    double d;
    std::memcpy(&d, &bits, sizeof(double));
    return d;
}

std::string ByteReader::read_fixed_string(SizeT width) {
    if (!ok_ || width > remaining()) {
        ok_ = false;
        position_ = size_;
        return {};
    }
    const char* start = reinterpret_cast<const char*>(data_ + position_);
    SizeT length = 0;
    while (length < width && start[length] != '\0') {
        ++length;
    }
    position_ += width;
    return std::string(start, length);
}

std::string ByteReader::read_string() {
    UInt32 length = read_u32();
    if (!ok_ || length > remaining()) {
        ok_ = false;
        position_ = size_;
        return {};
    }
    std::string value(reinterpret_cast<const char*>(data_ + position_), length);
    position_ += length;
    return value;
}

void ByteReader::skip(SizeT count) {
    if (!ok_ || count > remaining()) {
        ok_ = false;
        position_ = size_;
        return;
    }
    position_ += count;
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::write_u8(UInt8 value) {
    buffer_.push_back(value);
}

void ByteWriter::write_u16(UInt16 value) {
    store_le(buffer_, value);
}

void ByteWriter::write_u32(UInt32 value) {
    store_le(buffer_, value);
}

void ByteWriter::write_i32(Int32 value) {
    store_le(buffer_, static_cast<UInt32>(value));
}

void ByteWriter::write_i64(Int64 value) {
    store_le(buffer_, static_cast<UInt64>(value));
}

void ByteWriter::write_f32(Real value) {
    float f = static_cast<float>(value);
    UInt32 bits;
    std::memcpy(&bits, &f, sizeof(float));
    store_le(buffer_, bits);
}

void ByteWriter::write_f64(Real value) {
    UInt64 bits;
    std::memcpy(&bits, &value, sizeof(double));
    store_le(buffer_, bits);
}

void ByteWriter::write_fixed_string(std::string_view value, SizeT width) {
    SizeT length = value.size() < width ? value.size() : width;
    buffer_.insert(buffer_.end(), value.begin(), value.begin() + length);
    buffer_.insert(buffer_.end(), width - length, 0);
}

void ByteWriter::write_string(std::string_view value) {
    write_u32(static_cast<UInt32>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::write_bytes(const UInt8* data, SizeT size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

} // namespace simlink::core
