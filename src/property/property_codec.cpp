/**
 * @file property_codec.cpp
 * @brief Property value codec implementation
 */

#include "simlink/property/property_codec.h"
#include "simlink/core/byte_codec.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace simlink::property {

using transport::DataType;

std::string code_safe_name(const std::string& name) {
    std::string result = name;
    std::replace(result.begin(), result.end(), ' ', '_');
    return result;
}

std::string sim_name(const std::string& name) {
    std::string result = name;
    std::replace(result.begin(), result.end(), '_', ' ');
    return result;
}

std::optional<Real> parse_number(const std::string& text) {
    const char* begin = text.c_str();
    while (*begin != '\0' && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    if (*begin == '\0') {
        return std::nullopt;
    }

    char* end = nullptr;
    Real value = std::strtod(begin, &end);
    if (end == begin) {
        return std::nullopt;
    }
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    if (*end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<Real> as_number(const PropertyValue& value) {
    if (const auto* i = std::get_if<Int64>(&value)) {
        return static_cast<Real>(*i);
    }
    if (const auto* r = std::get_if<Real>(&value)) {
        return *r;
    }
    return parse_number(std::get<std::string>(value));
}

// ============================================================================
// Decoding
// ============================================================================

std::optional<PropertyValues> decode_property_values(
    const std::vector<PropertyDefinition>& definitions,
    const std::vector<UInt8>& payload) {

    core::ByteReader reader(payload);
    PropertyValues values;

    for (const auto& definition : definitions) {
        PropertyValue value;
        switch (definition.data_type) {
            case DataType::Int32:
                value = static_cast<Int64>(reader.read_i32());
                break;
            case DataType::Int64:
                value = reader.read_i64();
                break;
            case DataType::Float32:
                value = reader.read_f32();
                break;
            case DataType::Float64:
                value = reader.read_f64();
                break;
            default:
                value = reader.read_fixed_string(transport::data_type_size(definition.data_type));
                break;
        }
        values[code_safe_name(definition.name)] = std::move(value);
    }

    if (!reader.ok()) {
        return std::nullopt;
    }
    return values;
}

// ============================================================================
// Encoding
// ============================================================================

namespace {

template <typename IntT>
std::optional<IntT> to_integer(Real number) {
    // -min is exactly representable; max may round up for 64-bit types
    const Real lower = static_cast<Real>(std::numeric_limits<IntT>::min());
    const Real upper = -lower;
    Real truncated = std::trunc(number);
    if (truncated < lower || truncated >= upper) {
        return std::nullopt;
    }
    return static_cast<IntT>(truncated);
}

} // namespace

std::optional<std::vector<UInt8>> encode_property_value(const PropertyDefinition& definition,
                                                        const PropertyValue& value) {
    core::ByteWriter writer;

    if (transport::is_string_type(definition.data_type)) {
        const auto* text = std::get_if<std::string>(&value);
        if (!text) {
            return std::nullopt;
        }
        writer.write_fixed_string(*text, transport::data_type_size(definition.data_type));
        return writer.take();
    }

    std::optional<Real> number = as_number(value);
    if (!number) {
        return std::nullopt;
    }

    switch (definition.data_type) {
        case DataType::Int32: {
            auto integer = to_integer<Int32>(*number);
            if (!integer) {
                return std::nullopt;
            }
            writer.write_i32(*integer);
            break;
        }
        case DataType::Int64: {
            // Int64 values pass through untouched to keep full precision
            if (const auto* exact = std::get_if<Int64>(&value)) {
                writer.write_i64(*exact);
                break;
            }
            auto integer = to_integer<Int64>(*number);
            if (!integer) {
                return std::nullopt;
            }
            writer.write_i64(*integer);
            break;
        }
        case DataType::Float32:
            writer.write_f32(*number);
            break;
        case DataType::Float64:
            writer.write_f64(*number);
            break;
        default:
            return std::nullopt;
    }
    return writer.take();
}

} // namespace simlink::property
