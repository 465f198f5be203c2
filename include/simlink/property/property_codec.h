#pragma once
/**
 * @file property_codec.h
 * @brief Property value encoding for get/set payloads
 *
 * A data response carries the defined properties back to back, in
 * definition order, each in its wire datatype. A write payload carries a
 * single value.
 */

#include "simlink/property/property_catalog.h"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace simlink::property {

/**
 * @brief Decoded property value
 *
 * Integer datatypes decode to Int64, floating-point to Real, strings to
 * std::string.
 */
using PropertyValue = std::variant<Int64, Real, std::string>;

/**
 * @brief Result of a get, keyed by code-safe property name
 */
using PropertyValues = std::map<std::string, PropertyValue>;

/// "PLANE ALTITUDE" -> "PLANE_ALTITUDE"
std::string code_safe_name(const std::string& name);

/// "PLANE_ALTITUDE" -> "PLANE ALTITUDE"
std::string sim_name(const std::string& name);

/**
 * @brief Decode a data response
 * @return nullopt if the payload is shorter than the definitions require
 */
std::optional<PropertyValues> decode_property_values(
    const std::vector<PropertyDefinition>& definitions,
    const std::vector<UInt8>& payload);

/**
 * @brief Encode a single value for a write
 *
 * Numeric strings are accepted for numeric properties ("1500" writes
 * 1500.0). Returns nullopt if the value cannot be represented in the
 * property's datatype.
 */
std::optional<std::vector<UInt8>> encode_property_value(const PropertyDefinition& definition,
                                                        const PropertyValue& value);

/**
 * @brief Parse a string as a number, accepting surrounding whitespace
 */
std::optional<Real> parse_number(const std::string& text);

/// Value as Real, if numeric
std::optional<Real> as_number(const PropertyValue& value);

} // namespace simlink::property
