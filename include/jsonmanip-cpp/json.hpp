/// @file json.hpp
/// @brief nlohmann/json interoperability for jsonmanip-cpp.
///
/// Provides ADL serialization (to_json/from_json) between Value and
/// nlohmann::ordered_json, which keeps object keys in insertion order, plus
/// text helpers built on nlohmann's parser and serializer.

#pragma once

#include <jsonmanip-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace jsonmanip_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

/// Decimals become doubles; NaN and the infinities become null, as
/// nlohmann serializes them.
void to_json(nlohmann::ordered_json& j, const Value& value);

/// Unsigned integers above the int64 range become doubles.
/// @throws Error (type_error) for binary values.
void from_json(const nlohmann::ordered_json& j, Value& value);

// =============================================================================
// Text
// =============================================================================

/// Parse JSON text into a Value.
///
/// Parsing streams through nlohmann's SAX interface, so `use_decimal` can
/// keep fractional numbers exactly as written (`1.10` stays `1.10`).
///
/// @param text The JSON document.
/// @param filename A label for error reports.
/// @param use_decimal Parse fractional and exponent numbers as Decimal.
/// @throws SyntaxError if `text` is not valid JSON.
auto parse_json(std::string_view text, std::string_view filename = "<string>",
                bool use_decimal = false) -> Value;

/// Serialize a Value as JSON text.
/// @param indent Spaces per level; negative for the compact form.
auto dump_json(const Value& value, int indent = -1) -> std::string;

/// Write the compact JSON form.
auto operator<<(std::ostream& os, const Value& value) -> std::ostream&;

}  // namespace jsonmanip_cpp
