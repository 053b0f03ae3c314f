#pragma once

#include "remotegate/common/result.hpp"

#include <string>
#include <unordered_map>

namespace remotegate::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// json_escape wrapped in double quotes.
[[nodiscard]] std::string json_string(const std::string &value);

/// Top-level members of a JSON object. String members are unescaped; numbers,
/// booleans and nested values keep their raw JSON text; null members are absent.
using JsonFlatMap = std::unordered_map<std::string, std::string>;

/// Parse a JSON object into a flat map. Fails if the text is not one object.
[[nodiscard]] Result<JsonFlatMap> json_parse_flat(const std::string &json);

/// Member lookup with a fallback for absent keys.
[[nodiscard]] std::string json_field(const JsonFlatMap &map, const std::string &key,
                                     const std::string &fallback = "");

} // namespace remotegate::common
