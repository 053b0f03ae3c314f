#pragma once

#include "remotegate/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace remotegate::common {

/// Flat view of a TOML document: keys are "section.key", values are the raw
/// right-hand side text. Only scalar values are supported.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace remotegate::common
