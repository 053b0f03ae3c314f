#pragma once

#include "remotegate/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace remotegate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Escapes &, <, >, " and ' for safe embedding in HTML text and attributes.
[[nodiscard]] std::string html_escape(const std::string &value);

/// Last path component of a slash-separated path; "" for an empty path.
[[nodiscard]] std::string path_basename(const std::string &path);

/// Cuts value to at most max_bytes (marker included) without splitting a
/// UTF-8 sequence. Appends "..." when truncated.
[[nodiscard]] std::string truncate_text(const std::string &value, std::size_t max_bytes);

/// Decodes %XX escapes in a URL path segment. '+' is left untouched.
[[nodiscard]] std::string percent_decode(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace remotegate::common
