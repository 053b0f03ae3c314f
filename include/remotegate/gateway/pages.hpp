#pragma once

#include "remotegate/common/result.hpp"
#include "remotegate/control/types.hpp"

#include <cstdint>
#include <string>

namespace remotegate::gateway {

struct PageFields {
  std::string token;
  std::int64_t created_at_ms = 0;
  std::string icon;
  std::string title;
  std::string project;
  std::string event_type;
  std::string message;
};

[[nodiscard]] const std::string &default_control_page_template();

/// Reads a template file; an empty path yields the built-in template.
[[nodiscard]] common::Result<std::string> load_page_template(const std::string &path);

/// Substitutes {{TOKEN}}, {{CREATED_AT}}, {{ICON}}, {{TITLE}}, {{PROJECT}},
/// {{EVENT_TYPE}} and {{MESSAGE}}. Every value is HTML-escaped.
[[nodiscard]] std::string render_control_page(const std::string &page_template,
                                              const PageFields &fields);

[[nodiscard]] std::string render_expired_page();

[[nodiscard]] std::string action_icon(control::ActionKind kind);
[[nodiscard]] std::string action_title(control::ActionKind kind);

} // namespace remotegate::gateway
