#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace remotegate::control {

using TimePoint = std::chrono::system_clock::time_point;
using TimeSource = std::function<TimePoint()>;

[[nodiscard]] TimeSource system_time_source();

enum class ActionKind { Permission, Idle, Elicitation, Completion, Unspecified };

enum class Verdict { Allow, Deny };

/// Wire name used by hooks ("permission_prompt", "idle_prompt", ...).
[[nodiscard]] std::string action_kind_to_string(ActionKind kind);
/// Accepts wire names and short aliases; anything else is Unspecified.
[[nodiscard]] ActionKind action_kind_from_string(const std::string &value);
/// Human label shown on the resolution page.
[[nodiscard]] std::string action_kind_label(ActionKind kind);

[[nodiscard]] std::string verdict_to_string(Verdict verdict);
[[nodiscard]] std::optional<Verdict> verdict_from_string(const std::string &value);

struct SessionRecord {
  std::string session_id;
  std::string terminal_handle;
  std::string cwd;
  TimePoint registered_at{};
};

struct NewAction {
  std::string token;
  std::string session_id;
  ActionKind kind = ActionKind::Unspecified;
  std::string message;
  std::string project;
  std::string tool;
};

struct ActionRecord {
  std::string token;
  std::string session_id;
  ActionKind kind = ActionKind::Unspecified;
  std::string message;
  std::string project;
  std::string tool;
  TimePoint created_at{};
  bool consumed = false;
};

[[nodiscard]] std::int64_t to_epoch_millis(TimePoint time);

} // namespace remotegate::control
