#include "remotegate/control/types.hpp"

#include "remotegate/common/strings.hpp"

namespace remotegate::control {

TimeSource system_time_source() {
  return []() { return std::chrono::system_clock::now(); };
}

std::string action_kind_to_string(const ActionKind kind) {
  switch (kind) {
  case ActionKind::Permission:
    return "permission_prompt";
  case ActionKind::Idle:
    return "idle_prompt";
  case ActionKind::Elicitation:
    return "elicitation_dialog";
  case ActionKind::Completion:
    return "stop";
  case ActionKind::Unspecified:
    return "unspecified";
  }
  return "unspecified";
}

ActionKind action_kind_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "permission_prompt" || normalized == "permission") {
    return ActionKind::Permission;
  }
  if (normalized == "idle_prompt" || normalized == "idle") {
    return ActionKind::Idle;
  }
  if (normalized == "elicitation_dialog" || normalized == "elicitation") {
    return ActionKind::Elicitation;
  }
  if (normalized == "stop" || normalized == "completion") {
    return ActionKind::Completion;
  }
  return ActionKind::Unspecified;
}

std::string action_kind_label(const ActionKind kind) {
  switch (kind) {
  case ActionKind::Permission:
    return "permission prompt";
  case ActionKind::Idle:
    return "idle prompt";
  case ActionKind::Elicitation:
    return "elicitation dialog";
  case ActionKind::Completion:
    return "stop";
  case ActionKind::Unspecified:
    return "notification";
  }
  return "notification";
}

std::string verdict_to_string(const Verdict verdict) {
  return verdict == Verdict::Allow ? "allow" : "deny";
}

std::optional<Verdict> verdict_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "allow") {
    return Verdict::Allow;
  }
  if (normalized == "deny") {
    return Verdict::Deny;
  }
  return std::nullopt;
}

std::int64_t to_epoch_millis(const TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

} // namespace remotegate::control
