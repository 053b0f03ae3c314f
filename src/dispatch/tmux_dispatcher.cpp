#include "remotegate/dispatch/tmux_dispatcher.hpp"

#include "remotegate/common/strings.hpp"

#include <array>

namespace remotegate::dispatch {

namespace {

bool names_missing_target(const std::string &output) {
  static constexpr std::array<const char *, 4> kMarkers = {
      "can't find", "no such", "not found", "no server running"};
  const std::string lowered = common::to_lower(output);
  for (const char *marker : kMarkers) {
    if (lowered.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

TmuxDispatcher::TmuxDispatcher(const std::chrono::milliseconds timeout, ProcessRunner runner)
    : timeout_(timeout), runner_(std::move(runner)) {}

DispatchOutcome TmuxDispatcher::run_step(const std::vector<std::string> &argv) {
  auto result = runner_(argv, timeout_);
  if (!result.ok()) {
    return DispatchOutcome::failed(result.error());
  }
  const auto &output = result.value();
  if (output.timed_out) {
    return DispatchOutcome::failed("tmux timed out");
  }
  if (output.exit_code != 0) {
    const std::string detail = common::trim(output.output);
    if (names_missing_target(detail)) {
      return DispatchOutcome::not_found(detail);
    }
    return DispatchOutcome::failed(detail.empty()
                                       ? "tmux exited with code " + std::to_string(output.exit_code)
                                       : detail);
  }
  return DispatchOutcome::ok();
}

DispatchOutcome TmuxDispatcher::send(const std::string &terminal_handle, const std::string &text) {
  if (common::trim(terminal_handle).empty()) {
    return DispatchOutcome::not_found("no terminal handle");
  }

  // Literal text first, then Enter as a key name.
  auto typed = run_step({"tmux", "send-keys", "-t", terminal_handle, "-l", "--", text});
  if (!typed.sent()) {
    return typed;
  }
  return run_step({"tmux", "send-keys", "-t", terminal_handle, "Enter"});
}

} // namespace remotegate::dispatch
