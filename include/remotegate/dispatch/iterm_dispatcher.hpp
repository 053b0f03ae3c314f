#pragma once

#include "remotegate/dispatch/dispatcher.hpp"

namespace remotegate::dispatch {

/// Writes text into an iTerm2 session through osascript. The handle is the
/// session's unique id; an ITERM_SESSION_ID value ("w0t0p0:<id>") is accepted.
class ItermDispatcher final : public IKeystrokeDispatcher {
public:
  explicit ItermDispatcher(std::chrono::milliseconds timeout,
                           ProcessRunner runner = default_process_runner());

  [[nodiscard]] DispatchOutcome send(const std::string &terminal_handle,
                                     const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "iterm"; }

  [[nodiscard]] static std::string build_script(const std::string &session_id,
                                                const std::string &text);

private:
  std::chrono::milliseconds timeout_;
  ProcessRunner runner_;
};

} // namespace remotegate::dispatch
