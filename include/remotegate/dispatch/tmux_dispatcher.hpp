#pragma once

#include "remotegate/dispatch/dispatcher.hpp"

namespace remotegate::dispatch {

/// Types into a tmux pane with `send-keys`. The handle is a tmux target
/// (for example "%3" or "main:0.1").
class TmuxDispatcher final : public IKeystrokeDispatcher {
public:
  explicit TmuxDispatcher(std::chrono::milliseconds timeout,
                          ProcessRunner runner = default_process_runner());

  [[nodiscard]] DispatchOutcome send(const std::string &terminal_handle,
                                     const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "tmux"; }

private:
  DispatchOutcome run_step(const std::vector<std::string> &argv);

  std::chrono::milliseconds timeout_;
  ProcessRunner runner_;
};

} // namespace remotegate::dispatch
