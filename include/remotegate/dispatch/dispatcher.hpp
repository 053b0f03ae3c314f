#pragma once

#include "remotegate/common/process.hpp"
#include "remotegate/common/result.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace remotegate::dispatch {

enum class DispatchStatus { Sent, SessionNotFound, Failed };

[[nodiscard]] std::string dispatch_status_to_string(DispatchStatus status);

struct DispatchOutcome {
  DispatchStatus status = DispatchStatus::Failed;
  std::string detail;

  [[nodiscard]] bool sent() const { return status == DispatchStatus::Sent; }

  static DispatchOutcome ok() { return {DispatchStatus::Sent, ""}; }
  static DispatchOutcome not_found(std::string detail) {
    return {DispatchStatus::SessionNotFound, std::move(detail)};
  }
  static DispatchOutcome failed(std::string detail) {
    return {DispatchStatus::Failed, std::move(detail)};
  }
};

using ProcessRunner = std::function<common::Result<common::ProcessOutput>(
    const std::vector<std::string> &argv, std::chrono::milliseconds timeout)>;

[[nodiscard]] ProcessRunner default_process_runner();

/// Delivers text (followed by Enter) to the terminal identified by a handle.
/// Implementations never throw; every failure is reported in the outcome.
class IKeystrokeDispatcher {
public:
  virtual ~IKeystrokeDispatcher() = default;

  [[nodiscard]] virtual DispatchOutcome send(const std::string &terminal_handle,
                                             const std::string &text) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace remotegate::dispatch
