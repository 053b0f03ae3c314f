#include "remotegate/dispatch/dispatcher.hpp"

namespace remotegate::dispatch {

std::string dispatch_status_to_string(const DispatchStatus status) {
  switch (status) {
  case DispatchStatus::Sent:
    return "sent";
  case DispatchStatus::SessionNotFound:
    return "session_not_found";
  case DispatchStatus::Failed:
    return "failed";
  }
  return "failed";
}

ProcessRunner default_process_runner() {
  return [](const std::vector<std::string> &argv, const std::chrono::milliseconds timeout) {
    return common::run_process(argv, timeout);
  };
}

} // namespace remotegate::dispatch
