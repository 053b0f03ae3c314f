#pragma once

#include "remotegate/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace remotegate::common {

struct ProcessOutput {
  int exit_code = -1;
  std::string output;
  bool timed_out = false;
};

/// Runs argv[0] (looked up on PATH) with the given arguments, capturing
/// stdout and stderr together. The child is killed once timeout elapses.
/// Fails only when the process could not be started.
[[nodiscard]] Result<ProcessOutput> run_process(const std::vector<std::string> &argv,
                                                std::chrono::milliseconds timeout);

} // namespace remotegate::common
