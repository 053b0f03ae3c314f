#pragma once

#include "remotegate/common/result.hpp"
#include "remotegate/control/types.hpp"
#include "remotegate/gate/http_client.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace remotegate::gate {

/// The fields of a PermissionRequest hook payload the gate uses.
struct PermissionRequest {
  std::string session_id;
  std::string tool_name = "Unknown";
  std::string cwd;
  std::string message;
};

[[nodiscard]] common::Result<PermissionRequest> parse_permission_request(const std::string &json);

/// One-line summary of what the tool call wants to do, built from the
/// tool_input object ("$ ls -la", "Edit file: ...").
[[nodiscard]] std::string describe_tool_request(const std::string &tool_name,
                                                const std::string &tool_input_json);

/// Hook output that answers the permission prompt.
[[nodiscard]] std::string hook_decision_json(control::Verdict verdict);

struct GateOptions {
  std::string server_url = "http://127.0.0.1:9876";
  /// Base for links shown to the operator; server_url when empty.
  std::string public_url;
  std::chrono::seconds timeout{60};
  std::chrono::seconds poll_interval{2};
  std::size_t max_message_bytes = 300;
};

using Sleeper = std::function<void(std::chrono::seconds)>;
using TokenGenerator = std::function<common::Result<std::string>()>;
using GateClock = std::function<std::chrono::steady_clock::time_point()>;

[[nodiscard]] Sleeper default_sleeper();
[[nodiscard]] TokenGenerator default_token_generator();
[[nodiscard]] GateClock default_gate_clock();

/// Registers a permission action with the control-plane and waits for a
/// remote verdict. The timeout is a deadline on `clock`, so slow requests
/// count against it.
class PermissionGate {
public:
  PermissionGate(GateOptions options, HttpClient &client, Sleeper sleeper = default_sleeper(),
                 TokenGenerator tokens = default_token_generator(),
                 GateClock clock = default_gate_clock());

  /// Verdict, or nullopt on timeout or when the control-plane is unreachable.
  /// Links for the operator are written to `notice`.
  [[nodiscard]] std::optional<control::Verdict> await_decision(const PermissionRequest &request,
                                                               std::ostream &notice);

  /// Full hook run: reads the payload, waits, and writes the decision JSON to
  /// `out` when there is one. Always returns exit code 0.
  int run(const std::string &payload, std::ostream &out, std::ostream &notice);

  /// Token of the most recent registration attempt.
  [[nodiscard]] const std::string &last_token() const { return last_token_; }

private:
  [[nodiscard]] bool register_action(const PermissionRequest &request, const std::string &token);
  [[nodiscard]] std::optional<control::Verdict> poll_decision(const std::string &token);

  GateOptions options_;
  HttpClient &client_;
  Sleeper sleeper_;
  TokenGenerator tokens_;
  GateClock clock_;
  std::string last_token_;
};

} // namespace remotegate::gate
