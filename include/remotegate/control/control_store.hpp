#pragma once

#include "remotegate/config/schema.hpp"
#include "remotegate/control/action_store.hpp"
#include "remotegate/control/decision_channel.hpp"
#include "remotegate/control/session_registry.hpp"
#include "remotegate/control/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace remotegate::control {

struct StoreLimits {
  std::chrono::seconds action_ttl{30 * 60};
  std::chrono::seconds session_retention{24 * 60 * 60};
  std::chrono::seconds decision_retention{30 * 60};
  std::size_t max_message_bytes = 1024;

  [[nodiscard]] static StoreLimits from_config(const config::StoreConfig &config);
};

struct StoreStats {
  std::size_t sessions = 0;
  std::size_t actions = 0;
  std::size_t decisions = 0;
};

struct SweepReport {
  std::size_t sessions = 0;
  std::size_t actions = 0;
  std::size_t decisions = 0;
};

enum class VerdictOutcome {
  // This call consumed the action; the verdict is recorded.
  Resolved,
  // A verdict already exists for the token (earlier click or a racing one).
  AlreadyDecided,
  // No pending action and no verdict: expired, unknown, or used by custom text.
  Expired,
};

struct VerdictResolution {
  VerdictOutcome outcome = VerdictOutcome::Expired;
  std::optional<Verdict> verdict;
  std::optional<ActionRecord> action;
};

/// Owns the session registry, action tokens and decision channel for one
/// control-plane process. Every operation reads time from the injected source.
class ControlStore {
public:
  explicit ControlStore(StoreLimits limits = {}, TimeSource clock = system_time_source());

  ControlStore(const ControlStore &) = delete;
  ControlStore &operator=(const ControlStore &) = delete;

  [[nodiscard]] TimePoint now() const;

  void register_session(const std::string &session_id, const std::string &terminal_handle,
                        const std::string &cwd);
  [[nodiscard]] std::optional<SessionRecord> session(const std::string &session_id) const;
  void remove_session(const std::string &session_id);

  void register_action(const NewAction &action);
  [[nodiscard]] std::optional<ActionRecord> peek_action(const std::string &token);
  [[nodiscard]] std::optional<ActionRecord> consume_action(const std::string &token);

  bool record_decision(const std::string &token, Verdict verdict);
  [[nodiscard]] std::optional<Verdict> decision(const std::string &token) const;

  /// Approve/deny sequence: the verdict is written before the action is
  /// consumed so a poller observes it even if the consume loses a race.
  [[nodiscard]] VerdictResolution resolve_verdict(const std::string &token, Verdict verdict);

  /// Custom-text resolution; consumes the action and returns it.
  [[nodiscard]] std::optional<ActionRecord> resolve_text(const std::string &token);

  SweepReport sweep();
  SweepReport sweep(TimePoint now);

  [[nodiscard]] StoreStats stats() const;
  [[nodiscard]] const StoreLimits &limits() const { return limits_; }

private:
  StoreLimits limits_;
  TimeSource clock_;
  SessionRegistry sessions_;
  ActionStore actions_;
  DecisionChannel decisions_;
};

} // namespace remotegate::control
