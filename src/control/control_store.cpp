#include "remotegate/control/control_store.hpp"

#include <utility>

namespace remotegate::control {

StoreLimits StoreLimits::from_config(const config::StoreConfig &config) {
  StoreLimits limits;
  limits.action_ttl = std::chrono::seconds(config.action_ttl_seconds);
  limits.session_retention = std::chrono::seconds(config.session_retention_seconds);
  limits.decision_retention = std::chrono::seconds(config.decision_ttl_seconds);
  limits.max_message_bytes = static_cast<std::size_t>(config.max_message_bytes);
  return limits;
}

ControlStore::ControlStore(StoreLimits limits, TimeSource clock)
    : limits_(limits), clock_(clock ? std::move(clock) : system_time_source()),
      sessions_(limits.session_retention), actions_(limits.action_ttl, limits.max_message_bytes),
      decisions_(limits.decision_retention) {}

TimePoint ControlStore::now() const { return clock_(); }

void ControlStore::register_session(const std::string &session_id,
                                    const std::string &terminal_handle, const std::string &cwd) {
  sessions_.upsert(session_id, terminal_handle, cwd, now());
}

std::optional<SessionRecord> ControlStore::session(const std::string &session_id) const {
  return sessions_.get(session_id);
}

void ControlStore::remove_session(const std::string &session_id) {
  (void)sessions_.remove(session_id);
}

void ControlStore::register_action(const NewAction &action) { actions_.create(action, now()); }

std::optional<ActionRecord> ControlStore::peek_action(const std::string &token) {
  return actions_.peek(token, now());
}

std::optional<ActionRecord> ControlStore::consume_action(const std::string &token) {
  return actions_.consume(token, now());
}

bool ControlStore::record_decision(const std::string &token, const Verdict verdict) {
  return decisions_.set(token, verdict, now());
}

std::optional<Verdict> ControlStore::decision(const std::string &token) const {
  return decisions_.get(token);
}

VerdictResolution ControlStore::resolve_verdict(const std::string &token, const Verdict verdict) {
  VerdictResolution resolution;
  const auto pending = peek_action(token);
  if (!pending.has_value()) {
    resolution.verdict = decision(token);
    resolution.outcome = resolution.verdict.has_value() ? VerdictOutcome::AlreadyDecided
                                                        : VerdictOutcome::Expired;
    return resolution;
  }

  (void)record_decision(token, verdict);
  auto consumed = consume_action(token);
  resolution.verdict = decision(token);
  if (!consumed.has_value()) {
    resolution.outcome = resolution.verdict.has_value() ? VerdictOutcome::AlreadyDecided
                                                        : VerdictOutcome::Expired;
    return resolution;
  }

  resolution.outcome = VerdictOutcome::Resolved;
  resolution.action = std::move(consumed);
  return resolution;
}

std::optional<ActionRecord> ControlStore::resolve_text(const std::string &token) {
  return consume_action(token);
}

SweepReport ControlStore::sweep() { return sweep(now()); }

SweepReport ControlStore::sweep(const TimePoint now) {
  SweepReport report;
  report.sessions = sessions_.sweep(now);
  report.actions = actions_.sweep(now);
  report.decisions = decisions_.sweep(now);
  return report;
}

StoreStats ControlStore::stats() const {
  return StoreStats{
      .sessions = sessions_.size(),
      .actions = actions_.size(),
      .decisions = decisions_.size(),
  };
}

} // namespace remotegate::control
