#include "remotegate/control/session_registry.hpp"

namespace remotegate::control {

SessionRegistry::SessionRegistry(const std::chrono::seconds retention) : retention_(retention) {}

void SessionRegistry::upsert(const std::string &session_id, const std::string &terminal_handle,
                             const std::string &cwd, const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[session_id] = SessionRecord{
      .session_id = session_id,
      .terminal_handle = terminal_handle,
      .cwd = cwd,
      .registered_at = now,
  };
}

std::optional<SessionRecord> SessionRegistry::get(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool SessionRegistry::remove(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(session_id) > 0;
}

std::size_t SessionRegistry::sweep(const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now - it->second.registered_at > retention_) {
      it = sessions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace remotegate::control
