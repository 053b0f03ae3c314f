#pragma once

#include "remotegate/control/types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace remotegate::control {

/// Agent session id -> terminal handle and working directory.
/// Re-registering a session overwrites the previous record.
class SessionRegistry {
public:
  explicit SessionRegistry(std::chrono::seconds retention);

  void upsert(const std::string &session_id, const std::string &terminal_handle,
              const std::string &cwd, TimePoint now);
  [[nodiscard]] std::optional<SessionRecord> get(const std::string &session_id) const;
  /// Returns whether a record was present. Removing an unknown id is not an error.
  bool remove(const std::string &session_id);
  /// Drops records older than the retention window; returns how many.
  std::size_t sweep(TimePoint now);
  [[nodiscard]] std::size_t size() const;

private:
  std::chrono::seconds retention_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SessionRecord> sessions_;
};

} // namespace remotegate::control
