#pragma once

#include "remotegate/control/types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace remotegate::control {

/// One-time action tokens. A token moves pending -> consumed at most once and
/// is never re-armed; records older than the TTL read as absent.
class ActionStore {
public:
  ActionStore(std::chrono::seconds ttl, std::size_t max_message_bytes);

  /// Inserts a pending record. The caller owns token uniqueness; an existing
  /// record under the same token is replaced.
  void create(const NewAction &action, TimePoint now);
  /// Pending and unexpired record, if any. Expired records are erased here.
  [[nodiscard]] std::optional<ActionRecord> peek(const std::string &token, TimePoint now);
  /// Marks the record consumed and returns it. Only one caller per token ever
  /// receives a value.
  [[nodiscard]] std::optional<ActionRecord> consume(const std::string &token, TimePoint now);
  /// Drops consumed and expired records; returns how many.
  std::size_t sweep(TimePoint now);
  [[nodiscard]] std::size_t size() const;

private:
  [[nodiscard]] bool is_expired(const ActionRecord &record, TimePoint now) const;
  // Caller holds mutex_.
  ActionRecord *find_live(const std::string &token, TimePoint now);

  std::chrono::seconds ttl_;
  std::size_t max_message_bytes_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ActionRecord> actions_;
};

} // namespace remotegate::control
