#pragma once

#include "remotegate/control/types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace remotegate::control {

/// Token -> verdict, kept independently of the action record so a poller can
/// still read the verdict after a click consumed the action.
class DecisionChannel {
public:
  explicit DecisionChannel(std::chrono::seconds retention);

  /// First write for a token wins; returns false if a verdict already existed.
  bool set(const std::string &token, Verdict verdict, TimePoint now);
  [[nodiscard]] std::optional<Verdict> get(const std::string &token) const;
  std::size_t sweep(TimePoint now);
  [[nodiscard]] std::size_t size() const;

private:
  struct Entry {
    Verdict verdict = Verdict::Deny;
    TimePoint decided_at{};
  };

  std::chrono::seconds retention_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> decisions_;
};

} // namespace remotegate::control
