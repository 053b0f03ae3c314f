#include "remotegate/control/decision_channel.hpp"

namespace remotegate::control {

DecisionChannel::DecisionChannel(const std::chrono::seconds retention) : retention_(retention) {}

bool DecisionChannel::set(const std::string &token, const Verdict verdict, const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto [it, inserted] = decisions_.try_emplace(token, Entry{verdict, now});
  (void)it;
  return inserted;
}

std::optional<Verdict> DecisionChannel::get(const std::string &token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = decisions_.find(token);
  if (it == decisions_.end()) {
    return std::nullopt;
  }
  return it->second.verdict;
}

std::size_t DecisionChannel::sweep(const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = decisions_.begin(); it != decisions_.end();) {
    if (now - it->second.decided_at > retention_) {
      it = decisions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t DecisionChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return decisions_.size();
}

} // namespace remotegate::control
