#include "remotegate/control/action_store.hpp"

#include "remotegate/common/strings.hpp"

namespace remotegate::control {

ActionStore::ActionStore(const std::chrono::seconds ttl, const std::size_t max_message_bytes)
    : ttl_(ttl), max_message_bytes_(max_message_bytes) {}

void ActionStore::create(const NewAction &action, const TimePoint now) {
  ActionRecord record;
  record.token = action.token;
  record.session_id = action.session_id;
  record.kind = action.kind;
  record.message = common::truncate_text(action.message, max_message_bytes_);
  record.project = action.project;
  record.tool = action.tool;
  record.created_at = now;
  record.consumed = false;

  std::lock_guard<std::mutex> lock(mutex_);
  actions_[record.token] = std::move(record);
}

bool ActionStore::is_expired(const ActionRecord &record, const TimePoint now) const {
  return now - record.created_at > ttl_;
}

ActionRecord *ActionStore::find_live(const std::string &token, const TimePoint now) {
  const auto it = actions_.find(token);
  if (it == actions_.end()) {
    return nullptr;
  }
  if (is_expired(it->second, now)) {
    actions_.erase(it);
    return nullptr;
  }
  if (it->second.consumed) {
    return nullptr;
  }
  return &it->second;
}

std::optional<ActionRecord> ActionStore::peek(const std::string &token, const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ActionRecord *record = find_live(token, now);
  if (record == nullptr) {
    return std::nullopt;
  }
  return *record;
}

std::optional<ActionRecord> ActionStore::consume(const std::string &token, const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  ActionRecord *record = find_live(token, now);
  if (record == nullptr) {
    return std::nullopt;
  }
  record->consumed = true;
  return *record;
}

std::size_t ActionStore::sweep(const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = actions_.begin(); it != actions_.end();) {
    if (it->second.consumed || is_expired(it->second, now)) {
      it = actions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t ActionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return actions_.size();
}

} // namespace remotegate::control
