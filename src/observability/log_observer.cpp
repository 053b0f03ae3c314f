#include "remotegate/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace remotegate::observability {

namespace {

// Tokens are bearer-like; only a prefix goes to the log.
std::string short_token(const std::string &token) {
  constexpr std::size_t kVisible = 8;
  if (token.size() <= kVisible) {
    return token;
  }
  return token.substr(0, kVisible) + "...";
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ServerStartEvent>) {
          log_line("INFO", "server.start listening on http://" + evt.host + ":" +
                               std::to_string(evt.port));
        } else if constexpr (std::is_same_v<T, ServerStopEvent>) {
          log_line("INFO", "server.stop");
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          log_line("INFO", "session." + evt.change + " id=" + evt.session_id);
        } else if constexpr (std::is_same_v<T, ActionRegisteredEvent>) {
          log_line("INFO", "action.registered token=" + short_token(evt.token) +
                               " session=" + evt.session_id + " kind=" + evt.kind);
        } else if constexpr (std::is_same_v<T, ResolutionEvent>) {
          log_line("INFO", "action.resolve token=" + short_token(evt.token) + " via=" + evt.via +
                               " outcome=" + evt.outcome);
        } else if constexpr (std::is_same_v<T, DispatchEvent>) {
          const std::string level = evt.outcome == "sent" ? "INFO" : "WARN";
          std::string line = "dispatch handle=" + evt.terminal_handle + " outcome=" + evt.outcome;
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line(level, line);
        } else if constexpr (std::is_same_v<T, SweepEvent>) {
          log_line("DEBUG", "sweep sessions=" + std::to_string(evt.sessions) +
                                " actions=" + std::to_string(evt.actions) +
                                " decisions=" + std::to_string(evt.decisions));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request route=" + m.route + " status=" +
                                std::to_string(m.status) +
                                " latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, StoreSizeMetric>) {
          log_line("DEBUG", "metric.store sessions=" + std::to_string(m.sessions) +
                                " actions=" + std::to_string(m.actions) +
                                " decisions=" + std::to_string(m.decisions));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace remotegate::observability
