#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace remotegate::observability {

struct ServerStartEvent {
  std::string host;
  std::uint16_t port = 0;
};

struct ServerStopEvent {};

struct SessionEvent {
  std::string session_id;
  std::string change;
};

struct ActionRegisteredEvent {
  std::string token;
  std::string session_id;
  std::string kind;
};

struct ResolutionEvent {
  std::string token;
  std::string via;
  std::string outcome;
};

struct DispatchEvent {
  std::string terminal_handle;
  std::string outcome;
  std::string detail;
};

struct SweepEvent {
  std::size_t sessions = 0;
  std::size_t actions = 0;
  std::size_t decisions = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ServerStartEvent, ServerStopEvent, SessionEvent, ActionRegisteredEvent,
                 ResolutionEvent, DispatchEvent, SweepEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::string route;
  int status = 0;
  std::chrono::milliseconds latency{0};
};

struct StoreSizeMetric {
  std::size_t sessions = 0;
  std::size_t actions = 0;
  std::size_t decisions = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, StoreSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace remotegate::observability
