#include "remotegate/observability/global.hpp"

#include <mutex>

namespace remotegate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_server_start(const std::string &host, const std::uint16_t port) {
  record_event(ServerStartEvent{.host = host, .port = port});
}

void record_server_stop() { record_event(ServerStopEvent{}); }

void record_session(const std::string &session_id, const std::string &change) {
  record_event(SessionEvent{.session_id = session_id, .change = change});
}

void record_action_registered(const std::string &token, const std::string &session_id,
                              const std::string &kind) {
  record_event(ActionRegisteredEvent{.token = token, .session_id = session_id, .kind = kind});
}

void record_resolution(const std::string &token, const std::string &via,
                       const std::string &outcome) {
  record_event(ResolutionEvent{.token = token, .via = via, .outcome = outcome});
}

void record_dispatch(const std::string &terminal_handle, const std::string &outcome,
                     const std::string &detail) {
  record_event(
      DispatchEvent{.terminal_handle = terminal_handle, .outcome = outcome, .detail = detail});
}

void record_sweep(const std::size_t sessions, const std::size_t actions,
                  const std::size_t decisions) {
  record_event(SweepEvent{.sessions = sessions, .actions = actions, .decisions = decisions});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace remotegate::observability
