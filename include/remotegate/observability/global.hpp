#pragma once

#include "remotegate/observability/observer.hpp"

#include <memory>

namespace remotegate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_server_start(const std::string &host, std::uint16_t port);
void record_server_stop();
void record_session(const std::string &session_id, const std::string &change);
void record_action_registered(const std::string &token, const std::string &session_id,
                              const std::string &kind);
void record_resolution(const std::string &token, const std::string &via,
                       const std::string &outcome);
void record_dispatch(const std::string &terminal_handle, const std::string &outcome,
                     const std::string &detail);
void record_sweep(std::size_t sessions, std::size_t actions, std::size_t decisions);
void record_error(const std::string &component, const std::string &message);

} // namespace remotegate::observability
