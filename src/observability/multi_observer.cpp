#include "remotegate/observability/multi_observer.hpp"

namespace remotegate::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  observers_.push_back(std::move(observer));
}

template <typename Fn> void MultiObserver::broadcast(Fn &&fn) {
  for (const auto &observer : observers_) {
    fn(*observer);
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  broadcast([&event](IObserver &sink) { sink.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  broadcast([&metric](IObserver &sink) { sink.record_metric(metric); });
}

void MultiObserver::flush() {
  broadcast([](IObserver &sink) { sink.flush(); });
}

std::unique_ptr<IObserver> MultiObserver::collapse(std::unique_ptr<MultiObserver> multi) {
  if (multi->observers_.size() == 1) {
    return std::move(multi->observers_.front());
  }
  return multi;
}

} // namespace remotegate::observability
