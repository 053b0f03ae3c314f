#pragma once

#include "remotegate/observability/observer.hpp"

#include <memory>
#include <vector>

namespace remotegate::observability {

/// Fans every event and metric out to each member sink, in insertion order.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  /// A list with a single member is returned as that member.
  [[nodiscard]] static std::unique_ptr<IObserver> collapse(std::unique_ptr<MultiObserver> multi);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void broadcast(Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace remotegate::observability
