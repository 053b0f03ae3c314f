#include "remotegate/control/sweeper.hpp"

#include "remotegate/observability/global.hpp"

#include <algorithm>

namespace remotegate::control {

Sweeper::Sweeper(ControlStore &store, const std::chrono::milliseconds interval)
    : store_(store), interval_(interval) {}

Sweeper::~Sweeper() { stop(); }

void Sweeper::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void Sweeper::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Sweeper::is_running() const { return running_; }

std::size_t Sweeper::runs() const { return runs_; }

void Sweeper::run_loop() {
  while (running_) {
    const auto wait_steps = std::max<long long>(1, interval_.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!running_) {
      break;
    }

    const SweepReport report = store_.sweep();
    ++runs_;
    if (report.sessions + report.actions + report.decisions > 0) {
      observability::record_sweep(report.sessions, report.actions, report.decisions);
    }
    const StoreStats stats = store_.stats();
    observability::record_metric(observability::StoreSizeMetric{
        .sessions = stats.sessions, .actions = stats.actions, .decisions = stats.decisions});
  }
}

} // namespace remotegate::control
