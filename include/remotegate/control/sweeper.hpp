#pragma once

#include "remotegate/control/control_store.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace remotegate::control {

/// Background thread that evicts stale sessions, actions and decisions.
class Sweeper {
public:
  Sweeper(ControlStore &store, std::chrono::milliseconds interval);
  ~Sweeper();

  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t runs() const;

private:
  void run_loop();

  ControlStore &store_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> runs_{0};
};

} // namespace remotegate::control
