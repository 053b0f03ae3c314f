#pragma once

#include "remotegate/common/result.hpp"
#include "remotegate/config/schema.hpp"
#include "remotegate/control/control_store.hpp"
#include "remotegate/control/sweeper.hpp"
#include "remotegate/dispatch/dispatcher.hpp"
#include "remotegate/gateway/http.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace remotegate::gateway {

struct ServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 9876;
};

/// HTTP control-plane over a ControlStore. Each accepted connection is served
/// on its own worker thread so a slow keystroke dispatch never holds up
/// /decision pollers.
class ControlServer {
public:
  ControlServer(const config::Config &config, control::ControlStore &store,
                dispatch::IKeystrokeDispatcher &dispatcher);
  ~ControlServer();

  ControlServer(const ControlServer &) = delete;
  ControlServer &operator=(const ControlServer &) = delete;

  [[nodiscard]] common::Status start(const ServerOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  /// Routes one parsed request. Handler exceptions become a 500 here; every
  /// response carries the CORS header.
  [[nodiscard]] HttpResponse dispatch_for_test(const HttpRequest &request);

private:
  [[nodiscard]] HttpResponse route(const HttpRequest &request);

  [[nodiscard]] HttpResponse handle_health() const;
  [[nodiscard]] HttpResponse handle_register_session(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_unregister_session(const std::string &session_id);
  [[nodiscard]] HttpResponse handle_register_action(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_verdict(const std::string &token, control::Verdict verdict);
  [[nodiscard]] HttpResponse handle_control_page(const std::string &token);
  [[nodiscard]] HttpResponse handle_custom_text(const std::string &token,
                                                const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_decision(const std::string &token) const;

  dispatch::DispatchOutcome deliver(const control::ActionRecord &action, const std::string &text);

  void accept_loop();
  void handle_client(int client_fd);

  const config::Config &config_;
  control::ControlStore &store_;
  dispatch::IKeystrokeDispatcher &dispatcher_;
  std::string page_template_;
  std::chrono::steady_clock::time_point started_at_;
  std::unique_ptr<control::Sweeper> sweeper_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;

  std::mutex workers_mutex_;
  std::condition_variable workers_cv_;
  std::size_t active_workers_ = 0;
};

} // namespace remotegate::gateway
