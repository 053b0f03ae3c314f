#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace remotegate::config {

struct ServerConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 9876;
  bool allow_public_bind = false;
  std::size_t max_body_bytes = 64 * 1024;
  std::size_t max_connections = 64;
  std::string page_template;
  std::string remote_url;
};

struct StoreConfig {
  std::uint64_t action_ttl_seconds = 30 * 60;
  std::uint64_t session_retention_seconds = 24 * 60 * 60;
  std::uint64_t decision_ttl_seconds = 30 * 60;
  std::uint64_t sweep_interval_seconds = 5 * 60;
  std::size_t max_message_bytes = 1024;
};

struct DispatcherConfig {
  std::string backend = "tmux";
  std::uint64_t timeout_ms = 10'000;
};

struct GateConfig {
  std::uint64_t timeout_seconds = 60;
  std::uint64_t poll_interval_seconds = 2;
  std::string server_url;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ServerConfig server;
  StoreConfig store;
  DispatcherConfig dispatcher;
  GateConfig gate;
  ObservabilityConfig observability;
};

} // namespace remotegate::config
