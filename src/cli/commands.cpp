#include "remotegate/cli/commands.hpp"

#include "remotegate/common/strings.hpp"
#include "remotegate/config/config.hpp"
#include "remotegate/control/control_store.hpp"
#include "remotegate/dispatch/factory.hpp"
#include "remotegate/gate/http_client.hpp"
#include "remotegate/gate/permission_gate.hpp"
#include "remotegate/gateway/server.hpp"
#include "remotegate/observability/factory.hpp"
#include "remotegate/observability/global.hpp"
#include "remotegate/security/token.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace remotegate::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested = true; }

std::string version_string() {
#ifdef REMOTEGATE_VERSION
  return std::string("remotegate ") + REMOTEGATE_VERSION;
#else
  return "remotegate 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

void print_help() {
  std::cout << "remotegate - remote approval and keystroke relay for terminal agents\n\n";
  std::cout << "usage: remotegate [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  serve [--host H] [--port P] [--duration-secs N]\n";
  std::cout << "                 run the control-plane until SIGINT/SIGTERM\n";
  std::cout << "  gate           PermissionRequest hook: read payload on stdin, wait for a verdict\n";
  std::cout << "  token          print a fresh action token\n";
  std::cout << "  config-path    print the config file location\n";
  std::cout << "  version        print the version\n";
  std::cout << "  help           show this message\n";
}

int run_serve(std::vector<std::string> args) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return 1;
  }
  config::Config cfg = loaded.value();

  std::string host;
  std::string port_raw;
  std::string duration_raw;
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--duration-secs", "", duration_raw);
  if (!host.empty()) {
    cfg.server.host = host;
  }
  if (!port_raw.empty()) {
    try {
      const unsigned long port = std::stoul(port_raw);
      if (port > 65535) {
        throw std::out_of_range("port");
      }
      cfg.server.port = static_cast<std::uint16_t>(port);
    } catch (const std::exception &) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
  }

  auto validated = config::validate_config(cfg);
  if (!validated.ok()) {
    std::cerr << validated.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(cfg));
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }

  auto dispatcher = dispatch::create_dispatcher(cfg.dispatcher);
  if (!dispatcher.ok()) {
    std::cerr << dispatcher.error() << "\n";
    return 1;
  }

  control::ControlStore store(control::StoreLimits::from_config(cfg.store));
  gateway::ControlServer server(cfg, store, *dispatcher.value());
  auto status = server.start({.host = cfg.server.host, .port = cfg.server.port});
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }

  std::cout << "remotegate listening on " << cfg.server.host << ":" << server.port()
            << " (dispatcher: " << dispatcher.value()->name() << ")\n";
  if (!cfg.server.remote_url.empty()) {
    std::cout << "Public URL: " << cfg.server.remote_url << "\n";
  }
  std::cout.flush();

  std::chrono::seconds duration{0};
  if (!duration_raw.empty()) {
    try {
      duration = std::chrono::seconds(std::stoll(duration_raw));
    } catch (const std::exception &) {
      duration = std::chrono::seconds(0);
    }
  }

  g_stop_requested = false;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
  const auto started = std::chrono::steady_clock::now();
  while (!g_stop_requested) {
    if (duration.count() > 0 && std::chrono::steady_clock::now() - started >= duration) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.stop();
  if (auto *observer = observability::get_global_observer()) {
    observer->flush();
  }
  return 0;
}

// Never blocks the agent on its own failures: every error path exits 0 with
// nothing on stdout so the interactive prompt takes over.
int run_gate() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << "remotegate gate: " << loaded.error() << "\n";
    return 0;
  }
  const config::Config &cfg = loaded.value();
  observability::set_global_observer(observability::create_observer(cfg));

  gate::GateOptions options;
  options.server_url = config::local_server_url(cfg);
  options.public_url = config::public_base_url(cfg);
  options.timeout = std::chrono::seconds(cfg.gate.timeout_seconds);
  options.poll_interval = std::chrono::seconds(cfg.gate.poll_interval_seconds);

  gate::CurlHttpClient client;
  gate::PermissionGate permission_gate(options, client);
  const int code = permission_gate.run(read_stdin_all(), std::cout, std::cerr);
  std::cout.flush();
  return code;
}

int run_token() {
  auto token = security::generate_action_token();
  if (!token.ok()) {
    std::cerr << token.error() << "\n";
    return 1;
  }
  std::cout << token.value() << "\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  try {
    if (subcommand == "serve") {
      return run_serve(std::move(args));
    }
    if (subcommand == "gate") {
      return run_gate();
    }
    if (subcommand == "token") {
      return run_token();
    }
  } catch (const std::exception &e) {
    std::cerr << subcommand << " failed: " << e.what() << "\n";
    return subcommand == "gate" ? 0 : 1;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace remotegate::cli
