#include "remotegate/config/config.hpp"

#include "remotegate/common/strings.hpp"
#include "remotegate/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace remotegate::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".remotegate";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("REMOTEGATE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(common::trim(raw), &consumed);
    if (consumed != common::trim(raw).size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<Config> parse_config(const std::string &toml_text) {
  auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.server.host = doc.get_string("server.host", config.server.host);
  const auto port = doc.get_u64("server.port", config.server.port);
  if (port > std::numeric_limits<std::uint16_t>::max()) {
    return common::Result<Config>::failure("server.port out of range: " + std::to_string(port));
  }
  config.server.port = static_cast<std::uint16_t>(port);
  config.server.allow_public_bind =
      doc.get_bool("server.allow_public_bind", config.server.allow_public_bind);
  config.server.max_body_bytes = static_cast<std::size_t>(
      doc.get_u64("server.max_body_bytes", config.server.max_body_bytes));
  config.server.max_connections = static_cast<std::size_t>(
      doc.get_u64("server.max_connections", config.server.max_connections));
  config.server.page_template =
      common::expand_path(doc.get_string("server.page_template", config.server.page_template));
  config.server.remote_url = doc.get_string("server.remote_url", config.server.remote_url);

  config.store.action_ttl_seconds =
      doc.get_u64("store.action_ttl_seconds", config.store.action_ttl_seconds);
  config.store.session_retention_seconds =
      doc.get_u64("store.session_retention_seconds", config.store.session_retention_seconds);
  config.store.decision_ttl_seconds =
      doc.get_u64("store.decision_ttl_seconds", config.store.decision_ttl_seconds);
  config.store.sweep_interval_seconds =
      doc.get_u64("store.sweep_interval_seconds", config.store.sweep_interval_seconds);
  config.store.max_message_bytes = static_cast<std::size_t>(
      doc.get_u64("store.max_message_bytes", config.store.max_message_bytes));

  config.dispatcher.backend = doc.get_string("dispatcher.backend", config.dispatcher.backend);
  config.dispatcher.timeout_ms = doc.get_u64("dispatcher.timeout_ms", config.dispatcher.timeout_ms);

  config.gate.timeout_seconds = doc.get_u64("gate.timeout_seconds", config.gate.timeout_seconds);
  config.gate.poll_interval_seconds =
      doc.get_u64("gate.poll_interval_seconds", config.gate.poll_interval_seconds);
  config.gate.server_url = doc.get_string("gate.server_url", config.gate.server_url);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.error());
  }

  const auto path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::ostringstream contents;
  contents << file.rdbuf();

  auto parsed = parse_config(contents.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

void apply_env_overrides(Config &config) {
  if (const auto host = env_value("REMOTEGATE_HOST"); host.has_value()) {
    config.server.host = *host;
  }
  if (const auto port = env_value("REMOTEGATE_PORT"); port.has_value()) {
    const auto parsed = parse_u64(*port);
    if (parsed.has_value() && *parsed > 0 && *parsed <= std::numeric_limits<std::uint16_t>::max()) {
      config.server.port = static_cast<std::uint16_t>(*parsed);
    }
  }
  if (const auto remote = env_value("REMOTEGATE_REMOTE_URL"); remote.has_value()) {
    config.server.remote_url = *remote;
  }
  if (const auto dispatcher = env_value("REMOTEGATE_DISPATCHER"); dispatcher.has_value()) {
    config.dispatcher.backend = *dispatcher;
  }
  if (const auto timeout = env_value("REMOTEGATE_GATE_TIMEOUT"); timeout.has_value()) {
    if (const auto parsed = parse_u64(*timeout); parsed.has_value()) {
      config.gate.timeout_seconds = *parsed;
    }
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.server.port == 0) {
    return common::Result<std::vector<std::string>>::failure("server.port must be 1-65535");
  }
  if (common::trim(config.server.host).empty()) {
    return common::Result<std::vector<std::string>>::failure("server.host must not be empty");
  }
  if (!is_loopback_host(config.server.host) && !config.server.allow_public_bind) {
    return common::Result<std::vector<std::string>>::failure(
        "refusing non-loopback server.host without server.allow_public_bind=true");
  }
  if (config.server.max_connections == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "server.max_connections must be positive");
  }
  if (config.store.action_ttl_seconds == 0 || config.store.session_retention_seconds == 0 ||
      config.store.decision_ttl_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "store retention windows must be positive");
  }
  if (config.store.sweep_interval_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "store.sweep_interval_seconds must be positive");
  }
  if (config.gate.poll_interval_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "gate.poll_interval_seconds must be positive");
  }

  const std::string backend = common::to_lower(common::trim(config.dispatcher.backend));
  if (backend != "tmux" && backend != "iterm" && backend != "none") {
    return common::Result<std::vector<std::string>>::failure("Invalid dispatcher.backend: " +
                                                              config.dispatcher.backend);
  }

  if (config.store.decision_ttl_seconds < config.gate.timeout_seconds) {
    warnings.push_back(
        "store.decision_ttl_seconds is shorter than gate.timeout_seconds; a slow poller may "
        "miss its verdict");
  }
  if (config.gate.poll_interval_seconds > config.gate.timeout_seconds) {
    warnings.push_back("gate.poll_interval_seconds exceeds gate.timeout_seconds");
  }
  if (!config.server.page_template.empty()) {
    std::error_code ec;
    if (!std::filesystem::exists(config.server.page_template, ec)) {
      warnings.push_back("server.page_template not found, built-in page will be used: " +
                         config.server.page_template);
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string local_server_url(const Config &config) {
  if (!common::trim(config.gate.server_url).empty()) {
    return strip_trailing_slash(common::trim(config.gate.server_url));
  }
  std::string host = config.server.host;
  if (host == "0.0.0.0" || host.empty()) {
    host = "127.0.0.1";
  }
  return "http://" + host + ":" + std::to_string(config.server.port);
}

std::string public_base_url(const Config &config) {
  if (!common::trim(config.server.remote_url).empty()) {
    return strip_trailing_slash(common::trim(config.server.remote_url));
  }
  return local_server_url(config);
}

bool is_loopback_host(const std::string &host) {
  const std::string lowered = common::to_lower(common::trim(host));
  return lowered == "127.0.0.1" || lowered == "localhost" || lowered == "::1" ||
         lowered == "[::1]";
}

} // namespace remotegate::config
