#include "remotegate/gateway/server.hpp"

#include "remotegate/common/json_util.hpp"
#include "remotegate/common/strings.hpp"
#include "remotegate/config/config.hpp"
#include "remotegate/gateway/pages.hpp"
#include "remotegate/observability/global.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace remotegate::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr std::size_t kMaxHeaderBytes = 8192;
constexpr int kClientReadTimeoutSeconds = 10;

/// Token or id that follows `prefix` in the path, percent-decoded. Absent when
/// empty or when it would span more than one segment.
std::optional<std::string> path_param(const std::string &path, const std::string &prefix) {
  if (!common::starts_with(path, prefix) || path.size() == prefix.size()) {
    return std::nullopt;
  }
  const std::string raw = path.substr(prefix.size());
  if (raw.find('/') != std::string::npos) {
    return std::nullopt;
  }
  const std::string decoded = common::percent_decode(raw);
  if (decoded.empty()) {
    return std::nullopt;
  }
  return decoded;
}

// Route label without the token, for latency metrics.
std::string route_label(const HttpRequest &request) {
  const auto second = request.path.find('/', 1);
  return request.method + " " +
         (second == std::string::npos ? request.path : request.path.substr(0, second));
}

void add_cors_headers(HttpResponse &response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

common::Result<common::JsonFlatMap> parse_json_body(const HttpRequest &request) {
  const std::string body = common::trim(request.body);
  if (body.empty()) {
    return common::Result<common::JsonFlatMap>::failure("empty body");
  }
  return common::json_parse_flat(body);
}

std::string first_present(const common::JsonFlatMap &map, const std::string &primary,
                          const std::string &alternate) {
  std::string value = common::trim(common::json_field(map, primary));
  if (value.empty()) {
    value = common::trim(common::json_field(map, alternate));
  }
  return value;
}

void send_all(const int fd, const std::string &text) {
  std::size_t offset = 0;
  while (offset < text.size()) {
    const ssize_t n = send(fd, text.data() + offset, text.size() - offset, MSG_NOSIGNAL);
    if (n <= 0) {
      return;
    }
    offset += static_cast<std::size_t>(n);
  }
}

} // namespace

ControlServer::ControlServer(const config::Config &config, control::ControlStore &store,
                             dispatch::IKeystrokeDispatcher &dispatcher)
    : config_(config), store_(store), dispatcher_(dispatcher),
      started_at_(std::chrono::steady_clock::now()) {
  auto loaded = load_page_template(config.server.page_template);
  if (loaded.ok()) {
    page_template_ = loaded.value();
  } else {
    observability::record_error("gateway", loaded.error() + "; using built-in page");
    page_template_ = default_control_page_template();
  }
}

ControlServer::~ControlServer() { stop(); }

common::Status ControlServer::start(const ServerOptions &options) {
  if (running_) {
    return common::Status::error("control server already running");
  }

  if (!config::is_loopback_host(options.host) && !config_.server.allow_public_bind) {
    return common::Status::error("refusing public bind without allow_public_bind=true");
  }

  std::string bind_host = common::to_lower(common::trim(options.host));
  if (bind_host == "localhost") {
    bind_host = "127.0.0.1";
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  started_at_ = std::chrono::steady_clock::now();
  sweeper_ = std::make_unique<control::Sweeper>(
      store_, std::chrono::seconds(config_.store.sweep_interval_seconds));
  sweeper_->start();

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  observability::record_server_start(bind_host, bound_port_);
  return common::Status::success();
}

void ControlServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  {
    std::unique_lock<std::mutex> lock(workers_mutex_);
    workers_cv_.wait(lock, [this]() { return active_workers_ == 0; });
  }
  if (sweeper_ != nullptr) {
    sweeper_->stop();
    sweeper_.reset();
  }
  observability::record_server_stop();
}

std::uint16_t ControlServer::port() const { return bound_port_; }

bool ControlServer::is_running() const { return running_.load(); }

HttpResponse ControlServer::dispatch_for_test(const HttpRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  HttpResponse response;
  try {
    response = route(request);
  } catch (const std::exception &e) {
    observability::record_error("gateway", request.method + " " + request.path + ": " + e.what());
    response = make_error_response(500, "internal server error");
  }
  add_cors_headers(response);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric(observability::RequestLatencyMetric{
      .route = route_label(request), .status = response.status, .latency = elapsed});
  return response;
}

HttpResponse ControlServer::route(const HttpRequest &request) {
  const std::string &method = request.method;
  const std::string &path = request.path;

  if (method == "OPTIONS") {
    HttpResponse response;
    response.status = 204;
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, DELETE, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";
    return response;
  }

  if (method == "GET" && path == "/health") {
    return handle_health();
  }
  if (method == "POST" && path == "/session") {
    return handle_register_session(request);
  }
  if (method == "POST" && path == "/register-action") {
    return handle_register_action(request);
  }
  if (method == "DELETE") {
    if (const auto id = path_param(path, "/session/")) {
      return handle_unregister_session(*id);
    }
  }
  if (method == "GET") {
    if (const auto token = path_param(path, "/approve/")) {
      return handle_verdict(*token, control::Verdict::Allow);
    }
    if (const auto token = path_param(path, "/deny/")) {
      return handle_verdict(*token, control::Verdict::Deny);
    }
    if (const auto token = path_param(path, "/control/")) {
      return handle_control_page(*token);
    }
    if (const auto token = path_param(path, "/decision/")) {
      return handle_decision(*token);
    }
  }
  if (method == "POST") {
    if (const auto token = path_param(path, "/control/")) {
      return handle_custom_text(*token, request);
    }
  }

  return make_error_response(404, "not found");
}

HttpResponse ControlServer::handle_health() const {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - started_at_);
  const control::StoreStats stats = store_.stats();
  std::ostringstream body;
  body << R"({"ok":true,"status":"ok","uptime_seconds":)" << uptime.count()
       << R"(,"sessions":)" << stats.sessions << R"(,"actions":)" << stats.actions
       << R"(,"decisions":)" << stats.decisions << "}";
  return make_json_response(200, body.str());
}

HttpResponse ControlServer::handle_register_session(const HttpRequest &request) {
  auto parsed = parse_json_body(request);
  if (!parsed.ok()) {
    return make_error_response(400, "invalid json");
  }
  const auto &fields = parsed.value();
  const std::string session_id = common::trim(common::json_field(fields, "session_id"));
  if (session_id.empty()) {
    return make_error_response(400, "missing session_id");
  }
  const std::string handle = first_present(fields, "terminal_handle", "iterm_session");
  store_.register_session(session_id, handle, common::json_field(fields, "cwd"));
  observability::record_session(session_id, "registered");
  return make_json_response(200, R"({"ok":true})");
}

HttpResponse ControlServer::handle_unregister_session(const std::string &session_id) {
  store_.remove_session(session_id);
  observability::record_session(session_id, "removed");
  return make_json_response(200, R"({"ok":true})");
}

HttpResponse ControlServer::handle_register_action(const HttpRequest &request) {
  auto parsed = parse_json_body(request);
  if (!parsed.ok()) {
    return make_error_response(400, "invalid json");
  }
  const auto &fields = parsed.value();
  control::NewAction action;
  action.token = first_present(fields, "token", "uuid");
  if (action.token.empty()) {
    return make_error_response(400, "missing token");
  }
  action.session_id = common::trim(common::json_field(fields, "session_id"));
  action.kind = control::action_kind_from_string(first_present(fields, "notification_type", "kind"));
  action.message = common::json_field(fields, "message");
  action.project = common::trim(common::json_field(fields, "project"));
  action.tool = common::trim(common::json_field(fields, "tool"));
  store_.register_action(action);
  observability::record_action_registered(action.token, action.session_id,
                                          control::action_kind_to_string(action.kind));
  return make_json_response(200, R"({"ok":true})");
}

dispatch::DispatchOutcome ControlServer::deliver(const control::ActionRecord &action,
                                                 const std::string &text) {
  const auto session = store_.session(action.session_id);
  if (!session.has_value() || common::trim(session->terminal_handle).empty()) {
    auto outcome = dispatch::DispatchOutcome::not_found("no terminal registered for session '" +
                                                        action.session_id + "'");
    observability::record_dispatch("", dispatch::dispatch_status_to_string(outcome.status),
                                   outcome.detail);
    return outcome;
  }

  auto outcome = dispatcher_.send(session->terminal_handle, text);
  observability::record_dispatch(session->terminal_handle,
                                 dispatch::dispatch_status_to_string(outcome.status),
                                 outcome.detail);
  return outcome;
}

HttpResponse ControlServer::handle_verdict(const std::string &token,
                                           const control::Verdict verdict) {
  const std::string via = control::verdict_to_string(verdict);
  const auto resolution = store_.resolve_verdict(token, verdict);

  if (resolution.outcome == control::VerdictOutcome::Expired ||
      !resolution.verdict.has_value()) {
    observability::record_resolution(token, via, "expired");
    return make_error_response(410, "token expired or already used");
  }

  const std::string decided = control::verdict_to_string(*resolution.verdict);
  if (resolution.outcome == control::VerdictOutcome::AlreadyDecided) {
    observability::record_resolution(token, via, "already_decided");
    return make_json_response(200, std::string(R"({"ok":true,"decision":)") +
                                       common::json_string(decided) +
                                       R"(,"already_decided":true})");
  }

  observability::record_resolution(token, via, "resolved");
  // A racing click may have recorded its verdict first; type what was recorded.
  const std::string keystroke = *resolution.verdict == control::Verdict::Allow ? "y" : "n";
  const auto outcome = deliver(*resolution.action, keystroke);

  std::ostringstream body;
  body << R"({"ok":true,"decision":)" << common::json_string(decided)
       << R"(,"sent":)" << common::json_string(keystroke)
       << R"(,"dispatched":)" << bool_text(outcome.sent())
       << R"(,"dispatch":)" << common::json_string(dispatch::dispatch_status_to_string(outcome.status))
       << "}";
  return make_json_response(200, body.str());
}

HttpResponse ControlServer::handle_control_page(const std::string &token) {
  const auto action = store_.peek_action(token);
  if (!action.has_value()) {
    return make_html_response(410, render_expired_page());
  }

  PageFields fields;
  fields.token = action->token;
  fields.created_at_ms = control::to_epoch_millis(action->created_at);
  fields.icon = action_icon(action->kind);
  fields.title = action_title(action->kind);
  fields.event_type = control::action_kind_label(action->kind);
  fields.message = action->message;
  fields.project = action->project;
  if (fields.project.empty()) {
    if (const auto session = store_.session(action->session_id)) {
      fields.project = common::path_basename(session->cwd);
    }
  }
  return make_html_response(200, render_control_page(page_template_, fields));
}

HttpResponse ControlServer::handle_custom_text(const std::string &token,
                                               const HttpRequest &request) {
  std::string text = request.body;
  const std::string content_type = common::to_lower(header_lookup(request, "content-type"));
  const bool looks_json = common::starts_with(common::trim(request.body), "{");
  if (content_type.find("application/json") != std::string::npos || looks_json) {
    auto parsed = common::json_parse_flat(common::trim(request.body));
    if (parsed.ok()) {
      text = common::json_field(parsed.value(), "text");
    } else if (content_type.find("application/json") != std::string::npos) {
      return make_error_response(400, "invalid json");
    }
  }
  text = common::trim(text);
  if (text.empty()) {
    return make_error_response(400, "empty input");
  }

  const auto action = store_.resolve_text(token);
  if (!action.has_value()) {
    observability::record_resolution(token, "text", "expired");
    return make_error_response(410, "token expired or already used");
  }
  observability::record_resolution(token, "text", "resolved");
  const auto outcome = deliver(*action, text);

  std::ostringstream body;
  body << R"({"ok":true,"sent":)" << common::json_string(text)
       << R"(,"dispatched":)" << bool_text(outcome.sent())
       << R"(,"dispatch":)" << common::json_string(dispatch::dispatch_status_to_string(outcome.status))
       << "}";
  return make_json_response(200, body.str());
}

HttpResponse ControlServer::handle_decision(const std::string &token) const {
  const auto verdict = store_.decision(token);
  if (!verdict.has_value()) {
    return make_json_response(200, R"({"ok":true,"decision":null})");
  }
  return make_json_response(200, std::string(R"({"ok":true,"decision":)") +
                                     common::json_string(control::verdict_to_string(*verdict)) +
                                     "}");
}

void ControlServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(workers_mutex_);
      if (active_workers_ >= config_.server.max_connections) {
        HttpResponse busy = make_error_response(503, "server busy");
        add_cors_headers(busy);
        send_all(client, render_http_response(busy));
        close(client);
        continue;
      }
      ++active_workers_;
    }

    std::thread([this, client]() {
      handle_client(client);
      close(client);
      std::lock_guard<std::mutex> lock(workers_mutex_);
      --active_workers_;
      workers_cv_.notify_all();
    }).detach();
  }
}

void ControlServer::handle_client(const int client_fd) {
  timeval timeout{};
  timeout.tv_sec = kClientReadTimeoutSeconds;
  setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  const std::size_t max_body = config_.server.max_body_bytes;
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  bool header_parsed = false;
  while (raw.size() < (max_body + kMaxHeaderBytes)) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (!header_parsed) {
      const auto header_end = raw.find("\r\n\r\n");
      if (header_end != std::string::npos) {
        header_parsed = true;
        auto parsed = parse_http_request(raw.substr(0, header_end + 4));
        if (parsed.ok()) {
          const std::string cl = header_lookup(parsed.value(), "content-length");
          if (!cl.empty()) {
            try {
              content_length = static_cast<std::size_t>(std::stoull(cl));
            } catch (const std::exception &) {
              content_length = 0;
            }
          }
        }
        if (content_length > max_body) {
          HttpResponse too_large = make_error_response(413, "request body too large");
          add_cors_headers(too_large);
          send_all(client_fd, render_http_response(too_large));
          return;
        }
      } else if (raw.size() > kMaxHeaderBytes) {
        break;
      }
    }

    if (header_parsed) {
      const auto header_end = raw.find("\r\n\r\n");
      if (header_end != std::string::npos && raw.size() >= header_end + 4 + content_length) {
        break;
      }
    }
  }

  auto parsed = parse_http_request(raw);
  HttpResponse response;
  if (!parsed.ok()) {
    response = make_error_response(400, "invalid request");
    add_cors_headers(response);
  } else {
    HttpRequest request = parsed.value();
    if (request.body.size() > content_length) {
      request.body.resize(content_length);
    }
    response = dispatch_for_test(request);
  }
  send_all(client_fd, render_http_response(response));
}

} // namespace remotegate::gateway
