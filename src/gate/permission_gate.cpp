#include "remotegate/gate/permission_gate.hpp"

#include "remotegate/common/json_util.hpp"
#include "remotegate/common/strings.hpp"
#include "remotegate/observability/global.hpp"
#include "remotegate/security/token.hpp"

#include <algorithm>
#include <sstream>
#include <thread>
#include <vector>

namespace remotegate::gate {

namespace {

constexpr std::uint64_t kHealthTimeoutMs = 1000;
constexpr std::uint64_t kRequestTimeoutMs = 2000;
constexpr std::size_t kFieldPreviewBytes = 60;
constexpr std::size_t kMaxPreviewFields = 3;

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

// First few members of an object as "key: value" pairs, in source order.
std::vector<std::pair<std::string, std::string>> preview_fields(const std::string &json) {
  std::vector<std::pair<std::string, std::string>> out;
  auto parsed = common::json_parse_flat(json);
  if (!parsed.ok()) {
    return out;
  }
  std::vector<std::pair<std::size_t, std::string>> ordered;
  for (const auto &[key, value] : parsed.value()) {
    const auto pos = json.find(common::json_string(key));
    ordered.emplace_back(pos == std::string::npos ? json.size() : pos, key);
  }
  std::sort(ordered.begin(), ordered.end());
  for (const auto &[pos, key] : ordered) {
    if (out.size() >= kMaxPreviewFields) {
      break;
    }
    (void)pos;
    out.emplace_back(key, common::truncate_text(parsed.value().at(key), kFieldPreviewBytes));
  }
  return out;
}

} // namespace

common::Result<PermissionRequest> parse_permission_request(const std::string &json) {
  auto parsed = common::json_parse_flat(common::trim(json));
  if (!parsed.ok()) {
    return common::Result<PermissionRequest>::failure("invalid hook payload: " + parsed.error());
  }
  const auto &fields = parsed.value();

  PermissionRequest request;
  request.session_id = common::trim(common::json_field(fields, "session_id"));
  request.tool_name = common::trim(common::json_field(fields, "tool_name", "Unknown"));
  if (request.tool_name.empty()) {
    request.tool_name = "Unknown";
  }
  request.cwd = common::trim(common::json_field(fields, "cwd"));
  request.message = common::json_field(fields, "message");
  if (common::trim(request.message).empty()) {
    request.message = describe_tool_request(request.tool_name, common::json_field(fields, "tool_input"));
  }
  return common::Result<PermissionRequest>::success(std::move(request));
}

std::string describe_tool_request(const std::string &tool_name,
                                  const std::string &tool_input_json) {
  common::JsonFlatMap input;
  auto parsed = common::json_parse_flat(common::trim(tool_input_json));
  if (parsed.ok()) {
    input = parsed.value();
  }
  const auto field = [&input](const std::string &key, const std::string &fallback = "") {
    return common::json_field(input, key, fallback);
  };

  if (tool_name == "Bash") {
    const std::string description = field("description");
    if (!description.empty()) {
      return description + "\n\n$ " + field("command");
    }
    return "$ " + field("command");
  }
  if (tool_name == "Write") {
    return "Create/overwrite file:\n" + field("file_path", "unknown");
  }
  if (tool_name == "Edit") {
    return "Edit file: " + field("file_path", "unknown") +
           "\nReplace: " + common::truncate_text(field("old_string"), 80);
  }
  if (tool_name == "WebFetch") {
    return "Fetch URL:\n" + field("url", "unknown");
  }
  if (tool_name == "Task") {
    return "Launch " + field("subagent_type", "unknown") + " agent: " + field("description");
  }

  const auto preview = preview_fields(common::trim(tool_input_json));
  const bool is_mcp = common::starts_with(tool_name, "mcp__");
  std::ostringstream out;
  out << (is_mcp ? "MCP tool: " : "") << tool_name << (is_mcp ? "\n" : ": ");
  for (std::size_t i = 0; i < preview.size(); ++i) {
    if (i > 0) {
      out << (is_mcp ? "\n" : ", ");
    }
    out << preview[i].first << ": " << preview[i].second;
  }
  return out.str();
}

std::string hook_decision_json(const control::Verdict verdict) {
  if (verdict == control::Verdict::Allow) {
    return R"({"hookSpecificOutput":{"hookEventName":"PermissionRequest","decision":{"behavior":"allow"}}})";
  }
  return R"({"hookSpecificOutput":{"hookEventName":"PermissionRequest","decision":{"behavior":"deny","message":"Denied via remotegate remote control"}}})";
}

Sleeper default_sleeper() {
  return [](const std::chrono::seconds duration) { std::this_thread::sleep_for(duration); };
}

TokenGenerator default_token_generator() {
  return []() { return security::generate_action_token(); };
}

GateClock default_gate_clock() {
  return [] { return std::chrono::steady_clock::now(); };
}

PermissionGate::PermissionGate(GateOptions options, HttpClient &client, Sleeper sleeper,
                               TokenGenerator tokens, GateClock clock)
    : options_(std::move(options)), client_(client),
      sleeper_(sleeper ? std::move(sleeper) : default_sleeper()),
      tokens_(tokens ? std::move(tokens) : default_token_generator()),
      clock_(clock ? std::move(clock) : default_gate_clock()) {
  options_.server_url = strip_trailing_slash(options_.server_url);
  options_.public_url = strip_trailing_slash(options_.public_url);
  if (options_.public_url.empty()) {
    options_.public_url = options_.server_url;
  }
  if (options_.poll_interval.count() <= 0) {
    options_.poll_interval = std::chrono::seconds(1);
  }
}

bool PermissionGate::register_action(const PermissionRequest &request, const std::string &token) {
  const std::string project = common::path_basename(request.cwd);
  std::ostringstream body;
  body << "{\"token\":" << common::json_string(token)
       << ",\"session_id\":" << common::json_string(request.session_id)
       << ",\"notification_type\":\"permission_prompt\""
       << ",\"message\":"
       << common::json_string(common::truncate_text(request.message, options_.max_message_bytes))
       << ",\"project\":" << common::json_string(project)
       << ",\"tool\":" << common::json_string(request.tool_name) << "}";

  const auto response =
      client_.post_json(options_.server_url + "/register-action", body.str(), kRequestTimeoutMs);
  if (!response.ok()) {
    observability::record_error(
        "gate", "register-action failed: " +
                    (response.network_error ? response.network_error_message
                                            : "status " + std::to_string(response.status)));
    return false;
  }
  return true;
}

std::optional<control::Verdict> PermissionGate::poll_decision(const std::string &token) {
  const auto response = client_.get(options_.server_url + "/decision/" + token, kRequestTimeoutMs);
  if (!response.ok()) {
    return std::nullopt;
  }
  auto parsed = common::json_parse_flat(response.body);
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return control::verdict_from_string(common::json_field(parsed.value(), "decision"));
}

std::optional<control::Verdict> PermissionGate::await_decision(const PermissionRequest &request,
                                                               std::ostream &notice) {
  const auto deadline = clock_() + options_.timeout;
  const auto health = client_.get(options_.server_url + "/health", kHealthTimeoutMs);
  if (!health.ok()) {
    return std::nullopt;
  }

  auto token = tokens_();
  if (!token.ok()) {
    observability::record_error("gate", "token generation failed: " + token.error());
    return std::nullopt;
  }
  last_token_ = token.value();
  if (!register_action(request, last_token_)) {
    return std::nullopt;
  }

  notice << "remotegate: waiting for remote decision on " << request.tool_name << "\n"
         << "  approve: " << options_.public_url << "/approve/" << last_token_ << "\n"
         << "  deny:    " << options_.public_url << "/deny/" << last_token_ << "\n"
         << "  details: " << options_.public_url << "/control/" << last_token_ << "\n";

  while (true) {
    if (const auto verdict = poll_decision(last_token_)) {
      return verdict;
    }
    const auto remaining = deadline - clock_();
    if (remaining <= std::chrono::steady_clock::duration::zero()) {
      return std::nullopt;
    }
    sleeper_(std::min(options_.poll_interval,
                      std::chrono::ceil<std::chrono::seconds>(remaining)));
  }
}

int PermissionGate::run(const std::string &payload, std::ostream &out, std::ostream &notice) {
  if (common::trim(payload).empty()) {
    return 0;
  }
  auto request = parse_permission_request(payload);
  if (!request.ok()) {
    observability::record_error("gate", request.error());
    return 0;
  }
  const auto verdict = await_decision(request.value(), notice);
  if (verdict.has_value()) {
    out << hook_decision_json(*verdict) << "\n";
  }
  return 0;
}

} // namespace remotegate::gate
