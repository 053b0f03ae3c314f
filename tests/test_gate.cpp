#include "test_framework.hpp"

#include "remotegate/common/result.hpp"
#include "remotegate/control/control_store.hpp"
#include "remotegate/gate/permission_gate.hpp"
#include "remotegate/gateway/server.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <functional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
namespace ctl = remotegate::control;
namespace gate = remotegate::gate;
namespace gw = remotegate::gateway;
namespace rt = remotegate::testing;

constexpr const char *kBase = "http://gate.test";

// Hands requests straight to an in-process ControlServer.
class LoopbackClient final : public gate::HttpClient {
public:
  explicit LoopbackClient(gw::ControlServer &server) : server_(server) {}

  gate::HttpResponse get(const std::string &url, std::uint64_t) override {
    return forward("GET", url, "");
  }

  gate::HttpResponse post_json(const std::string &url, const std::string &body,
                               std::uint64_t) override {
    return forward("POST", url, body);
  }

  void set_offline(bool offline) { offline_ = offline; }
  void set_latency_hook(std::function<void()> hook) { latency_hook_ = std::move(hook); }
  [[nodiscard]] const std::vector<std::string> &log() const { return log_; }

private:
  gate::HttpResponse forward(const std::string &method, const std::string &url,
                             const std::string &body) {
    const std::string path = url.substr(std::string(kBase).size());
    log_.push_back(method + " " + path);
    if (latency_hook_) {
      latency_hook_();
    }
    gate::HttpResponse out;
    if (offline_) {
      out.network_error = true;
      out.network_error_message = "connection refused";
      return out;
    }
    const auto resp = server_.dispatch_for_test(rt::make_request(method, path, body));
    out.status = static_cast<std::uint16_t>(resp.status);
    out.body = resp.body;
    return out;
  }

  gw::ControlServer &server_;
  bool offline_ = false;
  std::function<void()> latency_hook_;
  std::vector<std::string> log_;
};

struct GateFixture {
  rt::ManualClock store_clock;
  remotegate::config::Config config = rt::quiet_config();
  ctl::ControlStore store;
  rt::RecordingDispatcher dispatcher;
  gw::ControlServer server;
  LoopbackClient client;
  int sleeps = 0;
  std::chrono::steady_clock::time_point fake_now{};

  GateFixture() : store({}, store_clock.source()), server(config, store, dispatcher), client(server) {}

  gate::GateOptions options() const {
    gate::GateOptions opts;
    opts.server_url = std::string(kBase) + "/";
    opts.public_url = "https://phone.example";
    return opts;
  }

  gate::GateClock clock() {
    return [this] { return fake_now; };
  }

  // Moves the fake clock forward by each wait before running `inner`.
  gate::Sleeper advancing(std::function<void(std::chrono::seconds)> inner) {
    return [this, inner = std::move(inner)](std::chrono::seconds interval) {
      fake_now += interval;
      inner(interval);
    };
  }

  // Sleeper that clicks a link on the first wait.
  gate::Sleeper clicking(const std::string &verb) {
    return [this, verb](std::chrono::seconds interval) {
      fake_now += interval;
      ++sleeps;
      if (sleeps == 1) {
        (void)server.dispatch_for_test(rt::make_request("GET", "/" + verb + "/gate-token"));
      }
    };
  }

  static gate::TokenGenerator fixed_token() {
    return [] { return remotegate::common::Result<std::string>::success("gate-token"); };
  }
};

const std::string kPayload =
    R"({"session_id":"s1","tool_name":"Bash","cwd":"/home/dev/webapp",)"
    R"("tool_input":{"command":"npm test","description":"Run the suite"}})";

} // namespace

void register_gate_tests(std::vector<remotegate::tests::TestCase> &tests) {
  using remotegate::tests::require;
  using rt::contains;

  tests.push_back({"gate_approve_writes_allow_decision", [] {
                     GateFixture fx;
                     gate::PermissionGate gate(fx.options(), fx.client, fx.clicking("approve"),
                                               GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     require(gate.run(kPayload, out, notice) == 0, "exit code");
                     require(out.str() == gate::hook_decision_json(ctl::Verdict::Allow) + "\n",
                             "allow decision written: " + out.str());
                     require(fx.sleeps == 1, "one wait before the decision appeared");
                     require(contains(notice.str(), "https://phone.example/approve/gate-token"),
                             "approve link uses public url");
                     require(contains(notice.str(), "https://phone.example/control/gate-token"),
                             "details link");

                     const auto &log = fx.client.log();
                     require(log.size() >= 3 && log[0] == "GET /health", "health probed first");
                     require(log[1] == "POST /register-action", "then registered");
                     require(log[2] == "GET /decision/gate-token", "then polled");
                   }});

  tests.push_back({"gate_registration_carries_project_and_message", [] {
                     GateFixture fx;
                     gate::PermissionGate gate(fx.options(), fx.client, fx.clicking("deny"),
                                               GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     (void)gate.run(kPayload, out, notice);
                     const auto page =
                         fx.server.dispatch_for_test(rt::make_request("GET", "/control/gate-token"));
                     // The token is consumed by the deny, so only the decision remains.
                     require(page.status == 410, "consumed after deny");
                     require(out.str() == gate::hook_decision_json(ctl::Verdict::Deny) + "\n",
                             "deny decision written");
                     require(contains(out.str(), "Denied via remotegate remote control"),
                             "deny message");
                   }});

  tests.push_back({"gate_registered_action_visible_before_decision", [] {
                     GateFixture fx;
                     std::string page_body;
                     int sleeps = 0;
                     auto sleeper = [&](std::chrono::seconds) {
                       ++sleeps;
                       if (sleeps == 1) {
                         page_body = fx.server
                                         .dispatch_for_test(
                                             rt::make_request("GET", "/control/gate-token"))
                                         .body;
                         (void)fx.server.dispatch_for_test(
                             rt::make_request("GET", "/approve/gate-token"));
                       }
                     };
                     gate::PermissionGate gate(fx.options(), fx.client, fx.advancing(sleeper),
                                               GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     (void)gate.run(kPayload, out, notice);
                     require(contains(page_body, "webapp"), "project from cwd basename");
                     require(contains(page_body, "Run the suite"), "tool description shown");
                     require(contains(page_body, "$ npm test"), "command shown");
                   }});

  tests.push_back({"gate_times_out_silently", [] {
                     GateFixture fx;
                     int sleeps = 0;
                     auto sleeper = [&](std::chrono::seconds interval) {
                       require(interval == 2s, "poll interval");
                       ++sleeps;
                     };
                     gate::PermissionGate gate(fx.options(), fx.client, fx.advancing(sleeper),
                                               GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     require(gate.run(kPayload, out, notice) == 0, "exit code");
                     require(out.str().empty(), "no decision on timeout");
                     require(sleeps == 30, "60s budget at 2s intervals");
                     require(fx.store.peek_action("gate-token").has_value(),
                             "action left for the local prompt");
                   }});

  tests.push_back({"gate_unreachable_server_defers", [] {
                     GateFixture fx;
                     fx.client.set_offline(true);
                     int sleeps = 0;
                     gate::PermissionGate gate(
                         fx.options(), fx.client,
                         fx.advancing([&](std::chrono::seconds) { ++sleeps; }),
                         GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     require(gate.run(kPayload, out, notice) == 0, "exit code");
                     require(out.str().empty(), "no output");
                     require(notice.str().empty(), "no links printed");
                     require(fx.client.log().size() == 1, "only the health probe");
                     require(sleeps == 0, "no polling");
                   }});

  tests.push_back({"gate_invalid_payload_defers", [] {
                     GateFixture fx;
                     gate::PermissionGate gate(fx.options(), fx.client, fx.clicking("approve"),
                                               GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     require(gate.run("not json", out, notice) == 0, "exit code");
                     require(gate.run("   ", out, notice) == 0, "empty payload exit code");
                     require(out.str().empty(), "no output");
                     require(fx.client.log().empty(), "no requests");
                   }});

  tests.push_back({"gate_zero_poll_interval_is_clamped", [] {
                     GateFixture fx;
                     auto opts = fx.options();
                     opts.timeout = 3s;
                     opts.poll_interval = 0s;
                     int sleeps = 0;
                     gate::PermissionGate gate(opts, fx.client,
                                               fx.advancing([&](std::chrono::seconds interval) {
                                                 require(interval == 1s, "clamped to 1s");
                                                 ++sleeps;
                                               }),
                                               GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     (void)gate.run(kPayload, out, notice);
                     require(sleeps == 3, "three one-second waits");
                   }});

  tests.push_back({"gate_slow_requests_count_against_deadline", [] {
                     GateFixture fx;
                     fx.client.set_latency_hook([&fx] { fx.fake_now += 2s; });
                     int sleeps = 0;
                     gate::PermissionGate gate(
                         fx.options(), fx.client,
                         fx.advancing([&](std::chrono::seconds) { ++sleeps; }),
                         GateFixture::fixed_token(), fx.clock());
                     const auto started = fx.fake_now;
                     std::ostringstream out;
                     std::ostringstream notice;
                     require(gate.run(kPayload, out, notice) == 0, "exit code");
                     require(out.str().empty(), "no decision");
                     const auto waited = fx.fake_now - started;
                     require(waited <= 64s, "deadline holds despite slow requests");
                     require(sleeps < 30, "fewer waits than an idle server allows");
                   }});

  tests.push_back({"gate_final_wait_is_trimmed_to_deadline", [] {
                     GateFixture fx;
                     auto opts = fx.options();
                     opts.timeout = 5s;
                     opts.poll_interval = 2s;
                     std::vector<std::chrono::seconds> waits;
                     gate::PermissionGate gate(
                         opts, fx.client,
                         fx.advancing([&](std::chrono::seconds interval) { waits.push_back(interval); }),
                         GateFixture::fixed_token(), fx.clock());
                     std::ostringstream out;
                     std::ostringstream notice;
                     (void)gate.run(kPayload, out, notice);
                     require(waits.size() == 3, "three waits");
                     require(waits[0] == 2s && waits[1] == 2s && waits[2] == 1s,
                             "last wait ends at the deadline");
                   }});

  tests.push_back({"gate_parse_permission_request", [] {
                     const auto parsed = gate::parse_permission_request(kPayload);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().session_id == "s1", "session id");
                     require(parsed.value().tool_name == "Bash", "tool");
                     require(parsed.value().message == "Run the suite\n\n$ npm test",
                             "message from tool input: " + parsed.value().message);

                     const auto bare = gate::parse_permission_request(R"({"session_id":"s2"})");
                     require(bare.ok() && bare.value().tool_name == "Unknown", "default tool");

                     const auto explicit_message = gate::parse_permission_request(
                         R"({"tool_name":"Bash","message":"Allow this?","tool_input":{"command":"x"}})");
                     require(explicit_message.value().message == "Allow this?", "message wins");
                     require(!gate::parse_permission_request("[1,2]").ok(), "non-object rejected");
                   }});

  tests.push_back({"gate_describe_tool_request", [] {
                     require(gate::describe_tool_request("Bash", R"({"command":"ls -la"})") ==
                                 "$ ls -la",
                             "bash");
                     require(gate::describe_tool_request("Write", R"({"file_path":"/a.txt"})") ==
                                 "Create/overwrite file:\n/a.txt",
                             "write");
                     require(gate::describe_tool_request(
                                 "Edit", R"({"file_path":"/a.cpp","old_string":"int x;"})") ==
                                 "Edit file: /a.cpp\nReplace: int x;",
                             "edit");
                     require(gate::describe_tool_request("WebFetch", "{}") ==
                                 "Fetch URL:\nunknown",
                             "webfetch fallback");
                     require(gate::describe_tool_request(
                                 "Task", R"({"subagent_type":"review","description":"check"})") ==
                                 "Launch review agent: check",
                             "task");
                     require(gate::describe_tool_request(
                                 "mcp__db__query", R"({"sql":"select 1","db":"main"})") ==
                                 "MCP tool: mcp__db__query\nsql: select 1\ndb: main",
                             "mcp tool");
                     require(gate::describe_tool_request("Glob", R"({"pattern":"*.cpp"})") ==
                                 "Glob: pattern: *.cpp",
                             "generic tool");
                   }});

  tests.push_back({"gate_hook_decision_json_shapes", [] {
                     const auto allow = gate::hook_decision_json(ctl::Verdict::Allow);
                     require(contains(allow, R"("hookEventName":"PermissionRequest")"), "event");
                     require(contains(allow, R"("behavior":"allow")"), "allow behavior");
                     require(!contains(allow, "message"), "allow has no message");
                     const auto deny = gate::hook_decision_json(ctl::Verdict::Deny);
                     require(contains(deny, R"("behavior":"deny")"), "deny behavior");
                   }});
}
