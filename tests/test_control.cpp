#include "test_framework.hpp"

#include "remotegate/control/action_store.hpp"
#include "remotegate/control/control_store.hpp"
#include "remotegate/control/decision_channel.hpp"
#include "remotegate/control/session_registry.hpp"
#include "remotegate/control/sweeper.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

remotegate::control::NewAction make_action(const std::string &token,
                                           const std::string &session_id = "s1") {
  remotegate::control::NewAction action;
  action.token = token;
  action.session_id = session_id;
  action.kind = remotegate::control::ActionKind::Permission;
  action.message = "Run ls?";
  action.tool = "Bash";
  return action;
}

} // namespace

void register_control_tests(std::vector<remotegate::tests::TestCase> &tests) {
  using remotegate::tests::require;
  namespace ctl = remotegate::control;
  namespace rt = remotegate::testing;

  tests.push_back({"control_kind_names_and_aliases", [] {
                     require(ctl::action_kind_from_string("permission_prompt") ==
                                 ctl::ActionKind::Permission,
                             "wire name");
                     require(ctl::action_kind_from_string("idle") == ctl::ActionKind::Idle,
                             "alias");
                     require(ctl::action_kind_from_string("Completion") ==
                                 ctl::ActionKind::Completion,
                             "case-insensitive alias");
                     require(ctl::action_kind_from_string("whatever") ==
                                 ctl::ActionKind::Unspecified,
                             "unknown maps to unspecified");
                     require(ctl::action_kind_to_string(ctl::ActionKind::Elicitation) ==
                                 "elicitation_dialog",
                             "round name");
                     require(ctl::verdict_from_string("deny") == ctl::Verdict::Deny, "verdict");
                     require(!ctl::verdict_from_string("maybe").has_value(), "bad verdict");
                   }});

  tests.push_back({"control_registry_overwrites_and_removes", [] {
                     rt::ManualClock clock;
                     ctl::SessionRegistry registry(24h);
                     registry.upsert("s1", "%1", "/work/a", clock.now());
                     registry.upsert("s1", "%2", "/work/b", clock.now());
                     const auto record = registry.get("s1");
                     require(record.has_value(), "session should exist");
                     require(record->terminal_handle == "%2", "second registration wins");
                     require(record->cwd == "/work/b", "cwd overwritten");
                     require(registry.size() == 1, "one record");

                     require(registry.remove("s1"), "first remove reports presence");
                     require(!registry.remove("s1"), "second remove is a no-op");
                     require(!registry.get("s1").has_value(), "removed");
                   }});

  tests.push_back({"control_registry_sweeps_after_retention", [] {
                     rt::ManualClock clock;
                     ctl::SessionRegistry registry(24h);
                     registry.upsert("old", "%1", "/a", clock.now());
                     clock.advance(23h);
                     registry.upsert("fresh", "%2", "/b", clock.now());
                     clock.advance(1h + 1s);
                     require(registry.sweep(clock.now()) == 1, "only the old session goes");
                     require(!registry.get("old").has_value(), "old swept");
                     require(registry.get("fresh").has_value(), "fresh kept");
                   }});

  tests.push_back({"control_action_consumed_exactly_once", [] {
                     rt::ManualClock clock;
                     ctl::ActionStore store(30min, 1024);
                     store.create(make_action("t1"), clock.now());
                     require(store.peek("t1", clock.now()).has_value(), "pending after create");
                     const auto first = store.consume("t1", clock.now());
                     require(first.has_value(), "first consume wins");
                     require(first->consumed, "returned record is marked consumed");
                     require(!store.consume("t1", clock.now()).has_value(),
                             "second consume is absent");
                     require(!store.peek("t1", clock.now()).has_value(),
                             "consumed records do not peek");
                   }});

  tests.push_back({"control_action_expires_after_ttl", [] {
                     rt::ManualClock clock;
                     ctl::ActionStore store(30min, 1024);
                     store.create(make_action("t1"), clock.now());
                     clock.advance(30min);
                     require(store.peek("t1", clock.now()).has_value(),
                             "exactly at the ttl the action is still live");
                     clock.advance(1s);
                     require(!store.peek("t1", clock.now()).has_value(), "expired");
                     require(!store.consume("t1", clock.now()).has_value(),
                             "expired cannot be consumed");
                   }});

  tests.push_back({"control_action_message_truncated", [] {
                     rt::ManualClock clock;
                     ctl::ActionStore store(30min, 1024);
                     auto action = make_action("t1");
                     action.message = std::string(5000, 'x');
                     store.create(action, clock.now());
                     const auto stored = store.peek("t1", clock.now());
                     require(stored.has_value(), "stored");
                     require(stored->message.size() == 1024, "message capped");
                     require(stored->message.substr(1021) == "...", "truncation marker");
                   }});

  tests.push_back({"control_action_sweep_drops_consumed_and_expired", [] {
                     rt::ManualClock clock;
                     ctl::ActionStore store(30min, 1024);
                     store.create(make_action("used"), clock.now());
                     store.create(make_action("stale"), clock.now());
                     clock.advance(20min);
                     store.create(make_action("live"), clock.now());
                     (void)store.consume("used", clock.now());
                     clock.advance(11min);
                     require(store.sweep(clock.now()) == 2, "used and stale removed");
                     require(store.size() == 1, "live remains");
                   }});

  tests.push_back({"control_concurrent_consume_has_one_winner", [] {
                     rt::ManualClock clock;
                     ctl::ActionStore store(30min, 1024);
                     store.create(make_action("race"), clock.now());
                     std::atomic<int> winners{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 16; ++i) {
                       threads.emplace_back([&]() {
                         if (store.consume("race", clock.now()).has_value()) {
                           ++winners;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(winners.load() == 1, "exactly one consumer must win, got " +
                                                      std::to_string(winners.load()));
                   }});

  tests.push_back({"control_decision_first_write_wins", [] {
                     rt::ManualClock clock;
                     ctl::DecisionChannel channel(30min);
                     require(!channel.get("t1").has_value(), "no decision yet");
                     require(channel.set("t1", ctl::Verdict::Allow, clock.now()), "first set");
                     require(!channel.set("t1", ctl::Verdict::Deny, clock.now()),
                             "second set refused");
                     require(channel.get("t1") == ctl::Verdict::Allow, "first verdict kept");
                     clock.advance(31min);
                     require(channel.sweep(clock.now()) == 1, "decision swept");
                     require(!channel.get("t1").has_value(), "gone after sweep");
                   }});

  tests.push_back({"control_resolve_verdict_sequence", [] {
                     rt::ManualClock clock;
                     ctl::ControlStore store({}, clock.source());
                     store.register_action(make_action("t1"));

                     const auto first = store.resolve_verdict("t1", ctl::Verdict::Allow);
                     require(first.outcome == ctl::VerdictOutcome::Resolved, "first resolves");
                     require(first.action.has_value(), "resolved carries the action");
                     require(first.verdict == ctl::Verdict::Allow, "verdict allow");

                     const auto second = store.resolve_verdict("t1", ctl::Verdict::Deny);
                     require(second.outcome == ctl::VerdictOutcome::AlreadyDecided,
                             "repeat click reports already decided");
                     require(second.verdict == ctl::Verdict::Allow, "recorded verdict reported");
                     require(!second.action.has_value(), "no action on repeat");
                     require(store.decision("t1") == ctl::Verdict::Allow,
                             "decision unchanged by the deny");

                     const auto unknown = store.resolve_verdict("nope", ctl::Verdict::Allow);
                     require(unknown.outcome == ctl::VerdictOutcome::Expired, "unknown expired");
                     require(!store.decision("nope").has_value(),
                             "no decision recorded for unknown token");
                   }});

  tests.push_back({"control_text_resolution_leaves_no_decision", [] {
                     rt::ManualClock clock;
                     ctl::ControlStore store({}, clock.source());
                     store.register_action(make_action("t1"));
                     require(store.resolve_text("t1").has_value(), "text consumes");
                     require(!store.resolve_text("t1").has_value(), "second text refused");
                     const auto verdict = store.resolve_verdict("t1", ctl::Verdict::Allow);
                     require(verdict.outcome == ctl::VerdictOutcome::Expired,
                             "approve after text is expired");
                     require(!store.decision("t1").has_value(), "no decision recorded");
                   }});

  tests.push_back({"control_concurrent_verdicts_record_one_decision", [] {
                     rt::ManualClock clock;
                     ctl::ControlStore store({}, clock.source());
                     store.register_action(make_action("t1"));
                     std::atomic<int> resolved{0};
                     std::atomic<int> mismatched{0};
                     std::atomic<int> expired{0};
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 8; ++i) {
                       const auto verdict = i % 2 == 0 ? ctl::Verdict::Allow : ctl::Verdict::Deny;
                       threads.emplace_back([&, verdict]() {
                         const auto result = store.resolve_verdict("t1", verdict);
                         if (result.outcome == ctl::VerdictOutcome::Resolved) {
                           ++resolved;
                         } else if (result.outcome == ctl::VerdictOutcome::Expired) {
                           ++expired;
                         }
                         if (result.verdict != store.decision("t1")) {
                           ++mismatched;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(resolved.load() == 1, "exactly one resolution");
                     require(expired.load() == 0, "losers see the recorded verdict, not expiry");
                     require(mismatched.load() == 0, "every caller reports the recorded verdict");
                     require(store.decision("t1").has_value(), "a decision is recorded");
                   }});

  tests.push_back({"control_store_sweep_reports_counts", [] {
                     rt::ManualClock clock;
                     ctl::ControlStore store({}, clock.source());
                     store.register_session("s1", "%1", "/a");
                     store.register_action(make_action("t1"));
                     (void)store.record_decision("t1", ctl::Verdict::Deny);
                     clock.advance(25h);
                     const auto report = store.sweep();
                     require(report.sessions == 1, "session swept");
                     require(report.actions == 1, "action swept");
                     require(report.decisions == 1, "decision swept");
                     const auto stats = store.stats();
                     require(stats.sessions == 0 && stats.actions == 0 && stats.decisions == 0,
                             "store empty after sweep");
                   }});

  tests.push_back({"control_sweeper_runs_in_background", [] {
                     rt::ManualClock clock;
                     ctl::ControlStore store({}, clock.source());
                     store.register_action(make_action("t1"));
                     clock.advance(31min);

                     ctl::Sweeper sweeper(store, 100ms);
                     sweeper.start();
                     require(sweeper.is_running(), "sweeper running");
                     const auto deadline = std::chrono::steady_clock::now() + 3s;
                     while (sweeper.runs() == 0 && std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(20ms);
                     }
                     sweeper.stop();
                     require(!sweeper.is_running(), "sweeper stopped");
                     require(sweeper.runs() > 0, "sweeper should have run");
                     require(store.stats().actions == 0, "expired action swept");
                   }});
}
