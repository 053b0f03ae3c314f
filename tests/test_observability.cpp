#include "test_framework.hpp"

#include "remotegate/control/control_store.hpp"
#include "remotegate/gateway/server.hpp"
#include "remotegate/observability/factory.hpp"
#include "remotegate/observability/global.hpp"
#include "remotegate/observability/log_observer.hpp"
#include "remotegate/observability/multi_observer.hpp"
#include "remotegate/observability/noop_observer.hpp"
#include "remotegate/security/token.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace obs = remotegate::observability;
namespace rt = remotegate::testing;

class CountingObserver final : public obs::IObserver {
public:
  void record_event(const obs::ObserverEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }
  void record_metric(const obs::ObserverMetric &metric) override {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.push_back(metric);
  }
  void flush() override { ++flushes_; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

  template <typename T> [[nodiscard]] std::size_t count_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        events_.begin(), events_.end(),
        [](const obs::ObserverEvent &e) { return std::holds_alternative<T>(e); }));
  }

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for (const auto &e : events_) {
      if (const auto *typed = std::get_if<T>(&e)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  [[nodiscard]] std::vector<obs::RequestLatencyMetric> latencies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<obs::RequestLatencyMetric> out;
    for (const auto &m : metrics_) {
      if (const auto *typed = std::get_if<obs::RequestLatencyMetric>(&m)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  int flushes_ = 0;

private:
  mutable std::mutex mutex_;
  std::vector<obs::ObserverEvent> events_;
  std::vector<obs::ObserverMetric> metrics_;
};

// Installs an observer for the duration of a test.
class ScopedObserver {
public:
  explicit ScopedObserver(std::unique_ptr<obs::IObserver> observer) {
    obs::set_global_observer(std::move(observer));
  }
  ~ScopedObserver() { obs::set_global_observer(nullptr); }
};

} // namespace

void register_observability_tests(std::vector<remotegate::tests::TestCase> &tests) {
  using remotegate::tests::require;
  using rt::contains;

  tests.push_back({"observability_log_observer_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver log(out);
                     log.record_event(obs::ServerStartEvent{"127.0.0.1", 9876});
                     log.record_event(obs::ActionRegisteredEvent{
                         "0123456789abcdef0123456789abcdef", "s1", "permission_prompt"});
                     log.record_event(obs::DispatchEvent{"%3", "session_not_found", "pane gone"});
                     log.record_event(obs::ErrorEvent{"server", "bind failed"});
                     log.flush();

                     const auto text = out.str();
                     require(contains(text, "[INFO] server.start listening on http://127.0.0.1:9876\n"),
                             "start line: " + text);
                     require(contains(text, "token=01234567... session=s1"),
                             "token shortened");
                     require(!contains(text, "0123456789abcdef0123456789abcdef"),
                             "full token never logged");
                     require(contains(text, "[WARN] dispatch handle=%3 outcome=session_not_found "
                                            "detail=pane gone"),
                             "missed dispatch is a warning");
                     require(contains(text, "[ERROR] server: bind failed"), "error line");
                   }});

  tests.push_back({"observability_log_observer_metrics", [] {
                     std::ostringstream out;
                     obs::LogObserver log(out);
                     log.record_metric(obs::RequestLatencyMetric{
                         "GET /approve", 200, std::chrono::milliseconds(4)});
                     log.record_metric(obs::StoreSizeMetric{1, 2, 3});
                     require(contains(out.str(), "metric.request route=GET /approve status=200 "
                                                 "latency_ms=4"),
                             "latency line");
                     require(contains(out.str(), "metric.store sessions=1 actions=2 decisions=3"),
                             "store line");
                   }});

  tests.push_back({"observability_multi_observer_fans_out", [] {
                     auto first = std::make_unique<CountingObserver>();
                     auto second = std::make_unique<CountingObserver>();
                     auto *a = first.get();
                     auto *b = second.get();
                     obs::MultiObserver multi;
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers skipped");
                     multi.record_event(obs::ServerStopEvent{});
                     multi.record_metric(obs::StoreSizeMetric{});
                     multi.flush();
                     require(a->count_events<obs::ServerStopEvent>() == 1, "first got event");
                     require(b->count_events<obs::ServerStopEvent>() == 1, "second got event");
                     require(a->flushes_ == 1 && b->flushes_ == 1, "flush forwarded");
                   }});

  tests.push_back({"observability_factory_backends", [] {
                     auto config = rt::quiet_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none");
                     config.observability.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log");
                     config.observability.backend = "log,none";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list");
                     require(static_cast<obs::MultiObserver *>(multi.get())->size() == 2,
                             "two members");
                     config.observability.backend = "log,";
                     require(obs::create_observer(config)->name() == "log",
                             "single-member list collapses to that member");
                   }});

  tests.push_back({"observability_record_without_observer_is_noop", [] {
                     obs::set_global_observer(nullptr);
                     require(obs::get_global_observer() == nullptr, "cleared");
                     obs::record_error("test", "nobody listening");
                     obs::record_sweep(1, 2, 3);
                   }});

  tests.push_back({"observability_server_reports_lifecycle", [] {
                     auto counting = std::make_unique<CountingObserver>();
                     auto *seen = counting.get();
                     ScopedObserver scope(std::move(counting));

                     rt::ManualClock clock;
                     const auto config = rt::quiet_config();
                     remotegate::control::ControlStore store({}, clock.source());
                     rt::RecordingDispatcher dispatcher;
                     remotegate::gateway::ControlServer server(config, store, dispatcher);

                     (void)server.dispatch_for_test(rt::make_request(
                         "POST", "/session", R"({"session_id":"s1","terminal_handle":"%1"})"));
                     (void)server.dispatch_for_test(rt::make_request(
                         "POST", "/register-action",
                         R"({"token":"secret-token-123","session_id":"s1","notification_type":"idle_prompt"})"));
                     (void)server.dispatch_for_test(
                         rt::make_request("GET", "/approve/secret-token-123"));

                     require(seen->count_events<obs::SessionEvent>() == 1, "session event");
                     require(seen->count_events<obs::ActionRegisteredEvent>() == 1,
                             "registration event");
                     require(seen->count_events<obs::DispatchEvent>() == 1, "dispatch event");
                     const auto resolutions = seen->events_of<obs::ResolutionEvent>();
                     require(resolutions.size() == 1 && resolutions[0].via == "allow",
                             "resolution via allow");

                     const auto latencies = seen->latencies();
                     require(latencies.size() == 3, "one latency sample per request");
                     for (const auto &sample : latencies) {
                       require(!contains(sample.route, "secret-token"), "route label hides token");
                     }
                   }});

  tests.push_back({"security_action_tokens_are_random_hex", [] {
                     const auto a = remotegate::security::generate_action_token();
                     const auto b = remotegate::security::generate_action_token();
                     require(a.ok() && b.ok(), "token generation");
                     require(a.value().size() == 32, "128 bits as hex");
                     require(a.value().find_first_not_of("0123456789abcdef") == std::string::npos,
                             "lower-case hex");
                     require(a.value() != b.value(), "tokens differ");
                     const auto short_hex = remotegate::security::random_hex(4);
                     require(short_hex.ok() && short_hex.value().size() == 8, "byte count");
                   }});
}
