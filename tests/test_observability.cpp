#include "test_framework.hpp"

#include "memroute/config/schema.hpp"
#include "memroute/observability/factory.hpp"
#include "memroute/observability/global.hpp"
#include "memroute/observability/log_observer.hpp"
#include "memroute/observability/multi_observer.hpp"
#include "memroute/observability/noop_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
};

class CountingObserver final : public memroute::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const memroute::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const memroute::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<memroute::tests::TestCase> &tests) {
  using memroute::tests::require;
  namespace ob = memroute::observability;
  namespace mt = memroute::testing;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_degraded("facts", "timeout");
                     ob::record_metric(ob::RequestLatencyMetric{.latency = std::chrono::milliseconds(4)});

                     // Reset to prevent dangling references during static destruction
                     ob::set_global_observer(nullptr);
                     ob::record_error("router", "ignored without an observer");
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     multi->add(std::make_unique<CountingObserver>(&one));
                     multi->add(std::make_unique<CountingObserver>(&two));
                     require(multi->size() == 2, "multi should hold two observers");

                     multi->record_event(ob::ErrorEvent{.component = "x", .message = "y"});
                     multi->record_metric(ob::ComponentLatencyMetric{
                         .component = "facts", .latency = std::chrono::milliseconds(3)});
                     require(one.events == 1 && two.events == 1, "events not forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metrics not forwarded");
                   }});

  tests.push_back({"observability_log_observer_lines", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out);
                     observer.record_event(ob::QueryClassifiedEvent{
                         .category = "factual", .strategy = "content_only", .confidence = 1.0,
                         .temporal = false});
                     observer.record_event(
                         ob::BackendDegradedEvent{.component = "facts", .reason = "timed out"});
                     observer.record_event(ob::ContradictionResolvedEvent{
                         .user_id = "u1",
                         .entity = "pizza",
                         .kept_relationship = "dislikes",
                         .dropped_relationship = "likes",
                         .near_tie = true});
                     observer.record_metric(ob::ComponentLatencyMetric{
                         .component = "vector_fusion", .latency = std::chrono::milliseconds(12)});
                     observer.flush();

                     const std::string text = out.str();
                     require(text.find("[DEBUG] query.classified category=factual") !=
                                 std::string::npos,
                             "classification line missing");
                     require(text.find("[WARN] backend.degraded component=facts reason=timed out") !=
                                 std::string::npos,
                             "degraded line missing");
                     require(text.find("[WARN] fact.contradiction") != std::string::npos,
                             "near ties should log as warnings");
                     require(text.find("component=vector_fusion value=12") != std::string::npos,
                             "latency metric missing");
                   }});

  tests.push_back({"observability_factory_backends", [] {
                     memroute::config::Config config;
                     config.observability.backend = "none";
                     require(ob::create_observer(config)->name() == "noop", "none should be noop");
                     config.observability.backend = "LOG";
                     require(ob::create_observer(config)->name() == "log", "log backend expected");
                     config.observability.backend = "log, none";
                     require(ob::create_observer(config)->name() == "multi",
                             "comma list should build a multi observer");
                   }});

  tests.push_back({"observability_helpers_reach_installed_observer", [] {
                     mt::ObserverScope scope;
                     ob::record_degraded("emotion_port", "timeout");
                     ob::record_component_latency("facts", std::chrono::milliseconds(7));
                     ob::record_error("router", "all components failed");

                     const auto degraded = scope.log().events_of<ob::BackendDegradedEvent>();
                     require(degraded.size() == 1 && degraded.front().component == "emotion_port",
                             "degraded event not captured");
                     require(scope.log().events_of<ob::ErrorEvent>().size() == 1,
                             "error event not captured");
                     require(scope.log().metrics().size() == 1, "latency metric not captured");
                   }});
}
