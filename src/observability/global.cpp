#include "memroute/observability/global.hpp"

#include <mutex>

namespace memroute::observability {

namespace {

std::mutex g_observer_mutex;
// Recorders hold their own reference, so a replaced observer outlives in-flight calls.
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (const auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_degraded(const std::string &component, const std::string &reason) {
  record_event(BackendDegradedEvent{.component = component, .reason = reason});
}

void record_component_latency(const std::string &component,
                              const std::chrono::milliseconds latency) {
  record_metric(ComponentLatencyMetric{.component = component, .latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace memroute::observability
