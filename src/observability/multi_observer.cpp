#include "memroute/observability/multi_observer.hpp"

namespace memroute::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  observers_.push_back(std::move(observer));
}

std::size_t MultiObserver::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return observers_.size();
}

void MultiObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace memroute::observability
