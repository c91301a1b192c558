#pragma once

#include "memroute/observability/observer.hpp"

#include <memory>

namespace memroute::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_degraded(const std::string &component, const std::string &reason);
void record_component_latency(const std::string &component, std::chrono::milliseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace memroute::observability
