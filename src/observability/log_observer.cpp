#include "memroute/observability/log_observer.hpp"

#include <iostream>
#include <sstream>
#include <type_traits>

namespace memroute::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        std::ostringstream line;
        if constexpr (std::is_same_v<T, QueryClassifiedEvent>) {
          line << "query.classified category=" << evt.category << " strategy=" << evt.strategy
               << " confidence=" << evt.confidence << " temporal=" << (evt.temporal ? "true" : "false");
          log_line("DEBUG", line.str());
        } else if constexpr (std::is_same_v<T, RetrievalEvent>) {
          line << "retrieval.done path=" << evt.path << " memories=" << evt.memories
               << " facts=" << evt.facts << " related=" << evt.related
               << " degraded=" << evt.degraded_components
               << " duration_ms=" << evt.duration.count();
          log_line("INFO", line.str());
        } else if constexpr (std::is_same_v<T, BackendDegradedEvent>) {
          log_line("WARN", "backend.degraded component=" + evt.component + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, FactStoredEvent>) {
          log_line("INFO", "fact.stored user=" + evt.user_id + " entity=" + evt.entity +
                               " relationship=" + evt.relationship + " outcome=" + evt.outcome);
        } else if constexpr (std::is_same_v<T, ContradictionResolvedEvent>) {
          line << "fact.contradiction user=" << evt.user_id << " entity=" << evt.entity
               << " kept=" << evt.kept_relationship << " dropped=" << evt.dropped_relationship
               << " near_tie=" << (evt.near_tie ? "true" : "false");
          log_line(evt.near_tie ? "WARN" : "INFO", line.str());
        } else if constexpr (std::is_same_v<T, FactsDeprecatedEvent>) {
          line << "facts.deprecation examined=" << evt.examined << " degraded=" << evt.degraded
               << " deprecated=" << evt.deprecated << " dry_run=" << (evt.dry_run ? "true" : "false");
          log_line("INFO", line.str());
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ComponentLatencyMetric>) {
          log_line("DEBUG", "metric.component_latency_ms component=" + m.component +
                                " value=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace memroute::observability
