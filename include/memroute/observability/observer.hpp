#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace memroute::observability {

struct QueryClassifiedEvent {
  std::string category;
  std::string strategy;
  double confidence = 0.0;
  bool temporal = false;
};

struct RetrievalEvent {
  std::string path;
  std::size_t memories = 0;
  std::size_t facts = 0;
  std::size_t related = 0;
  std::size_t degraded_components = 0;
  std::chrono::milliseconds duration{0};
};

struct BackendDegradedEvent {
  std::string component;
  std::string reason;
};

struct FactStoredEvent {
  std::string user_id;
  std::string entity;
  std::string relationship;
  std::string outcome;
};

struct ContradictionResolvedEvent {
  std::string user_id;
  std::string entity;
  std::string kept_relationship;
  std::string dropped_relationship;
  bool near_tie = false;
};

struct FactsDeprecatedEvent {
  std::size_t examined = 0;
  std::size_t degraded = 0;
  std::size_t deprecated = 0;
  bool dry_run = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<QueryClassifiedEvent, RetrievalEvent, BackendDegradedEvent, FactStoredEvent,
                 ContradictionResolvedEvent, FactsDeprecatedEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ComponentLatencyMetric {
  std::string component;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<RequestLatencyMetric, ComponentLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace memroute::observability
