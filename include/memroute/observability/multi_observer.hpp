#pragma once

#include "memroute/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace memroute::observability {

/// Fans out to every child. Children see one call at a time even when router
/// workers record concurrently.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace memroute::observability
