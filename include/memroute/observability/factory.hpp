#pragma once

#include "memroute/config/schema.hpp"
#include "memroute/observability/observer.hpp"

#include <memory>

namespace memroute::observability {

/// `none` / `noop`, `log`, or a comma-separated combination.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace memroute::observability
