#pragma once

#include "memroute/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace memroute::retrieval {

/// Caps how many worker threads are alive at once, abandoned ones included.
class WorkerLimit {
public:
  explicit WorkerLimit(const std::size_t max_workers) : max_workers_(max_workers) {}

  [[nodiscard]] bool try_acquire() {
    std::size_t current = active_.load();
    while (current < max_workers_) {
      if (active_.compare_exchange_weak(current, current + 1)) {
        return true;
      }
    }
    return false;
  }

  void release() { active_.fetch_sub(1); }

  [[nodiscard]] std::size_t active() const { return active_.load(); }
  [[nodiscard]] std::size_t max_workers() const { return max_workers_; }

private:
  std::atomic<std::size_t> active_{0};
  std::size_t max_workers_;
};

/// A sub-operation running on its own thread that the caller may stop waiting for.
/// Unlike a `std::async` future, abandoning it never blocks: the thread keeps only
/// what its callable captured and finishes in the background.
template <typename T> class PendingCall {
public:
  using Callable = std::function<common::Result<T>()>;

  /// With a `limit`, a launch past its capacity fails at once instead of starting a thread.
  [[nodiscard]] static PendingCall launch(Callable fn,
                                          std::shared_ptr<WorkerLimit> limit = nullptr) {
    auto promise = std::make_shared<std::promise<common::Result<T>>>();
    PendingCall call;
    call.future_ = promise->get_future();
    if (limit != nullptr && !limit->try_acquire()) {
      promise->set_value(common::Result<T>::failure(
          "worker limit reached (" + std::to_string(limit->max_workers()) + " in flight)"));
      return call;
    }
    try {
      std::thread([promise, limit, fn = std::move(fn)]() {
        try {
          promise->set_value(fn());
        } catch (const std::exception &e) {
          promise->set_value(common::Result<T>::failure(e.what()));
        }
        if (limit != nullptr) {
          limit->release();
        }
      }).detach();
    } catch (const std::system_error &e) {
      if (limit != nullptr) {
        limit->release();
      }
      promise->set_value(
          common::Result<T>::failure(std::string("could not start worker: ") + e.what()));
    }
    return call;
  }

  /// The result, or nullopt when the deadline passed first.
  [[nodiscard]] std::optional<common::Result<T>>
  wait_until(const std::chrono::steady_clock::time_point deadline) {
    if (!future_.valid()) {
      return std::nullopt;
    }
    if (future_.wait_until(deadline) != std::future_status::ready) {
      return std::nullopt;
    }
    return future_.get();
  }

private:
  PendingCall() = default;

  std::future<common::Result<T>> future_;
};

} // namespace memroute::retrieval
