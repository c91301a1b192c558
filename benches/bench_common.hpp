#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace memroute::bench {

/// Times each iteration so tail latency can be compared with the router's budgets.
inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  if (iterations <= 0) {
    return;
  }
  std::vector<std::int64_t> samples;
  samples.reserve(static_cast<std::size_t>(iterations));
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    const auto before = std::chrono::steady_clock::now();
    fn();
    samples.push_back(std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::steady_clock::now() - before)
                          .count());
  }
  const auto total = std::chrono::duration_cast<std::chrono::microseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();
  std::sort(samples.begin(), samples.end());
  const auto percentile = [&samples](const double p) {
    const auto index = static_cast<std::size_t>(p * static_cast<double>(samples.size() - 1));
    return samples[index];
  };
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << " p50_us=" << percentile(0.50)
            << " p99_us=" << percentile(0.99) << "\n";
}

} // namespace memroute::bench
