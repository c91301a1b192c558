#pragma once

#include "memroute/config/schema.hpp"
#include "memroute/query/types.hpp"

#include <string>
#include <vector>

namespace memroute::query {

/// Spots chronological intent ("first", "last", "yesterday") and turns it into a
/// retrieval window. Oldest-first windows always read in ascending timestamp order.
class TemporalQueryDetector {
public:
  explicit TemporalQueryDetector(config::TemporalConfig config = {});

  /// Window bounds are computed from `now`; the same (text, now) always yields the same window.
  [[nodiscard]] TemporalDetection detect(const std::string &text, common::UnixSeconds now) const;

  [[nodiscard]] const config::TemporalConfig &config() const { return config_; }

private:
  [[nodiscard]] bool detect_specific(const std::string &normalized, common::UnixSeconds now,
                                     TemporalDetection &out) const;

  config::TemporalConfig config_;
  std::vector<std::string> first_patterns_;
  std::vector<std::string> last_patterns_;
  std::vector<std::string> all_time_markers_;
};

/// Converts a detected window into a chronological store read.
[[nodiscard]] memory::ChronologicalRange to_chronological_range(const TemporalWindow &window);

} // namespace memroute::query
