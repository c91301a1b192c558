#include "memroute/query/temporal_detector.hpp"

#include "memroute/common/text.hpp"

#include <algorithm>
#include <regex>

namespace memroute::query {

TemporalQueryDetector::TemporalQueryDetector(config::TemporalConfig config)
    : config_(config),
      first_patterns_{"very first", "first time", "when did we start", "at first", "first",
                      "earliest",   "initial",    "beginning",         "started",  "began"},
      last_patterns_{"most recent", "just now", "moments ago", "last time", "latest",
                     "recently",    "recent",   "last"},
      all_time_markers_{"ever", "all time", "of all time", "ever since"} {}

bool TemporalQueryDetector::detect_specific(const std::string &normalized,
                                            const common::UnixSeconds now,
                                            TemporalDetection &out) const {
  out.window.direction = TemporalDirection::Newest;
  out.window.limit = config_.newest_limit;
  out.window.scope = TemporalScope::Range;
  out.window.until = now;

  if (common::contains_phrase(normalized, "yesterday")) {
    const common::UnixSeconds today = common::utc_day_start(now);
    out.window.since = today - common::kSecondsPerDay;
    out.window.until = today - 1;
    out.matched = "yesterday";
    return true;
  }
  if (common::contains_phrase(normalized, "this morning") ||
      common::contains_phrase(normalized, "today")) {
    out.window.since = now - static_cast<common::UnixSeconds>(config_.session_hours) *
                                 common::kSecondsPerHour;
    out.matched = common::contains_phrase(normalized, "today") ? "today" : "this morning";
    return true;
  }

  static const std::regex kRelative(R"((?:^| )(\d{1,6}) (hour|hours|day|days) ago)");
  std::smatch match;
  if (std::regex_search(normalized, match, kRelative)) {
    const long long amount = std::stoll(match[1].str());
    const common::UnixSeconds unit =
        match[2].str().starts_with("hour") ? common::kSecondsPerHour : common::kSecondsPerDay;
    out.window.since = now - (amount + 1) * unit;
    out.window.until = now - std::max(amount - 1, 0LL) * unit;
    out.matched = match[1].str() + " " + match[2].str() + " ago";
    return true;
  }

  if (common::contains_phrase(normalized, "last week")) {
    out.window.since = now - 7 * common::kSecondsPerDay;
    out.matched = "last week";
    return true;
  }
  if (common::contains_phrase(normalized, "ago")) {
    out.window.scope = TemporalScope::AllTime;
    out.window.since.reset();
    out.window.until.reset();
    out.matched = "ago";
    return true;
  }
  return false;
}

TemporalDetection TemporalQueryDetector::detect(const std::string &text,
                                                const common::UnixSeconds now) const {
  const std::string normalized = common::normalize_text(text);
  TemporalDetection detection;

  for (const auto &pattern : first_patterns_) {
    if (!common::contains_phrase(normalized, pattern)) {
      continue;
    }
    detection.is_temporal = true;
    detection.matched = pattern;
    detection.window.direction = TemporalDirection::Oldest;
    detection.window.limit = config_.oldest_limit;
    const bool all_time =
        std::any_of(all_time_markers_.begin(), all_time_markers_.end(),
                    [&normalized](const auto &marker) {
                      return common::contains_phrase(normalized, marker);
                    });
    if (all_time) {
      detection.window.scope = TemporalScope::AllTime;
    } else {
      detection.window.scope = TemporalScope::Session;
      detection.window.since = now - static_cast<common::UnixSeconds>(config_.session_hours) *
                                         common::kSecondsPerHour;
      detection.window.until = now;
    }
    return detection;
  }

  TemporalDetection specific;
  if (detect_specific(normalized, now, specific)) {
    specific.is_temporal = true;
    return specific;
  }

  for (const auto &pattern : last_patterns_) {
    if (!common::contains_phrase(normalized, pattern)) {
      continue;
    }
    detection.is_temporal = true;
    detection.matched = pattern;
    detection.window.direction = TemporalDirection::Newest;
    detection.window.scope = TemporalScope::Session;
    detection.window.limit = config_.newest_limit;
    detection.window.since = now - static_cast<common::UnixSeconds>(config_.recent_hours) *
                                       common::kSecondsPerHour;
    detection.window.until = now;
    return detection;
  }
  return detection;
}

memory::ChronologicalRange to_chronological_range(const TemporalWindow &window) {
  memory::ChronologicalRange range;
  range.since = window.since;
  range.until = window.until;
  range.ascending = window.direction == TemporalDirection::Oldest;
  range.limit = window.limit;
  return range;
}

} // namespace memroute::query
