#include "test_framework.hpp"

#include "memroute/query/temporal_detector.hpp"

namespace {

namespace q = memroute::query;
using memroute::common::kSecondsPerDay;
using memroute::common::kSecondsPerHour;

constexpr memroute::common::UnixSeconds kNow = 1700000000;

} // namespace

void register_temporal_tests(std::vector<memroute::tests::TestCase> &tests) {
  using memroute::tests::require;

  tests.push_back({"temporal_first_reads_session_oldest_first", [] {
                     const q::TemporalQueryDetector detector;
                     const auto detection =
                         detector.detect("What was the first thing we discussed?", kNow);
                     require(detection.is_temporal, "first should be temporal");
                     require(detection.matched == "first", "matched pattern mismatch");
                     require(detection.window.direction == q::TemporalDirection::Oldest,
                             "expected oldest");
                     require(detection.window.scope == q::TemporalScope::Session,
                             "expected session scope");
                     require(detection.window.limit == 3, "oldest limit mismatch");
                     require(detection.window.since == kNow - 4 * kSecondsPerHour,
                             "session start mismatch");
                     require(detection.window.until == kNow, "session end mismatch");

                     const auto range = q::to_chronological_range(detection.window);
                     require(range.ascending, "oldest reads must be ascending");
                     require(range.limit == 3 && range.since == detection.window.since,
                             "range should mirror the window");
                   }});

  tests.push_back({"temporal_ever_widens_to_all_time", [] {
                     const q::TemporalQueryDetector detector;
                     const auto detection =
                         detector.detect("what is the earliest thing I ever told you", kNow);
                     require(detection.is_temporal, "earliest should be temporal");
                     require(detection.window.direction == q::TemporalDirection::Oldest,
                             "expected oldest");
                     require(detection.window.scope == q::TemporalScope::AllTime,
                             "ever should widen the scope");
                     require(!detection.window.since.has_value() &&
                                 !detection.window.until.has_value(),
                             "all-time windows are unbounded");
                   }});

  tests.push_back({"temporal_recent_reads_last_day_newest_first", [] {
                     const q::TemporalQueryDetector detector;
                     const auto detection = detector.detect("what did I mention most recently?", kNow);
                     require(detection.is_temporal, "recently should be temporal");
                     require(detection.matched == "recently", "matched pattern mismatch");
                     require(detection.window.direction == q::TemporalDirection::Newest,
                             "expected newest");
                     require(detection.window.limit == 5, "newest limit mismatch");
                     require(detection.window.since == kNow - 24 * kSecondsPerHour,
                             "recent window mismatch");
                     require(!q::to_chronological_range(detection.window).ascending,
                             "newest reads are descending");
                   }});

  tests.push_back({"temporal_yesterday_is_previous_utc_day", [] {
                     const q::TemporalQueryDetector detector;
                     const auto detection = detector.detect("What did we talk about yesterday", kNow);
                     require(detection.is_temporal, "yesterday should be temporal");
                     require(detection.window.scope == q::TemporalScope::Range, "expected range");
                     require(detection.window.since == 1699833600, "yesterday start mismatch");
                     require(detection.window.until == 1699919999, "yesterday end mismatch");
                   }});

  tests.push_back({"temporal_relative_hours_ago", [] {
                     const q::TemporalQueryDetector detector;
                     const auto detection = detector.detect("what did I say 3 hours ago", kNow);
                     require(detection.is_temporal, "hours ago should be temporal");
                     require(detection.matched == "3 hours ago", "matched text mismatch");
                     require(detection.window.since == kNow - 4 * kSecondsPerHour,
                             "relative start mismatch");
                     require(detection.window.until == kNow - 2 * kSecondsPerHour,
                             "relative end mismatch");

                     const auto days = detector.detect("something from 1 day ago", kNow);
                     require(days.window.since == kNow - 2 * kSecondsPerDay,
                             "day window start mismatch");
                     require(days.window.until == kNow, "day window end mismatch");
                   }});

  tests.push_back({"temporal_vague_ago_is_all_time", [] {
                     const q::TemporalQueryDetector detector;
                     const auto detection = detector.detect("you said something a while ago", kNow);
                     require(detection.is_temporal, "ago should be temporal");
                     require(detection.window.scope == q::TemporalScope::AllTime,
                             "vague ago should be all time");
                     require(detection.window.direction == q::TemporalDirection::Newest,
                             "vague ago reads newest first");
                     require(!detection.window.since.has_value(), "no bounds expected");
                   }});

  tests.push_back({"temporal_last_week_and_today", [] {
                     const q::TemporalQueryDetector detector;
                     const auto week = detector.detect("what happened last week", kNow);
                     require(week.is_temporal && week.matched == "last week",
                             "last week should win over last");
                     require(week.window.since == kNow - 7 * kSecondsPerDay, "week start mismatch");

                     const auto today = detector.detect("what did I eat today", kNow);
                     require(today.is_temporal && today.matched == "today", "today expected");
                     require(today.window.since == kNow - 4 * kSecondsPerHour,
                             "today should use the session window");
                   }});

  tests.push_back({"temporal_session_hours_follow_config", [] {
                     memroute::config::TemporalConfig config;
                     config.session_hours = 8;
                     config.oldest_limit = 2;
                     const q::TemporalQueryDetector detector(config);
                     const auto detection = detector.detect("at first we spoke about work", kNow);
                     require(detection.window.since == kNow - 8 * kSecondsPerHour,
                             "configured session length ignored");
                     require(detection.window.limit == 2, "configured limit ignored");
                   }});

  tests.push_back({"temporal_ignores_plain_queries", [] {
                     const q::TemporalQueryDetector detector;
                     for (const char *text :
                          {"What foods do I like?", "I just want pizza", "tell me a joke",
                           "how do I feel about this idea", "an everlasting lastingness"}) {
                       const auto detection = detector.detect(text, kNow);
                       require(!detection.is_temporal,
                               std::string("unexpected temporal match for: ") + text);
                       require(detection.matched.empty(), "matched should be empty");
                     }
                   }});
}
