#pragma once

#include <cstdint>
#include <string>

namespace memroute::common {

/// Seconds since the Unix epoch.
using UnixSeconds = std::int64_t;

constexpr UnixSeconds kSecondsPerHour = 3600;
constexpr UnixSeconds kSecondsPerDay = 86400;

[[nodiscard]] UnixSeconds now_unix();
[[nodiscard]] std::string to_rfc3339(UnixSeconds seconds);
[[nodiscard]] std::string now_rfc3339();
/// Start of the UTC calendar day containing `seconds`.
[[nodiscard]] UnixSeconds utc_day_start(UnixSeconds seconds);

} // namespace memroute::common
