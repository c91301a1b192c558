#include "memroute/common/time.hpp"

#include <chrono>
#include <ctime>

namespace memroute::common {

UnixSeconds now_unix() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string to_rfc3339(const UnixSeconds seconds) {
  const auto raw = static_cast<std::time_t>(seconds);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &raw);
#else
  gmtime_r(&raw, &tm);
#endif
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buffer;
}

std::string now_rfc3339() { return to_rfc3339(now_unix()); }

UnixSeconds utc_day_start(const UnixSeconds seconds) {
  const UnixSeconds remainder = seconds % kSecondsPerDay;
  return seconds - (remainder < 0 ? remainder + kSecondsPerDay : remainder);
}

} // namespace memroute::common
