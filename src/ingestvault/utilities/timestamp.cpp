#include "ingestvault/utilities/timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace ingestvault {

std::string formatIso8601(TimePoint tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;
  std::time_t t = SystemClock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char base[20];
  std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[32];
  std::snprintf(out, sizeof(out), "%s.%03dZ", base,
                static_cast<int>(ms.count()));
  return std::string(out);
}

std::string formatCompactUtc(TimePoint tp) {
  std::time_t t = SystemClock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char out[20];
  std::strftime(out, sizeof(out), "%Y%m%dT%H%M%SZ", &utc);
  return std::string(out);
}

double secondsBetween(TimePoint start, TimePoint end) {
  return std::chrono::duration<double>(end - start).count();
}

} // namespace ingestvault
