#ifndef INGESTVAULT_TIMESTAMP_HPP
#define INGESTVAULT_TIMESTAMP_HPP

#include <chrono>
#include <string>

namespace ingestvault {

using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;

/** ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T08:15:02.120Z */
std::string formatIso8601(TimePoint tp);

/** Compact UTC stamp for file names, e.g. 20261019T081502Z */
std::string formatCompactUtc(TimePoint tp);

/** Seconds between two points as a double. */
double secondsBetween(TimePoint start, TimePoint end);

} // namespace ingestvault

#endif // INGESTVAULT_TIMESTAMP_HPP
