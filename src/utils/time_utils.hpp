#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;
constexpr long long MILLISECONDS_PER_MINUTE = MILLISECONDS_PER_SECOND * SECONDS_PER_MINUTE;
constexpr long long MILLISECONDS_PER_HOUR = MILLISECONDS_PER_SECOND * SECONDS_PER_HOUR;
constexpr long long MILLISECONDS_PER_DAY = MILLISECONDS_PER_SECOND * SECONDS_PER_DAY;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

std::string get_current_human_readable_time();

// UTC epoch milliseconds -> "YYYY-MM-DDTHH:MM:SSZ"
std::string format_epoch_milliseconds_iso(long long epoch_milliseconds);

// Days since 1970-01-01 for a proleptic Gregorian civil date
long long days_from_civil(int year, int month, int day);

// Floor division for negative epoch values
long long floor_divide(long long numerator, long long denominator);

// "YYYY-MM-DD" -> UTC epoch milliseconds at midnight; throws std::invalid_argument on malformed input
long long parse_date_to_epoch_milliseconds(const std::string& date_string);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
