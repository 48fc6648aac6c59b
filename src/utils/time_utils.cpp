#include "time_utils.hpp"
#include <ctime>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::string format_epoch_milliseconds_iso(long long epoch_milliseconds) {
    time_t timestamp_seconds = static_cast<time_t>(floor_divide(epoch_milliseconds, MILLISECONDS_PER_SECOND));

    // Use thread-safe gmtime_r instead of gmtime
    struct tm timeinfo;
    gmtime_r(&timestamp_seconds, &timeinfo);

    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

long long floor_divide(long long numerator, long long denominator) {
    long long quotient = numerator / denominator;
    if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
        --quotient;
    }
    return quotient;
}

long long days_from_civil(int year, int month, int day) {
    // Howard Hinnant's days_from_civil
    year -= month <= 2 ? 1 : 0;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const unsigned year_of_era = static_cast<unsigned>(year - era * 400);
    const unsigned day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * 146097 + static_cast<long long>(day_of_era) - 719468;
}

long long parse_date_to_epoch_milliseconds(const std::string& date_string) {
    int year = 0;
    int month = 0;
    int day = 0;
    char first_separator = 0;
    char second_separator = 0;

    std::istringstream date_stream(date_string);
    date_stream >> year >> first_separator >> month >> second_separator >> day;
    if (date_stream.fail() || first_separator != '-' || second_separator != '-' ||
        month < 1 || month > 12 || day < 1 || day > 31) {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + date_string);
    }

    return days_from_civil(year, month, day) * MILLISECONDS_PER_DAY;
}

} // namespace TimeUtils
