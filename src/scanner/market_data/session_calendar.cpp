#include "session_calendar.hpp"
#include "utils/time_utils.hpp"

namespace FvgScanner {
namespace Core {

namespace {
    // Day of week for days since epoch, 0 = Sunday (1970-01-01 was a Thursday).
    int weekday_from_days(long long days_since_epoch) {
        long long weekday = (days_since_epoch + 4) % 7;
        if (weekday < 0) weekday += 7;
        return static_cast<int>(weekday);
    }

    // Day of month of the n-th Sunday in a month.
    int nth_sunday_of_month(int year, int month, int occurrence) {
        long long first_day = TimeUtils::days_from_civil(year, month, 1);
        int first_weekday = weekday_from_days(first_day);
        int first_sunday = 1 + (7 - first_weekday) % 7;
        return first_sunday + 7 * (occurrence - 1);
    }

    int civil_year_from_days(long long days_since_epoch) {
        // Inverse of days_from_civil, year component only
        long long shifted_days = days_since_epoch + 719468;
        const long long era = (shifted_days >= 0 ? shifted_days : shifted_days - 146096) / 146097;
        const unsigned day_of_era = static_cast<unsigned>(shifted_days - era * 146097);
        const unsigned year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
        const unsigned day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
        const unsigned month_index = (5 * day_of_year + 2) / 153;
        const unsigned month = month_index < 10 ? month_index + 3 : month_index - 9;
        long long year = static_cast<long long>(year_of_era) + era * 400;
        return static_cast<int>(month <= 2 ? year + 1 : year);
    }
}

SessionCalendar::SessionCalendar(const Config::SessionConfig& session_config) : config(session_config) {}

bool SessionCalendar::is_us_daylight_saving(long long utc_timestamp_ms, int standard_utc_offset_hours) {
    long long standard_local_ms = utc_timestamp_ms + standard_utc_offset_hours * TimeUtils::MILLISECONDS_PER_HOUR;
    int year = civil_year_from_days(TimeUtils::floor_divide(standard_local_ms, TimeUtils::MILLISECONDS_PER_DAY));

    // Transitions happen at 02:00 local standard time
    long long dst_start_ms = TimeUtils::days_from_civil(year, 3, nth_sunday_of_month(year, 3, 2)) * TimeUtils::MILLISECONDS_PER_DAY
                             + 2 * TimeUtils::MILLISECONDS_PER_HOUR;
    long long dst_end_ms = TimeUtils::days_from_civil(year, 11, nth_sunday_of_month(year, 11, 1)) * TimeUtils::MILLISECONDS_PER_DAY
                           + 1 * TimeUtils::MILLISECONDS_PER_HOUR;

    return standard_local_ms >= dst_start_ms && standard_local_ms < dst_end_ms;
}

long long SessionCalendar::local_timestamp_ms(long long utc_timestamp_ms) const {
    int offset_hours = config.utc_offset_hours;
    if (config.observe_us_dst && is_us_daylight_saving(utc_timestamp_ms, config.utc_offset_hours)) {
        offset_hours += 1;
    }
    return utc_timestamp_ms + offset_hours * TimeUtils::MILLISECONDS_PER_HOUR;
}

long long SessionCalendar::session_id(long long utc_timestamp_ms) const {
    return TimeUtils::floor_divide(local_timestamp_ms(utc_timestamp_ms), TimeUtils::MILLISECONDS_PER_DAY);
}

int SessionCalendar::local_minute_of_day(long long utc_timestamp_ms) const {
    long long local_ms = local_timestamp_ms(utc_timestamp_ms);
    long long day_start_ms = TimeUtils::floor_divide(local_ms, TimeUtils::MILLISECONDS_PER_DAY) * TimeUtils::MILLISECONDS_PER_DAY;
    return static_cast<int>((local_ms - day_start_ms) / TimeUtils::MILLISECONDS_PER_MINUTE);
}

SessionTag SessionCalendar::session_tag(long long utc_timestamp_ms) const {
    int minute_of_day = local_minute_of_day(utc_timestamp_ms);
    for (const auto& window : config.windows) {
        if (window.contains(minute_of_day)) {
            return window.tag;
        }
    }
    return SessionTag::OFF_SESSION;
}

bool SessionCalendar::is_regular_session(long long utc_timestamp_ms) const {
    int minute_of_day = local_minute_of_day(utc_timestamp_ms);
    return minute_of_day >= config.regular_open_minute && minute_of_day < config.regular_close_minute;
}

SessionIdFunction SessionCalendar::session_id_function() const {
    SessionCalendar calendar_copy(*this);
    return [calendar_copy](long long timestamp_ms) { return calendar_copy.session_id(timestamp_ms); };
}

SessionTagFunction SessionCalendar::session_tag_function() const {
    SessionCalendar calendar_copy(*this);
    return [calendar_copy](long long timestamp_ms) { return calendar_copy.session_tag(timestamp_ms); };
}

std::vector<Bar> filter_regular_session(const std::vector<Bar>& bars, const SessionCalendar& calendar) {
    std::vector<Bar> session_bars;
    session_bars.reserve(bars.size());
    for (const auto& bar : bars) {
        if (calendar.is_regular_session(bar.timestamp_ms)) {
            session_bars.push_back(bar);
        }
    }
    return session_bars;
}

} // namespace Core
} // namespace FvgScanner
