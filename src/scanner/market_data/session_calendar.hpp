#ifndef SESSION_CALENDAR_HPP
#define SESSION_CALENDAR_HPP

#include <functional>
#include <vector>
#include "configs/session_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Core {

// Injected calendar rules. Both must be pure functions of the UTC timestamp.
using SessionIdFunction = std::function<long long(long long timestamp_ms)>;
using SessionTagFunction = std::function<SessionTag(long long timestamp_ms)>;

/**
 * SessionCalendar - maps UTC bar timestamps to the market's local time.
 * The session id is the local trading date (days since epoch); the session tag
 * is the configured named window containing the local minute of day.
 */
class SessionCalendar {
public:
    explicit SessionCalendar(const Config::SessionConfig& session_config);

    long long local_timestamp_ms(long long utc_timestamp_ms) const;
    long long session_id(long long utc_timestamp_ms) const;
    int local_minute_of_day(long long utc_timestamp_ms) const;
    SessionTag session_tag(long long utc_timestamp_ms) const;
    bool is_regular_session(long long utc_timestamp_ms) const;

    SessionIdFunction session_id_function() const;
    SessionTagFunction session_tag_function() const;

    // US rule: second Sunday of March 02:00 local to first Sunday of November 02:00 local.
    static bool is_us_daylight_saving(long long utc_timestamp_ms, int standard_utc_offset_hours);

private:
    Config::SessionConfig config;
};

// Keeps bars inside [regular open, regular close) local time; order is preserved.
std::vector<Bar> filter_regular_session(const std::vector<Bar>& bars, const SessionCalendar& calendar);

} // namespace Core
} // namespace FvgScanner

#endif // SESSION_CALENDAR_HPP
