// SessionConfig.hpp
#ifndef SESSION_CONFIG_HPP
#define SESSION_CONFIG_HPP

#include <string>
#include <vector>
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Config {

// [start_minute, end_minute) in local minutes after midnight.
struct SessionWindow {
    Core::SessionTag tag;
    int start_minute;
    int end_minute;

    SessionWindow(Core::SessionTag window_tag, int start, int end)
        : tag(window_tag), start_minute(start), end_minute(end) {}

    bool contains(int minute_of_day) const {
        return minute_of_day >= start_minute && minute_of_day < end_minute;
    }
};

struct SessionConfig {
    int utc_offset_hours = -5;                       // Standard-time offset of the market timezone
    bool observe_us_dst = true;                      // Shift by one hour between 2nd Sunday of March and 1st Sunday of November
    int regular_open_minute = 9 * 60 + 30;           // Regular session open, local minutes
    int regular_close_minute = 16 * 60;              // Regular session close, local minutes
    // 11:00-11:30, 13:00-13:30 and 15:30-16:00 belong to no window and tag as OFF_SESSION
    std::vector<SessionWindow> windows = {
        SessionWindow(Core::SessionTag::PRE_MARKET, 4 * 60, 9 * 60 + 30),
        SessionWindow(Core::SessionTag::AM, 9 * 60 + 30, 11 * 60),
        SessionWindow(Core::SessionTag::LUNCH, 11 * 60 + 30, 13 * 60),
        SessionWindow(Core::SessionTag::PM, 13 * 60 + 30, 15 * 60 + 30),
        SessionWindow(Core::SessionTag::AFTER_HOURS, 16 * 60, 20 * 60)
    };
};

} // namespace Config
} // namespace FvgScanner

#endif // SESSION_CONFIG_HPP
