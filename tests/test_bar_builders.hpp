#ifndef TEST_BAR_BUILDERS_HPP
#define TEST_BAR_BUILDERS_HPP

#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Testing {

constexpr long long MS_PER_MINUTE = 60LL * 1000LL;

// UTC epoch milliseconds for a civil date and time.
long long utc_ms(int year, int month, int day, int hour, int minute);

// 2024-01-03 09:30 America/New_York (EST, UTC-5).
long long regular_open_ms();

// One bar per minute starting at regular_open_ms().
Core::Bar make_bar(size_t minute_index, double open, double high, double low, double close, double volume = 1000.0);

/**
 * 25 one-minute bars with a single bullish gap: bar 9 high 100.00, bar 11
 * low 100.50, formation at index 11. A swing low at index 3 (99.00) is
 * swept by bar 7 (wick 98.90, close 99.40). No later bar enters the gap.
 */
std::vector<Core::Bar> make_untouched_gap_scenario();

// Same series with bar 15 dipping to 100.20, inside the gap.
std::vector<Core::Bar> make_touched_gap_scenario();

// Bars 1..13 of the untouched scenario: too short for ATR, formation at index 10.
std::vector<Core::Bar> make_short_gap_scenario();

// Flat bars (range 1.0, constant volume) for indicator warmup checks.
std::vector<Core::Bar> make_flat_bars(size_t bar_count, double volume = 1000.0);

std::vector<Core::AnnotatedBar> annotate(const std::vector<Core::Bar>& bars,
                                         const Config::SystemConfig& config = Config::SystemConfig());

} // namespace Testing
} // namespace FvgScanner

#endif // TEST_BAR_BUILDERS_HPP
