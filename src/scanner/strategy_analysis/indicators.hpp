#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <vector>
#include <deque>
#include <optional>
#include "configs/indicator_config.hpp"
#include "scanner/data_structures/data_structures.hpp"
#include "scanner/market_data/session_calendar.hpp"

namespace FvgScanner {
namespace Core {

double compute_true_range(const Bar& current_bar, const Bar* previous_bar);

// SMA updates between full re-sums of the ATR window
constexpr int ATR_SUM_RESEED_INTERVAL = 1000;

/**
 * Average true range over the last `period` true ranges that each have a
 * previous close. Defined from bar index `period` onward.
 */
class AtrAccumulator {
public:
    AtrAccumulator(int period, Config::AtrMode mode);

    std::optional<double> update(const Bar& bar);
    void reset();

private:
    int period;
    Config::AtrMode mode;
    std::optional<Bar> previous_bar;
    std::deque<double> true_range_window;
    double true_range_sum;
    int updates_since_reseed;
    std::optional<double> wilder_value;
};

// Volume over the mean volume of the preceding `period` bars.
class RelativeVolumeAccumulator {
public:
    explicit RelativeVolumeAccumulator(int period);

    std::optional<double> update(double bar_volume);
    void reset();

private:
    int period;
    std::deque<double> volume_window;
    double volume_sum;
};

// Typical-price VWAP; sums restart whenever the session id changes.
class SessionVwapAccumulator {
public:
    SessionVwapAccumulator();

    double update(const Bar& bar, long long session_id);

private:
    bool has_session;
    long long current_session_id;
    double cumulative_price_volume;
    double cumulative_volume;
};

std::vector<AnnotatedBar> compute_indicators(const std::vector<Bar>& bars,
                                             const Config::IndicatorConfig& indicator_config,
                                             const SessionIdFunction& session_id_of,
                                             const SessionTagFunction& session_tag_of);

} // namespace Core
} // namespace FvgScanner

#endif // INDICATORS_HPP
