#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace FvgScanner {
namespace Core {

double compute_true_range(const Bar& current_bar, const Bar* previous_bar) {
    double high_low_range = current_bar.high_price - current_bar.low_price;
    if (previous_bar == nullptr) {
        return high_low_range;
    }
    return std::max({high_low_range,
                     std::abs(current_bar.high_price - previous_bar->close_price),
                     std::abs(current_bar.low_price - previous_bar->close_price)});
}

// ========================================================================
// ATR
// ========================================================================

AtrAccumulator::AtrAccumulator(int atr_period, Config::AtrMode atr_mode)
    : period(atr_period), mode(atr_mode), previous_bar(), true_range_window(), true_range_sum(0.0), updates_since_reseed(0), wilder_value() {
    if (period <= 0) {
        throw std::invalid_argument("ATR period must be positive, got " + std::to_string(period));
    }
}

std::optional<double> AtrAccumulator::update(const Bar& bar) {
    if (!previous_bar) {
        // First bar has no previous close and never contributes to the average
        previous_bar = bar;
        return std::nullopt;
    }

    double true_range_value = compute_true_range(bar, &previous_bar.value());
    previous_bar = bar;

    if (mode == Config::AtrMode::WILDER && wilder_value) {
        wilder_value = (wilder_value.value() * (period - 1) + true_range_value) / period;
        return wilder_value;
    }

    true_range_window.push_back(true_range_value);
    true_range_sum += true_range_value;
    if (static_cast<int>(true_range_window.size()) > period) {
        true_range_sum -= true_range_window.front();
        true_range_window.pop_front();
    }

    if (static_cast<int>(true_range_window.size()) < period) {
        return std::nullopt;
    }

    if (mode == Config::AtrMode::SMA) {
        if (++updates_since_reseed >= ATR_SUM_RESEED_INTERVAL) {
            // Rebuild the rolling sum from the window so rounding error stays bounded
            true_range_sum = 0.0;
            for (double window_true_range : true_range_window) {
                true_range_sum += window_true_range;
            }
            updates_since_reseed = 0;
        }
        return true_range_sum / period;
    }

    wilder_value = true_range_sum / period;
    return wilder_value;
}

void AtrAccumulator::reset() {
    previous_bar.reset();
    true_range_window.clear();
    true_range_sum = 0.0;
    updates_since_reseed = 0;
    wilder_value.reset();
}

// ========================================================================
// RELATIVE VOLUME
// ========================================================================

RelativeVolumeAccumulator::RelativeVolumeAccumulator(int rvol_period)
    : period(rvol_period), volume_window(), volume_sum(0.0) {
    if (period <= 0) {
        throw std::invalid_argument("RVOL period must be positive, got " + std::to_string(period));
    }
}

std::optional<double> RelativeVolumeAccumulator::update(double bar_volume) {
    std::optional<double> relative_volume;
    if (static_cast<int>(volume_window.size()) == period) {
        double average_volume = volume_sum / period;
        if (average_volume > 0.0) {
            relative_volume = bar_volume / average_volume;
        }
    }

    // Baseline excludes the current bar, so it joins the window afterwards
    volume_window.push_back(bar_volume);
    volume_sum += bar_volume;
    if (static_cast<int>(volume_window.size()) > period) {
        volume_sum -= volume_window.front();
        volume_window.pop_front();
    }
    return relative_volume;
}

void RelativeVolumeAccumulator::reset() {
    volume_window.clear();
    volume_sum = 0.0;
}

// ========================================================================
// SESSION VWAP
// ========================================================================

SessionVwapAccumulator::SessionVwapAccumulator()
    : has_session(false), current_session_id(0), cumulative_price_volume(0.0), cumulative_volume(0.0) {}

double SessionVwapAccumulator::update(const Bar& bar, long long session_id) {
    double typical_price = (bar.high_price + bar.low_price + bar.close_price) / 3.0;

    if (!has_session || session_id != current_session_id) {
        has_session = true;
        current_session_id = session_id;
        cumulative_price_volume = typical_price * bar.volume;
        cumulative_volume = bar.volume;
        return typical_price;
    }

    cumulative_price_volume += typical_price * bar.volume;
    cumulative_volume += bar.volume;
    if (cumulative_volume <= 0.0) {
        return typical_price;
    }
    return cumulative_price_volume / cumulative_volume;
}

// ========================================================================
// SERIES ANNOTATION
// ========================================================================

std::vector<AnnotatedBar> compute_indicators(const std::vector<Bar>& bars,
                                             const Config::IndicatorConfig& indicator_config,
                                             const SessionIdFunction& session_id_of,
                                             const SessionTagFunction& session_tag_of) {
    AtrAccumulator atr_accumulator(indicator_config.atr_period, indicator_config.atr_mode);
    RelativeVolumeAccumulator rvol_accumulator(indicator_config.rvol_period);
    SessionVwapAccumulator vwap_accumulator;

    std::vector<AnnotatedBar> annotated_bars;
    annotated_bars.reserve(bars.size());

    for (const Bar& bar : bars) {
        AnnotatedBar annotated_bar;
        annotated_bar.bar = bar;
        annotated_bar.session_id = session_id_of(bar.timestamp_ms);
        annotated_bar.session_tag = session_tag_of(bar.timestamp_ms);
        annotated_bar.atr = atr_accumulator.update(bar);
        annotated_bar.rvol = rvol_accumulator.update(bar.volume);
        annotated_bar.vwap = vwap_accumulator.update(bar, annotated_bar.session_id);
        annotated_bars.push_back(annotated_bar);
    }

    return annotated_bars;
}

} // namespace Core
} // namespace FvgScanner
