#include "structure_detector.hpp"
#include <algorithm>

namespace FvgScanner {
namespace Core {

// ========================================================================
// UNTOUCHED STATE MACHINE
// ========================================================================

GapTouchTracker::GapTouchTracker(const FairValueGap& gap)
    : lower_bound(gap.lower_bound), upper_bound(gap.upper_bound), state(State::UNTOUCHED), touch_index() {}

GapTouchTracker::State GapTouchTracker::observe(const Bar& bar, size_t bar_index) {
    if (state == State::TOUCHED) {
        return state;
    }
    // Wicks count; sharing a boundary price is a touch
    if (bar.low_price <= upper_bound && bar.high_price >= lower_bound) {
        state = State::TOUCHED;
        touch_index = bar_index;
    }
    return state;
}

// ========================================================================
// PIVOTS AND GAPS
// ========================================================================

std::vector<SwingPivot> detect_swing_pivots(const std::vector<AnnotatedBar>& bars) {
    std::vector<SwingPivot> pivots;
    if (bars.size() < 2 * PIVOT_NEIGHBOR_BARS + 1) {
        return pivots;
    }

    for (size_t center_index = PIVOT_NEIGHBOR_BARS; center_index + PIVOT_NEIGHBOR_BARS < bars.size(); ++center_index) {
        const Bar& center_bar = bars[center_index].bar;
        bool is_swing_high = true;
        bool is_swing_low = true;

        for (size_t offset = 1; offset <= PIVOT_NEIGHBOR_BARS; ++offset) {
            const Bar& before_bar = bars[center_index - offset].bar;
            const Bar& after_bar = bars[center_index + offset].bar;
            if (!(center_bar.high_price > before_bar.high_price && center_bar.high_price > after_bar.high_price)) {
                is_swing_high = false;
            }
            if (!(center_bar.low_price < before_bar.low_price && center_bar.low_price < after_bar.low_price)) {
                is_swing_low = false;
            }
        }

        if (is_swing_high) {
            pivots.emplace_back(center_index, center_bar.high_price, PivotKind::HIGH);
        }
        if (is_swing_low) {
            pivots.emplace_back(center_index, center_bar.low_price, PivotKind::LOW);
        }
    }
    return pivots;
}

std::vector<FairValueGap> detect_fair_value_gaps(const std::vector<AnnotatedBar>& bars) {
    std::vector<FairValueGap> gaps;
    if (bars.size() < 3) {
        return gaps;
    }

    for (size_t middle_index = 1; middle_index + 1 < bars.size(); ++middle_index) {
        const Bar& first_bar = bars[middle_index - 1].bar;
        const Bar& third_bar = bars[middle_index + 1].bar;

        FairValueGap gap;
        if (third_bar.low_price > first_bar.high_price) {
            gap.direction = GapDirection::BULLISH;
            gap.lower_bound = first_bar.high_price;
            gap.upper_bound = third_bar.low_price;
        } else if (third_bar.high_price < first_bar.low_price) {
            gap.direction = GapDirection::BEARISH;
            gap.lower_bound = third_bar.high_price;
            gap.upper_bound = first_bar.low_price;
        } else {
            continue;
        }

        gap.first_index = middle_index - 1;
        gap.middle_index = middle_index;
        gap.formation_index = middle_index + 1;
        gap.width = gap.upper_bound - gap.lower_bound;

        const std::optional<double>& formation_atr = bars[gap.formation_index].atr;
        if (formation_atr && formation_atr.value() > 0.0) {
            gap.width_in_atr = gap.width / formation_atr.value();
        }
        gaps.push_back(gap);
    }
    return gaps;
}

// ========================================================================
// LIQUIDITY SWEEP
// ========================================================================

std::optional<LiquiditySweep> find_liquidity_sweep(const std::vector<AnnotatedBar>& bars,
                                                   const std::vector<SwingPivot>& pivots,
                                                   const FairValueGap& gap,
                                                   const Config::StructureConfig& structure_config) {
    // Bullish displacement follows a raid on sell-side liquidity (swing lows), bearish on buy-side
    PivotKind swept_kind = gap.direction == GapDirection::BULLISH ? PivotKind::LOW : PivotKind::HIGH;
    if (gap.first_index == 0 || bars.empty()) {
        return std::nullopt;
    }
    size_t lookback_bars = static_cast<size_t>(std::max(0, structure_config.sweep_lookback_bars));
    size_t window_start = gap.first_index > lookback_bars ? gap.first_index - lookback_bars : 0;
    size_t window_end = std::min(gap.first_index - 1, bars.size() - 1);

    for (size_t sweep_index = window_end + 1; sweep_index-- > window_start;) {
        if (sweep_index <= PIVOT_NEIGHBOR_BARS) {
            break;
        }
        const Bar& sweep_bar = bars[sweep_index].bar;

        // Pivots are in ascending index order; only those confirmed before the sweep bar qualify
        auto confirmed_end = std::lower_bound(pivots.begin(), pivots.end(), sweep_index - PIVOT_NEIGHBOR_BARS,
                                              [](const SwingPivot& pivot, size_t bound_index) { return pivot.index < bound_index; });

        for (auto pivot_iterator = confirmed_end; pivot_iterator != pivots.begin();) {
            const SwingPivot& pivot = *--pivot_iterator;
            if (pivot.index < window_start) {
                break;
            }
            if (pivot.kind != swept_kind) {
                continue;
            }

            bool swept = swept_kind == PivotKind::LOW
                ? (sweep_bar.low_price < pivot.level && sweep_bar.close_price > pivot.level)
                : (sweep_bar.high_price > pivot.level && sweep_bar.close_price < pivot.level);
            if (swept) {
                return LiquiditySweep(pivot.index, pivot.level, pivot.kind, sweep_index);
            }
        }
    }
    return std::nullopt;
}

// ========================================================================
// CANDIDATE EVALUATION
// ========================================================================

size_t entry_evaluation_index(const FairValueGap& gap, size_t bar_count, const Config::StructureConfig& structure_config) {
    size_t evaluation_offset = static_cast<size_t>(std::max(1, structure_config.entry_evaluation_offset_bars));
    size_t last_index = bar_count == 0 ? 0 : bar_count - 1;
    return std::min(gap.formation_index + evaluation_offset, last_index);
}

std::vector<GapCandidate> evaluate_gap_candidates(const std::vector<AnnotatedBar>& bars,
                                                  const std::vector<SwingPivot>& pivots,
                                                  const std::vector<FairValueGap>& gaps,
                                                  const Config::StructureConfig& structure_config) {
    std::vector<GapCandidate> candidates;
    candidates.reserve(gaps.size());
    size_t required_forward_bars = static_cast<size_t>(std::max(1, structure_config.min_forward_bars));

    for (const FairValueGap& gap : gaps) {
        GapCandidate candidate;
        candidate.gap = gap;
        candidate.sweep = find_liquidity_sweep(bars, pivots, gap, structure_config);
        candidate.evaluation_index = entry_evaluation_index(gap, bars.size(), structure_config);

        size_t forward_bars = bars.size() - 1 - gap.formation_index;
        if (forward_bars < required_forward_bars) {
            candidate.status = GapStatus::PENDING;
            candidates.push_back(candidate);
            continue;
        }

        GapTouchTracker touch_tracker(gap);
        for (size_t bar_index = gap.formation_index + 1; bar_index <= candidate.evaluation_index; ++bar_index) {
            if (touch_tracker.observe(bars[bar_index].bar, bar_index) == GapTouchTracker::State::TOUCHED) {
                break;
            }
        }

        candidate.touch_index = touch_tracker.get_touch_index();
        candidate.status = touch_tracker.is_untouched() ? GapStatus::QUALIFIED : GapStatus::REJECTED;
        candidates.push_back(candidate);
    }
    return candidates;
}

// ========================================================================
// BREAK OF STRUCTURE
// ========================================================================

std::vector<StructureBreak> detect_structure_breaks(const std::vector<AnnotatedBar>& bars,
                                                    const std::vector<SwingPivot>& pivots,
                                                    const Config::StructureConfig& structure_config) {
    std::vector<StructureBreak> breaks;
    std::optional<SwingPivot> active_swing_high;
    std::optional<SwingPivot> active_swing_low;
    size_t next_pivot_position = 0;

    for (size_t bar_index = 0; bar_index < bars.size(); ++bar_index) {
        // Pivots become usable once their right-hand neighbours have closed
        while (next_pivot_position < pivots.size() &&
               pivots[next_pivot_position].index + PIVOT_NEIGHBOR_BARS < bar_index) {
            const SwingPivot& confirmed_pivot = pivots[next_pivot_position];
            if (confirmed_pivot.kind == PivotKind::HIGH) {
                active_swing_high = confirmed_pivot;
            } else {
                active_swing_low = confirmed_pivot;
            }
            ++next_pivot_position;
        }

        const AnnotatedBar& annotated_bar = bars[bar_index];
        double buffer = annotated_bar.atr ? structure_config.bos_atr_buffer * annotated_bar.atr.value() : 0.0;
        double close_price = annotated_bar.bar.close_price;

        if (active_swing_high && close_price > active_swing_high->level + buffer) {
            breaks.emplace_back(bar_index, GapDirection::BULLISH, active_swing_high->index);
            active_swing_high.reset();
        }
        if (active_swing_low && close_price < active_swing_low->level - buffer) {
            breaks.emplace_back(bar_index, GapDirection::BEARISH, active_swing_low->index);
            active_swing_low.reset();
        }
    }
    return breaks;
}

std::optional<StructureBreak> find_structure_break(const std::vector<StructureBreak>& breaks,
                                                   GapDirection direction,
                                                   size_t from_index,
                                                   size_t to_index) {
    for (const StructureBreak& structure_break : breaks) {
        if (structure_break.direction == direction &&
            structure_break.index >= from_index && structure_break.index <= to_index) {
            return structure_break;
        }
    }
    return std::nullopt;
}

} // namespace Core
} // namespace FvgScanner
