// structure_detector_test.cpp - pivots, gaps, sweeps, untouched tracking, structure breaks

#include <gtest/gtest.h>

#include "scanner/strategy_analysis/structure_detector.hpp"
#include "test_bar_builders.hpp"

#include <vector>

using namespace FvgScanner::Core;
using namespace FvgScanner::Testing;
using FvgScanner::Config::StructureConfig;

namespace {

std::vector<AnnotatedBar> annotate_plain(const std::vector<Bar>& bars) {
    std::vector<AnnotatedBar> annotated;
    for (const Bar& bar : bars) {
        AnnotatedBar annotated_bar;
        annotated_bar.bar = bar;
        annotated.push_back(annotated_bar);
    }
    return annotated;
}

FairValueGap gap_starting_at(GapDirection direction, size_t first_index) {
    FairValueGap gap;
    gap.direction = direction;
    gap.first_index = first_index;
    gap.middle_index = first_index + 1;
    gap.formation_index = first_index + 2;
    return gap;
}

StructureConfig lookback_of(int lookback_bars) {
    StructureConfig config;
    config.sweep_lookback_bars = lookback_bars;
    return config;
}

// Wick below `level`, close back above it
Bar low_sweep_bar(size_t minute_index, double level) {
    return make_bar(minute_index, level + 0.3, level + 0.5, level - 0.1, level + 0.2);
}

std::vector<GapCandidate> evaluate(const std::vector<Bar>& bars, const StructureConfig& config = StructureConfig()) {
    std::vector<AnnotatedBar> annotated = annotate(bars);
    std::vector<SwingPivot> pivots = detect_swing_pivots(annotated);
    std::vector<FairValueGap> gaps = detect_fair_value_gaps(annotated);
    return evaluate_gap_candidates(annotated, pivots, gaps, config);
}

}  // namespace

// ===========================================================================
// Swing pivots
// ===========================================================================

TEST(SwingPivotTest, StrictFractalHighAndLow) {
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 11.0, 9.0, 10.0),
        make_bar(1, 10.0, 12.0, 9.5, 11.0),
        make_bar(2, 11.0, 15.0, 10.0, 14.0),
        make_bar(3, 14.0, 13.0, 8.0, 9.0),
        make_bar(4, 9.0, 12.0, 8.5, 11.0),
        make_bar(5, 11.0, 12.5, 9.0, 12.0),
        make_bar(6, 12.0, 13.0, 9.5, 12.5),
    };
    // Keep prices consistent with each bar's range
    bars[3].open_price = 12.0;

    std::vector<SwingPivot> pivots = detect_swing_pivots(annotate_plain(bars));
    ASSERT_EQ(pivots.size(), 2u);
    EXPECT_EQ(pivots[0].index, 2u);
    EXPECT_EQ(pivots[0].kind, PivotKind::HIGH);
    EXPECT_DOUBLE_EQ(pivots[0].level, 15.0);
    EXPECT_EQ(pivots[1].index, 3u);
    EXPECT_EQ(pivots[1].kind, PivotKind::LOW);
    EXPECT_DOUBLE_EQ(pivots[1].level, 8.0);
}

TEST(SwingPivotTest, EqualNeighbourHighIsNotAPivot) {
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 11.0, 9.0, 10.0),
        make_bar(1, 10.0, 15.0, 9.5, 11.0),
        make_bar(2, 11.0, 15.0, 10.0, 14.0),
        make_bar(3, 12.0, 13.0, 9.8, 10.0),
        make_bar(4, 10.0, 12.0, 9.9, 11.0),
    };
    std::vector<SwingPivot> pivots = detect_swing_pivots(annotate_plain(bars));
    for (const SwingPivot& pivot : pivots) {
        EXPECT_NE(pivot.kind, PivotKind::HIGH);
    }
}

TEST(SwingPivotTest, BoundaryBarsAreNeverPivots) {
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 20.0, 1.0, 10.0),
        make_bar(1, 10.0, 11.0, 9.0, 10.0),
        make_bar(2, 10.0, 11.0, 9.0, 10.0),
        make_bar(3, 10.0, 11.0, 9.0, 10.0),
        make_bar(4, 10.0, 20.0, 1.0, 10.0),
    };
    EXPECT_TRUE(detect_swing_pivots(annotate_plain(bars)).empty());
    EXPECT_TRUE(detect_swing_pivots(annotate_plain(std::vector<Bar>(bars.begin(), bars.begin() + 4))).empty());
}

// ===========================================================================
// Fair value gaps
// ===========================================================================

TEST(FairValueGapTest, ScenarioHasSingleBullishGapFormedAtIndexEleven) {
    std::vector<FairValueGap> gaps = detect_fair_value_gaps(annotate(make_untouched_gap_scenario()));
    ASSERT_EQ(gaps.size(), 1u);
    const FairValueGap& gap = gaps[0];
    EXPECT_EQ(gap.direction, GapDirection::BULLISH);
    EXPECT_DOUBLE_EQ(gap.lower_bound, 100.00);
    EXPECT_DOUBLE_EQ(gap.upper_bound, 100.50);
    EXPECT_EQ(gap.first_index, 9u);
    EXPECT_EQ(gap.middle_index, 10u);
    EXPECT_EQ(gap.formation_index, 11u);
    EXPECT_DOUBLE_EQ(gap.width, 0.5);
    // ATR is still undefined at index 11
    EXPECT_FALSE(gap.width_in_atr.has_value());
}

TEST(FairValueGapTest, TouchingOuterCandlesAreNotAGap) {
    std::vector<Bar> bars = {
        make_bar(0, 99.5, 100.0, 99.0, 99.9),
        make_bar(1, 100.0, 101.0, 99.8, 100.9),
        make_bar(2, 100.9, 101.5, 100.0, 101.2),
    };
    EXPECT_TRUE(detect_fair_value_gaps(annotate_plain(bars)).empty());
}

TEST(FairValueGapTest, BearishGapBounds) {
    std::vector<Bar> bars = {
        make_bar(0, 101.0, 101.5, 100.5, 100.6),
        make_bar(1, 100.6, 100.7, 99.2, 99.3),
        make_bar(2, 99.3, 99.9, 99.0, 99.1),
    };
    std::vector<FairValueGap> gaps = detect_fair_value_gaps(annotate_plain(bars));
    ASSERT_EQ(gaps.size(), 1u);
    EXPECT_EQ(gaps[0].direction, GapDirection::BEARISH);
    EXPECT_DOUBLE_EQ(gaps[0].lower_bound, 99.9);
    EXPECT_DOUBLE_EQ(gaps[0].upper_bound, 100.5);
    EXPECT_GT(gaps[0].upper_bound, gaps[0].lower_bound);
}

TEST(FairValueGapTest, WidthInAtrUsesFormationBarAtr) {
    std::vector<Bar> bars = make_flat_bars(15);
    bars.push_back(make_bar(15, 100.0, 100.5, 99.5, 100.4));
    bars.push_back(make_bar(16, 100.4, 101.5, 100.3, 101.4));
    bars.push_back(make_bar(17, 101.4, 101.8, 100.9, 101.6));
    std::vector<AnnotatedBar> annotated = annotate(bars);
    std::vector<FairValueGap> gaps = detect_fair_value_gaps(annotated);
    ASSERT_EQ(gaps.size(), 1u);
    ASSERT_TRUE(annotated[17].atr.has_value());
    ASSERT_TRUE(gaps[0].width_in_atr.has_value());
    EXPECT_NEAR(*gaps[0].width_in_atr, 0.4 / *annotated[17].atr, 1e-9);
}

// ===========================================================================
// Untouched state machine
// ===========================================================================

TEST(GapTouchTrackerTest, TouchIsOneWay) {
    FairValueGap gap;
    gap.lower_bound = 100.0;
    gap.upper_bound = 100.5;
    GapTouchTracker tracker(gap);
    EXPECT_EQ(tracker.observe(make_bar(12, 101.0, 101.2, 100.7, 101.1), 12), GapTouchTracker::State::UNTOUCHED);
    EXPECT_EQ(tracker.observe(make_bar(13, 101.0, 101.2, 100.2, 101.1), 13), GapTouchTracker::State::TOUCHED);
    EXPECT_EQ(tracker.observe(make_bar(14, 101.0, 101.2, 100.7, 101.1), 14), GapTouchTracker::State::TOUCHED);
    EXPECT_FALSE(tracker.is_untouched());
    ASSERT_TRUE(tracker.get_touch_index().has_value());
    EXPECT_EQ(*tracker.get_touch_index(), 13u);
}

TEST(GapTouchTrackerTest, WickOnBoundaryCountsAsTouch) {
    FairValueGap gap;
    gap.lower_bound = 100.0;
    gap.upper_bound = 100.5;
    GapTouchTracker tracker(gap);
    EXPECT_EQ(tracker.observe(make_bar(12, 101.0, 101.2, 100.5, 101.1), 12), GapTouchTracker::State::TOUCHED);
}

// ===========================================================================
// Candidate evaluation scenarios
// ===========================================================================

TEST(GapCandidateTest, UntouchedScenarioQualifiesWithSweep) {
    std::vector<GapCandidate> candidates = evaluate(make_untouched_gap_scenario());
    ASSERT_EQ(candidates.size(), 1u);
    const GapCandidate& candidate = candidates[0];
    EXPECT_EQ(candidate.status, GapStatus::QUALIFIED);
    EXPECT_TRUE(candidate.is_untouched_at_evaluation());
    EXPECT_EQ(candidate.gap.formation_index, 11u);
    EXPECT_EQ(candidate.evaluation_index, 21u);
    EXPECT_FALSE(candidate.touch_index.has_value());

    ASSERT_TRUE(candidate.sweep.has_value());
    EXPECT_EQ(candidate.sweep->pivot_index, 3u);
    EXPECT_EQ(candidate.sweep->pivot_kind, PivotKind::LOW);
    EXPECT_DOUBLE_EQ(candidate.sweep->pivot_level, 99.00);
    EXPECT_EQ(candidate.sweep->sweep_index, 7u);
    EXPECT_TRUE(candidate.is_scorable());
}

TEST(GapCandidateTest, TouchAtBarFifteenRejects) {
    std::vector<GapCandidate> candidates = evaluate(make_touched_gap_scenario());
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].status, GapStatus::REJECTED);
    EXPECT_FALSE(candidates[0].is_untouched_at_evaluation());
    ASSERT_TRUE(candidates[0].touch_index.has_value());
    EXPECT_EQ(*candidates[0].touch_index, 15u);
    EXPECT_FALSE(candidates[0].is_scorable());
}

TEST(GapCandidateTest, TouchAfterEvaluationBarDoesNotReject) {
    std::vector<Bar> bars = make_untouched_gap_scenario();
    bars[23].low_price = 100.20;
    std::vector<GapCandidate> candidates = evaluate(bars);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].status, GapStatus::QUALIFIED);
}

TEST(GapCandidateTest, GapInFinalTwoBarsIsPending) {
    std::vector<Bar> full_bars = make_untouched_gap_scenario();
    for (size_t bar_count : {12u, 13u}) {
        std::vector<Bar> bars(full_bars.begin(), full_bars.begin() + bar_count);
        std::vector<GapCandidate> candidates = evaluate(bars);
        ASSERT_EQ(candidates.size(), 1u) << bar_count << " bars";
        EXPECT_EQ(candidates[0].status, GapStatus::PENDING) << bar_count << " bars";
        EXPECT_FALSE(candidates[0].is_scorable());
    }

    std::vector<Bar> resolved_bars(full_bars.begin(), full_bars.begin() + 14);
    std::vector<GapCandidate> candidates = evaluate(resolved_bars);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].status, GapStatus::QUALIFIED);
    EXPECT_EQ(candidates[0].evaluation_index, 13u);
}

TEST(GapCandidateTest, ShortLookbackMissesSweep) {
    StructureConfig config;
    config.sweep_lookback_bars = 1;
    std::vector<GapCandidate> candidates = evaluate(make_untouched_gap_scenario(), config);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].status, GapStatus::QUALIFIED);
    EXPECT_FALSE(candidates[0].sweep.has_value());
    EXPECT_FALSE(candidates[0].is_scorable());
}

// ===========================================================================
// Liquidity sweep association
// ===========================================================================

TEST(LiquiditySweepTest, BearishGapPairsWithSweptSwingHigh) {
    std::vector<Bar> bars = make_flat_bars(12);
    bars[7] = make_bar(7, 100.8, 101.2, 100.6, 100.9);     // wick above 101.0, close below
    bars[8] = make_bar(8, 101.1, 101.3, 101.0, 101.2);     // wick above but closes above
    std::vector<SwingPivot> pivots = {
        SwingPivot(3, 101.0, PivotKind::HIGH),
        SwingPivot(4, 99.0, PivotKind::LOW),
    };

    std::optional<LiquiditySweep> sweep = find_liquidity_sweep(
        annotate_plain(bars), pivots, gap_starting_at(GapDirection::BEARISH, 9), StructureConfig());
    ASSERT_TRUE(sweep.has_value());
    EXPECT_EQ(sweep->pivot_kind, PivotKind::HIGH);
    EXPECT_EQ(sweep->pivot_index, 3u);
    EXPECT_DOUBLE_EQ(sweep->pivot_level, 101.0);
    EXPECT_EQ(sweep->sweep_index, 7u);

    // The swing low at 4 is never raided, so a bullish gap has no sweep
    EXPECT_FALSE(find_liquidity_sweep(annotate_plain(bars), pivots,
                                      gap_starting_at(GapDirection::BULLISH, 9), StructureConfig()).has_value());
}

TEST(LiquiditySweepTest, LatestSweepBarWinsThenLatestPivot) {
    std::vector<Bar> bars = make_flat_bars(14);
    bars[7] = make_bar(7, 99.3, 99.5, 98.7, 99.2);         // raids both 99.0 and 98.8
    bars[9] = make_bar(9, 99.2, 99.4, 98.95, 99.1);        // raids only 99.0
    std::vector<SwingPivot> pivots = {
        SwingPivot(2, 99.0, PivotKind::LOW),
        SwingPivot(4, 98.8, PivotKind::LOW),
    };
    FairValueGap gap = gap_starting_at(GapDirection::BULLISH, 11);

    std::optional<LiquiditySweep> sweep = find_liquidity_sweep(annotate_plain(bars), pivots, gap, StructureConfig());
    ASSERT_TRUE(sweep.has_value());
    EXPECT_EQ(sweep->sweep_index, 9u);
    EXPECT_EQ(sweep->pivot_index, 2u);

    bars[9] = make_bar(9, 100.0, 100.5, 99.5, 100.0);
    sweep = find_liquidity_sweep(annotate_plain(bars), pivots, gap, StructureConfig());
    ASSERT_TRUE(sweep.has_value());
    EXPECT_EQ(sweep->sweep_index, 7u);
    EXPECT_EQ(sweep->pivot_index, 4u);
}

TEST(LiquiditySweepTest, PivotMustBeConfirmedBeforeSweepBar) {
    std::vector<Bar> bars = make_flat_bars(12);
    bars[7] = low_sweep_bar(7, 99.0);
    std::vector<SwingPivot> pivots = {SwingPivot(5, 99.0, PivotKind::LOW)};
    FairValueGap gap = gap_starting_at(GapDirection::BULLISH, 10);

    // Pivot 5 is only confirmed at the close of bar 7
    EXPECT_FALSE(find_liquidity_sweep(annotate_plain(bars), pivots, gap, StructureConfig()).has_value());

    bars[8] = low_sweep_bar(8, 99.0);
    std::optional<LiquiditySweep> sweep = find_liquidity_sweep(annotate_plain(bars), pivots, gap, StructureConfig());
    ASSERT_TRUE(sweep.has_value());
    EXPECT_EQ(sweep->sweep_index, 8u);
}

TEST(LiquiditySweepTest, LookbackWindowEdgeIsInclusive) {
    std::vector<Bar> bars = make_flat_bars(15);
    bars[8] = low_sweep_bar(8, 99.0);
    std::vector<SwingPivot> pivots = {SwingPivot(4, 99.0, PivotKind::LOW)};
    FairValueGap gap = gap_starting_at(GapDirection::BULLISH, 12);

    // Window [first_index - lookback, first_index - 1]: pivot 4 sits on the edge with lookback 8
    std::optional<LiquiditySweep> sweep = find_liquidity_sweep(annotate_plain(bars), pivots, gap, lookback_of(8));
    ASSERT_TRUE(sweep.has_value());
    EXPECT_EQ(sweep->pivot_index, 4u);
    EXPECT_EQ(sweep->sweep_index, 8u);

    EXPECT_FALSE(find_liquidity_sweep(annotate_plain(bars), pivots, gap, lookback_of(7)).has_value());

    // Lookback 4 starts the window at bar 8; no pivot inside it is confirmed by then
    std::vector<SwingPivot> late_pivots = {SwingPivot(4, 99.0, PivotKind::LOW), SwingPivot(9, 98.0, PivotKind::LOW)};
    EXPECT_FALSE(find_liquidity_sweep(annotate_plain(bars), late_pivots, gap, lookback_of(4)).has_value());
}

TEST(LiquiditySweepTest, GapFirstCandleIsNotASweepBar) {
    std::vector<Bar> bars = make_flat_bars(14);
    bars[9] = low_sweep_bar(9, 99.0);
    std::vector<SwingPivot> pivots = {SwingPivot(3, 99.0, PivotKind::LOW)};

    EXPECT_FALSE(find_liquidity_sweep(annotate_plain(bars), pivots,
                                      gap_starting_at(GapDirection::BULLISH, 9), StructureConfig()).has_value());

    std::optional<LiquiditySweep> sweep = find_liquidity_sweep(annotate_plain(bars), pivots,
                                                               gap_starting_at(GapDirection::BULLISH, 10), StructureConfig());
    ASSERT_TRUE(sweep.has_value());
    EXPECT_EQ(sweep->sweep_index, 9u);
}

TEST(LiquiditySweepTest, PivotsOutsideWindowAreIgnored) {
    std::vector<Bar> bars = make_flat_bars(50);
    bars[16] = make_bar(16, 99.4, 99.6, 99.1, 99.4);
    // 1 is before the window, 30 and 40 are not yet confirmed at bar 16
    std::vector<SwingPivot> pivots = {
        SwingPivot(1, 99.2, PivotKind::LOW),
        SwingPivot(12, 98.0, PivotKind::LOW),
        SwingPivot(30, 99.3, PivotKind::LOW),
        SwingPivot(40, 99.3, PivotKind::LOW),
    };
    FairValueGap gap = gap_starting_at(GapDirection::BULLISH, 20);

    EXPECT_FALSE(find_liquidity_sweep(annotate_plain(bars), pivots, gap, lookback_of(10)).has_value());

    pivots.insert(pivots.begin() + 2, SwingPivot(13, 99.25, PivotKind::LOW));
    std::optional<LiquiditySweep> sweep = find_liquidity_sweep(annotate_plain(bars), pivots, gap, lookback_of(10));
    ASSERT_TRUE(sweep.has_value());
    EXPECT_EQ(sweep->pivot_index, 13u);
    EXPECT_EQ(sweep->sweep_index, 16u);
}

// ===========================================================================
// Break of structure
// ===========================================================================

TEST(StructureBreakTest, CloseAboveConfirmedSwingHighBreaksOnce) {
    std::vector<Bar> bars = {
        make_bar(0, 10.0, 10.5, 9.5, 10.0),
        make_bar(1, 10.0, 10.8, 9.6, 10.5),
        make_bar(2, 10.5, 12.0, 10.2, 11.0),   // swing high 12.0
        make_bar(3, 11.0, 11.5, 10.4, 10.8),
        make_bar(4, 10.8, 11.2, 10.3, 10.9),
        make_bar(5, 10.9, 11.9, 10.6, 11.8),
        make_bar(6, 11.8, 12.6, 11.7, 12.5),   // close beyond 12.0
        make_bar(7, 12.5, 13.0, 12.4, 12.9),
    };
    StructureConfig config;
    std::vector<AnnotatedBar> annotated = annotate_plain(bars);
    std::vector<SwingPivot> pivots = detect_swing_pivots(annotated);
    std::vector<StructureBreak> breaks = detect_structure_breaks(annotated, pivots, config);

    ASSERT_EQ(breaks.size(), 1u);
    EXPECT_EQ(breaks[0].index, 6u);
    EXPECT_EQ(breaks[0].direction, GapDirection::BULLISH);
    EXPECT_EQ(breaks[0].pivot_index, 2u);

    std::optional<StructureBreak> in_window = find_structure_break(breaks, GapDirection::BULLISH, 4, 7);
    ASSERT_TRUE(in_window.has_value());
    EXPECT_EQ(in_window->index, 6u);
    EXPECT_FALSE(find_structure_break(breaks, GapDirection::BEARISH, 0, 7).has_value());
    EXPECT_FALSE(find_structure_break(breaks, GapDirection::BULLISH, 7, 7).has_value());
}
