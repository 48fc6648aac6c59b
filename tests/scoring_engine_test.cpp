// scoring_engine_test.cpp - component subscores and weighted composite

#include <gtest/gtest.h>

#include "scanner/strategy_analysis/scoring_engine.hpp"
#include "scanner/strategy_analysis/structure_detector.hpp"
#include "test_bar_builders.hpp"

#include <vector>

using namespace FvgScanner::Core;
using namespace FvgScanner::Testing;
using FvgScanner::Config::ScoringConfig;
using FvgScanner::Config::SessionQualityConfig;
using FvgScanner::Config::StructureConfig;

namespace {

struct ScoredScenario {
    std::vector<AnnotatedBar> bars;
    GapCandidate candidate;
};

ScoredScenario qualified_scenario(const std::vector<Bar>& raw_bars) {
    ScoredScenario scenario;
    scenario.bars = annotate(raw_bars);
    std::vector<SwingPivot> pivots = detect_swing_pivots(scenario.bars);
    std::vector<FairValueGap> gaps = detect_fair_value_gaps(scenario.bars);
    std::vector<GapCandidate> candidates = evaluate_gap_candidates(scenario.bars, pivots, gaps, StructureConfig());
    EXPECT_EQ(candidates.size(), 1u);
    if (!candidates.empty()) {
        scenario.candidate = candidates[0];
    }
    return scenario;
}

}  // namespace

// ===========================================================================
// Subscores
// ===========================================================================

TEST(SizeScoreTest, FullCreditInsideIdealBand) {
    ScoringConfig config;
    EXPECT_DOUBLE_EQ(*size_score(0.2, config), 1.0);
    EXPECT_DOUBLE_EQ(*size_score(0.5, config), 1.0);
    EXPECT_DOUBLE_EQ(*size_score(0.8, config), 1.0);
}

TEST(SizeScoreTest, PenalizedBelowAndAboveBand) {
    ScoringConfig config;
    EXPECT_NEAR(*size_score(0.1, config), 0.5, 1e-12);
    EXPECT_NEAR(*size_score(1.2, config), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(*size_score(2.0, config), 0.0);
    EXPECT_DOUBLE_EQ(*size_score(0.0, config), 0.0);
}

TEST(SizeScoreTest, UndefinedAtrGivesNoSizeScore) {
    EXPECT_FALSE(size_score(std::nullopt, ScoringConfig()).has_value());
}

TEST(SessionQualityTest, DefaultsFavourAmAndPm) {
    SessionQualityConfig quality;
    EXPECT_DOUBLE_EQ(session_quality_score(SessionTag::AM, quality), 1.0);
    EXPECT_DOUBLE_EQ(session_quality_score(SessionTag::PM, quality), 1.0);
    EXPECT_LT(session_quality_score(SessionTag::LUNCH, quality), 1.0);
    EXPECT_LT(session_quality_score(SessionTag::PRE_MARKET, quality), session_quality_score(SessionTag::LUNCH, quality));
    EXPECT_LT(session_quality_score(SessionTag::AFTER_HOURS, quality), session_quality_score(SessionTag::AM, quality));
    EXPECT_DOUBLE_EQ(session_quality_score(SessionTag::OFF_SESSION, quality), 0.0);
}

TEST(CleanlinessTest, ScenarioGapShareAndAlignment) {
    ScoredScenario scenario = qualified_scenario(make_untouched_gap_scenario());
    // Gap 0.50 against a 1.00 middle range, all three bodies bullish
    EXPECT_NEAR(cleanliness_score(scenario.candidate.gap, scenario.bars), 0.6 * 0.5 + 0.4 * 1.0, 1e-9);
}

TEST(CleanlinessTest, OpposingBodiesLowerTheScore) {
    std::vector<Bar> bars = make_untouched_gap_scenario();
    bars[9].close_price = 99.70;   // bearish first candle
    ScoredScenario scenario = qualified_scenario(bars);
    EXPECT_NEAR(cleanliness_score(scenario.candidate.gap, scenario.bars), 0.6 * 0.5 + 0.4 * (2.0 / 3.0), 1e-9);
}

// ===========================================================================
// Composite
// ===========================================================================

TEST(ScoringEngineTest, NullSizeIsExcludedFromComposite) {
    ScoredScenario scenario = qualified_scenario(make_untouched_gap_scenario());
    ScoringConfig config;
    config.size_weight = 50.0;
    FvgScanner::Core::Setup setup = ScoringEngine(config).score_candidate("TEST", scenario.candidate, scenario.bars);

    EXPECT_FALSE(setup.score.size.has_value());
    EXPECT_NEAR(setup.score.cleanliness, 70.0, 1e-9);
    EXPECT_NEAR(setup.score.session_quality, 100.0, 1e-9);
    EXPECT_NEAR(setup.score.composite, 85.0, 1e-9);
}

TEST(ScoringEngineTest, SetupCarriesEntryContext) {
    ScoredScenario scenario = qualified_scenario(make_untouched_gap_scenario());
    FvgScanner::Core::Setup setup = ScoringEngine(ScoringConfig()).score_candidate("SPY", scenario.candidate, scenario.bars);

    EXPECT_EQ(setup.symbol, "SPY");
    EXPECT_EQ(setup.entry_index, 21u);
    EXPECT_EQ(setup.entry_timestamp_ms, scenario.bars[21].bar.timestamp_ms);
    EXPECT_EQ(setup.session_tag, SessionTag::AM);
    EXPECT_TRUE(setup.untouched_at_evaluation);
    EXPECT_EQ(setup.sweep.sweep_index, 7u);
    EXPECT_DOUBLE_EQ(setup.vwap_at_entry, scenario.bars[21].vwap);
}

TEST(ScoringEngineTest, CompositeStaysWithinRangeForNonNegativeWeights) {
    ScoredScenario scenario = qualified_scenario(make_untouched_gap_scenario());
    const double weight_grid[] = {0.0, 0.3, 1.0, 7.5, 1000.0};
    for (double cleanliness_weight : weight_grid) {
        for (double size_weight : weight_grid) {
            for (double session_weight : weight_grid) {
                ScoringConfig config;
                config.cleanliness_weight = cleanliness_weight;
                config.size_weight = size_weight;
                config.session_weight = session_weight;
                ScoreBreakdown breakdown = ScoringEngine(config).score_components(
                    scenario.candidate.gap, scenario.bars, SessionTag::LUNCH);
                EXPECT_GE(breakdown.composite, 0.0);
                EXPECT_LE(breakdown.composite, 100.0);
            }
        }
    }
}

TEST(ScoringEngineTest, AllZeroWeightsScoreZero) {
    ScoredScenario scenario = qualified_scenario(make_untouched_gap_scenario());
    ScoringConfig config;
    config.cleanliness_weight = 0.0;
    config.size_weight = 0.0;
    config.session_weight = 0.0;
    EXPECT_EQ(ScoringEngine(config).score_components(scenario.candidate.gap, scenario.bars, SessionTag::AM).composite, 0.0);
}

TEST(ScoringEngineTest, IdenticalInputsGiveBitIdenticalScores) {
    ScoredScenario scenario = qualified_scenario(make_untouched_gap_scenario());
    ScoringConfig config;
    config.cleanliness_weight = 0.37;
    config.session_weight = 1.91;
    ScoringEngine engine(config);
    FvgScanner::Core::Setup first = engine.score_candidate("A", scenario.candidate, scenario.bars);
    FvgScanner::Core::Setup second = ScoringEngine(config).score_candidate("A", scenario.candidate, scenario.bars);
    EXPECT_EQ(first.score.composite, second.score.composite);
    EXPECT_EQ(first.score.cleanliness, second.score.cleanliness);
}

TEST(ScoringEngineTest, RejectedCandidateCannotBeScored) {
    ScoredScenario scenario = qualified_scenario(make_touched_gap_scenario());
    ASSERT_EQ(scenario.candidate.status, GapStatus::REJECTED);
    EXPECT_THROW(ScoringEngine(ScoringConfig()).score_candidate("TEST", scenario.candidate, scenario.bars),
                 std::invalid_argument);
}
