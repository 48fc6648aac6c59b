#include "scoring_engine.hpp"
#include <algorithm>
#include <stdexcept>

namespace FvgScanner {
namespace Core {

namespace {
    bool body_points_in_direction(const Bar& bar, GapDirection direction) {
        return direction == GapDirection::BULLISH ? bar.close_price > bar.open_price : bar.close_price < bar.open_price;
    }

    double clip(double value, double minimum_value, double maximum_value) {
        return std::min(std::max(value, minimum_value), maximum_value);
    }
}

double cleanliness_score(const FairValueGap& gap, const std::vector<AnnotatedBar>& bars) {
    if (gap.formation_index >= bars.size()) {
        throw std::out_of_range("Gap formation index " + std::to_string(gap.formation_index) +
                                " outside series of " + std::to_string(bars.size()) + " bars");
    }

    // Middle-bar range beyond the gap itself is overlap with the outer candles
    const Bar& middle_bar = bars[gap.middle_index].bar;
    double middle_range = middle_bar.high_price - middle_bar.low_price;
    double gap_share = gap.width > 0.0 ? gap.width / std::max(middle_range, gap.width) : 0.0;

    int aligned_candles = 0;
    for (size_t bar_index = gap.first_index; bar_index <= gap.formation_index; ++bar_index) {
        if (body_points_in_direction(bars[bar_index].bar, gap.direction)) {
            ++aligned_candles;
        }
    }
    double candle_alignment = static_cast<double>(aligned_candles) / 3.0;

    return clip(GAP_SHARE_WEIGHT * gap_share + CANDLE_ALIGNMENT_WEIGHT * candle_alignment, 0.0, 1.0);
}

std::optional<double> size_score(const std::optional<double>& width_in_atr, const Config::ScoringConfig& scoring_config) {
    if (!width_in_atr) {
        return std::nullopt;
    }

    double gap_size = width_in_atr.value();
    if (gap_size >= scoring_config.atr_ideal_min && gap_size <= scoring_config.atr_ideal_max) {
        return 1.0;
    }
    if (gap_size < scoring_config.atr_ideal_min) {
        return scoring_config.atr_ideal_min > 0.0 ? clip(gap_size / scoring_config.atr_ideal_min, 0.0, 1.0) : 0.0;
    }
    if (scoring_config.atr_ideal_max <= 0.0) {
        return 0.0;
    }
    return clip(1.0 - (gap_size - scoring_config.atr_ideal_max) / scoring_config.atr_ideal_max, 0.0, 1.0);
}

double session_quality_score(SessionTag session_tag, const Config::SessionQualityConfig& session_quality) {
    switch (session_tag) {
        case SessionTag::PRE_MARKET:
            return session_quality.pre_market;
        case SessionTag::AM:
            return session_quality.am;
        case SessionTag::LUNCH:
            return session_quality.lunch;
        case SessionTag::PM:
            return session_quality.pm;
        case SessionTag::AFTER_HOURS:
            return session_quality.after_hours;
        case SessionTag::OFF_SESSION:
            return session_quality.off_session;
    }
    return session_quality.off_session;
}

ScoringEngine::ScoringEngine(const Config::ScoringConfig& scoring_config) : config(scoring_config) {}

ScoreBreakdown ScoringEngine::score_components(const FairValueGap& gap, const std::vector<AnnotatedBar>& bars, SessionTag entry_session_tag) const {
    ScoreBreakdown breakdown;
    double cleanliness_component = cleanliness_score(gap, bars);
    std::optional<double> size_component = size_score(gap.width_in_atr, config);
    double session_component = clip(session_quality_score(entry_session_tag, config.session_quality), 0.0, 1.0);

    // Fixed accumulation order keeps composites bit-identical across runs
    double weighted_sum = 0.0;
    double weight_sum = 0.0;
    weighted_sum += config.cleanliness_weight * cleanliness_component;
    weight_sum += config.cleanliness_weight;
    if (size_component) {
        weighted_sum += config.size_weight * size_component.value();
        weight_sum += config.size_weight;
    }
    weighted_sum += config.session_weight * session_component;
    weight_sum += config.session_weight;

    breakdown.cleanliness = cleanliness_component * SCORE_SCALE_MAX;
    if (size_component) {
        breakdown.size = size_component.value() * SCORE_SCALE_MAX;
    }
    breakdown.session_quality = session_component * SCORE_SCALE_MAX;
    breakdown.composite = weight_sum > 0.0 ? clip(SCORE_SCALE_MAX * weighted_sum / weight_sum, 0.0, SCORE_SCALE_MAX) : 0.0;
    return breakdown;
}

Setup ScoringEngine::score_candidate(const std::string& symbol, const GapCandidate& candidate, const std::vector<AnnotatedBar>& bars) const {
    if (!candidate.is_scorable()) {
        throw std::invalid_argument("Gap at index " + std::to_string(candidate.gap.formation_index) + " for " + symbol +
                                    " is " + to_string(candidate.status) + (candidate.sweep ? "" : " without a sweep") +
                                    " and cannot be scored");
    }
    if (candidate.evaluation_index >= bars.size()) {
        throw std::out_of_range("Evaluation index " + std::to_string(candidate.evaluation_index) +
                                " outside series of " + std::to_string(bars.size()) + " bars");
    }

    const AnnotatedBar& entry_bar = bars[candidate.evaluation_index];
    Setup setup(symbol, candidate.gap, candidate.sweep.value());
    setup.entry_index = candidate.evaluation_index;
    setup.entry_timestamp_ms = entry_bar.bar.timestamp_ms;
    setup.session_tag = entry_bar.session_tag;
    setup.untouched_at_evaluation = candidate.is_untouched_at_evaluation();
    setup.rvol_at_formation = bars[candidate.gap.formation_index].rvol;
    setup.vwap_at_entry = entry_bar.vwap;
    setup.score = score_components(candidate.gap, bars, entry_bar.session_tag);
    return setup;
}

} // namespace Core
} // namespace FvgScanner
