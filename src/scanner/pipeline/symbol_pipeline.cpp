#include "symbol_pipeline.hpp"
#include "scanner/market_data/bar_series_validator.hpp"
#include "scanner/strategy_analysis/indicators.hpp"
#include "scanner/strategy_analysis/structure_detector.hpp"
#include "scanner/strategy_analysis/scoring_engine.hpp"
#include "logging/logs/scan_logs.hpp"
#include <algorithm>

namespace FvgScanner {
namespace Core {

using FvgScanner::Logging::ScanLogs;

SymbolPipeline::SymbolPipeline(const Config::SystemConfig& system_config)
    : config(system_config), calendar(system_config.session) {}

bool SymbolPipeline::has_insufficient_history(size_t bar_count) const {
    int warmup_bars = std::max(config.indicators.atr_period, config.indicators.rvol_period);
    return static_cast<int>(bar_count) <= warmup_bars;
}

SymbolScanResult SymbolPipeline::run(const std::string& symbol, const std::vector<Bar>& bars) const {
    BarSeriesValidator validator(symbol);
    validator.validate_series(bars);

    std::vector<Bar> scan_bars = bars;
    if (config.data.regular_session_only) {
        scan_bars = filter_regular_session(bars, calendar);
        ScanLogs::log_regular_session_filter(symbol, bars.size(), scan_bars.size());
    }

    SymbolScanResult result(symbol);
    result.bar_count = scan_bars.size();
    result.insufficient_history = has_insufficient_history(scan_bars.size());
    if (result.insufficient_history) {
        ScanLogs::log_insufficient_history(symbol, scan_bars.size());
    }

    std::vector<AnnotatedBar> annotated_bars = compute_indicators(scan_bars, config.indicators,
                                                                  calendar.session_id_function(),
                                                                  calendar.session_tag_function());

    std::vector<SwingPivot> pivots = detect_swing_pivots(annotated_bars);
    std::vector<FairValueGap> gaps = detect_fair_value_gaps(annotated_bars);
    result.candidates = evaluate_gap_candidates(annotated_bars, pivots, gaps, config.structure);
    std::vector<StructureBreak> structure_breaks = detect_structure_breaks(annotated_bars, pivots, config.structure);

    ScanLogs::log_candidate_summary(symbol, result.candidates);

    ScoringEngine scoring_engine(config.scoring);
    for (const GapCandidate& candidate : result.candidates) {
        if (config.logging.log_rejected_candidates && !candidate.is_scorable()) {
            ScanLogs::log_candidate_detail(symbol, candidate);
        }
        if (!candidate.is_scorable()) {
            continue;
        }

        Setup setup = scoring_engine.score_candidate(symbol, candidate, annotated_bars);
        std::optional<StructureBreak> confirming_break = find_structure_break(
            structure_breaks, candidate.gap.direction, candidate.sweep->sweep_index, candidate.evaluation_index);
        if (confirming_break) {
            setup.structure_break_index = confirming_break->index;
        }
        result.setups.push_back(setup);
    }

    result.status = result.setups.empty() ? OutcomeStatus::NO_SETUPS : OutcomeStatus::SETUPS_FOUND;
    return result;
}

} // namespace Core
} // namespace FvgScanner
