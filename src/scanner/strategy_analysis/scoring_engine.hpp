#ifndef SCORING_ENGINE_HPP
#define SCORING_ENGINE_HPP

#include <string>
#include <vector>
#include <optional>
#include "configs/scoring_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Core {

constexpr double SCORE_SCALE_MAX = 100.0;
constexpr double GAP_SHARE_WEIGHT = 0.6;
constexpr double CANDLE_ALIGNMENT_WEIGHT = 0.4;

// Subscores in [0,1].
double cleanliness_score(const FairValueGap& gap, const std::vector<AnnotatedBar>& bars);
std::optional<double> size_score(const std::optional<double>& width_in_atr, const Config::ScoringConfig& scoring_config);
double session_quality_score(SessionTag session_tag, const Config::SessionQualityConfig& session_quality);

/**
 * ScoringEngine - turns a qualified, swept candidate into a Setup.
 *
 * Composite = 100 * sum(w_k * s_k) / sum(w_k) over the available components,
 * accumulated in the fixed order cleanliness, size, session and clipped to
 * [0,100]. An undefined size subscore drops its weight from both sums.
 */
class ScoringEngine {
public:
    explicit ScoringEngine(const Config::ScoringConfig& scoring_config);

    ScoreBreakdown score_components(const FairValueGap& gap, const std::vector<AnnotatedBar>& bars, SessionTag entry_session_tag) const;

    // Throws std::invalid_argument for candidates that are not scorable.
    Setup score_candidate(const std::string& symbol, const GapCandidate& candidate, const std::vector<AnnotatedBar>& bars) const;

private:
    Config::ScoringConfig config;
};

} // namespace Core
} // namespace FvgScanner

#endif // SCORING_ENGINE_HPP
