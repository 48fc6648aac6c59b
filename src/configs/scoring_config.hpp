// ScoringConfig.hpp
#ifndef SCORING_CONFIG_HPP
#define SCORING_CONFIG_HPP

namespace FvgScanner {
namespace Config {

struct SessionQualityConfig {
    double pre_market = 0.25;
    double am = 1.0;
    double lunch = 0.5;
    double pm = 1.0;
    double after_hours = 0.25;
    double off_session = 0.0;
};

/**
 * Weights are raw; the engine divides the weighted sum by the sum of the
 * weights of the components that are available for a setup.
 */
struct ScoringConfig {
    double cleanliness_weight = 1.0;
    double size_weight = 1.0;
    double session_weight = 1.0;
    double atr_ideal_min = 0.2;                      // Lower edge of the ideal gap size band, in ATR
    double atr_ideal_max = 0.8;                      // Upper edge of the ideal gap size band, in ATR
    SessionQualityConfig session_quality;
};

} // namespace Config
} // namespace FvgScanner

#endif // SCORING_CONFIG_HPP
