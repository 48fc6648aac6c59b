#ifndef SYMBOL_PIPELINE_HPP
#define SYMBOL_PIPELINE_HPP

#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"
#include "scanner/market_data/session_calendar.hpp"

namespace FvgScanner {
namespace Core {

/**
 * SymbolPipeline - runs the stages for one symbol strictly in sequence:
 * integrity check, optional regular-session filter, indicators, pivots,
 * gap candidates, structure breaks, scoring.
 *
 * Holds no per-symbol state, so one instance is shared by all scan workers.
 * Throws DataIntegrityError for a bad series; the caller owns isolation.
 */
class SymbolPipeline {
public:
    explicit SymbolPipeline(const Config::SystemConfig& system_config);

    SymbolScanResult run(const std::string& symbol, const std::vector<Bar>& bars) const;

    // True when the series is too short for every indicator to warm up.
    bool has_insufficient_history(size_t bar_count) const;

private:
    const Config::SystemConfig& config;
    SessionCalendar calendar;
};

} // namespace Core
} // namespace FvgScanner

#endif // SYMBOL_PIPELINE_HPP
