#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include <string>
#include "indicator_config.hpp"
#include "structure_config.hpp"
#include "scoring_config.hpp"
#include "session_config.hpp"
#include "data_source_config.hpp"
#include "logging_config.hpp"

namespace FvgScanner {
namespace Config {

struct RunConfig {
    int worker_threads = 0;                          // 0 selects std::thread::hardware_concurrency()
    std::string report_directory = "reports";
};

/**
 * Main scanner configuration.
 * Every member carries its documented default; the CSV loader overrides only the keys it finds.
 */
struct SystemConfig {
    SystemConfig() {}

    IndicatorConfig indicators;        // ATR/RVOL periods and ATR smoothing mode
    StructureConfig structure;         // Sweep lookback, entry evaluation, BOS buffer
    ScoringConfig scoring;             // Component weights, ideal ATR band, session qualities
    SessionConfig session;             // Market timezone and named session windows
    DataSourceConfig data;             // Bar retrieval collaborator
    LoggingConfig logging;             // Log file and logging thread cadence
    RunConfig run;                     // Worker pool and report output
};

} // namespace Config
} // namespace FvgScanner

#endif // SYSTEM_CONFIG_HPP
