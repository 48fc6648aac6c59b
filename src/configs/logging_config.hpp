// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace FvgScanner {
namespace Config {

struct LoggingConfig {
    std::string log_file = "logs/fvg_scanner.log";
    int logging_poll_interval_milliseconds = 200;    // Logging thread queue drain interval
    bool log_rejected_candidates = false;            // Log every rejected/pending gap, not only totals
};

} // namespace Config
} // namespace FvgScanner

#endif // LOGGING_CONFIG_HPP
