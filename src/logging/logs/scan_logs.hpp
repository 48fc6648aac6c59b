#ifndef SCAN_LOGS_HPP
#define SCAN_LOGS_HPP

#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Logging {

class ScanLogs {
public:
    static void log_scan_configuration(const FvgScanner::Config::SystemConfig& config, size_t worker_count);
    static void log_symbol_started(const std::string& symbol);
    static void log_bars_loaded(const std::string& symbol, size_t bar_count, const std::string& provider_name);
    static void log_regular_session_filter(const std::string& symbol, size_t bars_before, size_t bars_after);
    static void log_insufficient_history(const std::string& symbol, size_t bar_count);
    static void log_candidate_summary(const std::string& symbol, const std::vector<FvgScanner::Core::GapCandidate>& candidates);
    static void log_candidate_detail(const std::string& symbol, const FvgScanner::Core::GapCandidate& candidate);
    static void log_symbol_completed(const FvgScanner::Core::SymbolScanResult& result);
    static void log_symbol_failed(const std::string& symbol, FvgScanner::Core::FailureKind failure_kind, const std::string& reason);
    static void log_run_summary(const std::vector<FvgScanner::Core::SymbolScanResult>& results, size_t ranked_setup_count);
    static void log_report_written(const std::string& report_path);
    static void log_configuration_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);
};

} // namespace Logging
} // namespace FvgScanner

#endif // SCAN_LOGS_HPP
