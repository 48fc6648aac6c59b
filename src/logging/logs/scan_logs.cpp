#include "scan_logs.hpp"
#include "logging/logging_macros.hpp"
#include <sstream>
#include <iomanip>

using FvgScanner::Logging::log_message;
using namespace FvgScanner::Core;

namespace FvgScanner {
namespace Logging {

void ScanLogs::log_scan_configuration(const FvgScanner::Config::SystemConfig& config, size_t worker_count) {
    LOG_SCAN_RUN_HEADER(config.data.symbols.size(), worker_count);
    LOG_SECTION_HEADER("CONFIGURATION");
    LOG_CONTENT("Source: " + FvgScanner::Config::DataSourceConfig::source_to_string(config.data.source));
    LOG_CONTENT("ATR: " + std::to_string(config.indicators.atr_period) + " bars (" +
                FvgScanner::Config::IndicatorConfig::atr_mode_to_string(config.indicators.atr_mode) + ")");
    LOG_CONTENT("RVOL baseline: " + std::to_string(config.indicators.rvol_period) + " bars");
    LOG_CONTENT("Sweep lookback: " + std::to_string(config.structure.sweep_lookback_bars) + " bars");
    LOG_CONTENT("Entry evaluation offset: " + std::to_string(config.structure.entry_evaluation_offset_bars) + " bars");

    std::ostringstream weights_stream;
    weights_stream << std::fixed << std::setprecision(2)
                   << "Weights: cleanliness=" << config.scoring.cleanliness_weight
                   << " size=" << config.scoring.size_weight
                   << " session=" << config.scoring.session_weight
                   << " | ideal ATR band [" << config.scoring.atr_ideal_min << ", " << config.scoring.atr_ideal_max << "]";
    LOG_CONTENT(weights_stream.str());
    LOG_SECTION_FOOTER();
}

void ScanLogs::log_symbol_started(const std::string& symbol) {
    log_message("Scanning " + symbol, "");
}

void ScanLogs::log_bars_loaded(const std::string& symbol, size_t bar_count, const std::string& provider_name) {
    log_message(symbol + ": loaded " + std::to_string(bar_count) + " bars from " + provider_name, "");
}

void ScanLogs::log_regular_session_filter(const std::string& symbol, size_t bars_before, size_t bars_after) {
    log_message(symbol + ": regular session filter kept " + std::to_string(bars_after) + "/" + std::to_string(bars_before) + " bars", "");
}

void ScanLogs::log_insufficient_history(const std::string& symbol, size_t bar_count) {
    log_message("WARNING: " + symbol + " has only " + std::to_string(bar_count) +
                " bars - leading indicator values are undefined", "");
}

void ScanLogs::log_candidate_summary(const std::string& symbol, const std::vector<GapCandidate>& candidates) {
    size_t qualified_count = 0;
    size_t rejected_count = 0;
    size_t pending_count = 0;
    size_t swept_count = 0;
    for (const GapCandidate& candidate : candidates) {
        if (candidate.status == GapStatus::QUALIFIED) ++qualified_count;
        if (candidate.status == GapStatus::REJECTED) ++rejected_count;
        if (candidate.status == GapStatus::PENDING) ++pending_count;
        if (candidate.sweep) ++swept_count;
    }
    log_message(symbol + ": " + std::to_string(candidates.size()) + " gaps | qualified=" + std::to_string(qualified_count) +
                " rejected=" + std::to_string(rejected_count) + " pending=" + std::to_string(pending_count) +
                " swept=" + std::to_string(swept_count), "");
}

void ScanLogs::log_candidate_detail(const std::string& symbol, const GapCandidate& candidate) {
    std::ostringstream detail_stream;
    detail_stream << std::fixed << std::setprecision(4)
                  << symbol << ": " << to_string(candidate.gap.direction) << " gap @" << candidate.gap.formation_index
                  << " [" << candidate.gap.lower_bound << ", " << candidate.gap.upper_bound << "] "
                  << to_string(candidate.status);
    if (candidate.touch_index) {
        detail_stream << " (touched @" << candidate.touch_index.value() << ")";
    }
    if (!candidate.sweep) {
        detail_stream << " no sweep";
    }
    log_message(detail_stream.str(), "");
}

void ScanLogs::log_symbol_completed(const SymbolScanResult& result) {
    log_message(result.symbol + ": " + to_string(result.status) + " (" + std::to_string(result.setups.size()) + " setups)", "");
}

void ScanLogs::log_symbol_failed(const std::string& symbol, FailureKind failure_kind, const std::string& reason) {
    log_message("ERROR: " + symbol + " failed [" + to_string(failure_kind) + "]: " + reason, "");
}

void ScanLogs::log_run_summary(const std::vector<SymbolScanResult>& results, size_t ranked_setup_count) {
    size_t failed_count = 0;
    LOG_SECTION_HEADER("SCAN SUMMARY");
    for (const SymbolScanResult& result : results) {
        std::ostringstream row_stream;
        row_stream << std::left << std::setw(10) << result.symbol << std::setw(14) << to_string(result.status)
                   << "bars=" << std::setw(8) << result.bar_count << "setups=" << result.setups.size();
        if (!result.succeeded()) {
            ++failed_count;
            row_stream << " [" << to_string(result.failure_kind) << "] " << result.failure_reason;
        }
        LOG_CONTENT(row_stream.str());
    }
    LOG_CONTENT("Symbols: " + std::to_string(results.size()) + " | failed: " + std::to_string(failed_count) +
                " | ranked setups: " + std::to_string(ranked_setup_count));
    LOG_SECTION_FOOTER();
}

void ScanLogs::log_report_written(const std::string& report_path) {
    log_message("Report written: " + report_path, "");
}

void ScanLogs::log_configuration_error(const std::string& error_message) {
    log_message("ERROR: Configuration error: " + error_message, "");
}

void ScanLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message, "");
}

} // namespace Logging
} // namespace FvgScanner
