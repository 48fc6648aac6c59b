#include "scan_system.hpp"
#include "configs/config_loader.hpp"
#include "api/polygon/polygon_aggregates_client.hpp"
#include "scanner/market_data/csv_bar_provider.hpp"
#include "scanner/pipeline/scan_coordinator.hpp"
#include "logging/logger/setup_report_writer.hpp"
#include "logging/logs/scan_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"

namespace FvgScanner {
namespace System {

using FvgScanner::Logging::ScanLogs;

ScanInitializationResult initialize(const std::string& config_path) {
    ScanInitializationResult initialization_result;

    // Fail fast before any logger or worker exists
    FvgScanner::Config::SystemConfig loaded_config = FvgScanner::Config::load_system_config(config_path);
    initialization_result.system_state = std::make_unique<ScanSystemState>(loaded_config);
    initialization_result.logger = FvgScanner::Logging::initialize_application_foundation(initialization_result.system_state->config);
    return initialization_result;
}

FvgScanner::Core::BarSeriesProviderPtr create_bar_provider(const FvgScanner::Config::DataSourceConfig& data_config) {
    switch (data_config.source) {
        case FvgScanner::Config::DataSource::POLYGON:
            return std::make_unique<FvgScanner::API::PolygonAggregatesClient>(data_config);
        case FvgScanner::Config::DataSource::CSV:
            return std::make_unique<FvgScanner::Core::CsvBarProvider>(data_config.csv_directory);
    }
    throw std::runtime_error("Unsupported data source");
}

void startup(ScanSystemState& system_state, std::shared_ptr<FvgScanner::Logging::AsyncLogger> logger) {
    FvgScanner::Threads::LoggingThread logging_thread_functor(logger, system_state.logger_iterations, system_state.config);
    system_state.logging_thread = std::thread(logging_thread_functor);
}

int run(ScanSystemState& system_state) {
    const FvgScanner::Config::SystemConfig& config = system_state.config;

    FvgScanner::Core::BarSeriesProviderPtr bar_provider = create_bar_provider(config.data);
    FvgScanner::Core::ScanCoordinator coordinator(config, *bar_provider);
    ScanLogs::log_scan_configuration(config, coordinator.resolve_worker_count(config.data.symbols.size()));

    std::vector<FvgScanner::Core::SymbolScanResult> results = coordinator.run(config.data.symbols);
    std::vector<FvgScanner::Core::Setup> ranked_setups = FvgScanner::Core::rank_setups(results);
    ScanLogs::log_run_summary(results, ranked_setups.size());

    FvgScanner::Logging::SetupReportWriter report_writer(config.run.report_directory);
    for (const std::string& report_path : report_writer.write_all(results, ranked_setups, config)) {
        ScanLogs::log_report_written(report_path);
    }

    for (const FvgScanner::Core::SymbolScanResult& result : results) {
        if (!result.succeeded()) {
            return EXIT_CODE_SYMBOL_FAILURES;
        }
    }
    return EXIT_CODE_SUCCESS;
}

void shutdown(ScanSystemState& system_state, std::shared_ptr<FvgScanner::Logging::AsyncLogger> logger) {
    if (logger) {
        FvgScanner::Logging::shutdown_global_logger(*logger);
    }
    if (system_state.logging_thread.joinable()) {
        system_state.logging_thread.join();
    }
}

} // namespace System
} // namespace FvgScanner
