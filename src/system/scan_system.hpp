#ifndef SCAN_SYSTEM_HPP
#define SCAN_SYSTEM_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "configs/system_config.hpp"
#include "logging/async_logger.hpp"
#include "scanner/market_data/bar_series_provider.hpp"

namespace FvgScanner {
namespace System {

constexpr int EXIT_CODE_SUCCESS = 0;
constexpr int EXIT_CODE_FATAL = 1;
constexpr int EXIT_CODE_SYMBOL_FAILURES = 2;

struct ScanSystemState {
    FvgScanner::Config::SystemConfig config;
    std::atomic<unsigned long> logger_iterations{0};
    std::thread logging_thread;

    explicit ScanSystemState(const FvgScanner::Config::SystemConfig& system_config) : config(system_config) {}
};

struct ScanInitializationResult {
    std::unique_ptr<ScanSystemState> system_state;
    std::shared_ptr<FvgScanner::Logging::AsyncLogger> logger;

    ScanInitializationResult() = default;
    ScanInitializationResult(ScanInitializationResult&&) = default;
    ScanInitializationResult& operator=(ScanInitializationResult&&) = default;

    ScanInitializationResult(const ScanInitializationResult&) = delete;
    ScanInitializationResult& operator=(const ScanInitializationResult&) = delete;
};

// Loads and validates configuration (ConfigurationError on failure), then sets up logging.
ScanInitializationResult initialize(const std::string& config_path);

FvgScanner::Core::BarSeriesProviderPtr create_bar_provider(const FvgScanner::Config::DataSourceConfig& data_config);

// System lifecycle management
void startup(ScanSystemState& system_state, std::shared_ptr<FvgScanner::Logging::AsyncLogger> logger);
int run(ScanSystemState& system_state);
void shutdown(ScanSystemState& system_state, std::shared_ptr<FvgScanner::Logging::AsyncLogger> logger);

} // namespace System
} // namespace FvgScanner

#endif // SCAN_SYSTEM_HPP
