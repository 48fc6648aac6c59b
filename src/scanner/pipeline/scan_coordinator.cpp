#include "scan_coordinator.hpp"
#include "scanner/data_structures/scanner_errors.hpp"
#include "logging/async_logger.hpp"
#include "logging/logs/scan_logs.hpp"
#include <algorithm>
#include <atomic>
#include <iomanip>
#include <sstream>
#include <thread>

namespace FvgScanner {
namespace Core {

using FvgScanner::Logging::ScanLogs;

namespace {
    SymbolScanResult make_failure(const std::string& symbol, FailureKind failure_kind, const std::string& reason) {
        SymbolScanResult result(symbol);
        result.status = OutcomeStatus::FAILED;
        result.failure_kind = failure_kind;
        result.failure_reason = reason;
        ScanLogs::log_symbol_failed(symbol, failure_kind, reason);
        return result;
    }
}

ScanCoordinator::ScanCoordinator(const Config::SystemConfig& system_config, const BarSeriesProvider& bar_provider)
    : config(system_config), provider(bar_provider), pipeline(system_config) {}

size_t ScanCoordinator::resolve_worker_count(size_t symbol_count) const {
    size_t worker_count = config.run.worker_threads > 0
        ? static_cast<size_t>(config.run.worker_threads)
        : static_cast<size_t>(std::max(1u, std::thread::hardware_concurrency()));
    return std::max<size_t>(1, std::min(worker_count, symbol_count));
}

SymbolScanResult ScanCoordinator::scan_symbol(const std::string& symbol) const {
    ScanLogs::log_symbol_started(symbol);
    try {
        std::vector<Bar> bars = provider.load_bars(symbol);
        ScanLogs::log_bars_loaded(symbol, bars.size(), provider.get_provider_name());

        SymbolScanResult result = pipeline.run(symbol, bars);
        ScanLogs::log_symbol_completed(result);
        return result;
    } catch (const DataIntegrityError& integrity_error) {
        return make_failure(symbol, FailureKind::DATA_INTEGRITY, integrity_error.what());
    } catch (const DataSourceError& source_error) {
        return make_failure(symbol, FailureKind::DATA_SOURCE, source_error.what());
    } catch (const std::exception& processing_error) {
        return make_failure(symbol, FailureKind::PROCESSING, processing_error.what());
    }
}

std::vector<SymbolScanResult> ScanCoordinator::run(const std::vector<std::string>& symbols) const {
    std::vector<SymbolScanResult> results;
    results.reserve(symbols.size());
    for (const std::string& symbol : symbols) {
        results.emplace_back(symbol);
    }
    if (symbols.empty()) {
        return results;
    }

    std::atomic<size_t> next_symbol_index{0};
    size_t worker_count = resolve_worker_count(symbols.size());

    auto worker_loop = [&](size_t worker_number) {
        std::ostringstream tag_stream;
        tag_stream << "SCAN" << std::setw(2) << std::setfill('0') << (worker_number % 100);
        FvgScanner::Logging::set_log_thread_tag(tag_stream.str());

        for (size_t symbol_index = next_symbol_index.fetch_add(1); symbol_index < symbols.size();
             symbol_index = next_symbol_index.fetch_add(1)) {
            results[symbol_index] = scan_symbol(symbols[symbol_index]);
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t worker_number = 0; worker_number < worker_count; ++worker_number) {
        workers.emplace_back(worker_loop, worker_number);
    }
    for (std::thread& worker : workers) {
        worker.join();
    }
    return results;
}

std::vector<Setup> rank_setups(const std::vector<SymbolScanResult>& results) {
    std::vector<Setup> ranked_setups;
    for (const SymbolScanResult& result : results) {
        ranked_setups.insert(ranked_setups.end(), result.setups.begin(), result.setups.end());
    }
    std::stable_sort(ranked_setups.begin(), ranked_setups.end(), [](const Setup& left, const Setup& right) {
        if (left.score.composite != right.score.composite) {
            return left.score.composite > right.score.composite;
        }
        if (left.symbol != right.symbol) {
            return left.symbol < right.symbol;
        }
        return left.gap.formation_index < right.gap.formation_index;
    });
    return ranked_setups;
}

} // namespace Core
} // namespace FvgScanner
