#ifndef SCAN_COORDINATOR_HPP
#define SCAN_COORDINATOR_HPP

#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "scanner/market_data/bar_series_provider.hpp"
#include "symbol_pipeline.hpp"

namespace FvgScanner {
namespace Core {

/**
 * ScanCoordinator - fans symbols out to worker threads.
 * Workers claim symbols through a shared atomic index and write into their
 * own result slot; the only synchronization is the final join. Every
 * symbol yields exactly one outcome, in input order.
 */
class ScanCoordinator {
public:
    ScanCoordinator(const Config::SystemConfig& system_config, const BarSeriesProvider& bar_provider);

    std::vector<SymbolScanResult> run(const std::vector<std::string>& symbols) const;

    // Load + pipeline for one symbol; failures become a FAILED outcome.
    SymbolScanResult scan_symbol(const std::string& symbol) const;

    size_t resolve_worker_count(size_t symbol_count) const;

private:
    const Config::SystemConfig& config;
    const BarSeriesProvider& provider;
    SymbolPipeline pipeline;
};

// All setups across successful symbols: score descending, then symbol, then formation index.
std::vector<Setup> rank_setups(const std::vector<SymbolScanResult>& results);

} // namespace Core
} // namespace FvgScanner

#endif // SCAN_COORDINATOR_HPP
