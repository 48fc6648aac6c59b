#ifndef SETUP_REPORT_WRITER_HPP
#define SETUP_REPORT_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Logging {

// Column order shared by the per-symbol and summary CSV reports.
extern const char* const SETUP_CSV_HEADER;

void write_setup_csv_row(std::ostream& output_stream, const FvgScanner::Core::Setup& setup);

/**
 * Persists scan output under one report directory:
 *   <SYMBOL>_setups.csv   chronological setups of one symbol
 *   summary.csv           every setup ranked by score
 *   run_summary.json      per-symbol outcomes and run settings
 * Throws std::runtime_error when a file cannot be written.
 */
class SetupReportWriter {
public:
    explicit SetupReportWriter(const std::string& report_directory);

    std::string write_symbol_report(const FvgScanner::Core::SymbolScanResult& result) const;
    std::string write_summary(const std::vector<FvgScanner::Core::Setup>& ranked_setups) const;
    std::string write_run_summary(const std::vector<FvgScanner::Core::SymbolScanResult>& results,
                                  const std::vector<FvgScanner::Core::Setup>& ranked_setups,
                                  const FvgScanner::Config::SystemConfig& config) const;

    // Symbol reports for successful symbols, then summary and run summary. Returns written paths.
    std::vector<std::string> write_all(const std::vector<FvgScanner::Core::SymbolScanResult>& results,
                                       const std::vector<FvgScanner::Core::Setup>& ranked_setups,
                                       const FvgScanner::Config::SystemConfig& config) const;

private:
    std::string directory;

    std::string path_for(const std::string& file_name) const;
    void ensure_directory() const;
};

} // namespace Logging
} // namespace FvgScanner

#endif // SETUP_REPORT_WRITER_HPP
