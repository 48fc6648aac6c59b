#ifndef CSV_BAR_PROVIDER_HPP
#define CSV_BAR_PROVIDER_HPP

#include <istream>
#include "bar_series_provider.hpp"

namespace FvgScanner {
namespace Core {

// Parses "ts_ms,open,high,low,close,volume" rows after a header line.
std::vector<Bar> parse_bar_csv(std::istream& csv_stream, const std::string& source_name);

/**
 * Reads <directory>/<SYMBOL>.csv. Rows are kept in file order; ordering
 * problems are left for the integrity validator to report.
 */
class CsvBarProvider : public BarSeriesProvider {
public:
    explicit CsvBarProvider(const std::string& csv_directory);

    std::vector<Bar> load_bars(const std::string& symbol) const override;
    std::string get_provider_name() const override { return "csv"; }

    std::string path_for_symbol(const std::string& symbol) const;

private:
    std::string directory;
};

} // namespace Core
} // namespace FvgScanner

#endif // CSV_BAR_PROVIDER_HPP
