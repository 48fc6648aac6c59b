#ifndef BAR_SERIES_PROVIDER_HPP
#define BAR_SERIES_PROVIDER_HPP

#include <memory>
#include <string>
#include <vector>
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Core {

/**
 * Retrieval collaborator. Implementations return a complete bar series for one
 * symbol or throw DataSourceError; they may retry internally but never return
 * partial data. Called concurrently from scan workers, one symbol per call.
 */
class BarSeriesProvider {
public:
    virtual ~BarSeriesProvider() = default;

    virtual std::vector<Bar> load_bars(const std::string& symbol) const = 0;
    virtual std::string get_provider_name() const = 0;
};

using BarSeriesProviderPtr = std::unique_ptr<BarSeriesProvider>;

} // namespace Core
} // namespace FvgScanner

#endif // BAR_SERIES_PROVIDER_HPP
