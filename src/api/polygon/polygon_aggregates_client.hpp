#ifndef POLYGON_AGGREGATES_CLIENT_HPP
#define POLYGON_AGGREGATES_CLIENT_HPP

#include <string>
#include <vector>
#include "configs/data_source_config.hpp"
#include "scanner/market_data/bar_series_provider.hpp"

namespace FvgScanner {
namespace API {

struct PolygonAggregatesPage {
    std::vector<Core::Bar> bars;
    std::string next_url;
};

// Parses one /v2/aggs response body. Throws DataSourceError on API errors or malformed bars.
PolygonAggregatesPage parse_aggregates_response(const std::string& response_body, const std::string& symbol);

/**
 * Polygon.io minute aggregates for a fixed date range.
 * Follows next_url until the range is exhausted and only then returns,
 * so the pipeline always receives a complete series.
 */
class PolygonAggregatesClient : public Core::BarSeriesProvider {
public:
    explicit PolygonAggregatesClient(const Config::DataSourceConfig& data_source_config);

    std::vector<Core::Bar> load_bars(const std::string& symbol) const override;
    std::string get_provider_name() const override { return "polygon"; }

    std::string build_first_page_url(const std::string& symbol) const;
    std::string append_api_key(const std::string& page_url) const;

private:
    Config::DataSourceConfig config;
    std::string api_key;

    std::string fetch_page(const std::string& page_url, const std::string& symbol) const;
};

} // namespace API
} // namespace FvgScanner

#endif // POLYGON_AGGREGATES_CLIENT_HPP
