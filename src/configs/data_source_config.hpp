// DataSourceConfig.hpp
#ifndef DATA_SOURCE_CONFIG_HPP
#define DATA_SOURCE_CONFIG_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace FvgScanner {
namespace Config {

enum class DataSource {
    CSV,
    POLYGON
};

struct DataSourceConfig {
    DataSource source = DataSource::CSV;
    std::vector<std::string> symbols;
    std::string csv_directory = "data/raw";
    bool regular_session_only = false;               // Drop bars outside the regular session before scanning

    // Polygon.io aggregates endpoint
    std::string polygon_base_url = "https://api.polygon.io";
    std::string polygon_aggregates_endpoint = "/v2/aggs/ticker/{symbol}/range/1/minute/{from}/{to}";
    std::string polygon_api_key;                     // Falls back to POLYGON_API_KEY from the environment
    std::string start_date;                          // YYYY-MM-DD, inclusive
    std::string end_date;                            // YYYY-MM-DD, inclusive
    int page_limit = 50000;
    int retry_count = 5;
    int backoff_milliseconds = 1000;                 // Multiplied by the attempt number
    int timeout_seconds = 30;
    bool enable_ssl_verification = true;

    static DataSource parse_source(const std::string& source_str) {
        if (source_str == "csv" || source_str == "CSV") {
            return DataSource::CSV;
        } else if (source_str == "polygon" || source_str == "POLYGON") {
            return DataSource::POLYGON;
        } else {
            throw std::runtime_error("Invalid data source: " + source_str + ". Must be 'csv' or 'polygon'");
        }
    }

    static std::string source_to_string(DataSource data_source) {
        switch (data_source) {
            case DataSource::CSV:
                return "csv";
            case DataSource::POLYGON:
                return "polygon";
        }
        return "csv";
    }
};

} // namespace Config
} // namespace FvgScanner

#endif // DATA_SOURCE_CONFIG_HPP
