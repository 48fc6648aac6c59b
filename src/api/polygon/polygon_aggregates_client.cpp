#include "polygon_aggregates_client.hpp"
#include "scanner/data_structures/scanner_errors.hpp"
#include "utils/http_utils.hpp"
#include "logging/async_logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cmath>

namespace FvgScanner {
namespace API {

using FvgScanner::Core::Bar;
using FvgScanner::Core::DataSourceError;

namespace {
    // Guards against a server that keeps handing back the same cursor
    constexpr int MAXIMUM_PAGE_COUNT = 10000;

    void replace_placeholder(std::string& url, const std::string& placeholder, const std::string& replacement) {
        size_t position = url.find(placeholder);
        if (position != std::string::npos) {
            url.replace(position, placeholder.length(), replacement);
        }
    }

    double require_number(const nlohmann::json& bar_json, const char* field_name, const std::string& symbol, size_t bar_position) {
        if (!bar_json.contains(field_name) || !bar_json[field_name].is_number()) {
            throw DataSourceError("Polygon bar " + std::to_string(bar_position) + " for " + symbol +
                                  " missing numeric field '" + field_name + "'");
        }
        return bar_json[field_name].get<double>();
    }
}

PolygonAggregatesPage parse_aggregates_response(const std::string& response_body, const std::string& symbol) {
    nlohmann::json parsed_response;
    try {
        parsed_response = nlohmann::json::parse(response_body);
    } catch (const nlohmann::json::parse_error& json_parse_exception) {
        throw DataSourceError("Failed to parse Polygon response for " + symbol + " - " + json_parse_exception.what() +
                              " | Response preview: " + response_body.substr(0, 200));
    }

    if (!parsed_response.is_object()) {
        throw DataSourceError("Polygon response for " + symbol + " is not a JSON object");
    }
    if (parsed_response.contains("error")) {
        std::string api_error_message = parsed_response["error"].is_string() ? parsed_response["error"].get<std::string>()
                                                                             : parsed_response["error"].dump();
        throw DataSourceError("Polygon API returned error for " + symbol + " - " + api_error_message);
    }
    if (parsed_response.contains("status") && parsed_response["status"].is_string()) {
        std::string response_status = parsed_response["status"].get<std::string>();
        if (response_status == "ERROR" || response_status == "NOT_AUTHORIZED") {
            throw DataSourceError("Polygon API status " + response_status + " for " + symbol);
        }
    }

    PolygonAggregatesPage page;
    if (parsed_response.contains("next_url") && parsed_response["next_url"].is_string()) {
        page.next_url = parsed_response["next_url"].get<std::string>();
    }

    // Empty ranges come back without a results array
    if (!parsed_response.contains("results")) {
        return page;
    }
    if (!parsed_response["results"].is_array()) {
        throw DataSourceError("Polygon 'results' field is not an array for " + symbol);
    }

    const auto& results_array = parsed_response["results"];
    page.bars.reserve(results_array.size());
    for (size_t bar_position = 0; bar_position < results_array.size(); ++bar_position) {
        const auto& bar_json = results_array[bar_position];
        double timestamp_value = require_number(bar_json, "t", symbol, bar_position);
        page.bars.emplace_back(static_cast<long long>(std::llround(timestamp_value)),
                               require_number(bar_json, "o", symbol, bar_position),
                               require_number(bar_json, "h", symbol, bar_position),
                               require_number(bar_json, "l", symbol, bar_position),
                               require_number(bar_json, "c", symbol, bar_position),
                               require_number(bar_json, "v", symbol, bar_position));
    }
    return page;
}

PolygonAggregatesClient::PolygonAggregatesClient(const Config::DataSourceConfig& data_source_config)
    : config(data_source_config), api_key(data_source_config.polygon_api_key) {
    if (api_key.empty()) {
        const char* environment_key = std::getenv("POLYGON_API_KEY");
        if (environment_key != nullptr) {
            api_key = environment_key;
        }
    }
    if (api_key.empty()) {
        throw DataSourceError("Polygon API key missing: set data.polygon_api_key or POLYGON_API_KEY");
    }
    if (config.start_date.empty() || config.end_date.empty()) {
        throw DataSourceError("Polygon source requires data.start_date and data.end_date");
    }
}

std::string PolygonAggregatesClient::append_api_key(const std::string& page_url) const {
    return page_url + (page_url.find('?') == std::string::npos ? "?" : "&") + "apiKey=" + api_key;
}

std::string PolygonAggregatesClient::build_first_page_url(const std::string& symbol) const {
    std::string aggregates_url = config.polygon_base_url + config.polygon_aggregates_endpoint;
    replace_placeholder(aggregates_url, "{symbol}", symbol);
    replace_placeholder(aggregates_url, "{from}", config.start_date);
    replace_placeholder(aggregates_url, "{to}", config.end_date);
    return aggregates_url + "?adjusted=true&sort=asc&limit=" + std::to_string(config.page_limit);
}

std::string PolygonAggregatesClient::fetch_page(const std::string& page_url, const std::string& symbol) const {
    HttpRequest page_request(append_api_key(page_url), config.retry_count, config.timeout_seconds,
                             config.enable_ssl_verification, config.backoff_milliseconds);
    try {
        return http_get(page_request);
    } catch (const std::runtime_error& http_request_exception) {
        throw DataSourceError("HTTP request failed for " + symbol + " aggregates - " + http_request_exception.what());
    }
}

std::vector<Bar> PolygonAggregatesClient::load_bars(const std::string& symbol) const {
    if (symbol.empty()) {
        throw DataSourceError("Symbol is required for a Polygon aggregates request");
    }

    std::vector<Bar> all_bars;
    std::string page_url = build_first_page_url(symbol);
    int page_count = 0;

    while (!page_url.empty()) {
        if (++page_count > MAXIMUM_PAGE_COUNT) {
            throw DataSourceError("Polygon pagination for " + symbol + " exceeded " + std::to_string(MAXIMUM_PAGE_COUNT) + " pages");
        }
        PolygonAggregatesPage page = parse_aggregates_response(fetch_page(page_url, symbol), symbol);
        all_bars.insert(all_bars.end(), page.bars.begin(), page.bars.end());
        page_url = page.next_url;
    }

    FvgScanner::Logging::log_message(symbol + ": " + std::to_string(all_bars.size()) + " Polygon bars in " +
                                     std::to_string(page_count) + " page(s)", "");
    return all_bars;
}

} // namespace API
} // namespace FvgScanner
