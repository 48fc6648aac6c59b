#include "config_loader.hpp"
#include "scanner/data_structures/scanner_errors.hpp"
#include "utils/time_utils.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>
#include <cctype>

using FvgScanner::Core::ConfigurationError;
using FvgScanner::Core::SessionTag;

namespace FvgScanner {
namespace Config {

namespace {
    inline std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        auto e = s.find_last_not_of(ws);
        if (b == std::string::npos) return "";
        return s.substr(b, e - b + 1);
    }

    inline std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    inline bool to_bool(const std::string& key, const std::string& v) {
        std::string s = to_lower(v);
        if (s == "1" || s == "true" || s == "yes") return true;
        if (s == "0" || s == "false" || s == "no") return false;
        throw ConfigurationError(key + ": expected a boolean, got '" + v + "'");
    }

    inline int to_int(const std::string& key, const std::string& v) {
        size_t parsed_length = 0;
        int parsed_value = 0;
        try {
            parsed_value = std::stoi(v, &parsed_length);
        } catch (const std::exception&) {
            throw ConfigurationError(key + ": expected an integer, got '" + v + "'");
        }
        if (parsed_length != v.size()) {
            throw ConfigurationError(key + ": expected an integer, got '" + v + "'");
        }
        return parsed_value;
    }

    inline double to_double(const std::string& key, const std::string& v) {
        size_t parsed_length = 0;
        double parsed_value = 0.0;
        try {
            parsed_value = std::stod(v, &parsed_length);
        } catch (const std::exception&) {
            throw ConfigurationError(key + ": expected a number, got '" + v + "'");
        }
        if (parsed_length != v.size() || !std::isfinite(parsed_value)) {
            throw ConfigurationError(key + ": expected a finite number, got '" + v + "'");
        }
        return parsed_value;
    }

    std::vector<std::string> split_symbols(const std::string& v) {
        std::vector<std::string> symbols;
        std::stringstream symbol_stream(v);
        std::string symbol;
        while (std::getline(symbol_stream, symbol, ';')) {
            symbol = trim(symbol);
            if (!symbol.empty()) symbols.push_back(symbol);
        }
        return symbols;
    }

    SessionTag parse_session_name(const std::string& key, const std::string& name) {
        std::string s = to_lower(name);
        if (s == "premarket" || s == "pre_market") return SessionTag::PRE_MARKET;
        if (s == "am") return SessionTag::AM;
        if (s == "lunch") return SessionTag::LUNCH;
        if (s == "pm") return SessionTag::PM;
        if (s == "afterhours" || s == "after_hours") return SessionTag::AFTER_HOURS;
        if (s == "off_session") return SessionTag::OFF_SESSION;
        throw ConfigurationError(key + ": unknown session name '" + name + "'");
    }

    void set_session_window(SessionConfig& session, const std::string& key, const std::string& name, const std::string& v) {
        SessionTag window_tag = parse_session_name(key, name);
        if (window_tag == SessionTag::OFF_SESSION) {
            throw ConfigurationError(key + ": off_session is the fallback tag and has no window");
        }
        size_t dash_position = v.find('-');
        if (dash_position == std::string::npos) {
            throw ConfigurationError(key + ": expected HH:MM-HH:MM, got '" + v + "'");
        }

        int start_minute = 0;
        int end_minute = 0;
        try {
            start_minute = parse_clock_minutes(trim(v.substr(0, dash_position)));
            end_minute = parse_clock_minutes(trim(v.substr(dash_position + 1)));
        } catch (const ConfigurationError& clock_error) {
            throw ConfigurationError(key + ": " + clock_error.what());
        }

        for (SessionWindow& window : session.windows) {
            if (window.tag == window_tag) {
                window.start_minute = start_minute;
                window.end_minute = end_minute;
                return;
            }
        }
        session.windows.emplace_back(window_tag, start_minute, end_minute);
    }

    double& session_quality_for(SessionQualityConfig& quality, const std::string& key, const std::string& name) {
        switch (parse_session_name(key, name)) {
            case SessionTag::PRE_MARKET: return quality.pre_market;
            case SessionTag::AM: return quality.am;
            case SessionTag::LUNCH: return quality.lunch;
            case SessionTag::PM: return quality.pm;
            case SessionTag::AFTER_HOURS: return quality.after_hours;
            case SessionTag::OFF_SESSION: return quality.off_session;
        }
        return quality.off_session;
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    bool valid_date(const std::string& date_value) {
        try {
            TimeUtils::parse_date_to_epoch_milliseconds(date_value);
            return true;
        } catch (const std::invalid_argument&) {
            return false;
        }
    }
}

int parse_clock_minutes(const std::string& clock_value) {
    size_t colon_position = clock_value.find(':');
    if (colon_position == std::string::npos || colon_position == 0 || colon_position + 3 != clock_value.size()) {
        throw ConfigurationError("expected HH:MM, got '" + clock_value + "'");
    }
    std::string hour_part = clock_value.substr(0, colon_position);
    std::string minute_part = clock_value.substr(colon_position + 1);
    auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
    if (!std::all_of(hour_part.begin(), hour_part.end(), is_digit) ||
        !std::all_of(minute_part.begin(), minute_part.end(), is_digit) || hour_part.size() > 2) {
        throw ConfigurationError("expected HH:MM, got '" + clock_value + "'");
    }

    int hours = std::stoi(hour_part);
    int minutes = std::stoi(minute_part);
    if (minutes > 59 || hours > 24 || (hours == 24 && minutes != 0)) {
        throw ConfigurationError("clock time out of range: '" + clock_value + "'");
    }
    return hours * 60 + minutes;
}

void load_config_from_stream(SystemConfig& cfg, std::istream& in, const std::string& source_name) {
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        std::stringstream ss(line);
        std::string key, value;
        if (!std::getline(ss, key, ',')) continue;
        if (!std::getline(ss, value)) continue;
        key = trim(key); value = trim(value);
        if (value.empty()) continue;

        try {

            // Indicators
            if (key == "indicators.atr_period") cfg.indicators.atr_period = to_int(key, value);
            else if (key == "indicators.atr_mode") {
                try {
                    cfg.indicators.atr_mode = IndicatorConfig::parse_atr_mode(value);
                } catch (const std::runtime_error& mode_error) {
                    throw ConfigurationError(key + ": " + mode_error.what());
                }
            }
            else if (key == "indicators.rvol_period") cfg.indicators.rvol_period = to_int(key, value);

            // Structure
            else if (key == "structure.sweep_lookback_bars") cfg.structure.sweep_lookback_bars = to_int(key, value);
            else if (key == "structure.entry_evaluation_offset_bars") cfg.structure.entry_evaluation_offset_bars = to_int(key, value);
            else if (key == "structure.min_forward_bars") cfg.structure.min_forward_bars = to_int(key, value);
            else if (key == "structure.bos_atr_buffer") cfg.structure.bos_atr_buffer = to_double(key, value);

            // Scoring
            else if (key == "scoring.cleanliness_weight") cfg.scoring.cleanliness_weight = to_double(key, value);
            else if (key == "scoring.size_weight") cfg.scoring.size_weight = to_double(key, value);
            else if (key == "scoring.session_weight") cfg.scoring.session_weight = to_double(key, value);
            else if (key == "scoring.atr_ideal_min") cfg.scoring.atr_ideal_min = to_double(key, value);
            else if (key == "scoring.atr_ideal_max") cfg.scoring.atr_ideal_max = to_double(key, value);
            else if (starts_with(key, "scoring.session_quality.")) {
                session_quality_for(cfg.scoring.session_quality, key, key.substr(std::string("scoring.session_quality.").size())) = to_double(key, value);
            }

            // Session
            else if (key == "session.utc_offset_hours") cfg.session.utc_offset_hours = to_int(key, value);
            else if (key == "session.observe_us_dst") cfg.session.observe_us_dst = to_bool(key, value);
            else if (key == "session.regular_open") cfg.session.regular_open_minute = parse_clock_minutes(value);
            else if (key == "session.regular_close") cfg.session.regular_close_minute = parse_clock_minutes(value);
            else if (starts_with(key, "session.window.")) {
                set_session_window(cfg.session, key, key.substr(std::string("session.window.").size()), value);
            }

            // Data source
            else if (key == "data.source") {
                try {
                    cfg.data.source = DataSourceConfig::parse_source(value);
                } catch (const std::runtime_error& source_error) {
                    throw ConfigurationError(key + ": " + source_error.what());
                }
            }
            else if (key == "data.symbols") cfg.data.symbols = split_symbols(value);
            else if (key == "data.csv_directory") cfg.data.csv_directory = value;
            else if (key == "data.regular_session_only") cfg.data.regular_session_only = to_bool(key, value);
            else if (key == "data.polygon_base_url") cfg.data.polygon_base_url = value;
            else if (key == "data.polygon_aggregates_endpoint") cfg.data.polygon_aggregates_endpoint = value;
            else if (key == "data.polygon_api_key") cfg.data.polygon_api_key = value;
            else if (key == "data.start_date") cfg.data.start_date = value;
            else if (key == "data.end_date") cfg.data.end_date = value;
            else if (key == "data.page_limit") cfg.data.page_limit = to_int(key, value);
            else if (key == "data.retry_count") cfg.data.retry_count = to_int(key, value);
            else if (key == "data.backoff_milliseconds") cfg.data.backoff_milliseconds = to_int(key, value);
            else if (key == "data.timeout_seconds") cfg.data.timeout_seconds = to_int(key, value);
            else if (key == "data.enable_ssl_verification") cfg.data.enable_ssl_verification = to_bool(key, value);

            // Run and output
            else if (key == "run.worker_threads") cfg.run.worker_threads = to_int(key, value);
            else if (key == "output.report_directory") cfg.run.report_directory = value;

            // Logging
            else if (key == "logging.log_file") cfg.logging.log_file = value;
            else if (key == "logging.poll_interval_milliseconds") cfg.logging.logging_poll_interval_milliseconds = to_int(key, value);
            else if (key == "logging.log_rejected_candidates") cfg.logging.log_rejected_candidates = to_bool(key, value);
        } catch (const ConfigurationError& value_error) {
            throw ConfigurationError(source_name + ":" + std::to_string(line_number) + ": " + value_error.what());
        }
    }
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream in(csv_path);
    if (!in.is_open()) return false;
    load_config_from_stream(cfg, in, csv_path);
    return true;
}

bool validate_config(const SystemConfig& config, std::string& errorMessage) {
    if (config.indicators.atr_period < 1) {
        errorMessage = "indicators.atr_period must be >= 1";
        return false;
    }
    if (config.indicators.rvol_period < 1) {
        errorMessage = "indicators.rvol_period must be >= 1";
        return false;
    }
    if (config.structure.sweep_lookback_bars < 0) {
        errorMessage = "structure.sweep_lookback_bars must be >= 0";
        return false;
    }
    if (config.structure.entry_evaluation_offset_bars < 1) {
        errorMessage = "structure.entry_evaluation_offset_bars must be >= 1";
        return false;
    }
    if (config.structure.min_forward_bars < 1) {
        errorMessage = "structure.min_forward_bars must be >= 1";
        return false;
    }
    if (config.structure.bos_atr_buffer < 0.0) {
        errorMessage = "structure.bos_atr_buffer must be >= 0";
        return false;
    }
    if (config.scoring.cleanliness_weight < 0.0 || config.scoring.size_weight < 0.0 || config.scoring.session_weight < 0.0) {
        errorMessage = "scoring weights must be non-negative";
        return false;
    }
    if (config.scoring.atr_ideal_min < 0.0 || config.scoring.atr_ideal_max <= 0.0) {
        errorMessage = "scoring.atr_ideal_min must be >= 0 and scoring.atr_ideal_max > 0";
        return false;
    }
    if (config.scoring.atr_ideal_min > config.scoring.atr_ideal_max) {
        errorMessage = "scoring.atr_ideal_min must not exceed scoring.atr_ideal_max";
        return false;
    }
    const SessionQualityConfig& quality = config.scoring.session_quality;
    for (double session_quality : {quality.pre_market, quality.am, quality.lunch, quality.pm, quality.after_hours, quality.off_session}) {
        if (session_quality < 0.0 || session_quality > 1.0) {
            errorMessage = "scoring.session_quality values must be between 0 and 1";
            return false;
        }
    }
    if (config.session.utc_offset_hours < -12 || config.session.utc_offset_hours > 14) {
        errorMessage = "session.utc_offset_hours must be between -12 and 14";
        return false;
    }
    if (config.session.regular_open_minute >= config.session.regular_close_minute) {
        errorMessage = "session.regular_open must be before session.regular_close";
        return false;
    }
    for (size_t window_position = 0; window_position < config.session.windows.size(); ++window_position) {
        const SessionWindow& window = config.session.windows[window_position];
        if (window.start_minute >= window.end_minute) {
            errorMessage = "session.window." + Core::to_string(window.tag) + " start must be before end";
            return false;
        }
        for (size_t other_position = window_position + 1; other_position < config.session.windows.size(); ++other_position) {
            const SessionWindow& other_window = config.session.windows[other_position];
            if (window.start_minute < other_window.end_minute && other_window.start_minute < window.end_minute) {
                errorMessage = "session.window." + Core::to_string(window.tag) + " overlaps session.window." + Core::to_string(other_window.tag);
                return false;
            }
        }
    }
    if (config.data.symbols.empty()) {
        errorMessage = "data.symbols is empty (provide ';'-separated symbols)";
        return false;
    }
    if (config.data.source == DataSource::CSV && config.data.csv_directory.empty()) {
        errorMessage = "data.csv_directory is required for the csv source";
        return false;
    }
    if (config.data.source == DataSource::POLYGON) {
        if (!valid_date(config.data.start_date) || !valid_date(config.data.end_date)) {
            errorMessage = "data.start_date and data.end_date must be YYYY-MM-DD for the polygon source";
            return false;
        }
        if (TimeUtils::parse_date_to_epoch_milliseconds(config.data.start_date) > TimeUtils::parse_date_to_epoch_milliseconds(config.data.end_date)) {
            errorMessage = "data.start_date must not be after data.end_date";
            return false;
        }
        if (config.data.retry_count < 1 || config.data.page_limit < 1 || config.data.timeout_seconds < 1 || config.data.backoff_milliseconds < 0) {
            errorMessage = "data.retry_count, data.page_limit and data.timeout_seconds must be >= 1; data.backoff_milliseconds >= 0";
            return false;
        }
    }
    if (config.run.worker_threads < 0) {
        errorMessage = "run.worker_threads must be >= 0";
        return false;
    }
    if (config.run.report_directory.empty()) {
        errorMessage = "output.report_directory is empty";
        return false;
    }
    if (config.logging.log_file.empty()) {
        errorMessage = "Logging path is empty (provide via CONFIG_CSV)";
        return false;
    }
    if (config.logging.logging_poll_interval_milliseconds < 1) {
        errorMessage = "logging.poll_interval_milliseconds must be >= 1";
        return false;
    }
    return true;
}

SystemConfig load_system_config(const std::string& csv_path) {
    SystemConfig config;
    if (!load_config_from_csv(config, csv_path)) {
        throw ConfigurationError("Cannot open configuration file: " + csv_path);
    }
    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        throw ConfigurationError("Invalid configuration in " + csv_path + ": " + validation_error);
    }
    return config;
}

} // namespace Config
} // namespace FvgScanner
