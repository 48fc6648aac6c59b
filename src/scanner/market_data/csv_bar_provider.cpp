#include "csv_bar_provider.hpp"
#include "scanner/data_structures/scanner_errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace FvgScanner {
namespace Core {

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline std::string normalize_header(std::string header_line) {
        header_line.erase(std::remove_if(header_line.begin(), header_line.end(),
                                         [](unsigned char c) { return std::isspace(c); }), header_line.end());
        std::transform(header_line.begin(), header_line.end(), header_line.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return header_line;
    }
}

std::vector<Bar> parse_bar_csv(std::istream& csv_stream, const std::string& source_name) {
    std::string header_line;
    if (!std::getline(csv_stream, header_line)) {
        throw DataSourceError("Empty bar file: " + source_name);
    }
    if (normalize_header(header_line) != "ts_ms,open,high,low,close,volume") {
        throw DataSourceError("Unrecognized bar file header in " + source_name + ": " + trim(header_line));
    }

    std::vector<Bar> bars;
    std::string line;
    size_t line_number = 1;
    while (std::getline(csv_stream, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty()) continue;

        std::stringstream line_stream(line);
        std::string field;
        std::vector<std::string> fields;
        while (std::getline(line_stream, field, ',')) {
            fields.push_back(trim(field));
        }
        if (fields.size() != 6) {
            throw DataSourceError("Malformed bar row at " + source_name + ":" + std::to_string(line_number) +
                                  " (expected 6 fields, got " + std::to_string(fields.size()) + ")");
        }

        try {
            bars.emplace_back(std::stoll(fields[0]), std::stod(fields[1]), std::stod(fields[2]),
                              std::stod(fields[3]), std::stod(fields[4]), std::stod(fields[5]));
        } catch (const std::exception& parse_exception) {
            throw DataSourceError("Bad numeric value at " + source_name + ":" + std::to_string(line_number) +
                                  " - " + parse_exception.what());
        }
    }
    return bars;
}

CsvBarProvider::CsvBarProvider(const std::string& csv_directory) : directory(csv_directory) {}

std::string CsvBarProvider::path_for_symbol(const std::string& symbol) const {
    if (directory.empty()) {
        return symbol + ".csv";
    }
    return directory + (directory.back() == '/' ? "" : "/") + symbol + ".csv";
}

std::vector<Bar> CsvBarProvider::load_bars(const std::string& symbol) const {
    std::string file_path = path_for_symbol(symbol);
    std::ifstream bar_file(file_path);
    if (!bar_file.is_open()) {
        throw DataSourceError("Cannot open bar file for " + symbol + ": " + file_path);
    }
    return parse_bar_csv(bar_file, file_path);
}

} // namespace Core
} // namespace FvgScanner
