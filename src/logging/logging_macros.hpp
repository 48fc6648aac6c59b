#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

// Standard indentation levels
#define LOG_INDENT_L1 "        "      // 8 spaces - Main section level
#define LOG_INDENT_L2 "        |   "  // Content level

// Section headers and footers
#define LOG_SECTION_HEADER(title) FvgScanner::Logging::log_message(LOG_INDENT_L1 "+-- " + std::string(title), "")
#define LOG_SECTION_FOOTER() FvgScanner::Logging::log_message(LOG_INDENT_L1 "+--", "")

// Content logging macros
#define LOG_CONTENT(msg) FvgScanner::Logging::log_message(LOG_INDENT_L2 + std::string(msg), "")

// Run header (special case - no indentation)
#define LOG_SCAN_RUN_HEADER(symbol_count, worker_count) \
    FvgScanner::Logging::log_message("", ""); \
    FvgScanner::Logging::log_message("================================================================================", ""); \
    FvgScanner::Logging::log_message("                    FVG SCAN - " + std::to_string(symbol_count) + " SYMBOLS / " + std::to_string(worker_count) + " WORKERS", ""); \
    FvgScanner::Logging::log_message("================================================================================", ""); \
    FvgScanner::Logging::log_message("", "")

#endif // LOGGING_MACROS_HPP
