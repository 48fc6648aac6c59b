// main.cpp
#include "system/scan_system.hpp"
#include "scanner/data_structures/scanner_errors.hpp"
#include "logging/logs/scan_logs.hpp"
#include <iostream>

using namespace FvgScanner::System;

namespace {
    constexpr const char* DEFAULT_CONFIG_PATH = "config/scanner_config.csv";

    void print_usage(const char* program_name) {
        std::cerr << "Usage: " << program_name << " [config_csv_path]" << std::endl;
        std::cerr << "  Scans minute bars for liquidity sweeps followed by untouched fair value gaps." << std::endl;
        std::cerr << "  Defaults to " << DEFAULT_CONFIG_PATH << std::endl;
    }
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return EXIT_CODE_FATAL;
    }
    std::string config_path = argc == 2 ? argv[1] : DEFAULT_CONFIG_PATH;
    if (config_path == "-h" || config_path == "--help") {
        print_usage(argv[0]);
        return EXIT_CODE_SUCCESS;
    }

    ScanInitializationResult initialization_result;
    try {
        initialization_result = initialize(config_path);
    } catch (const FvgScanner::Core::ConfigurationError& configuration_error) {
        FvgScanner::Logging::ScanLogs::log_configuration_error(configuration_error.what());
        return EXIT_CODE_FATAL;
    } catch (const std::exception& exception_error) {
        FvgScanner::Logging::ScanLogs::log_fatal_error(std::string("Initialization failed: ") + exception_error.what());
        return EXIT_CODE_FATAL;
    }

    ScanSystemState& system_state = *initialization_result.system_state;
    int exit_code = EXIT_CODE_FATAL;
    try {
        startup(system_state, initialization_result.logger);
        exit_code = run(system_state);
    } catch (const std::exception& exception_error) {
        FvgScanner::Logging::ScanLogs::log_fatal_error(exception_error.what());
        exit_code = EXIT_CODE_FATAL;
    }

    shutdown(system_state, initialization_result.logger);
    return exit_code;
}
