#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <istream>
#include <string>
#include "system_config.hpp"

namespace FvgScanner {
namespace Config {

// Apply key,value lines to cfg. Unknown keys are ignored; malformed values throw ConfigurationError.
void load_config_from_stream(SystemConfig& cfg, std::istream& csv_stream, const std::string& source_name);

// Load key,value CSV into SystemConfig. Returns false when the file cannot be opened.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& errorMessage);

// Defaults overlaid with csv_path, then validated. Throws ConfigurationError before any symbol is scanned.
SystemConfig load_system_config(const std::string& csv_path);

// "HH:MM" -> minutes after midnight; "24:00" is accepted as the end of day.
int parse_clock_minutes(const std::string& clock_value);

} // namespace Config
} // namespace FvgScanner

#endif // CONFIG_LOADER_HPP
