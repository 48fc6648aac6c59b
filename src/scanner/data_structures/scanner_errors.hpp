#ifndef SCANNER_ERRORS_HPP
#define SCANNER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace FvgScanner {
namespace Core {

// Bar series violates ordering or price sanity. Fatal for that symbol only.
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& message) : std::runtime_error(message) {}
};

// Bars could not be retrieved for a symbol (HTTP, JSON, missing file).
class DataSourceError : public std::runtime_error {
public:
    explicit DataSourceError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid weights/thresholds. Raised before any symbol is processed.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Core
} // namespace FvgScanner

#endif // SCANNER_ERRORS_HPP
