#ifndef BAR_SERIES_VALIDATOR_HPP
#define BAR_SERIES_VALIDATOR_HPP

#include <string>
#include <vector>
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Core {

/**
 * BarSeriesValidator - data-integrity gate run before any pipeline stage.
 * Throws DataIntegrityError naming the symbol and the offending bar index.
 */
class BarSeriesValidator {
public:
    explicit BarSeriesValidator(const std::string& symbol);

    void validate_series(const std::vector<Bar>& bars) const;
    void validate_price_data(const Bar& bar, size_t bar_index) const;
    void validate_ordering(const Bar& previous_bar, const Bar& current_bar, size_t bar_index) const;

private:
    std::string symbol;
};

} // namespace Core
} // namespace FvgScanner

#endif // BAR_SERIES_VALIDATOR_HPP
