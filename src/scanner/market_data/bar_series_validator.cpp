#include "bar_series_validator.hpp"
#include "scanner/data_structures/scanner_errors.hpp"
#include <cmath>
#include <algorithm>

namespace FvgScanner {
namespace Core {

BarSeriesValidator::BarSeriesValidator(const std::string& series_symbol) : symbol(series_symbol) {}

void BarSeriesValidator::validate_series(const std::vector<Bar>& bars) const {
    for (size_t bar_index = 0; bar_index < bars.size(); ++bar_index) {
        validate_price_data(bars[bar_index], bar_index);
        if (bar_index > 0) {
            validate_ordering(bars[bar_index - 1], bars[bar_index], bar_index);
        }
    }
}

void BarSeriesValidator::validate_price_data(const Bar& bar, size_t bar_index) const {
    if (!std::isfinite(bar.open_price) || !std::isfinite(bar.high_price) ||
        !std::isfinite(bar.low_price) || !std::isfinite(bar.close_price) || !std::isfinite(bar.volume)) {
        throw DataIntegrityError(symbol + ": non-finite price or volume at bar " + std::to_string(bar_index));
    }

    if (bar.high_price < bar.low_price) {
        throw DataIntegrityError(symbol + ": high below low at bar " + std::to_string(bar_index) +
                                 " | H:" + std::to_string(bar.high_price) + " L:" + std::to_string(bar.low_price));
    }

    // Open and close must lie inside the bar's range
    if (bar.high_price < std::max(bar.open_price, bar.close_price) || bar.low_price > std::min(bar.open_price, bar.close_price)) {
        throw DataIntegrityError(symbol + ": open/close outside high/low at bar " + std::to_string(bar_index));
    }

    if (bar.volume < 0.0) {
        throw DataIntegrityError(symbol + ": negative volume at bar " + std::to_string(bar_index));
    }
}

void BarSeriesValidator::validate_ordering(const Bar& previous_bar, const Bar& current_bar, size_t bar_index) const {
    if (current_bar.timestamp_ms == previous_bar.timestamp_ms) {
        throw DataIntegrityError(symbol + ": duplicate timestamp " + std::to_string(current_bar.timestamp_ms) +
                                 " at bar " + std::to_string(bar_index));
    }
    if (current_bar.timestamp_ms < previous_bar.timestamp_ms) {
        throw DataIntegrityError(symbol + ": out-of-order timestamp " + std::to_string(current_bar.timestamp_ms) +
                                 " at bar " + std::to_string(bar_index) + " (previous " + std::to_string(previous_bar.timestamp_ms) + ")");
    }
}

} // namespace Core
} // namespace FvgScanner
