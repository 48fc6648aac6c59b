// IndicatorConfig.hpp
#ifndef INDICATOR_CONFIG_HPP
#define INDICATOR_CONFIG_HPP

#include <string>
#include <stdexcept>

namespace FvgScanner {
namespace Config {

enum class AtrMode {
    SMA,
    WILDER
};

struct IndicatorConfig {
    int atr_period = 14;                             // True ranges averaged per ATR value
    AtrMode atr_mode = AtrMode::SMA;                 // Rolling simple mean or Wilder smoothing
    int rvol_period = 20;                            // Preceding bars in the relative-volume baseline

    static AtrMode parse_atr_mode(const std::string& mode_str) {
        if (mode_str == "sma" || mode_str == "SMA") {
            return AtrMode::SMA;
        } else if (mode_str == "wilder" || mode_str == "WILDER" || mode_str == "ema" || mode_str == "EMA") {
            return AtrMode::WILDER;
        } else {
            throw std::runtime_error("Invalid ATR mode: " + mode_str + ". Must be 'sma' or 'wilder'");
        }
    }

    static std::string atr_mode_to_string(AtrMode mode) {
        switch (mode) {
            case AtrMode::SMA:
                return "sma";
            case AtrMode::WILDER:
                return "wilder";
        }
        return "sma";
    }
};

} // namespace Config
} // namespace FvgScanner

#endif // INDICATOR_CONFIG_HPP
