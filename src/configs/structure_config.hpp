// StructureConfig.hpp
#ifndef STRUCTURE_CONFIG_HPP
#define STRUCTURE_CONFIG_HPP

namespace FvgScanner {
namespace Config {

struct StructureConfig {
    int sweep_lookback_bars = 20;                    // Window before the gap's first bar searched for a sweep
    int entry_evaluation_offset_bars = 10;           // Bars after formation at which the entry is evaluated
    int min_forward_bars = 2;                        // Bars needed after formation before a gap can resolve
    double bos_atr_buffer = 0.1;                     // Close beyond a swing level by this many ATR breaks structure
};

} // namespace Config
} // namespace FvgScanner

#endif // STRUCTURE_CONFIG_HPP
