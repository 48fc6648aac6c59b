#ifndef STRUCTURE_DETECTOR_HPP
#define STRUCTURE_DETECTOR_HPP

#include <vector>
#include <optional>
#include "configs/structure_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace FvgScanner {
namespace Core {

// Bars needed on each side of a fractal pivot.
constexpr size_t PIVOT_NEIGHBOR_BARS = 2;

/**
 * Two-state forward tracker for one gap. UNTOUCHED -> TOUCHED is the only
 * transition and it is never undone; later bars are ignored once touched.
 */
class GapTouchTracker {
public:
    enum class State {
        UNTOUCHED,
        TOUCHED
    };

    explicit GapTouchTracker(const FairValueGap& gap);

    // Applies one post-formation bar and returns the resulting state.
    State observe(const Bar& bar, size_t bar_index);

    State get_state() const { return state; }
    bool is_untouched() const { return state == State::UNTOUCHED; }
    std::optional<size_t> get_touch_index() const { return touch_index; }

private:
    double lower_bound;
    double upper_bound;
    State state;
    std::optional<size_t> touch_index;
};

std::vector<SwingPivot> detect_swing_pivots(const std::vector<AnnotatedBar>& bars);

std::vector<FairValueGap> detect_fair_value_gaps(const std::vector<AnnotatedBar>& bars);

// Most recent sweep of a confirmed pivot on the liquidity side opposite to the gap's direction.
std::optional<LiquiditySweep> find_liquidity_sweep(const std::vector<AnnotatedBar>& bars,
                                                   const std::vector<SwingPivot>& pivots,
                                                   const FairValueGap& gap,
                                                   const Config::StructureConfig& structure_config);

size_t entry_evaluation_index(const FairValueGap& gap, size_t bar_count, const Config::StructureConfig& structure_config);

std::vector<GapCandidate> evaluate_gap_candidates(const std::vector<AnnotatedBar>& bars,
                                                  const std::vector<SwingPivot>& pivots,
                                                  const std::vector<FairValueGap>& gaps,
                                                  const Config::StructureConfig& structure_config);

std::vector<StructureBreak> detect_structure_breaks(const std::vector<AnnotatedBar>& bars,
                                                    const std::vector<SwingPivot>& pivots,
                                                    const Config::StructureConfig& structure_config);

// First break in the gap's direction inside [from_index, to_index].
std::optional<StructureBreak> find_structure_break(const std::vector<StructureBreak>& breaks,
                                                   GapDirection direction,
                                                   size_t from_index,
                                                   size_t to_index);

} // namespace Core
} // namespace FvgScanner

#endif // STRUCTURE_DETECTOR_HPP
