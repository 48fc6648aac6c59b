#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>
#include <optional>

namespace FvgScanner {
namespace Core {

struct Bar {
    long long timestamp_ms;
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;

    Bar() : timestamp_ms(0), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0) {}
    Bar(long long timestamp, double open, double high, double low, double close, double bar_volume)
        : timestamp_ms(timestamp), open_price(open), high_price(high), low_price(low), close_price(close), volume(bar_volume) {}
};

// Named intraday windows in the symbol's local market time.
enum class SessionTag {
    PRE_MARKET,
    AM,
    LUNCH,
    PM,
    AFTER_HOURS,
    OFF_SESSION
};

std::string to_string(SessionTag session_tag);

struct AnnotatedBar {
    Bar bar;
    std::optional<double> atr;
    std::optional<double> rvol;
    double vwap;
    long long session_id;
    SessionTag session_tag;

    AnnotatedBar() : bar(), atr(), rvol(), vwap(0.0), session_id(0), session_tag(SessionTag::OFF_SESSION) {}
};

// ========================================================================
// STRUCTURE DATA
// ========================================================================

enum class PivotKind {
    HIGH,
    LOW
};

struct SwingPivot {
    size_t index;
    double level;
    PivotKind kind;

    SwingPivot(size_t bar_index, double pivot_level, PivotKind pivot_kind)
        : index(bar_index), level(pivot_level), kind(pivot_kind) {}
};

enum class GapDirection {
    BULLISH,
    BEARISH
};

std::string to_string(GapDirection direction);

/**
 * Three-candle imbalance. Bounds are fixed when the third candle closes.
 * formation_index is the third candle; first_index and middle_index precede it.
 */
struct FairValueGap {
    GapDirection direction;
    double lower_bound;
    double upper_bound;
    size_t first_index;
    size_t middle_index;
    size_t formation_index;
    double width;
    std::optional<double> width_in_atr;

    FairValueGap()
        : direction(GapDirection::BULLISH), lower_bound(0.0), upper_bound(0.0),
          first_index(0), middle_index(0), formation_index(0), width(0.0), width_in_atr() {}
};

struct LiquiditySweep {
    size_t pivot_index;
    double pivot_level;
    PivotKind pivot_kind;
    size_t sweep_index;

    LiquiditySweep(size_t swept_pivot_index, double swept_level, PivotKind swept_kind, size_t sweep_bar_index)
        : pivot_index(swept_pivot_index), pivot_level(swept_level), pivot_kind(swept_kind), sweep_index(sweep_bar_index) {}
};

struct StructureBreak {
    size_t index;
    GapDirection direction;
    size_t pivot_index;

    StructureBreak(size_t break_index, GapDirection break_direction, size_t broken_pivot_index)
        : index(break_index), direction(break_direction), pivot_index(broken_pivot_index) {}
};

enum class GapStatus {
    QUALIFIED,
    REJECTED,
    PENDING
};

std::string to_string(GapStatus status);

struct GapCandidate {
    FairValueGap gap;
    GapStatus status;
    size_t evaluation_index;
    std::optional<size_t> touch_index;
    std::optional<LiquiditySweep> sweep;

    GapCandidate() : gap(), status(GapStatus::PENDING), evaluation_index(0), touch_index(), sweep() {}

    bool is_untouched_at_evaluation() const { return status == GapStatus::QUALIFIED; }
    bool is_scorable() const { return status == GapStatus::QUALIFIED && sweep.has_value(); }
};

// ========================================================================
// SCORING DATA
// ========================================================================

struct ScoreBreakdown {
    double cleanliness;
    std::optional<double> size;
    double session_quality;
    double composite;

    ScoreBreakdown() : cleanliness(0.0), size(), session_quality(0.0), composite(0.0) {}
};

struct Setup {
    std::string symbol;
    FairValueGap gap;
    LiquiditySweep sweep;
    size_t entry_index;
    long long entry_timestamp_ms;
    SessionTag session_tag;
    ScoreBreakdown score;
    bool untouched_at_evaluation;
    std::optional<double> rvol_at_formation;
    double vwap_at_entry;
    std::optional<size_t> structure_break_index;

    Setup(const std::string& setup_symbol, const FairValueGap& fair_value_gap, const LiquiditySweep& liquidity_sweep)
        : symbol(setup_symbol), gap(fair_value_gap), sweep(liquidity_sweep), entry_index(0), entry_timestamp_ms(0),
          session_tag(SessionTag::OFF_SESSION), score(), untouched_at_evaluation(false), rvol_at_formation(),
          vwap_at_entry(0.0), structure_break_index() {}

    // Gap lies above VWAP for bullish setups (below for bearish) at the entry bar.
    bool gap_on_trend_side_of_vwap() const {
        return gap.direction == GapDirection::BULLISH ? gap.lower_bound > vwap_at_entry : gap.upper_bound < vwap_at_entry;
    }
};

// ========================================================================
// PIPELINE OUTCOMES
// ========================================================================

enum class OutcomeStatus {
    SETUPS_FOUND,
    NO_SETUPS,
    FAILED
};

std::string to_string(OutcomeStatus status);

enum class FailureKind {
    NONE,
    DATA_INTEGRITY,
    DATA_SOURCE,
    PROCESSING
};

std::string to_string(FailureKind kind);

struct SymbolScanResult {
    std::string symbol;
    OutcomeStatus status;
    FailureKind failure_kind;
    std::string failure_reason;
    bool insufficient_history;
    size_t bar_count;
    std::vector<GapCandidate> candidates;
    std::vector<Setup> setups;

    explicit SymbolScanResult(const std::string& result_symbol)
        : symbol(result_symbol), status(OutcomeStatus::NO_SETUPS), failure_kind(FailureKind::NONE),
          failure_reason(), insufficient_history(false), bar_count(0), candidates(), setups() {}

    bool succeeded() const { return status != OutcomeStatus::FAILED; }
};

} // namespace Core
} // namespace FvgScanner

#endif // DATA_STRUCTURES_HPP
