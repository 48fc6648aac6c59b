#include "data_structures.hpp"

namespace FvgScanner {
namespace Core {

std::string to_string(SessionTag session_tag) {
    switch (session_tag) {
        case SessionTag::PRE_MARKET: return "premarket";
        case SessionTag::AM: return "am";
        case SessionTag::LUNCH: return "lunch";
        case SessionTag::PM: return "pm";
        case SessionTag::AFTER_HOURS: return "afterhours";
        case SessionTag::OFF_SESSION: return "off_session";
    }
    return "off_session";
}

std::string to_string(GapDirection direction) {
    return direction == GapDirection::BULLISH ? "bullish" : "bearish";
}

std::string to_string(GapStatus status) {
    switch (status) {
        case GapStatus::QUALIFIED: return "qualified";
        case GapStatus::REJECTED: return "rejected";
        case GapStatus::PENDING: return "pending";
    }
    return "pending";
}

std::string to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::SETUPS_FOUND: return "SETUPS_FOUND";
        case OutcomeStatus::NO_SETUPS: return "NO_SETUPS";
        case OutcomeStatus::FAILED: return "FAILED";
    }
    return "FAILED";
}

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "none";
        case FailureKind::DATA_INTEGRITY: return "data_integrity";
        case FailureKind::DATA_SOURCE: return "data_source";
        case FailureKind::PROCESSING: return "processing";
    }
    return "processing";
}

} // namespace Core
} // namespace FvgScanner
