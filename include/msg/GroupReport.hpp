#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace msg {

enum class ErrorKind : uint8_t {
    NONE = 0,
    TRANSIENT_SERVICE,     // timeout / rate limit / non-zero exit from an AI service
    MALFORMED_RESPONSE,    // critique payload could not be parsed
    GEOMETRY_MISMATCH,     // edited representative changed dimensions
    TOOL_INVOCATION,       // frame extraction or reassembly failed (fatal)
    INPUT_REJECTED,        // input exceeds configured duration/size (fatal)
    BUDGET_EXPIRED,        // wall-clock budget ran out before the group finished
    SERVICE_UNAVAILABLE,   // capability not configured
};

inline const char* ErrorKindStr(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:                return "NONE";
        case ErrorKind::TRANSIENT_SERVICE:   return "TRANSIENT_SERVICE";
        case ErrorKind::MALFORMED_RESPONSE:  return "MALFORMED_RESPONSE";
        case ErrorKind::GEOMETRY_MISMATCH:   return "GEOMETRY_MISMATCH";
        case ErrorKind::TOOL_INVOCATION:     return "TOOL_INVOCATION";
        case ErrorKind::INPUT_REJECTED:      return "INPUT_REJECTED";
        case ErrorKind::BUDGET_EXPIRED:      return "BUDGET_EXPIRED";
        case ErrorKind::SERVICE_UNAVAILABLE: return "SERVICE_UNAVAILABLE";
        default:                             return "UNKNOWN";
    }
}

// Group-local fallback to a lower-quality but valid output.
struct GroupDegradationNotice {
    uint32_t    group_index = 0;
    ErrorKind   kind = ErrorKind::NONE;
    std::string detail;
};

// Why the orchestrator stopped iterating on a group.
enum class StopReason : uint8_t {
    NONE = 0,
    TARGET_SCORE,      // score >= target
    NO_ISSUES,         // critique reported nothing left to fix
    ITERATION_CAP,     // hit max iterations
    DEGRADED,          // external failure, accepted best so far
    BUDGET_EXPIRED,    // run deadline passed
};

inline const char* StopReasonStr(StopReason r) {
    switch (r) {
        case StopReason::NONE:           return "NONE";
        case StopReason::TARGET_SCORE:   return "TARGET_SCORE";
        case StopReason::NO_ISSUES:      return "NO_ISSUES";
        case StopReason::ITERATION_CAP:  return "ITERATION_CAP";
        case StopReason::DEGRADED:       return "DEGRADED";
        case StopReason::BUDGET_EXPIRED: return "BUDGET_EXPIRED";
        default:                         return "UNKNOWN";
    }
}

// Per-group summary handed back to the caller.
struct GroupReport {
    uint32_t group_index = 0;
    uint32_t start = 0;
    uint32_t end   = 0;
    uint32_t representative = 0;

    uint8_t  iterations = 0;
    uint8_t  surgical_edits = 0;
    float    final_score = 0.0f;   // last critique score (0 if never scored)
    bool     scored = false;
    bool     edited = false;       // representative differs from the source
    StopReason stop = StopReason::NONE;

    std::vector<std::string> applied;  // issue descriptions acted on
};

} // namespace msg
