#pragma once
#include <cstdint>
#include <opencv2/core.hpp>

#include "msg/Critique.hpp"
#include "msg/GroupReport.hpp"

namespace msg {

// Per-group orchestration states.
//   ENHANCING -> ANALYZING -> { SATISFIED | SURGICAL_EDIT -> ANALYZING
//                              | GLOBAL_RETRY -> ENHANCING } -> TERMINAL
enum class AttemptState : uint8_t {
    ENHANCING = 0,
    ANALYZING,
    SURGICAL_EDIT,
    GLOBAL_RETRY,
    SATISFIED,
    TERMINAL,
};

inline const char* AttemptStateStr(AttemptState s) {
    switch (s) {
        case AttemptState::ENHANCING:     return "ENHANCING";
        case AttemptState::ANALYZING:     return "ANALYZING";
        case AttemptState::SURGICAL_EDIT: return "SURGICAL_EDIT";
        case AttemptState::GLOBAL_RETRY:  return "GLOBAL_RETRY";
        case AttemptState::SATISFIED:     return "SATISFIED";
        case AttemptState::TERMINAL:      return "TERMINAL";
        default:                          return "UNKNOWN";
    }
}

// One group's representative as it moves through the state machine.
// 'edited' is what the representative will be written out as, surgical
// composites included. 'surgical_mask' is the union of every region touched
// by a surgical edit (CV_8UC1, empty if none); those pixels are left out
// when the group's colour transform is derived.
struct EnhancementAttempt {
    cv::Mat original;       // representative before enhancement (read-only)
    cv::Mat edited;         // empty until the first successful enhancement
    cv::Mat surgical_mask;

    Critique critique{};
    bool     scored = false;

    uint8_t  iteration = 0;
    uint8_t  surgical_edits = 0;
    AttemptState state = AttemptState::ENHANCING;
    StopReason   stop  = StopReason::NONE;

    bool hasEdit() const { return !edited.empty(); }
    bool terminal() const {
        return state == AttemptState::SATISFIED || state == AttemptState::TERMINAL;
    }
};

} // namespace msg
