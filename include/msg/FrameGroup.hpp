#pragma once
#include <cstdint>

namespace msg {

// Half-open index range [start, end) over the frame sequence.
// Groups produced for one run partition the sequence exactly and are
// ordered by start.
struct FrameGroup {
    uint32_t start = 0;
    uint32_t end   = 0;
    uint32_t representative = 0;   // absolute frame index, start <= rep < end

    uint32_t size() const { return end - start; }
    bool contains(uint32_t idx) const { return idx >= start && idx < end; }
};

} // namespace msg
