#pragma once
#include <cstdint>
#include "msg/FrameGroup.hpp"

namespace venh {

// Temporal midpoint of the group: start + floor(size / 2).
// Deterministic, always inside [start, end) for a non-empty group.
// An empty group returns its start.
uint32_t SelectRepresentative(const msg::FrameGroup& group);

} // namespace venh
