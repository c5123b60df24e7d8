#include "apps/venh/RepresentativeSelector.hpp"

namespace venh {

uint32_t SelectRepresentative(const msg::FrameGroup& group) {
    if (group.end <= group.start) return group.start;
    return group.start + (group.end - group.start) / 2;
}

} // namespace venh
