#pragma once
#include <cstdint>
#include <vector>

#include "apps/venh/HistogramEngine.hpp"
#include "msg/Frame.hpp"
#include "msg/FrameGroup.hpp"

namespace venh {

struct FrameGrouperConfig {
    // Adjacent frames with similarity >= threshold share a group.
    float SIMILARITY_THRESHOLD = 0.92f;

    HistogramConfig HIST{};
};

// ---------------------------------------------------------------------------
// FrameGrouper: single left-to-right pass over the sequence.
// Frame i joins the current group when Similarity(H[i-1], H[i]) >= threshold,
// otherwise it opens a new group. Each group gets its representative from
// SelectRepresentative().
// ---------------------------------------------------------------------------
class FrameGrouper {
public:
    explicit FrameGrouper(const FrameGrouperConfig& cfg = {});

    void setConfig(const FrameGrouperConfig& cfg);

    // Partition 'frames' into contiguous groups. An empty sequence yields
    // no groups. A frame whose histogram cannot be computed always starts a
    // new group and is never joined by its successor.
    bool group(const std::vector<msg::Frame>& frames,
               std::vector<msg::FrameGroup>& out) const;

    // Same pass over precomputed adjacent similarities: sims[i] compares
    // frame i with frame i+1, so sims.size() == frame_count - 1.
    bool groupFromSimilarities(const std::vector<float>& sims, uint32_t frame_count,
                               std::vector<msg::FrameGroup>& out) const;

    float threshold() const { return m_cfg.SIMILARITY_THRESHOLD; }

private:
    FrameGrouperConfig m_cfg{};
    HistogramEngine    m_hist;
};

} // namespace venh
