#include "apps/venh/FrameGrouper.hpp"
#include "apps/venh/RepresentativeSelector.hpp"

#include <iostream>

namespace venh {

static inline FrameGrouperConfig sanitise(const FrameGrouperConfig& in) {
    FrameGrouperConfig cfg = in;

    // Similarity lives in [-1, 1]; anything outside collapses to all-join
    // or all-split, which is allowed but almost certainly a typo.
    if (cfg.SIMILARITY_THRESHOLD > 1.0f)  cfg.SIMILARITY_THRESHOLD = 1.0f;
    if (cfg.SIMILARITY_THRESHOLD < -1.0f) cfg.SIMILARITY_THRESHOLD = -1.0f;
    return cfg;
}

FrameGrouper::FrameGrouper(const FrameGrouperConfig& cfg)
: m_cfg(sanitise(cfg))
, m_hist(m_cfg.HIST) {
}

void FrameGrouper::setConfig(const FrameGrouperConfig& cfg) {
    m_cfg  = sanitise(cfg);
    m_hist = HistogramEngine(m_cfg.HIST);
}

bool FrameGrouper::group(const std::vector<msg::Frame>& frames,
                         std::vector<msg::FrameGroup>& out) const {
    out.clear();
    if (frames.empty()) return true;

    const uint32_t n = static_cast<uint32_t>(frames.size());
    std::vector<float> sims;
    sims.reserve(n - 1);

    Histogram prev{};
    bool prev_ok = m_hist.compute(frames[0].pixels, prev);
    uint32_t failed = prev_ok ? 0 : 1;

    for (uint32_t i = 1; i < n; ++i) {
        Histogram cur{};
        const bool cur_ok = m_hist.compute(frames[i].pixels, cur);
        if (!cur_ok) ++failed;

        // -2 is below any threshold: forces a boundary.
        sims.push_back((prev_ok && cur_ok) ? HistogramEngine::similarity(prev, cur) : -2.0f);

        prev    = cur;
        prev_ok = cur_ok;
    }

    if (failed > 0) {
        std::cerr << "[FrameGrouper] " << failed << " frame(s) without histogram, split around them\n";
    }

    return groupFromSimilarities(sims, n, out);
}

bool FrameGrouper::groupFromSimilarities(const std::vector<float>& sims, uint32_t frame_count,
                                         std::vector<msg::FrameGroup>& out) const {
    out.clear();
    if (frame_count == 0) return true;
    if (sims.size() + 1 != frame_count) {
        std::cerr << "[FrameGrouper] expected " << (frame_count - 1)
                  << " similarities, got " << sims.size() << "\n";
        return false;
    }

    msg::FrameGroup cur{};
    cur.start = 0;

    for (uint32_t i = 1; i < frame_count; ++i) {
        if (sims[i - 1] >= m_cfg.SIMILARITY_THRESHOLD) continue;

        cur.end = i;
        cur.representative = SelectRepresentative(cur);
        out.push_back(cur);

        cur = msg::FrameGroup{};
        cur.start = i;
    }

    cur.end = frame_count;
    cur.representative = SelectRepresentative(cur);
    out.push_back(cur);
    return true;
}

} // namespace venh
