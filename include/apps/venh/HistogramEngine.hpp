#pragma once
#include <cstdint>
#include <opencv2/core.hpp>

namespace venh {

// ---------------------------------------------------------------------------
// Joint 3-D colour histogram of one frame.
// bins: CV_32F, dims = 3, size BINS x BINS x BINS over (B, G, R), sums to 1.
// ---------------------------------------------------------------------------
struct Histogram {
    cv::Mat bins;
    int     bins_per_channel = 0;

    bool valid() const { return !bins.empty(); }
};

struct HistogramConfig {
    int BINS = 32;      // per channel, uniform over 0..255
};

// ---------------------------------------------------------------------------
// HistogramEngine: per-frame colour distribution + pairwise similarity.
// Pure functions of the pixel data; safe to share between threads.
// ---------------------------------------------------------------------------
class HistogramEngine {
public:
    explicit HistogramEngine(const HistogramConfig& cfg = {});

    // Fill 'out' from an 8-bit BGR frame. False on empty or non CV_8UC3 input.
    bool compute(const cv::Mat& bgr, Histogram& out) const;

    // Pearson correlation between two histograms, clamped to [-1, 1].
    // Identical inputs give 1. Histograms of different shape give 0.
    static float similarity(const Histogram& a, const Histogram& b);

    int bins() const { return m_cfg.BINS; }

private:
    HistogramConfig m_cfg{};
};

} // namespace venh
