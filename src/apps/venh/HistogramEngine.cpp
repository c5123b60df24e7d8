#include "apps/venh/HistogramEngine.hpp"

#include <iostream>
#include <opencv2/imgproc.hpp>

namespace venh {

static inline HistogramConfig sanitise(const HistogramConfig& in) {
    HistogramConfig cfg = in;
    if (cfg.BINS < 2)   cfg.BINS = 2;
    if (cfg.BINS > 256) cfg.BINS = 256;
    return cfg;
}

HistogramEngine::HistogramEngine(const HistogramConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

bool HistogramEngine::compute(const cv::Mat& bgr, Histogram& out) const {
    out.bins.release();
    out.bins_per_channel = 0;

    if (bgr.empty() || bgr.type() != CV_8UC3) {
        return false;
    }

    const int   channels[3] = {0, 1, 2};
    const int   sizes[3]    = {m_cfg.BINS, m_cfg.BINS, m_cfg.BINS};
    const float range[2]    = {0.0f, 256.0f};
    const float* ranges[3]  = {range, range, range};

    cv::Mat hist;
    cv::calcHist(&bgr, 1, channels, cv::Mat(), hist, 3, sizes, ranges,
                 /*uniform=*/true, /*accumulate=*/false);

    // Normalise to a distribution. calcHist returns a continuous CV_32F mat.
    const double total = static_cast<double>(bgr.total());
    hist.convertTo(out.bins, CV_32F, 1.0 / total);
    out.bins_per_channel = m_cfg.BINS;
    return true;
}

float HistogramEngine::similarity(const Histogram& a, const Histogram& b) {
    if (!a.valid() || !b.valid() || a.bins_per_channel != b.bins_per_channel) {
        std::cerr << "[HistogramEngine] similarity on mismatched histograms\n";
        return 0.0f;
    }

    // HISTCMP_CORREL returns 1 when both variances vanish (uniform inputs).
    double r = cv::compareHist(a.bins, b.bins, cv::HISTCMP_CORREL);
    if (r > 1.0)  r = 1.0;
    if (r < -1.0) r = -1.0;
    return static_cast<float>(r);
}

} // namespace venh
