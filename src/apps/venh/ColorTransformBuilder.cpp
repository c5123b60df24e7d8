#include "apps/venh/ColorTransformBuilder.hpp"

#include <utility>
#include <vector>
#include <Eigen/Core>

namespace venh {

static inline ColorTransformBuilderConfig sanitise(const ColorTransformBuilderConfig& in) {
    ColorTransformBuilderConfig cfg = in;
    if (cfg.LEVELS < 2)      cfg.LEVELS = 2;
    if (cfg.LEVELS > 256)    cfg.LEVELS = 256;
    if (cfg.SAMPLE_STEP < 1) cfg.SAMPLE_STEP = 1;
    return cfg;
}

ColorTransformBuilder::ColorTransformBuilder(const ColorTransformBuilderConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

void ColorTransformBuilder::setConfig(const ColorTransformBuilderConfig& cfg) {
    m_cfg = sanitise(cfg);
}

bool ColorTransformBuilder::build(const cv::Mat& before, const cv::Mat& after, ColorTransform& out,
                                  const cv::Mat& exclude) {
    m_status   = Status::OK;
    m_observed = 0;

    if (before.empty() || after.empty())                          return fail(Status::EMPTY_INPUT, out);
    if (before.type() != CV_8UC3 || after.type() != CV_8UC3)      return fail(Status::BAD_FORMAT, out);
    if (before.rows != after.rows || before.cols != after.cols)   return fail(Status::GEOMETRY_MISMATCH, out);
    if (!exclude.empty() &&
        (exclude.type() != CV_8UC1 || exclude.size() != before.size())) return fail(Status::BAD_FORMAT, out);

    const int n = m_cfg.LEVELS;
    ColorTransform t(n);

    // Accumulate in double: a single bucket can absorb millions of pixels.
    std::vector<Eigen::Vector3d> sum(t.m_delta.size(), Eigen::Vector3d::Zero());
    std::vector<uint32_t>        count(t.m_delta.size(), 0);

    for (int y = 0; y < before.rows; y += m_cfg.SAMPLE_STEP) {
        const cv::Vec3b* src = before.ptr<cv::Vec3b>(y);
        const cv::Vec3b* dst = after.ptr<cv::Vec3b>(y);
        const uchar*     skip = exclude.empty() ? nullptr : exclude.ptr<uchar>(y);

        for (int x = 0; x < before.cols; x += m_cfg.SAMPLE_STEP) {
            if (skip && skip[x]) continue;

            const cv::Vec3b& s = src[x];
            const cv::Vec3b& d = dst[x];

            const int bb = s[0] * n / 256;
            const int bg = s[1] * n / 256;
            const int br = s[2] * n / 256;
            const std::size_t k = t.index(bb, bg, br);

            sum[k] += Eigen::Vector3d(double(d[0]) - s[0],
                                      double(d[1]) - s[1],
                                      double(d[2]) - s[2]);
            ++count[k];
        }
    }

    for (std::size_t k = 0; k < sum.size(); ++k) {
        if (count[k] == 0) continue;
        t.m_delta[k] = (sum[k] / static_cast<double>(count[k])).cast<float>();
        t.m_seen[k]  = 1;
        ++m_observed;
    }

    out = std::move(t);
    return true;
}

bool ColorTransformBuilder::fail(Status s, ColorTransform& out) {
    m_status = s;
    out = ColorTransform(m_cfg.LEVELS);
    return false;
}

const char* ColorTransformBuilder::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                return "OK";
        case Status::EMPTY_INPUT:       return "EMPTY_INPUT";
        case Status::BAD_FORMAT:        return "BAD_FORMAT";
        case Status::GEOMETRY_MISMATCH: return "GEOMETRY_MISMATCH";
        default:                        return "UNKNOWN";
    }
}

} // namespace venh
