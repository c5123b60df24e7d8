#include "apps/venh/ColorTransform.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

namespace venh {

static inline int sanitiseLevels(int levels) {
    if (levels < 2)   return 2;
    if (levels > 256) return 256;
    return levels;
}

ColorTransform::ColorTransform(int levels)
: m_levels(sanitiseLevels(levels)) {
    const std::size_t n = static_cast<std::size_t>(m_levels);
    m_delta.assign(n * n * n, Eigen::Vector3f::Zero());
    m_seen.assign(n * n * n, 0);

    m_axis.resize(256);
    for (int v = 0; v < 256; ++v) {
        m_axis[v] = axisFor(static_cast<float>(v));
    }
}

bool ColorTransform::isIdentity() const {
    for (const auto& d : m_delta) {
        if (d.x() != 0.0f || d.y() != 0.0f || d.z() != 0.0f) return false;
    }
    return true;
}

// Bucket i covers [i*256/N, (i+1)*256/N); its centre sits at
// (i + 0.5) * 256/N - 0.5 in pixel units. Invert that to get a continuous
// bucket coordinate, clamped to the outer centres.
ColorTransform::Axis ColorTransform::axisFor(float v) const {
    float u = (v + 0.5f) * static_cast<float>(m_levels) / 256.0f - 0.5f;
    const float top = static_cast<float>(m_levels - 1);
    if (u < 0.0f) u = 0.0f;
    if (u > top)  u = top;

    Axis a{};
    a.i0 = static_cast<int>(std::floor(u));
    if (a.i0 > m_levels - 1) a.i0 = m_levels - 1;
    a.i1 = (a.i0 + 1 < m_levels) ? a.i0 + 1 : a.i0;
    a.f  = u - static_cast<float>(a.i0);
    return a;
}

int ColorTransform::bucketOf(float v) const {
    int k = static_cast<int>(std::floor(v * static_cast<float>(m_levels) / 256.0f));
    if (k < 0) k = 0;
    if (k > m_levels - 1) k = m_levels - 1;
    return k;
}

// Unobserved corners drop out and the remaining weights are renormalised.
// The pixel's own bucket is always a corner with non-zero weight.
Eigen::Vector3f ColorTransform::blend(const Axis& b, const Axis& g, const Axis& r) const {
    const int   bi[2] = {b.i0, b.i1};
    const int   gi[2] = {g.i0, g.i1};
    const int   ri[2] = {r.i0, r.i1};
    const float bw[2] = {1.0f - b.f, b.f};
    const float gw[2] = {1.0f - g.f, g.f};
    const float rw[2] = {1.0f - r.f, r.f};

    Eigen::Vector3f acc = Eigen::Vector3f::Zero();
    float wsum = 0.0f;
    for (int x = 0; x < 2; ++x) {
        for (int y = 0; y < 2; ++y) {
            for (int z = 0; z < 2; ++z) {
                const std::size_t k = index(bi[x], gi[y], ri[z]);
                const float w = bw[x] * gw[y] * rw[z];
                if (!m_seen[k] || w <= 0.0f) continue;
                acc  += w * m_delta[k];
                wsum += w;
            }
        }
    }
    if (wsum <= 0.0f) return Eigen::Vector3f::Zero();
    return acc / wsum;
}

cv::Vec3b ColorTransform::map(const cv::Vec3b& bgr) const {
    const int n = m_levels;
    if (!m_seen[index(bgr[0] * n / 256, bgr[1] * n / 256, bgr[2] * n / 256)]) return bgr;

    const Eigen::Vector3f d = blend(m_axis[bgr[0]], m_axis[bgr[1]], m_axis[bgr[2]]);
    return cv::Vec3b(cv::saturate_cast<uchar>(bgr[0] + d.x()),
                     cv::saturate_cast<uchar>(bgr[1] + d.y()),
                     cv::saturate_cast<uchar>(bgr[2] + d.z()));
}

Eigen::Vector3f ColorTransform::mapf(const Eigen::Vector3f& bgr) const {
    if (!m_seen[index(bucketOf(bgr.x()), bucketOf(bgr.y()), bucketOf(bgr.z()))]) return bgr;

    const Eigen::Vector3f d = blend(axisFor(bgr.x()), axisFor(bgr.y()), axisFor(bgr.z()));
    return bgr + d;
}

std::string ColorTransform::toCube(const std::string& title) const {
    std::ostringstream os;
    os << "TITLE \"" << title << "\"\n";
    os << "LUT_3D_SIZE " << m_levels << "\n";
    os << "DOMAIN_MIN 0.0 0.0 0.0\n";
    os << "DOMAIN_MAX 1.0 1.0 1.0\n";

    // Node k samples input colour k / (N-1) on each axis.
    const float step = 255.0f / static_cast<float>(m_levels - 1);
    char line[64];
    for (int b = 0; b < m_levels; ++b) {
        for (int g = 0; g < m_levels; ++g) {
            for (int r = 0; r < m_levels; ++r) {
                const Eigen::Vector3f in(b * step, g * step, r * step);
                const Eigen::Vector3f out =
                    (mapf(in) / 255.0f).cwiseMax(0.0f).cwiseMin(1.0f);
                // .cube rows are R G B
                std::snprintf(line, sizeof(line), "%.6f %.6f %.6f\n", out.z(), out.y(), out.x());
                os << line;
            }
        }
    }
    return os.str();
}

bool ColorTransform::writeCube(const std::string& path, const std::string& title) const {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cerr << "[ColorTransform] cannot open " << path << " for writing\n";
        return false;
    }
    f << toCube(title);
    f.flush();
    if (!f) {
        std::cerr << "[ColorTransform] write failed: " << path << "\n";
        return false;
    }
    return true;
}

} // namespace venh
