#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <opencv2/core.hpp>

namespace venh {

class ColorTransformBuilder;

// ---------------------------------------------------------------------------
// ColorTransform: discretised 3-D colour LUT, N levels per channel.
//
// Each grid bucket holds the mean displacement (after - before) observed for
// input colours falling into it; bucket(v) = floor(v * N / 256). A pixel in
// an observed bucket is mapped by trilinearly blending the displacements of
// the observed buckets among the 8 surrounding bucket centres (weights
// renormalised) and adding the result to the pixel. A pixel whose own
// bucket was never observed is left untouched.
//
// Storing displacement rather than the mean output colour keeps the
// within-bucket variation of the input: two colours in one bucket stay
// distinct after the mapping, and an unchanged colour maps to itself.
//
// Immutable once built. Only ColorTransformBuilder fills the table; a
// default-constructed transform is the identity.
// ---------------------------------------------------------------------------
class ColorTransform {
public:
    explicit ColorTransform(int levels = 32);

    int  levels() const { return m_levels; }
    bool isIdentity() const;

    // Displacement stored for bucket (b, g, r), channel order B, G, R.
    const Eigen::Vector3f& displacement(int b, int g, int r) const {
        return m_delta[index(b, g, r)];
    }

    bool observed(int b, int g, int r) const { return m_seen[index(b, g, r)] != 0; }

    // Output colour for one 8-bit BGR pixel.
    cv::Vec3b map(const cv::Vec3b& bgr) const;

    // Unrounded output colour for a continuous BGR input in [0, 255].
    Eigen::Vector3f mapf(const Eigen::Vector3f& bgr) const;

    // Adobe .cube text (LUT_3D_SIZE N, domain 0..1, red fastest).
    std::string toCube(const std::string& title) const;
    bool writeCube(const std::string& path, const std::string& title) const;

private:
    friend class ColorTransformBuilder;

    // Interpolation coordinate along one channel.
    struct Axis {
        int   i0 = 0;
        int   i1 = 0;
        float f  = 0.0f;   // weight of i1
    };

    Axis axisFor(float v) const;
    int  bucketOf(float v) const;
    Eigen::Vector3f blend(const Axis& b, const Axis& g, const Axis& r) const;

    std::size_t index(int b, int g, int r) const {
        return (static_cast<std::size_t>(b) * m_levels + g) * m_levels + r;
    }

    int m_levels = 32;
    std::vector<Eigen::Vector3f> m_delta;   // N^3, red fastest
    std::vector<uint8_t> m_seen;            // N^3, 1 = bucket received samples
    std::vector<Axis> m_axis;               // precomputed for v = 0..255
};

} // namespace venh
