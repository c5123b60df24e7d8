#pragma once
#include <cstdint>
#include <opencv2/core.hpp>

#include "apps/venh/ColorTransform.hpp"

namespace venh {

struct ColorTransformBuilderConfig {
    int LEVELS = 32;        // grid levels per channel
    int SAMPLE_STEP = 1;    // use every n-th pixel in x and y
};

// ---------------------------------------------------------------------------
// ColorTransformBuilder: derive one group's LUT from its representative.
// 'before' and 'after' must be pixel-aligned 8-bit BGR images of the same
// size. For every input bucket seen in 'before', the mean displacement of
// the matching 'after' pixels becomes that bucket's entry. Pixels where
// 'exclude' (CV_8UC1, same size, optional) is non-zero are not sampled.
// ---------------------------------------------------------------------------
class ColorTransformBuilder {
public:
    explicit ColorTransformBuilder(const ColorTransformBuilderConfig& cfg = {});

    void setConfig(const ColorTransformBuilderConfig& cfg);

    // On failure 'out' is reset to the identity transform.
    bool build(const cv::Mat& before, const cv::Mat& after, ColorTransform& out,
               const cv::Mat& exclude = cv::Mat());

    enum class Status : uint8_t {
        OK = 0,
        EMPTY_INPUT,
        BAD_FORMAT,
        GEOMETRY_MISMATCH,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

    // Buckets that received at least one sample in the last build().
    uint32_t observedBuckets() const { return m_observed; }

private:
    ColorTransformBuilderConfig m_cfg{};

    Status   m_status = Status::OK;
    uint32_t m_observed = 0;

    bool fail(Status s, ColorTransform& out);
};

} // namespace venh
