#pragma once
#include <cstdint>
#include <opencv2/core.hpp>

namespace msg {

// One still image extracted from the source video.
struct Frame {
    uint32_t index = 0;     // position in the extracted sequence (0-based)
    uint64_t t_us  = 0;     // source timestamp (µs from start of stream)

    // 8-bit BGR (CV_8UC3). Shared, treat as read-only once extracted:
    // writers must clone before modifying.
    cv::Mat pixels;

    uint32_t width()  const { return static_cast<uint32_t>(pixels.cols); }
    uint32_t height() const { return static_cast<uint32_t>(pixels.rows); }
};

} // namespace msg
