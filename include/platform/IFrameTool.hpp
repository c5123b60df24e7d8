#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "msg/Frame.hpp"

namespace platform {

// What the frame tool reports about a source video before extraction.
struct VideoInfo {
    double   duration_s = 0.0;   // 0 if unknown
    double   fps = 0.0;          // 0 if unknown
    uint32_t width = 0;
    uint32_t height = 0;
    bool     has_audio = false;
    uint64_t size_bytes = 0;
};

// Frame extraction / reassembly collaborator (an audio/video codec toolkit).
// Extraction must preserve exact frame order at the requested rate;
// reassembly must copy the original audio without re-encoding.
class IFrameTool {
public:
    virtual bool probe(const std::string& input_path, VideoInfo& out) = 0;

    virtual bool extract(const std::string& input_path, double fps,
                         std::vector<msg::Frame>& out) = 0;

    virtual bool reassemble(const std::vector<cv::Mat>& frames,
                            const std::string& original_input_path,
                            double fps, bool copy_audio,
                            const std::string& output_path) = 0;

    // Human-readable description of the last failure.
    virtual std::string lastError() const = 0;

    virtual ~IFrameTool() = default;
};

} // namespace platform
