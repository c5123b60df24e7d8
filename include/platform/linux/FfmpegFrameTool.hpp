#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "platform/IFrameTool.hpp"

namespace platform {

// ------------------------------
// Config
// ------------------------------
struct FfmpegFrameToolConfig {
    std::string ffmpeg  = "ffmpeg";
    std::string ffprobe = "ffprobe";

    // Scratch space for frame images; empty = $TMPDIR or /tmp.
    std::string work_dir;

    // Lossless intermediate frames. ".jpg" is accepted for speed.
    std::string frame_ext = ".png";

    // Fixed output profile: H.264 yuv420p, +faststart.
    int         crf    = 18;
    std::string preset = "slow";

    bool keep_temp = false;   // leave frame directories behind for debugging
};

// ---------------------------------------------------------------------------
// FfmpegFrameTool: IFrameTool on top of the ffmpeg / ffprobe executables.
// Frames travel through a private temporary directory per call; nothing is
// left behind unless keep_temp is set.
// ---------------------------------------------------------------------------
class FfmpegFrameTool : public IFrameTool {
public:
    explicit FfmpegFrameTool(const FfmpegFrameToolConfig& cfg = {});

    bool probe(const std::string& input_path, VideoInfo& out) override;

    bool extract(const std::string& input_path, double fps,
                 std::vector<msg::Frame>& out) override;

    bool reassemble(const std::vector<cv::Mat>& frames,
                    const std::string& original_input_path,
                    double fps, bool copy_audio,
                    const std::string& output_path) override;

    std::string lastError() const override;

    // Command lines, exposed for inspection.
    std::vector<std::string> buildProbeArgs(const std::string& input_path) const;
    std::vector<std::string> buildExtractArgs(const std::string& input_path, double fps,
                                              const std::string& pattern) const;
    std::vector<std::string> buildReassembleArgs(const std::string& pattern,
                                                 const std::string& original_input_path,
                                                 double fps, bool copy_audio,
                                                 const std::string& output_path) const;

    // ffprobe -print_format json report -> VideoInfo. size_bytes stays 0
    // if the report has no format.size.
    static bool ParseProbeReport(const std::string& json_text, VideoInfo& out);

    // "30000/1001", "25/1", "29.97" -> frames per second (0 if unusable).
    static double ParseRate(const std::string& rate);

    enum class Status : uint8_t {
        OK = 0,
        // TOOL FAILS
        TOOL_MISSING,
        PROBE_FAIL,
        EXTRACT_FAIL,
        REASSEMBLE_FAIL,
        // FILE FAILS
        TEMPDIR_FAIL,
        FRAME_READ_FAIL,
        FRAME_WRITE_FAIL,
        OUTPUT_MISSING,
        // LOGIC FAILS
        PROBE_PARSE_FAIL,
        NO_FRAMES,
        BAD_ARGS,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    const std::string& lastDetail() const { return m_detail; }

private:
    FfmpegFrameToolConfig m_cfg{};

    // FDIR
    Status      m_status = Status::OK;
    std::string m_detail;

    bool makeTempDir(std::string& dir);
    void removeTempDir(const std::string& dir) const;

    bool fail(Status s, const std::string& detail);
};

} // namespace platform
