#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/venh/EnhancementOrchestrator.hpp"
#include "platform/IFrameTool.hpp"
#include "msg/Frame.hpp"
#include "msg/GroupReport.hpp"

namespace venh {

// ------------------------------
// Config
// ------------------------------
struct PipelineConfig {
    // Input admission. Longer / larger inputs are rejected as not
    // cost-effective instead of being processed.
    double   MAX_DURATION_S  = 120.0;   // 0 = no limit
    uint64_t MAX_INPUT_BYTES = 0;       // 0 = no limit

    // Every extracted frame and its output slot stay in memory for the
    // whole run. Clips whose decoded frames would exceed this are
    // rejected. 0 = no limit.
    uint64_t MAX_DECODED_BYTES = 4ull << 30;

    // 0 = pick from duration (DetermineExtractionFps).
    double   EXTRACTION_FPS  = 0.0;

    float    SIMILARITY_THRESHOLD = 0.92f;
    int      HISTOGRAM_BINS       = 32;

    uint8_t  MAX_ITERATIONS   = 3;
    float    TARGET_SCORE     = 8.5f;
    uint32_t RETRY_BACKOFF_MS = 500;
    std::string USER_FEEDBACK;

    uint32_t CONCURRENCY        = 5;    // concurrent groups
    uint32_t MAX_INFLIGHT_CALLS = 0;    // outbound AI calls, 0 = CONCURRENCY
    uint32_t TIME_BUDGET_S      = 0;    // wall clock for the whole run, 0 = none

    int      LUT_LEVELS   = 32;
    std::string LUT_DUMP_DIR;           // empty = no .cube export

    bool     COPY_AUDIO = true;
};

// What one run hands back to its caller.
struct PipelineResult {
    std::string output_path;
    std::vector<msg::GroupDegradationNotice> notices;
    std::vector<msg::GroupReport> groups;

    platform::VideoInfo source{};
    double   extraction_fps = 0.0;
    uint32_t frame_count = 0;
    uint64_t elapsed_us = 0;

    msg::ErrorKind error = msg::ErrorKind::NONE;   // TOOL_INVOCATION or INPUT_REJECTED
    std::string    error_detail;

    bool ok() const { return error == msg::ErrorKind::NONE; }
};

// Extraction rate for a source of the given rate and duration.
// requested_fps > 0 overrides the table; the result never exceeds a known
// source rate.
double DetermineExtractionFps(double source_fps, double duration_s, double requested_fps = 0.0);

// False when the clip is longer than max_duration_s (max_duration_s <= 0: always true).
bool IsDurationRecommended(double duration_s, double max_duration_s = 120.0);

// Memory held by the decoded frames and their output slots when a clip is
// extracted at 'fps'. 0 when the probe left the duration or size unknown.
uint64_t EstimateDecodedBytes(const platform::VideoInfo& info, double fps);

// Rough wall-clock estimate for enhancing a clip, in seconds.
double EstimateEnhancementSeconds(double duration_s, double fps);

// ---------------------------------------------------------------------------
// PipelineDriver: extract -> group -> per-group enhance/propagate (worker
// pool) -> reassemble with the original audio.
// ---------------------------------------------------------------------------
class PipelineDriver {
public:
    PipelineDriver(const PipelineConfig& cfg, platform::IFrameTool& tool, const ServiceSet& services);

    // Full run. On success 'out.output_path' names the enhanced video and
    // 'out.notices' lists every group-local fallback. Returns false only
    // for run-level failures (see PipelineResult::error).
    bool EnhanceVideo(const std::string& input_path, const std::string& output_path,
                      PipelineResult& out);

    // Grouping and the concurrent per-group phase over frames already in
    // memory. out_frames receives one frame per input frame, in order.
    bool EnhanceFrames(const std::vector<msg::Frame>& frames, uint64_t deadline_us,
                       std::vector<cv::Mat>& out_frames, PipelineResult& out);

    enum class Status : uint8_t {
        OK = 0,
        // LOGIC FAILS
        INPUT_TOO_LONG,
        INPUT_TOO_LARGE,
        NO_FRAMES,
        GROUPING_FAIL,
        // TOOL FAILS
        PROBE_FAIL,
        EXTRACT_FAIL,
        REASSEMBLE_FAIL,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

    const PipelineConfig& config() const { return m_cfg; }

private:
    PipelineConfig       m_cfg{};
    platform::IFrameTool& m_tool;
    ServiceSet           m_services{};

    Status m_status = Status::OK;

    bool fail(Status s, PipelineResult& out, const std::string& detail);
};

} // namespace venh
