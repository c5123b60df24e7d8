// PipelineDriver.cpp
#include "apps/venh/PipelineDriver.hpp"
#include "apps/venh/FrameGrouper.hpp"
#include "apps/venh/GroupWorker.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>

#include "os/rtos.hpp"

namespace venh {

// ------------------------------
// Extraction rate / cost helpers
// ------------------------------
static constexpr double MAX_EXTRACTION_FPS = 30.0;
static constexpr double FRAMES_PER_GROUP_ESTIMATE = 30.0;
static constexpr double SECONDS_PER_GROUP_ESTIMATE = 15.0;   // enhance + critique round
static constexpr double FIXED_OVERHEAD_S = 15.0;             // extraction + reassembly

double DetermineExtractionFps(double source_fps, double duration_s, double requested_fps) {
    double fps = MAX_EXTRACTION_FPS;

    if (requested_fps > 0.0)   fps = requested_fps;
    else if (duration_s <= 0.0)  fps = MAX_EXTRACTION_FPS;   // unknown duration
    else if (duration_s <= 30.0) fps = MAX_EXTRACTION_FPS;
    else if (duration_s <= 60.0) fps = 15.0;
    else if (duration_s <= 120.0) fps = 10.0;
    else                         fps = 5.0;

    if (source_fps > 0.0 && fps > source_fps) fps = source_fps;
    return fps;
}

bool IsDurationRecommended(double duration_s, double max_duration_s) {
    if (max_duration_s <= 0.0) return true;
    return duration_s <= max_duration_s;
}

uint64_t EstimateDecodedBytes(const platform::VideoInfo& info, double fps) {
    if (info.duration_s <= 0.0 || fps <= 0.0 || info.width == 0 || info.height == 0) return 0;
    const uint64_t frames = static_cast<uint64_t>(std::ceil(info.duration_s * fps));
    const uint64_t frame_bytes = uint64_t(info.width) * uint64_t(info.height) * 3ull;
    return frames * frame_bytes * 2ull;   // source + output slot
}

static uint64_t DecodedBytes(const std::vector<msg::Frame>& frames) {
    uint64_t total = 0;
    for (const auto& f : frames) total += uint64_t(f.pixels.total()) * f.pixels.elemSize();
    return total * 2ull;
}

double EstimateEnhancementSeconds(double duration_s, double fps) {
    const double rate   = DetermineExtractionFps(fps, duration_s);
    const double frames = std::max(0.0, duration_s) * rate;
    const double groups = std::max(1.0, frames / FRAMES_PER_GROUP_ESTIMATE);
    return groups * SECONDS_PER_GROUP_ESTIMATE + FIXED_OVERHEAD_S;
}

// ------------------------------
// Config
// ------------------------------
static inline PipelineConfig sanitise(const PipelineConfig& in) {
    PipelineConfig cfg = in;

    if (cfg.MAX_DURATION_S < 0.0) cfg.MAX_DURATION_S = 0.0;
    if (cfg.EXTRACTION_FPS < 0.0) cfg.EXTRACTION_FPS = 0.0;
    if (cfg.EXTRACTION_FPS > 240.0) cfg.EXTRACTION_FPS = 240.0;

    if (cfg.CONCURRENCY < 1)  cfg.CONCURRENCY = 1;
    if (cfg.CONCURRENCY > 64) cfg.CONCURRENCY = 64;
    if (cfg.MAX_INFLIGHT_CALLS == 0) cfg.MAX_INFLIGHT_CALLS = cfg.CONCURRENCY;
    if (cfg.MAX_INFLIGHT_CALLS > 64) cfg.MAX_INFLIGHT_CALLS = 64;

    // Remaining fields are clamped by the module that owns them.
    return cfg;
}

PipelineDriver::PipelineDriver(const PipelineConfig& cfg, platform::IFrameTool& tool, const ServiceSet& services)
: m_cfg(sanitise(cfg))
, m_tool(tool)
, m_services(services) {
    m_status = Status::OK;
}

// ---------------------------------------------------------------------------
// EnhanceVideo
// ---------------------------------------------------------------------------
bool PipelineDriver::EnhanceVideo(const std::string& input_path, const std::string& output_path,
                                  PipelineResult& out) {
    out = PipelineResult{};
    m_status = Status::OK;

    const uint64_t t0 = Rtos::NowUs();
    const uint64_t deadline_us = (m_cfg.TIME_BUDGET_S > 0)
        ? t0 + uint64_t(m_cfg.TIME_BUDGET_S) * 1000000ull : 0;

    // ---- Probe + admission ----
    platform::VideoInfo info{};
    if (!m_tool.probe(input_path, info)) {
        return fail(Status::PROBE_FAIL, out, m_tool.lastError());
    }
    out.source = info;

    std::cout << "[Pipeline] " << input_path << ": " << info.width << "x" << info.height
              << " " << info.fps << " fps, " << info.duration_s << " s"
              << (info.has_audio ? ", audio" : ", no audio") << "\n";

    if (!IsDurationRecommended(info.duration_s, m_cfg.MAX_DURATION_S)) {
        std::ostringstream os;
        os << "duration " << info.duration_s << " s exceeds " << m_cfg.MAX_DURATION_S
           << " s (estimated " << EstimateEnhancementSeconds(info.duration_s, info.fps)
           << " s of enhancement); not cost-effective";
        return fail(Status::INPUT_TOO_LONG, out, os.str());
    }
    if (m_cfg.MAX_INPUT_BYTES > 0 && info.size_bytes > m_cfg.MAX_INPUT_BYTES) {
        std::ostringstream os;
        os << "input is " << info.size_bytes << " bytes, limit " << m_cfg.MAX_INPUT_BYTES;
        return fail(Status::INPUT_TOO_LARGE, out, os.str());
    }

    // ---- Extract ----
    const double fps = DetermineExtractionFps(info.fps, info.duration_s, m_cfg.EXTRACTION_FPS);
    out.extraction_fps = fps;

    const uint64_t expected_bytes = EstimateDecodedBytes(info, fps);
    if (m_cfg.MAX_DECODED_BYTES > 0 && expected_bytes > m_cfg.MAX_DECODED_BYTES) {
        std::ostringstream os;
        os << "decoded frames at " << fps << " fps need about " << (expected_bytes >> 20)
           << " MiB, limit " << (m_cfg.MAX_DECODED_BYTES >> 20) << " MiB";
        return fail(Status::INPUT_TOO_LARGE, out, os.str());
    }

    std::vector<msg::Frame> frames;
    if (!m_tool.extract(input_path, fps, frames)) {
        return fail(Status::EXTRACT_FAIL, out, m_tool.lastError());
    }
    if (frames.empty()) {
        return fail(Status::NO_FRAMES, out, "extraction produced no frames");
    }
    std::cout << "[Pipeline] extracted " << frames.size() << " frames at " << fps << " fps\n";

    // The probe can leave the duration unknown; check what actually arrived.
    const uint64_t decoded_bytes = DecodedBytes(frames);
    if (m_cfg.MAX_DECODED_BYTES > 0 && decoded_bytes > m_cfg.MAX_DECODED_BYTES) {
        std::ostringstream os;
        os << frames.size() << " decoded frames need " << (decoded_bytes >> 20)
           << " MiB, limit " << (m_cfg.MAX_DECODED_BYTES >> 20) << " MiB";
        return fail(Status::INPUT_TOO_LARGE, out, os.str());
    }

    // ---- Group + enhance + propagate ----
    std::vector<cv::Mat> edited;
    if (!EnhanceFrames(frames, deadline_us, edited, out)) {
        return false;
    }

    // Frames are no longer needed once every slot is filled.
    frames.clear();

    // ---- Reassemble ----
    if (!m_tool.reassemble(edited, input_path, fps, m_cfg.COPY_AUDIO && info.has_audio, output_path)) {
        return fail(Status::REASSEMBLE_FAIL, out, m_tool.lastError());
    }

    out.output_path = output_path;
    out.elapsed_us  = Rtos::NowUs() - t0;

    std::cout << "[Pipeline] wrote " << output_path << " (" << out.groups.size() << " groups, "
              << out.notices.size() << " notices, " << (out.elapsed_us / 1000000.0) << " s)\n";
    return true;
}

// ---------------------------------------------------------------------------
// EnhanceFrames: grouping + worker pool
// ---------------------------------------------------------------------------
bool PipelineDriver::EnhanceFrames(const std::vector<msg::Frame>& frames, uint64_t deadline_us,
                                   std::vector<cv::Mat>& out_frames, PipelineResult& out) {
    out_frames.clear();
    out.frame_count = static_cast<uint32_t>(frames.size());
    if (frames.empty()) {
        return fail(Status::NO_FRAMES, out, "no frames to enhance");
    }

    FrameGrouperConfig gcfg{};
    gcfg.SIMILARITY_THRESHOLD = m_cfg.SIMILARITY_THRESHOLD;
    gcfg.HIST.BINS = m_cfg.HISTOGRAM_BINS;
    FrameGrouper grouper(gcfg);

    std::vector<msg::FrameGroup> groups;
    if (!grouper.group(frames, groups) || groups.empty()) {
        return fail(Status::GROUPING_FAIL, out, "frame grouping failed");
    }
    std::cout << "[Pipeline] " << groups.size() << " group(s) from " << frames.size() << " frames\n";

    out_frames.assign(frames.size(), cv::Mat());
    std::vector<GroupOutcome> outcomes(groups.size());

    // The one shared resource: bound on concurrent outbound AI calls.
    Rtos::CountingSemaphore gate(m_cfg.MAX_INFLIGHT_CALLS, m_cfg.MAX_INFLIGHT_CALLS);
    ServiceSet services = m_services;
    if (!services.call_gate) services.call_gate = &gate;

    OrchestratorConfig ocfg{};
    ocfg.MAX_ITERATIONS   = m_cfg.MAX_ITERATIONS;
    ocfg.TARGET_SCORE     = m_cfg.TARGET_SCORE;
    ocfg.RETRY_BACKOFF_MS = m_cfg.RETRY_BACKOFF_MS;
    ocfg.USER_FEEDBACK    = m_cfg.USER_FEEDBACK;

    ColorTransformBuilderConfig ccfg{};
    ccfg.LEVELS = m_cfg.LUT_LEVELS;

    GroupRun run{};
    run.frames = &frames;
    run.groups = &groups;
    run.out_frames = &out_frames;
    run.outcomes = &outcomes;
    run.deadline_us = deadline_us;
    run.lut_dump_dir = m_cfg.LUT_DUMP_DIR;

    // ---- Worker pool ----
    const std::size_t n_workers = std::min<std::size_t>(m_cfg.CONCURRENCY, groups.size());

    std::vector<std::unique_ptr<GroupWorker>> workers;
    std::vector<std::unique_ptr<Rtos::Task>>  tasks;
    std::vector<GroupWorker::TaskCtx>         ctxs(n_workers);   // never resized below
    GroupJobQueue jobs;

    for (std::size_t i = 0; i < n_workers; ++i) {
        workers.emplace_back(new GroupWorker(ocfg, ccfg, services, run));
    }

    std::size_t started = 0;
    for (std::size_t i = 0; i < n_workers; ++i) {
        ctxs[i].self = workers[i].get();
        ctxs[i].jobs_in = &jobs;

        char name[24];
        std::snprintf(name, sizeof(name), "venh_group_%zu", i);

        std::unique_ptr<Rtos::Task> task(new Rtos::Task());
        if (!task->Create(name, &GroupWorker::TaskEntry, &ctxs[i])) break;
        tasks.push_back(std::move(task));
        ++started;
    }

    if (started == 0) {
        std::cerr << "[Pipeline] no worker task could be started, processing groups inline\n";
        for (uint32_t g = 0; g < groups.size(); ++g) {
            workers[0]->processGroup(g);
        }
    } else {
        for (uint32_t g = 0; g < groups.size(); ++g) {
            GroupJob job{};
            job.group_index = g;
            (void)jobs.send(job, Rtos::MAX_TIMEOUT);
        }
        for (std::size_t i = 0; i < started; ++i) {
            GroupJob stop{};
            stop.stop = true;
            (void)jobs.send(stop, Rtos::MAX_TIMEOUT);
        }
        // Barrier: every group is terminal once all workers have left Run().
        for (auto& t : tasks) t->Join();
    }

    // ---- Gather in temporal order ----
    for (uint32_t g = 0; g < groups.size(); ++g) {
        GroupOutcome& oc = outcomes[g];
        if (!oc.done) {
            std::cerr << "[Pipeline] group " << g << " never completed\n";
        }
        out.groups.push_back(oc.report);
        out.notices.insert(out.notices.end(), oc.notices.begin(), oc.notices.end());
    }

    for (std::size_t i = 0; i < out_frames.size(); ++i) {
        if (out_frames[i].empty()) out_frames[i] = frames[i].pixels;
    }
    return true;
}

// FDIR

bool PipelineDriver::fail(Status s, PipelineResult& out, const std::string& detail) {
    m_status = s;

    switch (s) {
        case Status::INPUT_TOO_LONG:
        case Status::INPUT_TOO_LARGE:
            out.error = msg::ErrorKind::INPUT_REJECTED;
            break;
        default:
            out.error = msg::ErrorKind::TOOL_INVOCATION;
            break;
    }
    out.error_detail = detail;

    std::cerr << "[Pipeline] " << StatusStr(s) << ": " << detail << "\n";
    return false;
}

const char* PipelineDriver::StatusStr(PipelineDriver::Status s) {
    switch (s) {
        case Status::OK:              return "OK";
        case Status::INPUT_TOO_LONG:  return "INPUT_TOO_LONG";
        case Status::INPUT_TOO_LARGE: return "INPUT_TOO_LARGE";
        case Status::NO_FRAMES:       return "NO_FRAMES";
        case Status::GROUPING_FAIL:   return "GROUPING_FAIL";
        case Status::PROBE_FAIL:      return "PROBE_FAIL";
        case Status::EXTRACT_FAIL:    return "EXTRACT_FAIL";
        case Status::REASSEMBLE_FAIL: return "REASSEMBLE_FAIL";
        default:                      return "UNKNOWN";
    }
}

} // namespace venh
