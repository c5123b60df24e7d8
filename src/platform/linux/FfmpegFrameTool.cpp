// FfmpegFrameTool.cpp
#include "platform/linux/FfmpegFrameTool.hpp"

#include "os/process.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

#include <errno.h>
#include <string.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Keep error reports short: ffmpeg prints its whole banner on failure.
static std::string tail(const std::string& s, std::size_t n = 400) {
    if (s.size() <= n) return s;
    return "..." + s.substr(s.size() - n);
}

static std::string fmt_rate(double fps) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", fps);
    return buf;
}

static void append(std::vector<std::string>& args, std::initializer_list<std::string> more) {
    args.insert(args.end(), more.begin(), more.end());
}

static std::string frame_pattern(const std::string& dir, const std::string& ext) {
    return dir + "/frame_%06d" + ext;
}

} // anonymous namespace

namespace platform {

static inline FfmpegFrameToolConfig sanitise(const FfmpegFrameToolConfig& in) {
    FfmpegFrameToolConfig cfg = in;

    if (cfg.ffmpeg.empty())  cfg.ffmpeg  = "ffmpeg";
    if (cfg.ffprobe.empty()) cfg.ffprobe = "ffprobe";

    if (cfg.work_dir.empty()) {
        const char* tmp = std::getenv("TMPDIR");
        cfg.work_dir = (tmp && *tmp) ? tmp : "/tmp";
    }

    if (cfg.frame_ext != ".png" && cfg.frame_ext != ".jpg") cfg.frame_ext = ".png";

    if (cfg.crf < 0)  cfg.crf = 0;
    if (cfg.crf > 51) cfg.crf = 51;
    if (cfg.preset.empty()) cfg.preset = "slow";

    return cfg;
}

FfmpegFrameTool::FfmpegFrameTool(const FfmpegFrameToolConfig& cfg)
: m_cfg(sanitise(cfg)) {
    m_status = Status::OK;
}

// ---------------------------------------------------------------------------
// Command lines
// ---------------------------------------------------------------------------
std::vector<std::string> FfmpegFrameTool::buildProbeArgs(const std::string& input_path) const {
    return {m_cfg.ffprobe, "-v", "quiet", "-print_format", "json",
            "-show_format", "-show_streams", input_path};
}

std::vector<std::string> FfmpegFrameTool::buildExtractArgs(const std::string& input_path, double fps,
                                                           const std::string& pattern) const {
    std::vector<std::string> a = {m_cfg.ffmpeg, "-v", "error", "-nostdin", "-i", input_path};
    if (m_cfg.frame_ext == ".jpg") {
        append(a, {"-qscale:v", "2"});
    }
    if (fps > 0.0) {
        append(a, {"-vf", "fps=" + fmt_rate(fps)});
    }
    append(a, {"-vsync", "0", "-start_number", "1", "-y", pattern});
    return a;
}

std::vector<std::string> FfmpegFrameTool::buildReassembleArgs(const std::string& pattern,
                                                              const std::string& original_input_path,
                                                              double fps, bool copy_audio,
                                                              const std::string& output_path) const {
    std::vector<std::string> a = {m_cfg.ffmpeg, "-v", "error", "-nostdin",
                                  "-framerate", fmt_rate(fps), "-start_number", "1", "-i", pattern};
    if (copy_audio) {
        append(a, {"-i", original_input_path, "-map", "0:v", "-map", "1:a?"});
    } else {
        append(a, {"-map", "0:v"});
    }

    // yuv420p needs even dimensions.
    append(a, {"-vf", "scale=trunc(iw/2)*2:trunc(ih/2)*2",
                       "-c:v", "libx264", "-crf", std::to_string(m_cfg.crf),
                       "-preset", m_cfg.preset, "-pix_fmt", "yuv420p"});

    if (copy_audio) append(a, {"-c:a", "copy"});
    else            a.push_back("-an");

    append(a, {"-movflags", "+faststart", "-y", output_path});
    return a;
}

// ---------------------------------------------------------------------------
// Probe
// ---------------------------------------------------------------------------
double FfmpegFrameTool::ParseRate(const std::string& rate) {
    if (rate.empty()) return 0.0;

    char* end = nullptr;
    const double num = std::strtod(rate.c_str(), &end);
    if (end == rate.c_str()) return 0.0;

    if (*end == '/') {
        const char* den_s = end + 1;
        char* den_end = nullptr;
        const double den = std::strtod(den_s, &den_end);
        if (den_end == den_s || den <= 0.0) return 0.0;
        return num / den;
    }
    return num > 0.0 ? num : 0.0;
}

bool FfmpegFrameTool::ParseProbeReport(const std::string& json_text, VideoInfo& out) {
    out = VideoInfo{};

    const json doc = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return false;

    bool have_video = false;
    try {
        auto number_of = [](const json& v) -> double {
            if (v.is_number()) return v.get<double>();
            if (v.is_string()) return std::strtod(v.get<std::string>().c_str(), nullptr);
            return 0.0;
        };

        auto fmt = doc.find("format");
        if (fmt != doc.end() && fmt->is_object()) {
            auto d = fmt->find("duration");
            if (d != fmt->end()) out.duration_s = number_of(*d);
            auto s = fmt->find("size");
            if (s != fmt->end()) out.size_bytes = static_cast<uint64_t>(number_of(*s));
        }

        auto streams = doc.find("streams");
        if (streams != doc.end() && streams->is_array()) {
            for (const auto& st : *streams) {
                if (!st.is_object()) continue;
                const std::string type = st.value("codec_type", std::string());

                if (type == "audio") {
                    out.has_audio = true;
                } else if (type == "video" && !have_video) {
                    have_video = true;
                    out.width  = st.value("width", 0u);
                    out.height = st.value("height", 0u);

                    out.fps = ParseRate(st.value("r_frame_rate", std::string()));
                    if (out.fps <= 0.0 || out.fps > 1000.0) {
                        out.fps = ParseRate(st.value("avg_frame_rate", std::string()));
                    }

                    auto d = st.find("duration");
                    if (out.duration_s <= 0.0 && d != st.end()) out.duration_s = number_of(*d);
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[FrameTool] probe report: " << e.what() << "\n";
        return false;
    }

    return have_video;
}

bool FfmpegFrameTool::probe(const std::string& input_path, VideoInfo& out) {
    m_status = Status::OK;
    m_detail.clear();

    if (input_path.empty()) return fail(Status::BAD_ARGS, "empty input path");
    if (!Proc::Exists(m_cfg.ffprobe)) return fail(Status::TOOL_MISSING, m_cfg.ffprobe + " not found in PATH");

    Proc::Result r{};
    if (!Proc::Run(buildProbeArgs(input_path), r)) {
        return fail(Status::PROBE_FAIL, "exit " + std::to_string(r.exit_code) + ": " + tail(r.err));
    }

    if (!ParseProbeReport(r.out, out)) {
        return fail(Status::PROBE_PARSE_FAIL, "no video stream in ffprobe report for " + input_path);
    }

    if (out.size_bytes == 0) {
        std::error_code ec;
        const auto sz = fs::file_size(input_path, ec);
        if (!ec) out.size_bytes = static_cast<uint64_t>(sz);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Extract
// ---------------------------------------------------------------------------
bool FfmpegFrameTool::extract(const std::string& input_path, double fps, std::vector<msg::Frame>& out) {
    m_status = Status::OK;
    m_detail.clear();
    out.clear();

    if (input_path.empty()) return fail(Status::BAD_ARGS, "empty input path");
    if (!Proc::Exists(m_cfg.ffmpeg)) return fail(Status::TOOL_MISSING, m_cfg.ffmpeg + " not found in PATH");

    std::string dir;
    if (!makeTempDir(dir)) return false;

    Proc::Result r{};
    if (!Proc::Run(buildExtractArgs(input_path, fps, frame_pattern(dir, m_cfg.frame_ext)), r)) {
        removeTempDir(dir);
        return fail(Status::EXTRACT_FAIL, "exit " + std::to_string(r.exit_code) + ": " + tail(r.err));
    }

    // Zero-padded names: lexical order is frame order.
    std::vector<std::string> paths;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        const std::string name = entry.path().filename().string();
        if (name.rfind("frame_", 0) == 0 && entry.path().extension() == m_cfg.frame_ext) {
            paths.push_back(entry.path().string());
        }
    }
    if (ec) {
        removeTempDir(dir);
        return fail(Status::FRAME_READ_FAIL, "cannot list " + dir + ": " + ec.message());
    }
    std::sort(paths.begin(), paths.end());

    if (paths.empty()) {
        removeTempDir(dir);
        return fail(Status::NO_FRAMES, "ffmpeg produced no frames for " + input_path);
    }

    out.reserve(paths.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        msg::Frame f{};
        f.index  = static_cast<uint32_t>(i);
        f.t_us   = (fps > 0.0) ? static_cast<uint64_t>(double(i) * 1e6 / fps) : 0;
        f.pixels = cv::imread(paths[i], cv::IMREAD_COLOR);

        if (f.pixels.empty()) {
            out.clear();
            removeTempDir(dir);
            return fail(Status::FRAME_READ_FAIL, "cannot decode " + paths[i]);
        }
        out.push_back(f);
    }

    removeTempDir(dir);
    std::cout << "[FrameTool] extracted " << out.size() << " frames from " << input_path << "\n";
    return true;
}

// ---------------------------------------------------------------------------
// Reassemble
// ---------------------------------------------------------------------------
bool FfmpegFrameTool::reassemble(const std::vector<cv::Mat>& frames,
                                 const std::string& original_input_path,
                                 double fps, bool copy_audio,
                                 const std::string& output_path) {
    m_status = Status::OK;
    m_detail.clear();

    if (frames.empty() || fps <= 0.0 || output_path.empty()) {
        return fail(Status::BAD_ARGS, "reassembly needs frames, a positive rate and an output path");
    }
    if (!Proc::Exists(m_cfg.ffmpeg)) return fail(Status::TOOL_MISSING, m_cfg.ffmpeg + " not found in PATH");

    std::string dir;
    if (!makeTempDir(dir)) return false;

    char name[32];
    for (std::size_t i = 0; i < frames.size(); ++i) {
        std::snprintf(name, sizeof(name), "/frame_%06zu", i + 1);
        const std::string path = dir + name + m_cfg.frame_ext;

        bool written = false;
        try {
            written = cv::imwrite(path, frames[i]);
        } catch (const cv::Exception& e) {
            std::cerr << "[FrameTool] imwrite: " << e.what() << "\n";
            written = false;
        }
        if (!written) {
            removeTempDir(dir);
            return fail(Status::FRAME_WRITE_FAIL, "cannot write " + path);
        }
    }

    Proc::Result r{};
    const auto args = buildReassembleArgs(frame_pattern(dir, m_cfg.frame_ext), original_input_path,
                                          fps, copy_audio, output_path);
    if (!Proc::Run(args, r)) {
        removeTempDir(dir);
        return fail(Status::REASSEMBLE_FAIL, "exit " + std::to_string(r.exit_code) + ": " + tail(r.err));
    }
    removeTempDir(dir);

    std::error_code ec;
    const auto sz = fs::file_size(output_path, ec);
    if (ec || sz == 0) {
        return fail(Status::OUTPUT_MISSING, output_path + " missing or empty after reassembly");
    }

    std::cout << "[FrameTool] reassembled " << frames.size() << " frames at " << fmt_rate(fps)
              << " fps into " << output_path << (copy_audio ? " (audio copied)" : "") << "\n";
    return true;
}

// ---------------------------------------------------------------------------
// Temp dirs
// ---------------------------------------------------------------------------
bool FfmpegFrameTool::makeTempDir(std::string& dir) {
    std::string tmpl = m_cfg.work_dir + "/venh_frames_XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        return fail(Status::TEMPDIR_FAIL, "mkdtemp in " + m_cfg.work_dir + ": " + ::strerror(errno));
    }
    dir = buf.data();
    return true;
}

void FfmpegFrameTool::removeTempDir(const std::string& dir) const {
    if (m_cfg.keep_temp || dir.empty()) return;

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        std::cerr << "[FrameTool] could not remove " << dir << ": " << ec.message() << "\n";
    }
}

// FDIR

bool FfmpegFrameTool::fail(Status s, const std::string& detail) {
    m_status = s;
    m_detail = detail;
    std::cerr << "[FrameTool] " << StatusStr(s) << ": " << detail << "\n";
    return false;
}

std::string FfmpegFrameTool::lastError() const {
    if (m_status == Status::OK) return {};
    return std::string(StatusStr(m_status)) + ": " + m_detail;
}

const char* FfmpegFrameTool::StatusStr(FfmpegFrameTool::Status s) {
    switch (s) {
        case Status::OK:               return "OK";
        case Status::TOOL_MISSING:     return "TOOL_MISSING";
        case Status::PROBE_FAIL:       return "PROBE_FAIL";
        case Status::EXTRACT_FAIL:     return "EXTRACT_FAIL";
        case Status::REASSEMBLE_FAIL:  return "REASSEMBLE_FAIL";
        case Status::TEMPDIR_FAIL:     return "TEMPDIR_FAIL";
        case Status::FRAME_READ_FAIL:  return "FRAME_READ_FAIL";
        case Status::FRAME_WRITE_FAIL: return "FRAME_WRITE_FAIL";
        case Status::OUTPUT_MISSING:   return "OUTPUT_MISSING";
        case Status::PROBE_PARSE_FAIL: return "PROBE_PARSE_FAIL";
        case Status::NO_FRAMES:        return "NO_FRAMES";
        case Status::BAD_ARGS:         return "BAD_ARGS";
        default:                       return "UNKNOWN";
    }
}

} // namespace platform
