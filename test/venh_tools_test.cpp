// test/venh_tools_test.cpp
//
// Process plumbing: Proc::Run, ffmpeg/ffprobe command lines and report
// parsing, and the command-template AI service bridge (driven with
// coreutils instead of a real provider).

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "os/process.hpp"
#include "platform/linux/CommandImageServices.hpp"
#include "platform/linux/FfmpegFrameTool.hpp"

namespace {

int g_failures = 0;

void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// True if 'a' is immediately followed by 'b' somewhere in v.
bool adjacent(const std::vector<std::string>& v, const std::string& a, const std::string& b) {
    for (size_t i = 0; i + 1 < v.size(); ++i) {
        if (v[i] == a && v[i + 1] == b) return true;
    }
    return false;
}

const char* kProbeReport = R"({
  "streams": [
    {"index": 0, "codec_type": "video", "width": 1920, "height": 1080,
     "r_frame_rate": "30000/1001", "avg_frame_rate": "30000/1001", "duration": "12.5"},
    {"index": 1, "codec_type": "audio", "sample_rate": "48000"}
  ],
  "format": {"duration": "12.512000", "size": "7340032"}
})";

} // anonymous namespace

int main() {
    using namespace platform;

    std::cout << "=== venh_tools_test ===\n";

    {
        std::cout << "\n[Test 0] Proc::Run\n";
        Proc::Result r{};
        printResult("echo", Proc::Run({"echo", "hello"}, r) && r.launched && r.exit_code == 0 &&
                            r.out == "hello\n");

        printResult("non-zero exit", !Proc::Run({"sh", "-c", "echo oops >&2; exit 3"}, r) &&
                                     r.launched && r.exit_code == 3 && r.err == "oops\n");

        printResult("missing program", !Proc::Run({"venh_no_such_program_xyz"}, r) && !r.launched);
        printResult("Exists(sh)", Proc::Exists("sh"));
        printResult("!Exists(bogus)", !Proc::Exists("venh_no_such_program_xyz"));
    }

    {
        std::cout << "\n[Test 1] ParseRate\n";
        printResult("ntsc", std::fabs(FfmpegFrameTool::ParseRate("30000/1001") - 29.97003) < 1e-4);
        printResult("integer ratio", FfmpegFrameTool::ParseRate("25/1") == 25.0);
        printResult("decimal", FfmpegFrameTool::ParseRate("29.97") == 29.97);
        printResult("zero denominator", FfmpegFrameTool::ParseRate("0/0") == 0.0);
        printResult("garbage", FfmpegFrameTool::ParseRate("n/a") == 0.0);
        printResult("empty", FfmpegFrameTool::ParseRate("") == 0.0);
    }

    {
        std::cout << "\n[Test 2] ParseProbeReport\n";
        VideoInfo info{};
        printResult("parse", FfmpegFrameTool::ParseProbeReport(kProbeReport, info));
        printResult("dimensions", info.width == 1920 && info.height == 1080);
        printResult("fps", std::fabs(info.fps - 29.97003) < 1e-4);
        printResult("duration from format", std::fabs(info.duration_s - 12.512) < 1e-6);
        printResult("audio", info.has_audio);
        printResult("size", info.size_bytes == 7340032ull);

        const char* silent = R"({"streams": [{"codec_type": "video", "width": 640, "height": 360,
                                 "r_frame_rate": "0/0", "avg_frame_rate": "24/1", "duration": "3.0"}],
                                 "format": {}})";
        printResult("silent clip", FfmpegFrameTool::ParseProbeReport(silent, info) &&
                                   !info.has_audio && info.fps == 24.0 && info.duration_s == 3.0);

        printResult("audio only rejected",
                    !FfmpegFrameTool::ParseProbeReport(R"({"streams": [{"codec_type": "audio"}]})", info));
        printResult("garbage rejected", !FfmpegFrameTool::ParseProbeReport("not json", info));
    }

    {
        std::cout << "\n[Test 3] ffmpeg command lines\n";
        FfmpegFrameToolConfig cfg{};
        cfg.ffmpeg = "/opt/ff/ffmpeg";
        FfmpegFrameTool tool(cfg);

        const auto probe = tool.buildProbeArgs("in.mp4");
        printResult("probe json", probe.size() > 1 && probe[0] == "ffprobe" &&
                                  adjacent(probe, "-print_format", "json") && probe.back() == "in.mp4");

        const auto ex = tool.buildExtractArgs("in.mp4", 15.0, "/tmp/x/frame_%06d.png");
        printResult("extract binary", !ex.empty() && ex[0] == "/opt/ff/ffmpeg");
        printResult("extract input", adjacent(ex, "-i", "in.mp4"));
        printResult("extract rate", adjacent(ex, "-vf", "fps=15"));
        printResult("extract numbering", adjacent(ex, "-start_number", "1") && ex.back() == "/tmp/x/frame_%06d.png");

        const auto native = tool.buildExtractArgs("in.mp4", 0.0, "p");
        printResult("no fps filter at native rate", !contains(native, "-vf"));

        const auto with_audio = tool.buildReassembleArgs("/tmp/y/frame_%06d.png", "in.mp4", 29.97, true, "out.mp4");
        printResult("frame rate", adjacent(with_audio, "-framerate", "29.97"));
        printResult("original as second input", adjacent(with_audio, "-i", "in.mp4"));
        printResult("video from frames", adjacent(with_audio, "-map", "0:v"));
        printResult("optional audio map", adjacent(with_audio, "-map", "1:a?"));
        printResult("audio stream copy", adjacent(with_audio, "-c:a", "copy"));
        printResult("h264 yuv420p", adjacent(with_audio, "-c:v", "libx264") && adjacent(with_audio, "-pix_fmt", "yuv420p"));
        printResult("faststart", adjacent(with_audio, "-movflags", "+faststart"));
        printResult("output last", with_audio.back() == "out.mp4");

        const auto silent = tool.buildReassembleArgs("p", "in.mp4", 30.0, false, "out.mp4");
        printResult("no audio: -an", contains(silent, "-an") && !contains(silent, "-c:a") &&
                                     !contains(silent, "1:a?"));
    }

    {
        std::cout << "\n[Test 4] Frame tool failures\n";
        FfmpegFrameToolConfig cfg{};
        cfg.ffprobe = "venh_no_such_ffprobe";
        cfg.ffmpeg  = "venh_no_such_ffmpeg";
        FfmpegFrameTool tool(cfg);

        VideoInfo info{};
        printResult("probe without ffprobe", !tool.probe("in.mp4", info) &&
                    tool.lastStatus() == FfmpegFrameTool::Status::TOOL_MISSING &&
                    !tool.lastError().empty());

        std::vector<msg::Frame> frames;
        printResult("extract without ffmpeg", !tool.extract("in.mp4", 30.0, frames) &&
                    tool.lastStatus() == FfmpegFrameTool::Status::TOOL_MISSING);

        printResult("reassemble nothing", !tool.reassemble({}, "in.mp4", 30.0, true, "out.mp4"));
        printResult("StatusStr", std::string(FfmpegFrameTool::StatusStr(FfmpegFrameTool::Status::OK)) == "OK");
    }

    {
        std::cout << "\n[Test 5] Command templates\n";
        const auto argv = CommandImageServices::SplitCommand(
            "  ./edit.sh --in {input} --out {output}  'keep {region} sharp' \"a b\"  ");
        printResult("split", argv.size() == 7 && argv[0] == "./edit.sh" &&
                             argv[5] == "keep {region} sharp" && argv[6] == "a b");
        printResult("empty quotes kept", CommandImageServices::SplitCommand("x ''").size() == 2);
        printResult("blank line", CommandImageServices::SplitCommand("   ").empty());

        CommandImageServices::Placeholders p{};
        p.input = "/tmp/i.png";
        p.output = "/tmp/o.png";
        p.region = "top-left";
        p.instruction = "brighten";
        const auto ex = CommandImageServices::Expand(
            {"tool", "{input}", "--out={output}", "{region}:{instruction}", "{mask}"}, p);
        printResult("expand", ex.size() == 5 && ex[1] == "/tmp/i.png" && ex[2] == "--out=/tmp/o.png" &&
                              ex[3] == "top-left:brighten" && ex[4].empty());
    }

    {
        std::cout << "\n[Test 6] Command services through real processes\n";
        CommandServiceConfig cfg{};
        cfg.enhance_cmd  = CommandImageServices::SplitCommand("cp {input} {output}");
        cfg.critique_cmd = CommandImageServices::SplitCommand(
            "sh -c 'echo \"{\\\"score\\\": 9, \\\"issues\\\": []}\"'");
        cfg.surgical_cmd = CommandImageServices::SplitCommand("cp {mask} {output}");
        CommandImageServices svc(cfg);

        printResult("capabilities", svc.hasEnhance() && svc.hasCritique() && svc.hasSurgical());

        cv::Mat img(24, 32, CV_8UC3, cv::Scalar(10, 120, 230));
        cv::Mat out;
        printResult("enhance round trip", svc.enhance(img, "make it pop", out) &&
                                          out.size() == img.size() &&
                                          out.at<cv::Vec3b>(5, 5) == cv::Vec3b(10, 120, 230));

        std::string raw;
        printResult("critique stdout", svc.critique(img, raw) &&
                                       raw.find("\"score\": 9") != std::string::npos);

        cv::Mat mask(24, 32, CV_8UC1, cv::Scalar(255));
        printResult("surgical gets mask", svc.edit(img, mask, "global", "x", out) &&
                                          out.at<cv::Vec3b>(0, 0) == cv::Vec3b(255, 255, 255));

        CommandServiceConfig bad{};
        bad.enhance_cmd = CommandImageServices::SplitCommand("false");
        CommandImageServices broken(bad);
        printResult("failing command", !broken.enhance(img, "x", out) && out.empty());
        printResult("no critique command", !broken.critique(img, raw) && !broken.hasSurgical());
    }

    if (g_failures) {
        std::cout << "\nvenh_tools_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nvenh_tools_test: PASS\n";
    return 0;
}
