#include "apps/venh/CommandLine.hpp"
#include "apps/venh/PipelineDriver.hpp"
#include "platform/linux/CommandImageServices.hpp"
#include "platform/linux/FfmpegFrameTool.hpp"

#include <iomanip>
#include <iostream>
#include <string>

static void print_result(const venh::PipelineResult& res) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "[VENH] source " << res.source.width << "x" << res.source.height
              << " " << res.source.duration_s << "s @ " << res.source.fps << " fps"
              << (res.source.has_audio ? " (audio)" : "") << "\n";
    std::cout << "[VENH] extracted " << res.frame_count << " frames @ "
              << res.extraction_fps << " fps, " << res.groups.size() << " group(s)\n";

    for (const auto& g : res.groups) {
        std::cout << "[GROUP " << g.group_index << "] frames [" << g.start << "," << g.end
                  << ") rep=" << g.representative
                  << " iters=" << int(g.iterations)
                  << " surgical=" << int(g.surgical_edits);
        if (g.scored) std::cout << " score=" << g.final_score;
        std::cout << " stop=" << msg::StopReasonStr(g.stop)
                  << (g.edited ? "" : " (unchanged)") << "\n";
        for (const auto& a : g.applied) std::cout << "    - " << a << "\n";
    }

    for (const auto& n : res.notices) {
        std::cerr << "[NOTICE] group " << n.group_index << " "
                  << msg::ErrorKindStr(n.kind) << ": " << n.detail << "\n";
    }
    std::cout << "[VENH] elapsed " << (res.elapsed_us / 1e6) << " s\n";
}

int main(int argc, char** argv) {
    venh::CliArgs args;
    if (!venh::ParseCommandLine(argc, argv, args)) {
        venh::PrintUsage(argv[0]);
        return 2;
    }

    platform::FfmpegFrameToolConfig tool_cfg{};
    tool_cfg.ffmpeg    = args.ffmpeg;
    tool_cfg.ffprobe   = args.ffprobe;
    tool_cfg.work_dir  = args.work_dir;
    tool_cfg.keep_temp = args.keep_temp;
    platform::FfmpegFrameTool tool(tool_cfg);

    platform::CommandServiceConfig svc_cfg{};
    svc_cfg.enhance_cmd  = platform::CommandImageServices::SplitCommand(args.enhance_cmd);
    svc_cfg.critique_cmd = platform::CommandImageServices::SplitCommand(args.critique_cmd);
    svc_cfg.surgical_cmd = platform::CommandImageServices::SplitCommand(args.surgical_cmd);
    svc_cfg.work_dir     = args.work_dir;
    platform::CommandImageServices services(svc_cfg);

    venh::ServiceSet set{};
    set.enhance  = &services;
    set.critique = &services;
    set.surgical = services.hasSurgical() ? &services : nullptr;

    // Advisory only; admission is enforced by the driver.
    platform::VideoInfo info{};
    if (tool.probe(args.input, info)) {
        const double fps = venh::DetermineExtractionFps(info.fps, info.duration_s, args.cfg.EXTRACTION_FPS);
        std::cout << "[VENH] estimated time ~"
                  << static_cast<int>(venh::EstimateEnhancementSeconds(info.duration_s, fps)) << " s\n";
        if (!venh::IsDurationRecommended(info.duration_s, args.cfg.MAX_DURATION_S)) {
            std::cerr << "[VENH] clip is " << info.duration_s << " s, longer than the "
                      << args.cfg.MAX_DURATION_S << " s limit\n";
        }
    }

    venh::PipelineDriver driver(args.cfg, tool, set);
    venh::PipelineResult res{};
    const bool ok = driver.EnhanceVideo(args.input, args.output, res);

    print_result(res);

    if (!ok) {
        std::cerr << "[VENH] FAILED " << msg::ErrorKindStr(res.error)
                  << " (" << venh::PipelineDriver::StatusStr(driver.lastStatus()) << "): "
                  << res.error_detail << "\n";
        return 1;
    }

    std::cout << "[VENH] wrote " << res.output_path << "\n";
    return 0;
}
