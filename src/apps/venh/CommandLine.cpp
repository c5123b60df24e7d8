// CommandLine.cpp
#include "apps/venh/CommandLine.hpp"

#include <iostream>
#include <stdexcept>

namespace venh {

long long ParseInteger(const std::string& s, long long lo, long long hi) {
    std::size_t used = 0;
    const long long v = std::stoll(s, &used);
    if (used != s.size()) throw std::invalid_argument("trailing characters in '" + s + "'");
    if (v < lo || v > hi) {
        throw std::out_of_range(s + " not in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
    return v;
}

double ParseReal(const std::string& s, double lo, double hi) {
    std::size_t used = 0;
    const double v = std::stod(s, &used);
    if (used != s.size()) throw std::invalid_argument("trailing characters in '" + s + "'");
    if (!(v >= lo && v <= hi)) {
        throw std::out_of_range(s + " not in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
    return v;
}

void PrintUsage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " --input <FILE> --output <FILE> --enhance_cmd <CMD> --critique_cmd <CMD>\n"
        << "       [--surgical_cmd <CMD>] [--feedback TEXT]\n"
        << "       [--max_duration S] [--max_bytes N] [--max_memory_mb MB] [--fps F]\n"
        << "       [--threshold T] [--bins N]\n"
        << "       [--max_iters 1-255] [--target SCORE] [--backoff_ms MS]\n"
        << "       [--concurrency 1-64] [--max_inflight 0-64] [--budget_s S]\n"
        << "       [--lut_levels N] [--lut_dir DIR] [--work_dir DIR]\n"
        << "       [--ffmpeg PATH] [--ffprobe PATH] [--keep_temp] [--no_audio]\n"
        << "\nCommand templates are split on whitespace and may use the placeholders\n"
        << "{input} {output} {mask} {region} {instruction}. The critique command\n"
        << "prints its JSON verdict on stdout.\n"
        << "\nExample:\n"
        << "  " << exe << " --input clip.mp4 --output clip_enh.mp4 \\\n"
        << "      --enhance_cmd \"./ai_edit.sh {input} {output} '{instruction}'\" \\\n"
        << "      --critique_cmd \"./ai_critique.sh {input}\"\n";
}

static bool takesValue(const std::string& flag) {
    static const char* const kValueFlags[] = {
        "--input", "--output", "--enhance_cmd", "--critique_cmd", "--surgical_cmd", "--feedback",
        "--max_duration", "--max_bytes", "--max_memory_mb", "--fps", "--threshold", "--bins",
        "--max_iters", "--target", "--backoff_ms", "--concurrency", "--max_inflight", "--budget_s",
        "--lut_levels", "--lut_dir", "--work_dir", "--ffmpeg", "--ffprobe",
    };
    for (const char* f : kValueFlags) {
        if (flag == f) return true;
    }
    return false;
}

bool ParseCommandLine(int argc, const char* const* argv, CliArgs& out) {
    if (argc < 3) return false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        try {
            if (a == "--keep_temp") {
                out.keep_temp = true;
                continue;
            }
            if (a == "--no_audio") {
                out.cfg.COPY_AUDIO = false;
                continue;
            }

            if (!takesValue(a)) {
                std::cerr << "Unknown arg: " << a << "\n";
                return false;
            }

            const char* v = need_value(a.c_str());
            if (!v) return false;

            if      (a == "--input")        out.input = v;
            else if (a == "--output")       out.output = v;
            else if (a == "--enhance_cmd")  out.enhance_cmd = v;
            else if (a == "--critique_cmd") out.critique_cmd = v;
            else if (a == "--surgical_cmd") out.surgical_cmd = v;
            else if (a == "--feedback")     out.cfg.USER_FEEDBACK = v;
            else if (a == "--lut_dir")      out.cfg.LUT_DUMP_DIR = v;
            else if (a == "--work_dir")     out.work_dir = v;
            else if (a == "--ffmpeg")       out.ffmpeg = v;
            else if (a == "--ffprobe")      out.ffprobe = v;
            else if (a == "--max_duration") out.cfg.MAX_DURATION_S = ParseReal(v, 0.0, 86400.0);
            else if (a == "--max_bytes")
                out.cfg.MAX_INPUT_BYTES = static_cast<uint64_t>(ParseInteger(v, 0, 1ll << 50));
            else if (a == "--max_memory_mb")
                out.cfg.MAX_DECODED_BYTES = static_cast<uint64_t>(ParseInteger(v, 0, 1ll << 24)) << 20;
            else if (a == "--fps")          out.cfg.EXTRACTION_FPS = ParseReal(v, 0.0, 240.0);
            else if (a == "--threshold")
                out.cfg.SIMILARITY_THRESHOLD = static_cast<float>(ParseReal(v, -1.0, 1.0));
            else if (a == "--bins")         out.cfg.HISTOGRAM_BINS = static_cast<int>(ParseInteger(v, 2, 256));
            else if (a == "--max_iters")
                out.cfg.MAX_ITERATIONS = static_cast<uint8_t>(ParseInteger(v, 1, 255));
            else if (a == "--target")       out.cfg.TARGET_SCORE = static_cast<float>(ParseReal(v, 0.0, 10.0));
            else if (a == "--backoff_ms")
                out.cfg.RETRY_BACKOFF_MS = static_cast<uint32_t>(ParseInteger(v, 0, 60000));
            else if (a == "--concurrency")
                out.cfg.CONCURRENCY = static_cast<uint32_t>(ParseInteger(v, 1, 64));
            else if (a == "--max_inflight")
                out.cfg.MAX_INFLIGHT_CALLS = static_cast<uint32_t>(ParseInteger(v, 0, 64));
            else if (a == "--budget_s")
                out.cfg.TIME_BUDGET_S = static_cast<uint32_t>(ParseInteger(v, 0, 7 * 86400));
            else if (a == "--lut_levels")   out.cfg.LUT_LEVELS = static_cast<int>(ParseInteger(v, 2, 256));
        } catch (const std::logic_error& e) {
            std::cerr << "Bad value for " << a << ": " << e.what() << "\n";
            return false;
        }
    }

    if (out.input.empty() || out.output.empty()) return false;
    if (out.enhance_cmd.empty() || out.critique_cmd.empty()) {
        std::cerr << "--enhance_cmd and --critique_cmd are required\n";
        return false;
    }
    return true;
}

} // namespace venh
