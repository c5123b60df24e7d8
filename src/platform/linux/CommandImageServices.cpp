// CommandImageServices.cpp
#include "platform/linux/CommandImageServices.hpp"

#include "os/process.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>

#include <opencv2/imgcodecs.hpp>

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

namespace {

// Scratch file that is unlinked when it goes out of scope.
class TempFile {
public:
    TempFile() = default;
    ~TempFile() { if (!m_path.empty()) ::unlink(m_path.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    // Create <dir>/venh_<stem>_XXXXXX<suffix>.
    bool create(const std::string& dir, const char* stem, const char* suffix) {
        std::string tmpl = dir + "/venh_" + stem + "_XXXXXX" + suffix;
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        const int fd = ::mkstemps(buf.data(), static_cast<int>(::strlen(suffix)));
        if (fd < 0) {
            std::cerr << "[Services] mkstemps in " << dir << ": " << ::strerror(errno) << "\n";
            return false;
        }
        ::close(fd);
        m_path = buf.data();
        return true;
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

static void replaceAll(std::string& s, const std::string& key, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = s.find(key, pos)) != std::string::npos) {
        s.replace(pos, key.size(), value);
        pos += value.size();
    }
}

static bool writeImage(const std::string& path, const cv::Mat& img) {
    try {
        return cv::imwrite(path, img);
    } catch (const cv::Exception& e) {
        std::cerr << "[Services] imwrite " << path << ": " << e.what() << "\n";
        return false;
    }
}

} // anonymous namespace

namespace platform {

static inline CommandServiceConfig sanitise(const CommandServiceConfig& in) {
    CommandServiceConfig cfg = in;
    if (cfg.work_dir.empty()) {
        const char* tmp = std::getenv("TMPDIR");
        cfg.work_dir = (tmp && *tmp) ? tmp : "/tmp";
    }
    return cfg;
}

CommandImageServices::CommandImageServices(const CommandServiceConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

std::vector<std::string> CommandImageServices::SplitCommand(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_token = false;
    char quote = 0;

    for (char c : line) {
        if (quote) {
            if (c == quote) quote = 0;
            else cur.push_back(c);
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                out.push_back(cur);
                cur.clear();
                in_token = false;
            }
            continue;
        }
        cur.push_back(c);
        in_token = true;
    }
    if (in_token) out.push_back(cur);
    return out;
}

std::vector<std::string> CommandImageServices::Expand(const std::vector<std::string>& tmpl,
                                                      const Placeholders& p) {
    std::vector<std::string> argv;
    argv.reserve(tmpl.size());
    for (std::string tok : tmpl) {
        replaceAll(tok, "{input}", p.input);
        replaceAll(tok, "{output}", p.output);
        replaceAll(tok, "{mask}", p.mask);
        replaceAll(tok, "{region}", p.region);
        replaceAll(tok, "{instruction}", p.instruction);
        argv.push_back(tok);
    }
    return argv;
}

bool CommandImageServices::runImageCommand(const char* tag, const std::vector<std::string>& tmpl,
                                           const cv::Mat& image, const cv::Mat* mask,
                                           const std::string& region, const std::string& instruction,
                                           cv::Mat& result) {
    result.release();
    if (tmpl.empty() || image.empty()) return false;

    TempFile in, out, mask_file;
    if (!in.create(m_cfg.work_dir, "in", ".png"))   return false;
    if (!out.create(m_cfg.work_dir, "out", ".png")) return false;
    if (!writeImage(in.path(), image)) return false;

    Placeholders p{};
    p.input  = in.path();
    p.output = out.path();
    p.region = region;
    p.instruction = instruction;

    if (mask) {
        if (!mask_file.create(m_cfg.work_dir, "mask", ".png")) return false;
        if (!writeImage(mask_file.path(), *mask)) return false;
        p.mask = mask_file.path();
    }

    Proc::Result r{};
    if (!Proc::Run(Expand(tmpl, p), r)) {
        std::cerr << "[Services] " << tag << " command failed (exit " << r.exit_code << ")";
        if (!r.err.empty()) std::cerr << ": " << r.err.substr(0, 300);
        std::cerr << "\n";
        return false;
    }

    result = cv::imread(out.path(), cv::IMREAD_COLOR);
    if (result.empty()) {
        std::cerr << "[Services] " << tag << " produced no readable image\n";
        return false;
    }
    return true;
}

bool CommandImageServices::enhance(const cv::Mat& image, const std::string& instruction, cv::Mat& edited) {
    return runImageCommand("enhance", m_cfg.enhance_cmd, image, nullptr, "global", instruction, edited);
}

bool CommandImageServices::edit(const cv::Mat& image, const cv::Mat& mask,
                                const std::string& region, const std::string& instruction,
                                cv::Mat& edited) {
    return runImageCommand("surgical", m_cfg.surgical_cmd, image, &mask, region, instruction, edited);
}

bool CommandImageServices::critique(const cv::Mat& image, std::string& raw) {
    raw.clear();
    if (m_cfg.critique_cmd.empty() || image.empty()) return false;

    TempFile in;
    if (!in.create(m_cfg.work_dir, "critique", ".png")) return false;
    if (!writeImage(in.path(), image)) return false;

    Placeholders p{};
    p.input = in.path();

    Proc::Result r{};
    if (!Proc::Run(Expand(m_cfg.critique_cmd, p), r)) {
        std::cerr << "[Services] critique command failed (exit " << r.exit_code << ")\n";
        return false;
    }
    raw = r.out;
    return !raw.empty();
}

} // namespace platform
