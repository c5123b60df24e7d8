#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "platform/IImageServices.hpp"

namespace platform {

// ------------------------------
// Config
// ------------------------------
// Each command is an argv template. Tokens may contain placeholders that
// are replaced per call:
//   {input}        image file handed to the service
//   {output}       file the service must write its result image to
//   {mask}         mask image (surgical only; white = editable)
//   {region}       region name (surgical only)
//   {instruction}  instruction text, passed as part of a single argv entry
// The critique command prints its JSON verdict on stdout.
struct CommandServiceConfig {
    std::vector<std::string> enhance_cmd;
    std::vector<std::string> critique_cmd;
    std::vector<std::string> surgical_cmd;   // empty = no surgical capability

    std::string work_dir;                    // empty = $TMPDIR or /tmp
};

// ---------------------------------------------------------------------------
// CommandImageServices: bridges the AI service interfaces to external
// programs (provider CLIs, curl wrappers, scripts). Calls are independent
// and may run concurrently; every call uses its own temporary files.
// ---------------------------------------------------------------------------
class CommandImageServices : public IEnhancementService,
                             public ICritiqueService,
                             public ISurgicalEditService {
public:
    explicit CommandImageServices(const CommandServiceConfig& cfg);

    bool enhance(const cv::Mat& image, const std::string& instruction, cv::Mat& edited) override;
    bool critique(const cv::Mat& image, std::string& raw) override;
    bool edit(const cv::Mat& image, const cv::Mat& mask,
              const std::string& region, const std::string& instruction,
              cv::Mat& edited) override;

    bool hasEnhance()  const { return !m_cfg.enhance_cmd.empty(); }
    bool hasCritique() const { return !m_cfg.critique_cmd.empty(); }
    bool hasSurgical() const { return !m_cfg.surgical_cmd.empty(); }

    // Split a command line on whitespace, honouring '...' and "..." quoting.
    static std::vector<std::string> SplitCommand(const std::string& line);

    struct Placeholders {
        std::string input;
        std::string output;
        std::string mask;
        std::string region;
        std::string instruction;
    };

    // Replace every placeholder occurrence in every token.
    static std::vector<std::string> Expand(const std::vector<std::string>& tmpl,
                                           const Placeholders& p);

private:
    CommandServiceConfig m_cfg{};

    bool runImageCommand(const char* tag, const std::vector<std::string>& tmpl,
                         const cv::Mat& image, const cv::Mat* mask,
                         const std::string& region, const std::string& instruction,
                         cv::Mat& result);
};

} // namespace platform
