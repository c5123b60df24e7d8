#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "os/rtos.hpp"
#include "platform/IImageServices.hpp"
#include "msg/Critique.hpp"
#include "msg/EnhancementAttempt.hpp"
#include "msg/GroupReport.hpp"

namespace venh {

// Instruction sent with the first enhancement pass of every group.
extern const char* const kEnhancementInstruction;

struct OrchestratorConfig {
    uint8_t  MAX_ITERATIONS   = 3;      // enhancement + surgical rounds per group
    float    TARGET_SCORE     = 8.5f;   // stop once the critique reaches this
    uint32_t RETRY_BACKOFF_MS = 500;    // sleep before the single retry of a call

    // Appended to kEnhancementInstruction when non-empty.
    std::string USER_FEEDBACK;
};

// External collaborators for one run. enhance and critique are required;
// surgical may be null (surgical issues are then handled as global ones).
// call_gate, when set, bounds concurrent outbound calls across workers.
struct ServiceSet {
    platform::IEnhancementService*  enhance  = nullptr;
    platform::ICritiqueService*     critique = nullptr;
    platform::ISurgicalEditService* surgical = nullptr;
    Rtos::CountingSemaphore*        call_gate = nullptr;

    bool complete() const { return enhance && critique; }
};

// ---------------------------------------------------------------------------
// EnhancementOrchestrator: bounded improve-and-critique loop for one
// group's representative.
//
//   ENHANCING     -> enhancement service (iteration++)
//   ANALYZING     -> critique service -> SATISFIED | TERMINAL
//                                      | SURGICAL_EDIT | GLOBAL_RETRY
//   SURGICAL_EDIT -> masked edit per surgical issue (iteration++) -> ANALYZING
//   GLOBAL_RETRY  -> ENHANCING on the current edit
//
// Every external call gets one retry after a backoff. A second failure ends
// the group with the best edit obtained so far and a degradation notice.
// Holds no per-group state between run() calls; one instance per worker.
// ---------------------------------------------------------------------------
class EnhancementOrchestrator {
public:
    EnhancementOrchestrator(const OrchestratorConfig& cfg, const ServiceSet& services);

    void setConfig(const OrchestratorConfig& cfg);

    // Drive 'representative' to a terminal state. deadline_us is an
    // Rtos::NowUs() instant after which no new iteration starts (0 = none).
    // 'attempt' and 'report' are overwritten; notices are appended.
    void run(uint32_t group_index, const cv::Mat& representative, uint64_t deadline_us,
             msg::EnhancementAttempt& attempt, msg::GroupReport& report,
             std::vector<msg::GroupDegradationNotice>& notices);

    // Text sent with a global retry: the base instruction plus the issues.
    std::string globalRetryInstruction(const msg::Critique& critique) const;

    const std::string& baseInstruction() const { return m_instruction; }

private:
    // Best analysed candidate seen during one run().
    struct Candidate {
        cv::Mat  edited;
        cv::Mat  surgical_mask;
        msg::Critique critique{};
        bool     valid = false;
    };

    struct RunCtx {
        uint32_t group_index = 0;
        uint64_t deadline_us = 0;
        msg::EnhancementAttempt* attempt = nullptr;
        msg::GroupReport*        report  = nullptr;
        std::vector<msg::GroupDegradationNotice>* notices = nullptr;
        Candidate best{};
    };

    void stepEnhancing(RunCtx& ctx);
    void stepAnalyzing(RunCtx& ctx);
    void stepSurgical(RunCtx& ctx);

    // Choose the next state from a fresh critique.
    void decide(RunCtx& ctx);
    bool anyActionableSurgical(const msg::Critique& c) const;

    bool budgetExpired(const RunCtx& ctx) const;
    void stopForBudget(RunCtx& ctx);
    void degrade(RunCtx& ctx, msg::ErrorKind kind, const std::string& detail);
    void notice(RunCtx& ctx, msg::ErrorKind kind, const std::string& detail);

    // One call plus at most one retry, each holding the call gate.
    template <typename Fn>
    bool callWithRetry(uint32_t group_index, const char* what, Fn&& fn);

private:
    OrchestratorConfig m_cfg{};
    ServiceSet         m_services{};
    std::string        m_instruction;
};

} // namespace venh
