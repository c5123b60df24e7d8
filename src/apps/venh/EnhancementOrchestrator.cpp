#include "apps/venh/EnhancementOrchestrator.hpp"
#include "apps/venh/CritiqueAdapter.hpp"
#include "apps/venh/RegionMask.hpp"

#include <iostream>
#include <sstream>

#include <opencv2/core.hpp>

namespace venh {

const char* const kEnhancementInstruction =
    "Enhance this video frame to professional, near-photographic quality. "
    "Improve exposure, white balance, contrast, colour grading and clarity. "
    "Do not crop, reframe, resize, move, add or remove anything: the output "
    "must keep the exact composition, framing and resolution of the input so "
    "it stays pixel-aligned with it.";

static inline OrchestratorConfig sanitise(const OrchestratorConfig& in) {
    OrchestratorConfig cfg = in;
    if (cfg.MAX_ITERATIONS < 1)       cfg.MAX_ITERATIONS = 1;
    if (cfg.TARGET_SCORE < 0.0f)      cfg.TARGET_SCORE = 0.0f;
    if (cfg.TARGET_SCORE > 10.0f)     cfg.TARGET_SCORE = 10.0f;
    if (cfg.RETRY_BACKOFF_MS > 60000) cfg.RETRY_BACKOFF_MS = 60000;
    return cfg;
}

static std::string composeInstruction(const std::string& feedback) {
    std::string s = kEnhancementInstruction;
    if (!feedback.empty()) {
        s += "\n\nAdditional direction from the user: ";
        s += feedback;
    }
    return s;
}

EnhancementOrchestrator::EnhancementOrchestrator(const OrchestratorConfig& cfg, const ServiceSet& services)
: m_cfg(sanitise(cfg))
, m_services(services)
, m_instruction(composeInstruction(m_cfg.USER_FEEDBACK)) {
}

void EnhancementOrchestrator::setConfig(const OrchestratorConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_instruction = composeInstruction(m_cfg.USER_FEEDBACK);
}

namespace {

// One call-gate permit, returned even if the call throws.
class GateHold {
public:
    explicit GateHold(Rtos::CountingSemaphore* gate) : m_gate(gate) {
        if (m_gate) m_gate->take();
    }
    ~GateHold() {
        if (m_gate) m_gate->give();
    }

    GateHold(const GateHold&) = delete;
    GateHold& operator=(const GateHold&) = delete;

private:
    Rtos::CountingSemaphore* m_gate;
};

} // anonymous namespace

template <typename Fn>
bool EnhancementOrchestrator::callWithRetry(uint32_t group_index, const char* what, Fn&& fn) {
    for (int tries = 0; tries < 2; ++tries) {
        if (tries > 0) {
            std::cerr << "[Orchestrator] group=" << group_index << " " << what
                      << " failed, retrying in " << m_cfg.RETRY_BACKOFF_MS << " ms\n";
            if (m_cfg.RETRY_BACKOFF_MS > 0) Rtos::SleepMs(static_cast<int>(m_cfg.RETRY_BACKOFF_MS));
        }

        bool ok = false;
        {
            GateHold hold(m_services.call_gate);
            ok = fn();
        }
        if (ok) return true;
    }
    return false;
}

std::string EnhancementOrchestrator::globalRetryInstruction(const msg::Critique& critique) const {
    std::ostringstream os;
    os << m_instruction
       << "\n\nA previous pass still has these problems. Fix them across the whole "
          "frame while keeping composition and resolution unchanged:\n";
    int n = 1;
    for (const auto& issue : critique.issues) {
        os << n++ << ". " << issue.instruction << "\n";
    }
    return os.str();
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
void EnhancementOrchestrator::run(uint32_t group_index, const cv::Mat& representative, uint64_t deadline_us,
                                  msg::EnhancementAttempt& attempt, msg::GroupReport& report,
                                  std::vector<msg::GroupDegradationNotice>& notices) {
    attempt = msg::EnhancementAttempt{};
    attempt.original = representative;

    report = msg::GroupReport{};
    report.group_index = group_index;

    RunCtx ctx{};
    ctx.group_index = group_index;
    ctx.deadline_us = deadline_us;
    ctx.attempt = &attempt;
    ctx.report  = &report;
    ctx.notices = &notices;

    if (!m_services.complete()) {
        degrade(ctx, msg::ErrorKind::SERVICE_UNAVAILABLE, "enhancement or critique service not configured");
    } else if (representative.empty()) {
        degrade(ctx, msg::ErrorKind::INPUT_REJECTED, "representative frame is empty");
    }

    while (!attempt.terminal()) {
        switch (attempt.state) {
            case msg::AttemptState::ENHANCING:     stepEnhancing(ctx); break;
            case msg::AttemptState::ANALYZING:     stepAnalyzing(ctx); break;
            case msg::AttemptState::SURGICAL_EDIT: stepSurgical(ctx);  break;
            case msg::AttemptState::GLOBAL_RETRY:
                attempt.state = msg::AttemptState::ENHANCING;
                break;
            default:
                attempt.state = msg::AttemptState::TERMINAL;
                break;
        }
    }

    report.iterations     = attempt.iteration;
    report.surgical_edits = attempt.surgical_edits;
    report.scored         = attempt.scored;
    report.final_score    = attempt.scored ? attempt.critique.score : 0.0f;
    report.edited         = attempt.hasEdit();
    report.stop           = attempt.stop;

    std::cout << "[Orchestrator] group=" << group_index
              << " state=" << msg::AttemptStateStr(attempt.state)
              << " stop=" << msg::StopReasonStr(attempt.stop)
              << " iterations=" << int(attempt.iteration);
    if (attempt.scored) std::cout << " score=" << attempt.critique.score;
    std::cout << "\n";
}

// ---------------------------------------------------------------------------
// States
// ---------------------------------------------------------------------------
void EnhancementOrchestrator::stepEnhancing(RunCtx& ctx) {
    msg::EnhancementAttempt& a = *ctx.attempt;

    if (budgetExpired(ctx)) { stopForBudget(ctx); return; }
    if (a.iteration >= m_cfg.MAX_ITERATIONS) {
        a.state = msg::AttemptState::TERMINAL;
        a.stop  = msg::StopReason::ITERATION_CAP;
        return;
    }

    const bool first = !a.hasEdit();
    const cv::Mat input = first ? a.original : a.edited;
    const std::string instruction = first ? m_instruction : globalRetryInstruction(a.critique);

    ++a.iteration;

    cv::Mat out;
    const bool ok = callWithRetry(ctx.group_index, "enhance", [&]() {
        out.release();
        return m_services.enhance->enhance(input, instruction, out)
            && !out.empty() && out.type() == CV_8UC3;
    });

    if (!ok) {
        degrade(ctx, msg::ErrorKind::TRANSIENT_SERVICE, "enhancement failed after retry");
        return;
    }

    if (!first) {
        for (const auto& issue : a.critique.issues) {
            ctx.report->applied.push_back("global: " + issue.description);
        }
    }

    // Surgical regions were cut for the previous geometry.
    if (!a.surgical_mask.empty() && a.surgical_mask.size() != out.size()) {
        notice(ctx, msg::ErrorKind::GEOMETRY_MISMATCH,
               "enhancement returned " + std::to_string(out.cols) + "x" + std::to_string(out.rows) +
               ", earlier surgical regions no longer apply");
        a.surgical_mask.release();
    }

    a.edited = out;
    a.scored = false;
    a.state  = msg::AttemptState::ANALYZING;
}

void EnhancementOrchestrator::stepAnalyzing(RunCtx& ctx) {
    msg::EnhancementAttempt& a = *ctx.attempt;

    msg::Critique critique{};
    std::string   why;
    msg::ErrorKind last = msg::ErrorKind::NONE;

    const bool ok = callWithRetry(ctx.group_index, "critique", [&]() {
        std::string raw;
        if (!m_services.critique->critique(a.edited, raw)) {
            last = msg::ErrorKind::TRANSIENT_SERVICE;
            return false;
        }
        if (!CritiqueAdapter::Parse(raw, critique, &why)) {
            last = msg::ErrorKind::MALFORMED_RESPONSE;
            std::cerr << "[Orchestrator] group=" << ctx.group_index
                      << " unusable critique: " << why << "\n";
            return false;
        }
        return true;
    });

    if (!ok) {
        if (last == msg::ErrorKind::MALFORMED_RESPONSE) {
            // Nothing trustworthy left to act on: keep the current edit.
            notice(ctx, last, "critique unparseable after retry (" + why + "), accepted as satisfied");
            a.state = msg::AttemptState::SATISFIED;
            a.stop  = msg::StopReason::NO_ISSUES;
            return;
        }
        degrade(ctx, msg::ErrorKind::TRANSIENT_SERVICE, "critique failed after retry");
        return;
    }

    a.critique = critique;
    a.scored   = true;

    Candidate& best = ctx.best;
    if (!best.valid || critique.score >= best.critique.score) {
        best.edited        = a.edited;
        best.surgical_mask = a.surgical_mask.empty() ? cv::Mat() : a.surgical_mask.clone();
        best.critique      = critique;
        best.valid         = true;
    }

    std::cout << "[Orchestrator] group=" << ctx.group_index
              << " iter=" << int(a.iteration)
              << " score=" << critique.score
              << " issues=" << critique.issues.size() << "\n";

    decide(ctx);
}

void EnhancementOrchestrator::stepSurgical(RunCtx& ctx) {
    msg::EnhancementAttempt& a = *ctx.attempt;

    if (budgetExpired(ctx)) { stopForBudget(ctx); return; }

    ++a.iteration;

    cv::Mat current = a.edited;
    for (const auto& issue : a.critique.issues) {
        if (!issue.surgical) continue;

        cv::Mat mask;
        if (!BuildRegionMask(current.cols, current.rows, issue.region, mask)) {
            std::cerr << "[Orchestrator] group=" << ctx.group_index
                      << " skipping surgical issue in unknown region '" << issue.region << "'\n";
            continue;
        }

        cv::Mat out;
        const bool ok = callWithRetry(ctx.group_index, "surgical", [&]() {
            out.release();
            return m_services.surgical->edit(current, mask, issue.region, issue.instruction, out)
                && !out.empty();
        });

        if (!ok) {
            a.edited = current;
            degrade(ctx, msg::ErrorKind::TRANSIENT_SERVICE,
                    "surgical edit failed after retry (region " + issue.region + ")");
            return;
        }

        if (!CompositeThroughMask(out, mask, current)) {
            notice(ctx, msg::ErrorKind::GEOMETRY_MISMATCH,
                   "surgical result does not match the frame (region " + issue.region + "), edit skipped");
            continue;
        }

        if (a.surgical_mask.empty() || a.surgical_mask.size() != mask.size()) {
            a.surgical_mask = mask.clone();
        } else {
            cv::bitwise_or(a.surgical_mask, mask, a.surgical_mask);
        }

        ++a.surgical_edits;
        ctx.report->applied.push_back(issue.region + ": " + issue.description);
    }

    a.edited = current;
    a.scored = false;
    a.state  = msg::AttemptState::ANALYZING;
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------
bool EnhancementOrchestrator::anyActionableSurgical(const msg::Critique& c) const {
    if (!m_services.surgical) return false;
    for (const auto& issue : c.issues) {
        if (issue.surgical && IsKnownRegion(issue.region)) return true;
    }
    return false;
}

void EnhancementOrchestrator::decide(RunCtx& ctx) {
    msg::EnhancementAttempt& a = *ctx.attempt;
    const msg::Critique& c = a.critique;

    if (c.score >= m_cfg.TARGET_SCORE) {
        a.state = msg::AttemptState::SATISFIED;
        a.stop  = msg::StopReason::TARGET_SCORE;
    } else if (c.issues.empty()) {
        a.state = msg::AttemptState::SATISFIED;
        a.stop  = msg::StopReason::NO_ISSUES;
    } else if (a.iteration >= m_cfg.MAX_ITERATIONS) {
        a.state = msg::AttemptState::TERMINAL;
        a.stop  = msg::StopReason::ITERATION_CAP;
    } else if (anyActionableSurgical(c)) {
        a.state = msg::AttemptState::SURGICAL_EDIT;
    } else {
        // Includes surgical issues when no surgical service is configured.
        a.state = msg::AttemptState::GLOBAL_RETRY;
    }
}

bool EnhancementOrchestrator::budgetExpired(const RunCtx& ctx) const {
    return ctx.deadline_us != 0 && Rtos::NowUs() >= ctx.deadline_us;
}

void EnhancementOrchestrator::stopForBudget(RunCtx& ctx) {
    msg::EnhancementAttempt& a = *ctx.attempt;
    notice(ctx, msg::ErrorKind::BUDGET_EXPIRED,
           "time budget expired after " + std::to_string(int(a.iteration)) + " iteration(s)");
    a.state = msg::AttemptState::TERMINAL;
    a.stop  = msg::StopReason::BUDGET_EXPIRED;
}

void EnhancementOrchestrator::degrade(RunCtx& ctx, msg::ErrorKind kind, const std::string& detail) {
    msg::EnhancementAttempt& a = *ctx.attempt;
    notice(ctx, kind, detail);

    if (ctx.best.valid) {
        a.edited        = ctx.best.edited;
        a.surgical_mask = ctx.best.surgical_mask;
        a.critique      = ctx.best.critique;
        a.scored        = true;
    }
    a.state = msg::AttemptState::TERMINAL;
    a.stop  = msg::StopReason::DEGRADED;
}

void EnhancementOrchestrator::notice(RunCtx& ctx, msg::ErrorKind kind, const std::string& detail) {
    msg::GroupDegradationNotice n{};
    n.group_index = ctx.group_index;
    n.kind = kind;
    n.detail = detail;
    ctx.notices->push_back(n);

    std::cerr << "[Orchestrator] group=" << ctx.group_index << " "
              << msg::ErrorKindStr(kind) << ": " << detail << "\n";
}

} // namespace venh
