#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "os/rtos.hpp"

#include "apps/venh/ColorTransformBuilder.hpp"
#include "apps/venh/EnhancementOrchestrator.hpp"

#include "msg/Frame.hpp"
#include "msg/FrameGroup.hpp"
#include "msg/GroupReport.hpp"

namespace venh {

// ------------------------------
// Work queue (keep it explicit and boring)
// ------------------------------
struct GroupJob {
    uint32_t group_index = 0;
    bool     stop = false;     // poison pill: worker leaves its loop
};

static constexpr std::size_t GROUP_JOB_Q_CAP = 16;
using GroupJobQueue = Rtos::Queue<GroupJob, GROUP_JOB_Q_CAP>;

// Per-group result slot. Exactly one worker writes each slot.
struct GroupOutcome {
    msg::GroupReport report{};
    std::vector<msg::GroupDegradationNotice> notices;
    bool done = false;
};

// Everything one run shares with its workers. Inputs are read-only; each
// worker writes only out_frames[start, end) and outcomes[g] of the groups
// it takes off the queue.
struct GroupRun {
    const std::vector<msg::Frame>*      frames   = nullptr;
    const std::vector<msg::FrameGroup>* groups   = nullptr;
    std::vector<cv::Mat>*               out_frames = nullptr;
    std::vector<GroupOutcome>*          outcomes   = nullptr;

    uint64_t    deadline_us = 0;      // Rtos::NowUs() instant, 0 = none
    std::string lut_dump_dir;         // write group_NNNN.cube here if set
};

// ---------------------------------------------------------------------------
// GroupWorker: orchestrate -> build transform -> propagate, one group at a
// time. Owns its orchestrator and builder; the only state shared with other
// workers is the call gate inside the ServiceSet.
// ---------------------------------------------------------------------------
class GroupWorker {
public:
    // Task entry wiring for OSAL (void* arg).
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        GroupWorker*   self    = nullptr;
        GroupJobQueue* jobs_in = nullptr;
    };

public:
    GroupWorker(const OrchestratorConfig& orch_cfg,
                const ColorTransformBuilderConfig& ctb_cfg,
                const ServiceSet& services,
                const GroupRun& run);

    // OSAL-compatible entry point
    static void TaskEntry(void* arg);

    // Process one group synchronously into its slots. An OpenCV failure
    // inside the group degrades that group only.
    void processGroup(uint32_t group_index);

    uint32_t processed() const { return m_processed; }

private:
    // Main loop: receive jobs until a stop job arrives.
    void Run(GroupJobQueue& jobs_in);

    void enhanceGroup(uint32_t group_index);
    void skipGroup(uint32_t group_index, const msg::FrameGroup& g, GroupOutcome& oc);
    void failGroup(uint32_t group_index, const std::string& what);
    void dumpTransform(uint32_t group_index, const ColorTransform& t) const;

private:
    EnhancementOrchestrator m_orch;
    ColorTransformBuilder   m_builder;
    int                     m_levels = 32;
    GroupRun                m_run{};

    uint32_t m_processed = 0;
};

} // namespace venh
