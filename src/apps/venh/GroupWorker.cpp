// GroupWorker.cpp
#include "apps/venh/GroupWorker.hpp"
#include "apps/venh/TransformPropagator.hpp"

#include <cstdio>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace venh {

GroupWorker::GroupWorker(const OrchestratorConfig& orch_cfg,
                         const ColorTransformBuilderConfig& ctb_cfg,
                         const ServiceSet& services,
                         const GroupRun& run)
: m_orch(orch_cfg, services)
, m_builder(ctb_cfg)
, m_levels(ctb_cfg.LEVELS)
, m_run(run) {
}

void GroupWorker::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);
    if (!ctx || !ctx->self || !ctx->jobs_in) {
        return;
    }
    ctx->self->Run(*ctx->jobs_in);
}

void GroupWorker::Run(GroupJobQueue& jobs_in) {
    while (true) {
        GroupJob job{};
        if (!jobs_in.receive(job, Rtos::MAX_TIMEOUT)) {
            continue;
        }
        if (job.stop) break;

        processGroup(job.group_index);
    }
}

void GroupWorker::processGroup(uint32_t group_index) {
    try {
        enhanceGroup(group_index);
    } catch (const cv::Exception& e) {
        failGroup(group_index, e.what());
    }
}

void GroupWorker::enhanceGroup(uint32_t group_index) {
    if (!m_run.frames || !m_run.groups || !m_run.out_frames || !m_run.outcomes ||
        group_index >= m_run.groups->size()) {
        std::cerr << "[GroupWorker] bad job for group " << group_index << "\n";
        return;
    }

    const std::vector<msg::Frame>& frames = *m_run.frames;
    const msg::FrameGroup& g = (*m_run.groups)[group_index];
    GroupOutcome& oc = (*m_run.outcomes)[group_index];
    oc = GroupOutcome{};

    // No new group starts once the run's budget is gone.
    if (m_run.deadline_us != 0 && Rtos::NowUs() >= m_run.deadline_us) {
        skipGroup(group_index, g, oc);
        return;
    }

    const cv::Mat& source = frames[g.representative].pixels;

    // ---- Enhance the representative ----
    msg::EnhancementAttempt attempt{};
    m_orch.run(group_index, source, m_run.deadline_us, attempt, oc.report, oc.notices);

    oc.report.start = g.start;
    oc.report.end   = g.end;
    oc.report.representative = g.representative;

    // ---- Derive the group transform ----
    ColorTransform transform(m_levels);
    cv::Mat rep_out = attempt.edited;

    if (attempt.hasEdit() &&
        !m_builder.build(source, attempt.edited, transform, attempt.surgical_mask)) {

        msg::GroupDegradationNotice n{};
        n.group_index = group_index;

        if (m_builder.lastStatus() == ColorTransformBuilder::Status::GEOMETRY_MISMATCH) {
            // Representative edited, rest unchanged.
            cv::resize(attempt.edited, rep_out, source.size(), 0, 0, cv::INTER_AREA);
            n.kind = msg::ErrorKind::GEOMETRY_MISMATCH;
            n.detail = "edited representative is " + std::to_string(attempt.edited.cols) + "x" +
                       std::to_string(attempt.edited.rows) + ", source is " +
                       std::to_string(source.cols) + "x" + std::to_string(source.rows) +
                       "; resized, rest of group unchanged";
        } else {
            rep_out = source;
            n.kind = msg::ErrorKind::MALFORMED_RESPONSE;
            n.detail = std::string("colour transform not built (") +
                       ColorTransformBuilder::StatusStr(m_builder.lastStatus()) + "), group unchanged";
        }

        oc.notices.push_back(n);
        std::cerr << "[GroupWorker] group=" << group_index << " "
                  << msg::ErrorKindStr(n.kind) << ": " << n.detail << "\n";
    }

    // ---- Propagate ----
    if (!PropagateGroup(transform, frames, g, rep_out, *m_run.out_frames)) {
        std::cerr << "[GroupWorker] group=" << group_index << " propagation incomplete\n";
    }

    if (!m_run.lut_dump_dir.empty() && attempt.hasEdit()) {
        dumpTransform(group_index, transform);
    }

    oc.done = true;
    ++m_processed;
}

void GroupWorker::skipGroup(uint32_t group_index, const msg::FrameGroup& g, GroupOutcome& oc) {
    for (uint32_t i = g.start; i < g.end; ++i) {
        (*m_run.out_frames)[i] = (*m_run.frames)[i].pixels;
    }

    oc.report.group_index = group_index;
    oc.report.start = g.start;
    oc.report.end   = g.end;
    oc.report.representative = g.representative;
    oc.report.stop  = msg::StopReason::BUDGET_EXPIRED;

    msg::GroupDegradationNotice n{};
    n.group_index = group_index;
    n.kind = msg::ErrorKind::BUDGET_EXPIRED;
    n.detail = "time budget expired before the group started; frames left unchanged";
    oc.notices.push_back(n);

    std::cerr << "[GroupWorker] group=" << group_index << " skipped: budget expired\n";
    oc.done = true;
    ++m_processed;
}

// An image operation threw part way through the group: fall back to the
// source frames for the whole range.
void GroupWorker::failGroup(uint32_t group_index, const std::string& what) {
    const msg::FrameGroup& g = (*m_run.groups)[group_index];
    GroupOutcome& oc = (*m_run.outcomes)[group_index];

    for (uint32_t i = g.start; i < g.end; ++i) {
        (*m_run.out_frames)[i] = (*m_run.frames)[i].pixels;
    }

    oc.report.group_index = group_index;
    oc.report.start = g.start;
    oc.report.end   = g.end;
    oc.report.representative = g.representative;
    oc.report.edited = false;
    oc.report.stop   = msg::StopReason::DEGRADED;

    msg::GroupDegradationNotice n{};
    n.group_index = group_index;
    n.kind = msg::ErrorKind::GEOMETRY_MISMATCH;
    n.detail = "image operation failed (" + what + "); frames left unchanged";
    oc.notices.push_back(n);

    std::cerr << "[GroupWorker] group=" << group_index << " " << n.detail << "\n";
    oc.done = true;
    ++m_processed;
}

void GroupWorker::dumpTransform(uint32_t group_index, const ColorTransform& t) const {
    char name[32];
    std::snprintf(name, sizeof(name), "group_%04u.cube", group_index);
    const std::string path = m_run.lut_dump_dir + "/" + name;

    if (!t.writeCube(path, "venh group " + std::to_string(group_index))) {
        std::cerr << "[GroupWorker] LUT dump failed for group " << group_index << "\n";
    }
}

} // namespace venh
