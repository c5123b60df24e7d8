#include "apps/venh/TransformPropagator.hpp"

#include <iostream>

namespace venh {

bool ApplyTransform(const ColorTransform& t, const cv::Mat& in, cv::Mat& out) {
    if (in.empty() || in.type() != CV_8UC3) {
        std::cerr << "[Propagator] expected non-empty CV_8UC3 frame\n";
        return false;
    }

    if (t.isIdentity()) {
        out = in;
        return true;
    }

    cv::Mat dst(in.rows, in.cols, CV_8UC3);
    for (int y = 0; y < in.rows; ++y) {
        const cv::Vec3b* s = in.ptr<cv::Vec3b>(y);
        cv::Vec3b*       d = dst.ptr<cv::Vec3b>(y);
        for (int x = 0; x < in.cols; ++x) {
            d[x] = t.map(s[x]);
        }
    }
    out = dst;
    return true;
}

bool PropagateGroup(const ColorTransform& t,
                    const std::vector<msg::Frame>& frames,
                    const msg::FrameGroup& group,
                    const cv::Mat& rep_edited,
                    std::vector<cv::Mat>& out_frames) {
    if (group.end > frames.size() || group.end > out_frames.size() || group.start >= group.end) {
        std::cerr << "[Propagator] group [" << group.start << ", " << group.end
                  << ") out of range\n";
        return false;
    }

    bool ok = true;
    for (uint32_t i = group.start; i < group.end; ++i) {
        if (i == group.representative) {
            out_frames[i] = rep_edited.empty() ? frames[i].pixels : rep_edited;
            continue;
        }

        if (!ApplyTransform(t, frames[i].pixels, out_frames[i])) {
            // Keep the slot filled so reassembly still sees every frame.
            out_frames[i] = frames[i].pixels;
            ok = false;
        }
    }
    return ok;
}

} // namespace venh
