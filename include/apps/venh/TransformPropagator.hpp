#pragma once
#include <vector>
#include <opencv2/core.hpp>

#include "apps/venh/ColorTransform.hpp"
#include "msg/Frame.hpp"
#include "msg/FrameGroup.hpp"

namespace venh {

// Map every pixel of an 8-bit BGR frame through 't'. 'in' is never modified;
// 'out' gets its own buffer, except for the identity transform where it
// shares 'in' (frames are read-only once extracted).
bool ApplyTransform(const ColorTransform& t, const cv::Mat& in, cv::Mat& out);

// Write the group's output frames into out_frames[group.start .. group.end).
// The representative slot receives 'rep_edited' as-is (or the source frame
// if it is empty); every other slot receives ApplyTransform of its source.
// out_frames must already be sized to the full sequence. Slots outside the
// group are not touched.
bool PropagateGroup(const ColorTransform& t,
                    const std::vector<msg::Frame>& frames,
                    const msg::FrameGroup& group,
                    const cv::Mat& rep_edited,
                    std::vector<cv::Mat>& out_frames);

} // namespace venh
