#pragma once
#include <string>
#include <opencv2/core.hpp>

namespace venh {

// Named edit regions understood by the surgical-edit path.
//   3x3 grid : top-left, top-center, top-right, center-left, center,
//              center-right, bottom-left, bottom-center, bottom-right
//              (inner edges grown by width/20 horizontally,
//               height/20 vertically)
//   foreground : central 60 %
//   background : 20 % border band
//   global     : whole frame
// Names are matched case-insensitively; '_' and ' ' are read as '-'.

bool IsKnownRegion(const std::string& region);

// mask: CV_8UC1 of size (width, height), 255 inside the region, 0 outside.
// False (and an empty mask) for unknown regions or non-positive sizes.
bool BuildRegionMask(int width, int height, const std::string& region, cv::Mat& mask);

// Copy 'edited' into 'base' where mask != 0. All three must share one size;
// base and edited are CV_8UC3. Returns false (base untouched) otherwise.
bool CompositeThroughMask(const cv::Mat& edited, const cv::Mat& mask, cv::Mat& base);

} // namespace venh
