#pragma once
#include <string>
#include <opencv2/core.hpp>

namespace platform {

// External AI collaborators. Every call is a blocking request; a false
// return means the call failed (timeout, rate limit, server error, bad
// payload) and may be retried by the caller.

// (image, instruction) -> edited image, same resolution expected.
class IEnhancementService {
public:
    virtual bool enhance(const cv::Mat& image, const std::string& instruction,
                         cv::Mat& edited) = 0;
    virtual ~IEnhancementService() = default;
};

// (image) -> raw critique payload. The payload shape is provider specific;
// venh::CritiqueAdapter turns it into msg::Critique.
class ICritiqueService {
public:
    virtual bool critique(const cv::Mat& image, std::string& raw) = 0;
    virtual ~ICritiqueService() = default;
};

// (image, mask, region, instruction) -> image edited inside the mask only.
// mask: CV_8UC1, same size as image, 255 = editable.
class ISurgicalEditService {
public:
    virtual bool edit(const cv::Mat& image, const cv::Mat& mask,
                      const std::string& region, const std::string& instruction,
                      cv::Mat& edited) = 0;
    virtual ~ISurgicalEditService() = default;
};

} // namespace platform
