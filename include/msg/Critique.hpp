#pragma once
#include <string>
#include <vector>

namespace msg {

// One remaining problem reported by the critique service.
struct Issue {
    std::string description;
    std::string instruction;         // edit text for the services; falls back to description
    std::string region = "global";   // named region (see RegionMask)
    bool surgical = false;           // true: localized, fix with a masked edit
};

// Validated critique. Only the CritiqueAdapter builds these from raw
// service payloads; nothing downstream sees the raw shape.
struct Critique {
    float score = 0.0f;              // 0..10
    std::vector<Issue> issues;

    bool anySurgical() const {
        for (const auto& i : issues) if (i.surgical) return true;
        return false;
    }
};

} // namespace msg
