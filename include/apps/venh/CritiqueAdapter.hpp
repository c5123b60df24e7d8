#pragma once
#include <string>
#include "msg/Critique.hpp"

namespace venh {

// ---------------------------------------------------------------------------
// CritiqueAdapter: the only place that looks at raw critique payloads.
//
// Accepts a JSON object, optionally wrapped in markdown fences or prose.
//   score   : "score" | "professionalScore" | "quality_score",
//             number or numeric string, clamped to [0, 10]. Required.
//   issues  : "issues" | "remainingImprovements", array of objects or strings.
//             description : "description" | "issue" | "editInstruction"
//             instruction : "editInstruction" | "instruction" (else description)
//             region      : string, lower-cased, default "global"
//             surgical    : "surgical" | "imagenSuitable", bool or "true"/"yes";
//                           an issue with impact "low" is never surgical
//   "noFurtherEditsNeeded": true clears the issue list.
// ---------------------------------------------------------------------------
class CritiqueAdapter {
public:
    // False if no JSON object can be found, it does not parse, or it has no
    // usable score. 'why' (optional) receives a short reason.
    static bool Parse(const std::string& raw, msg::Critique& out, std::string* why = nullptr);

    // Remove a leading ```/```json fence and its closing fence, if present.
    static std::string StripFences(const std::string& text);
};

} // namespace venh
