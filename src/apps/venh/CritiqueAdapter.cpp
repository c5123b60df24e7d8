#include "apps/venh/CritiqueAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim_copy(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool set_why(std::string* why, const char* reason) {
    if (why) *why = reason;
    return false;
}

// Number, or a string that starts with one ("8.5", "8.5/10").
bool parse_number(const json& v, double& out) {
    if (v.is_number()) {
        out = v.get<double>();
        return std::isfinite(out);
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        char* end = nullptr;
        out = std::strtod(s.c_str(), &end);
        return end != s.c_str() && std::isfinite(out);
    }
    return false;
}

bool parse_flag(const json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        const std::string s = lower_copy(trim_copy(v.get<std::string>()));
        return s == "true" || s == "yes" || s == "1";
    }
    if (v.is_number_integer()) return v.get<int>() != 0;
    return false;
}

// First key present with a non-null value, or nullptr.
const json* find_any(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = obj.find(k);
        if (it != obj.end() && !it->is_null()) return &(*it);
    }
    return nullptr;
}

std::string string_field(const json& obj, std::initializer_list<const char*> keys) {
    const json* v = find_any(obj, keys);
    if (!v || !v->is_string()) return {};
    return trim_copy(v->get<std::string>());
}

bool parse_issue(const json& item, msg::Issue& out) {
    out = msg::Issue{};

    if (item.is_string()) {
        out.description = trim_copy(item.get<std::string>());
        out.instruction = out.description;
        return !out.description.empty();
    }
    if (!item.is_object()) return false;

    out.description = string_field(item, {"description", "issue", "editInstruction"});
    if (out.description.empty()) return false;

    out.instruction = string_field(item, {"editInstruction", "instruction"});
    if (out.instruction.empty()) out.instruction = out.description;

    const std::string region = lower_copy(string_field(item, {"region"}));
    out.region = region.empty() ? "global" : region;

    const json* s = find_any(item, {"surgical", "imagenSuitable"});
    out.surgical = s ? parse_flag(*s) : false;

    if (out.surgical && lower_copy(string_field(item, {"impact"})) == "low") {
        out.surgical = false;
    }
    return true;
}

} // anonymous namespace

namespace venh {

std::string CritiqueAdapter::StripFences(const std::string& text) {
    const std::string t = trim_copy(text);
    if (t.compare(0, 3, "```") != 0) return t;

    const std::size_t first_nl = t.find('\n');
    if (first_nl == std::string::npos) return t;

    std::size_t close = t.rfind("```");
    if (close == std::string::npos || close <= first_nl) close = t.size();
    return trim_copy(t.substr(first_nl + 1, close - first_nl - 1));
}

bool CritiqueAdapter::Parse(const std::string& raw, msg::Critique& out, std::string* why) {
    out = msg::Critique{};

    const std::string text = StripFences(raw);
    const std::size_t open  = text.find('{');
    const std::size_t close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return set_why(why, "no JSON object in payload");
    }

    const json doc = json::parse(text.substr(open, close - open + 1), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return set_why(why, "payload is not a JSON object");
    }

    try {
        const json* score = find_any(doc, {"score", "professionalScore", "quality_score"});
        double s = 0.0;
        if (!score || !parse_number(*score, s)) {
            return set_why(why, "missing or non-numeric score");
        }
        out.score = static_cast<float>(std::min(10.0, std::max(0.0, s)));

        const json* issues = find_any(doc, {"issues", "remainingImprovements"});
        if (issues && issues->is_array()) {
            for (const auto& item : *issues) {
                msg::Issue issue{};
                if (parse_issue(item, issue)) out.issues.push_back(issue);
            }
        }

        const json* done = find_any(doc, {"noFurtherEditsNeeded"});
        if (done && parse_flag(*done)) out.issues.clear();
    } catch (const json::exception& e) {
        std::cerr << "[CritiqueAdapter] " << e.what() << "\n";
        out = msg::Critique{};
        return set_why(why, "unexpected value type in payload");
    }

    return true;
}

} // namespace venh
