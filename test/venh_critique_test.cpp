// test/venh_critique_test.cpp
//
// CritiqueAdapter payload coercion and RegionMask geometry.

#include <cmath>
#include <iostream>
#include <string>

#include <opencv2/core.hpp>

#include "apps/venh/CritiqueAdapter.hpp"
#include "apps/venh/RegionMask.hpp"

static int g_failures = 0;

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static double coverage(const cv::Mat& mask) {
    return double(cv::countNonZero(mask)) / double(mask.total());
}

int main() {
    using namespace venh;

    std::cout << "=== venh_critique_test ===\n";

    {
        std::cout << "\n[Test 0] Canonical payload\n";
        msg::Critique c{};
        const std::string raw =
            R"({"score": 6.5, "issues": [)"
            R"({"description": "sky is washed out", "region": "Top-Center", "surgical": true},)"
            R"({"description": "overall too dark", "instruction": "lift shadows"}]})";
        printResult("Parse()", CritiqueAdapter::Parse(raw, c));
        printResult("score", c.score == 6.5f);
        printResult("two issues", c.issues.size() == 2);
        if (c.issues.size() == 2) {
            printResult("region lower-cased", c.issues[0].region == "top-center");
            printResult("surgical flag", c.issues[0].surgical && !c.issues[1].surgical);
            printResult("instruction falls back", c.issues[0].instruction == "sky is washed out");
            printResult("explicit instruction", c.issues[1].instruction == "lift shadows");
            printResult("default region", c.issues[1].region == "global");
        }
        printResult("anySurgical()", c.anySurgical());
    }

    {
        std::cout << "\n[Test 1] Fenced payload with provider keys\n";
        msg::Critique c{};
        const std::string raw =
            "Here is my review:\n"
            "```json\n"
            "{\"professionalScore\": \"7.8/10\",\n"
            " \"remainingImprovements\": [\n"
            "   {\"issue\": \"noise in shadows\", \"editInstruction\": \"denoise the shadows\",\n"
            "    \"region\": \"background\", \"imagenSuitable\": \"yes\", \"impact\": \"high\"},\n"
            "   {\"issue\": \"slight halo\", \"region\": \"center\", \"imagenSuitable\": true, \"impact\": \"low\"},\n"
            "   \"colour cast is a bit green\"\n"
            " ]}\n"
            "```\n";
        printResult("Parse()", CritiqueAdapter::Parse(raw, c));
        printResult("string score", std::abs(c.score - 7.8f) < 1e-5f);
        printResult("three issues", c.issues.size() == 3);
        if (c.issues.size() == 3) {
            // editInstruction wins over issue only for the instruction
            printResult("description from 'issue'", c.issues[0].description == "noise in shadows");
            printResult("instruction from 'editInstruction'", c.issues[0].instruction == "denoise the shadows");
            printResult("imagenSuitable yes", c.issues[0].surgical);
            printResult("low impact is global", !c.issues[1].surgical);
            printResult("string issue", c.issues[2].description == "colour cast is a bit green" &&
                                        c.issues[2].region == "global" && !c.issues[2].surgical);
        }
    }

    {
        std::cout << "\n[Test 2] Score clamping and alternate key\n";
        msg::Critique c{};
        printResult("high clamp", CritiqueAdapter::Parse(R"({"score": 14})", c) && c.score == 10.0f);
        printResult("low clamp", CritiqueAdapter::Parse(R"({"score": -3})", c) && c.score == 0.0f);
        printResult("quality_score", CritiqueAdapter::Parse(R"({"quality_score": 9})", c) && c.score == 9.0f);
        printResult("no issues key", c.issues.empty());
    }

    {
        std::cout << "\n[Test 3] noFurtherEditsNeeded clears issues\n";
        msg::Critique c{};
        const std::string raw =
            R"({"score": 8, "noFurtherEditsNeeded": true, "issues": ["tiny thing"]})";
        printResult("Parse()", CritiqueAdapter::Parse(raw, c));
        printResult("issues cleared", c.issues.empty());
    }

    {
        std::cout << "\n[Test 4] Malformed payloads\n";
        msg::Critique c{};
        std::string why;
        printResult("not JSON", !CritiqueAdapter::Parse("looks great to me!", c, &why) && !why.empty());
        printResult("broken JSON", !CritiqueAdapter::Parse("{\"score\": 5,,}", c, &why));
        printResult("missing score", !CritiqueAdapter::Parse(R"({"issues": []})", c, &why));
        printResult("non-numeric score", !CritiqueAdapter::Parse(R"({"score": "great"})", c, &why));
        printResult("array payload", !CritiqueAdapter::Parse("[1, 2, 3]", c, &why));
        printResult("critique reset", c.score == 0.0f && c.issues.empty());

        printResult("junk issues skipped",
                    CritiqueAdapter::Parse(R"({"score": 5, "issues": [42, {}, {"description": ""}]})", c) &&
                    c.issues.empty());
    }

    {
        std::cout << "\n[Test 5] StripFences\n";
        printResult("plain", CritiqueAdapter::StripFences("  {\"a\":1} ") == "{\"a\":1}");
        printResult("fenced", CritiqueAdapter::StripFences("```json\n{\"a\":1}\n```") == "{\"a\":1}");
        printResult("unterminated", CritiqueAdapter::StripFences("```\n{\"a\":1}") == "{\"a\":1}");
    }

    {
        std::cout << "\n[Test 6] Region masks\n";
        const int w = 300, h = 180;
        cv::Mat m;

        printResult("global", BuildRegionMask(w, h, "global", m) && coverage(m) == 1.0);

        printResult("foreground", BuildRegionMask(w, h, "foreground", m) &&
                                  std::abs(coverage(m) - 0.36) < 0.01);
        printResult("foreground centre set", m.at<uchar>(h / 2, w / 2) == 255 && m.at<uchar>(0, 0) == 0);

        printResult("background", BuildRegionMask(w, h, "background", m) &&
                                  std::abs(coverage(m) - 0.64) < 0.01);
        printResult("background centre clear", m.at<uchar>(h / 2, w / 2) == 0 && m.at<uchar>(0, 0) == 255);

        // top-left: x in [0, 100 + 15), y in [0, 60 + 9)
        printResult("top-left", BuildRegionMask(w, h, "top-left", m) &&
                                cv::countNonZero(m) == 115 * 69);
        printResult("top-left corner", m.at<uchar>(0, 0) == 255 && m.at<uchar>(h - 1, w - 1) == 0);

        // center: x in [85, 215), y in [51, 129)
        printResult("center", BuildRegionMask(w, h, "center", m) &&
                              cv::countNonZero(m) == 130 * 78);
        printResult("vertical margin from height", m.at<uchar>(51, w / 2) == 255 &&
                                                   m.at<uchar>(50, w / 2) == 0 &&
                                                   m.at<uchar>(128, w / 2) == 255 &&
                                                   m.at<uchar>(129, w / 2) == 0);

        printResult("aliases", BuildRegionMask(w, h, "Bottom_Right", m) &&
                               m.at<uchar>(h - 1, w - 1) == 255);
        printResult("IsKnownRegion", IsKnownRegion("center left") && IsKnownRegion("GLOBAL") &&
                                     !IsKnownRegion("sky"));
        printResult("unknown rejected", !BuildRegionMask(w, h, "sky", m) && m.empty());
        printResult("bad size rejected", !BuildRegionMask(0, h, "global", m));

        const char* grid[] = {"top-left", "top-center", "top-right",
                              "center-left", "center", "center-right",
                              "bottom-left", "bottom-center", "bottom-right"};
        cv::Mat all(h, w, CV_8UC1, cv::Scalar(0));
        bool built = true;
        for (const char* r : grid) {
            built = built && BuildRegionMask(w, h, r, m);
            if (built) all |= m;
        }
        printResult("grid covers frame", built && coverage(all) == 1.0);
    }

    {
        std::cout << "\n[Test 7] CompositeThroughMask\n";
        cv::Mat base(60, 80, CV_8UC3, cv::Scalar(10, 20, 30));
        const cv::Mat shared = base;
        cv::Mat edited(60, 80, CV_8UC3, cv::Scalar(200, 100, 50));
        cv::Mat mask;
        BuildRegionMask(80, 60, "top-right", mask);

        printResult("composite", CompositeThroughMask(edited, mask, base));
        printResult("inside edited", base.at<cv::Vec3b>(0, 79) == cv::Vec3b(200, 100, 50));
        printResult("outside kept", base.at<cv::Vec3b>(59, 0) == cv::Vec3b(10, 20, 30));
        printResult("shared buffer untouched", shared.at<cv::Vec3b>(0, 79) == cv::Vec3b(10, 20, 30));

        cv::Mat small(10, 10, CV_8UC3, cv::Scalar(0));
        printResult("size mismatch rejected", !CompositeThroughMask(small, mask, base));
    }

    if (g_failures) {
        std::cout << "\nvenh_critique_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nvenh_critique_test: PASS\n";
    return 0;
}
