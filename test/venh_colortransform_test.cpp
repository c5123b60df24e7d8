// test/venh_colortransform_test.cpp
//
// ColorTransformBuilder -> ColorTransform -> ApplyTransform / PropagateGroup,
// plus the .cube export.

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/venh/ColorTransform.hpp"
#include "apps/venh/ColorTransformBuilder.hpp"
#include "apps/venh/TransformPropagator.hpp"

static int g_failures = 0;

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static bool sameImage(const cv::Mat& a, const cv::Mat& b) {
    if (a.size() != b.size() || a.type() != b.type()) return false;
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    const cv::Scalar s = cv::sum(diff);
    return s[0] == 0 && s[1] == 0 && s[2] == 0;
}

static cv::Mat noise(int w, int h, int seed) {
    cv::RNG rng(seed);
    cv::Mat img(h, w, CV_8UC3);
    rng.fill(img, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
    return img;
}

int main() {
    using namespace venh;

    std::cout << "=== venh_colortransform_test ===\n";

    {
        std::cout << "\n[Test 0] Default transform is the identity\n";
        ColorTransform t;
        printResult("isIdentity()", t.isIdentity() && t.levels() == 32);

        bool exact = true;
        for (int v = 0; v < 256; v += 5) {
            const cv::Vec3b p(uchar(v), uchar(255 - v), uchar(v / 2));
            exact = exact && t.map(p) == p;
        }
        printResult("map() leaves pixels unchanged", exact);
    }

    {
        std::cout << "\n[Test 1] build(x, x) is the identity and applies as a no-op\n";
        const cv::Mat img = noise(120, 90, 1);
        ColorTransformBuilder builder;
        ColorTransform t;
        const bool ok = builder.build(img, img, t);
        printResult("build()", ok && builder.lastStatus() == ColorTransformBuilder::Status::OK);
        printResult("isIdentity()", t.isIdentity());
        printResult("observed buckets > 0", builder.observedBuckets() > 0);

        cv::Mat out;
        printResult("ApplyTransform()", ApplyTransform(t, img, out));
        printResult("output == input", sameImage(out, img));
    }

    {
        std::cout << "\n[Test 2] Known brightness shift is reproduced\n";
        const cv::Mat before = noise(200, 200, 2);
        cv::Mat after;
        before.convertTo(after, CV_8UC3, 1.0, 20.0);

        ColorTransformBuilderConfig cfg{};
        cfg.LEVELS = 8;
        ColorTransformBuilder builder(cfg);
        ColorTransform t;
        printResult("build()", builder.build(before, after, t));
        printResult("8 levels", t.levels() == 8);

        const cv::Vec3b mid = t.map(cv::Vec3b(100, 100, 100));
        printResult("mid grey +20", mid == cv::Vec3b(120, 120, 120));

        const cv::Vec3b other = t.map(cv::Vec3b(70, 140, 110));
        printResult("mixed colour +20", other == cv::Vec3b(90, 160, 130));

        const cv::Vec3b top = t.map(cv::Vec3b(255, 255, 255));
        printResult("saturates at white", top == cv::Vec3b(255, 255, 255));
    }

    {
        std::cout << "\n[Test 2b] Sparse palette: observed colours exact, others untouched\n";
        cv::Mat before(40, 40, CV_8UC3, cv::Scalar(100, 100, 100));
        before(cv::Rect(0, 0, 20, 40)).setTo(cv::Scalar(30, 180, 220));
        cv::Mat after;
        before.convertTo(after, CV_8UC3, 1.0, 20.0);

        ColorTransformBuilder builder;
        ColorTransform t;
        builder.build(before, after, t);
        printResult("two buckets observed", builder.observedBuckets() == 2);
        printResult("observed()", t.observed(100 * 32 / 256, 100 * 32 / 256, 100 * 32 / 256));
        printResult("grey +20", t.map(cv::Vec3b(100, 100, 100)) == cv::Vec3b(120, 120, 120));
        printResult("same bucket +20", t.map(cv::Vec3b(101, 98, 99)) == cv::Vec3b(121, 118, 119));
        printResult("second colour +20", t.map(cv::Vec3b(30, 180, 220)) == cv::Vec3b(50, 200, 240));
        printResult("unobserved untouched", t.map(cv::Vec3b(40, 200, 90)) == cv::Vec3b(40, 200, 90));
    }

    {
        std::cout << "\n[Test 3] Same colour in two frames maps to the same output\n";
        const cv::Mat before = noise(160, 120, 3);
        cv::Mat after;
        before.convertTo(after, CV_8UC3, 0.8, 30.0);

        ColorTransformBuilder builder;
        ColorTransform t;
        builder.build(before, after, t);

        cv::Mat a = noise(64, 48, 4);
        cv::Mat b = noise(64, 48, 5);
        const cv::Rect shared(10, 10, 20, 20);
        a(shared).setTo(cv::Scalar(40, 90, 200));
        b(shared).setTo(cv::Scalar(40, 90, 200));

        cv::Mat ta, tb;
        ApplyTransform(t, a, ta);
        ApplyTransform(t, b, tb);
        printResult("shared region identical", sameImage(ta(shared), tb(shared)));
        printResult("input untouched", a.at<cv::Vec3b>(15, 15) == cv::Vec3b(40, 90, 200));
    }

    {
        std::cout << "\n[Test 4] Bad inputs reset to the identity\n";
        ColorTransformBuilder builder;
        ColorTransform t;
        builder.build(noise(32, 32, 6), noise(32, 32, 7), t);
        printResult("non-identity after noise pair", !t.isIdentity());

        const bool ok = builder.build(noise(32, 32, 6), noise(40, 32, 7), t);
        printResult("size mismatch rejected", !ok);
        printResult("GEOMETRY_MISMATCH",
                    builder.lastStatus() == ColorTransformBuilder::Status::GEOMETRY_MISMATCH);
        printResult("identity after failure", t.isIdentity());

        printResult("empty rejected", !builder.build(cv::Mat(), noise(8, 8, 1), t) &&
                    builder.lastStatus() == ColorTransformBuilder::Status::EMPTY_INPUT);

        cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(3));
        printResult("grey rejected", !builder.build(gray, gray, t) &&
                    builder.lastStatus() == ColorTransformBuilder::Status::BAD_FORMAT);

        cv::Mat out;
        printResult("ApplyTransform() rejects grey", !ApplyTransform(t, gray, out));
    }

    {
        std::cout << "\n[Test 5] Excluded pixels do not reach the transform\n";
        const cv::Mat before = noise(100, 80, 8);
        cv::Mat after = before.clone();
        const cv::Rect patched(0, 0, 50, 80);
        after(patched).setTo(cv::Scalar(255, 0, 255));

        cv::Mat exclude(before.size(), CV_8UC1, cv::Scalar(0));
        exclude(patched).setTo(255);

        ColorTransformBuilder builder;
        ColorTransform t;
        printResult("build() with exclude", builder.build(before, after, t, exclude));
        printResult("patch ignored", t.isIdentity());

        ColorTransform t2;
        builder.build(before, after, t2);
        printResult("patch seen without exclude", !t2.isIdentity());

        cv::Mat bad(10, 10, CV_8UC1, cv::Scalar(0));
        printResult("wrong-size exclude rejected", !builder.build(before, after, t, bad));
    }

    {
        std::cout << "\n[Test 6] PropagateGroup\n";
        std::vector<msg::Frame> frames;
        for (uint32_t i = 0; i < 6; ++i) {
            msg::Frame f{};
            f.index = i;
            f.pixels = noise(32, 24, 20 + int(i));
            frames.push_back(f);
        }

        msg::FrameGroup g{};
        g.start = 1; g.end = 5; g.representative = 3;

        cv::Mat rep_edited;
        frames[3].pixels.convertTo(rep_edited, CV_8UC3, 1.0, 10.0);

        ColorTransformBuilder builder;
        ColorTransform t;
        builder.build(frames[3].pixels, rep_edited, t);

        std::vector<cv::Mat> out(frames.size());
        printResult("PropagateGroup()", PropagateGroup(t, frames, g, rep_edited, out));
        printResult("slots outside untouched", out[0].empty() && out[5].empty());
        printResult("representative is the edit", sameImage(out[3], rep_edited));

        bool filled = true;
        for (uint32_t i = g.start; i < g.end; ++i) {
            filled = filled && out[i].size() == frames[i].pixels.size();
        }
        printResult("group slots filled", filled);

        cv::Mat expect;
        ApplyTransform(t, frames[2].pixels, expect);
        printResult("member == ApplyTransform", sameImage(out[2], expect));

        msg::FrameGroup bad{};
        bad.start = 4; bad.end = 9; bad.representative = 5;
        printResult("out-of-range group rejected", !PropagateGroup(t, frames, bad, rep_edited, out));

        std::vector<cv::Mat> out2(frames.size());
        PropagateGroup(t, frames, g, cv::Mat(), out2);
        printResult("no edit -> source at representative", sameImage(out2[3], frames[3].pixels));
    }

    {
        std::cout << "\n[Test 7] .cube export\n";
        ColorTransform t(4);
        const std::string cube = t.toCube("identity");

        std::istringstream is(cube);
        std::string line;
        std::vector<std::string> lines;
        while (std::getline(is, line)) lines.push_back(line);

        printResult("line count", lines.size() == 4 + 4 * 4 * 4);
        printResult("title", !lines.empty() && lines[0] == "TITLE \"identity\"");
        printResult("size", lines.size() > 1 && lines[1] == "LUT_3D_SIZE 4");
        printResult("first node black", lines.size() > 4 && lines[4] == "0.000000 0.000000 0.000000");
        printResult("last node white", !lines.empty() && lines.back() == "1.000000 1.000000 1.000000");
        // Red varies fastest.
        printResult("second node is red",
                    lines.size() > 5 && lines[5] == "0.333333 0.000000 0.000000");

        const char* tmp = std::getenv("TMPDIR");
        const std::string path = std::string((tmp && *tmp) ? tmp : "/tmp") + "/venh_ct_test.cube";
        printResult("writeCube()", t.writeCube(path, "identity"));
        std::remove(path.c_str());
        printResult("writeCube() bad path", !t.writeCube("/nonexistent_dir/x.cube", "x"));
    }

    if (g_failures) {
        std::cout << "\nvenh_colortransform_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nvenh_colortransform_test: PASS\n";
    return 0;
}
