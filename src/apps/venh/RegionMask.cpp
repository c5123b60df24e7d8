#include "apps/venh/RegionMask.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace {

std::string normalise(const std::string& in) {
    std::string s;
    s.reserve(in.size());
    for (char c : in) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (c == '_' || c == ' ') s.push_back('-');
        else s.push_back(static_cast<char>(std::tolower(u)));
    }
    return s;
}

// Cell of the 3x3 grid addressed by (col, row), grown by 'margin' on every
// edge that is not an image border.
cv::Rect gridCell(int width, int height, int col, int row) {
    const int tw = width / 3;
    const int th = height / 3;
    const int mx = width / 20;
    const int my = height / 20;

    const int x1 = (col == 0) ? 0 : col * tw - mx;
    const int y1 = (row == 0) ? 0 : row * th - my;
    const int x2 = (col == 2) ? width  : (col + 1) * tw + mx;
    const int y2 = (row == 2) ? height : (row + 1) * th + my;

    const int cx1 = std::max(0, x1), cy1 = std::max(0, y1);
    const int cx2 = std::min(width, x2), cy2 = std::min(height, y2);
    return cv::Rect(cx1, cy1, std::max(0, cx2 - cx1), std::max(0, cy2 - cy1));
}

bool gridIndex(const std::string& r, int& col, int& row) {
    static const char* names[3][3] = {
        {"top-left",    "top-center",    "top-right"},
        {"center-left", "center",        "center-right"},
        {"bottom-left", "bottom-center", "bottom-right"},
    };
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            if (r == names[y][x]) { col = x; row = y; return true; }
        }
    }
    return false;
}

} // anonymous namespace

namespace venh {

bool IsKnownRegion(const std::string& region) {
    const std::string r = normalise(region);
    int c = 0, w = 0;
    return gridIndex(r, c, w) || r == "foreground" || r == "background" || r == "global";
}

bool BuildRegionMask(int width, int height, const std::string& region, cv::Mat& mask) {
    mask.release();
    if (width <= 0 || height <= 0) return false;

    const std::string r = normalise(region);
    cv::Mat m(height, width, CV_8UC1, cv::Scalar(0));

    int col = 0, row = 0;
    if (gridIndex(r, col, row)) {
        m(gridCell(width, height, col, row)).setTo(255);
    } else if (r == "foreground") {
        const int x1 = width / 5,      y1 = height / 5;
        const int x2 = 4 * width / 5,  y2 = 4 * height / 5;
        m(cv::Rect(x1, y1, x2 - x1, y2 - y1)).setTo(255);
    } else if (r == "background") {
        const int ew = width / 5, eh = height / 5;
        m.setTo(255);
        m(cv::Rect(ew, eh, width - 2 * ew, height - 2 * eh)).setTo(0);
    } else if (r == "global") {
        m.setTo(255);
    } else {
        std::cerr << "[RegionMask] unknown region '" << region << "'\n";
        return false;
    }

    mask = m;
    return true;
}

bool CompositeThroughMask(const cv::Mat& edited, const cv::Mat& mask, cv::Mat& base) {
    if (edited.empty() || mask.empty() || base.empty()) return false;
    if (edited.size() != base.size() || mask.size() != base.size()) return false;
    if (edited.type() != base.type() || mask.type() != CV_8UC1) return false;

    // base may share its buffer with a frame the caller still reads.
    cv::Mat out = base.clone();
    edited.copyTo(out, mask);
    base = out;
    return true;
}

} // namespace venh
