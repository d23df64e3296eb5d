#include "ProcessingObserver.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>

using namespace cv;
using namespace std;

namespace FolioGeom {

namespace {

Mat toColor(const Mat& image) {
    Mat out;
    if (image.channels() == 1) {
        Mat eight;
        if (image.depth() != CV_8U) {
            normalize(image, eight, 0, 255, NORM_MINMAX, CV_8U);
        } else {
            eight = image;
        }
        cvtColor(eight, out, COLOR_GRAY2BGR);
    } else {
        out = image.clone();
    }
    return out;
}

Scalar sideColor(BorderSide side) {
    switch (side) {
        case BorderSide::Top: return Scalar(0, 0, 255);
        case BorderSide::Bottom: return Scalar(0, 255, 0);
        case BorderSide::Left: return Scalar(255, 0, 0);
        case BorderSide::Right: return Scalar(0, 255, 255);
    }
    return Scalar(255, 255, 255);
}

// Two far-apart points of the line inside a w x h frame
bool lineEndpoints(const BorderLine& line, const Size& size, Point& p1, Point& p2) {
    if (!line.valid) return false;
    if (fabs(line.b) > fabs(line.a)) {
        p1 = Point(0, cvRound(-line.c / line.b));
        p2 = Point(size.width - 1, cvRound(-(line.a * (size.width - 1) + line.c) / line.b));
    } else {
        if (fabs(line.a) < 1e-12) return false;
        p1 = Point(cvRound(-line.c / line.a), 0);
        p2 = Point(cvRound(-(line.b * (size.height - 1) + line.c) / line.a), size.height - 1);
    }
    return true;
}

} // namespace

DebugImageStack::DebugImageStack(const string& outputPath)
    : outputPath_(outputPath) {
    if (!outputPath_.empty() && outputPath_.back() != '/') {
        outputPath_ += '/';
    }
}

void DebugImageStack::push(const Mat& image, const string& name) {
    if (image.empty()) return;
    stack_.emplace_back(image.clone(), name);
}

void DebugImageStack::onImage(const string& stage, const Mat& image) {
    push(toColor(image), stage);
}

void DebugImageStack::onBorderPoints(const Mat& source, const BorderPoints& points) {
    Mat canvas = toColor(source);
    for (BorderSide side : {BorderSide::Top, BorderSide::Bottom, BorderSide::Left, BorderSide::Right}) {
        for (const auto& p : points.side(side)) {
            circle(canvas, p, 4, sideColor(side), FILLED);
        }
    }
    push(canvas, "border_points");
}

void DebugImageStack::onBorderLine(BorderSide side, const BorderLine& line) {
    lines_.emplace_back(side, line);
}

void DebugImageStack::onContour(const Mat& source, const PageContour& contour, ContourMethod method) {
    Mat canvas = toColor(source);
    for (const auto& [side, line] : lines_) {
        Point p1, p2;
        if (lineEndpoints(line, canvas.size(), p1, p2)) {
            cv::line(canvas, p1, p2, sideColor(side), 1);
        }
    }
    lines_.clear();

    if (contour.found()) {
        vector<Point> quad;
        for (const auto& c : contour.corners) quad.emplace_back(cvRound(c.x), cvRound(c.y));
        polylines(canvas, quad, true, Scalar(0, 255, 0), 3);
        for (size_t i = 0; i < quad.size(); i++) {
            circle(canvas, quad[i], 8, Scalar(0, 0, 255), FILLED);
            putText(canvas, to_string(i), quad[i] + Point(10, -10), FONT_HERSHEY_SIMPLEX, 0.8, Scalar(0, 0, 255), 2);
        }
        char label[64];
        snprintf(label, sizeof(label), "%s %.2f deg", contourMethodName(method), contour.angleDeg);
        putText(canvas, label, Point(20, 40), FONT_HERSHEY_SIMPLEX, 1.0, Scalar(0, 255, 0), 2);
    }
    push(canvas, string("contour_") + contourMethodName(method));
}

void DebugImageStack::onProfile(const string& stage, const vector<double>& profile) {
    if (profile.size() < 2) return;

    const int width = max(200, static_cast<int>(profile.size()));
    const int height = 200;
    Mat plot(height, width, CV_8UC3, Scalar(255, 255, 255));

    auto [lo, hi] = minmax_element(profile.begin(), profile.end());
    double range = max(*hi - *lo, 1e-9);
    vector<Point> curve;
    for (size_t i = 0; i < profile.size(); i++) {
        int x = static_cast<int>(i * (width - 1) / (profile.size() - 1));
        int y = height - 1 - static_cast<int>((profile[i] - *lo) / range * (height - 1));
        curve.emplace_back(x, y);
    }
    polylines(plot, curve, false, Scalar(0, 0, 0), 1);
    push(plot, stage);
}

void DebugImageStack::onFold(const Mat& image, const FoldEstimate& fold) {
    Mat canvas = toColor(image);
    line(canvas, Point(fold.x, 0), Point(fold.x, canvas.rows - 1), Scalar(0, 0, 255), 2);
    char label[64];
    snprintf(label, sizeof(label), "fold %d conf %.2f", fold.x, fold.confidence);
    putText(canvas, label, Point(20, 40), FONT_HERSHEY_SIMPLEX, 1.0, Scalar(0, 0, 255), 2);
    push(canvas, "fold");
}

void DebugImageStack::flush() {
    if (stack_.empty()) return;

    cout << "[DEBUG] Flushing " << stack_.size() << " debug images..." << endl;

    error_code ec;
    filesystem::create_directories(outputPath_, ec);
    if (ec) {
        cerr << "[ERROR] Could not create debug directory " << outputPath_ << ": " << ec.message() << endl;
        stack_.clear();
        return;
    }

    for (size_t i = 0; i < stack_.size(); i++) {
        const auto& [image, name] = stack_[i];

        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string filename = string(indexStr) + "_" + name + ".jpg";
        string fullPath = outputPath_ + filename;

        if (imwrite(fullPath, image)) {
            cout << "[DEBUG] Saved: " << filename << endl;
        } else {
            cout << "[WARN] Failed to save: " << filename << endl;
        }
    }

    stack_.clear();
    cout << "[DEBUG] Debug stack flushed and cleared" << endl;
}

void DebugImageStack::clear() {
    stack_.clear();
    lines_.clear();
}

} // namespace FolioGeom
