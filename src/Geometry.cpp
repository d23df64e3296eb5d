#include "Geometry.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace FolioGeom {

const char* statusName(Status status) {
    switch (status) {
        case Status::Ok: return "ok";
        case Status::InsufficientData: return "insufficient data";
        case Status::GeometryRejected: return "geometry rejected";
        case Status::DegenerateTransform: return "degenerate transform";
        case Status::LowConfidence: return "low confidence";
    }
    return "unknown";
}

const char* borderSideName(BorderSide side) {
    switch (side) {
        case BorderSide::Top: return "top";
        case BorderSide::Bottom: return "bottom";
        case BorderSide::Left: return "left";
        case BorderSide::Right: return "right";
    }
    return "unknown";
}

vector<Point2f>& BorderPoints::side(BorderSide s) {
    switch (s) {
        case BorderSide::Top: return top;
        case BorderSide::Bottom: return bottom;
        case BorderSide::Left: return left;
        case BorderSide::Right: break;
    }
    return right;
}

const vector<Point2f>& BorderPoints::side(BorderSide s) const {
    switch (s) {
        case BorderSide::Top: return top;
        case BorderSide::Bottom: return bottom;
        case BorderSide::Left: return left;
        case BorderSide::Right: break;
    }
    return right;
}

double BorderLine::distance(const Point2f& p) const {
    double norm = sqrt(a * a + b * b);
    if (norm < 1e-12) {
        return numeric_limits<double>::infinity();
    }
    return fabs(a * p.x + b * p.y + c) / norm;
}

size_t BorderLine::inlierCount() const {
    return static_cast<size_t>(count(inliers.begin(), inliers.end(), true));
}

bool intersectLines(const BorderLine& l1, const BorderLine& l2, Point2f& out) {
    if (!l1.valid || !l2.valid) {
        return false;
    }
    double det = l1.a * l2.b - l2.a * l1.b;
    if (fabs(det) < 1e-10) {
        return false;
    }
    out.x = static_cast<float>((l1.b * l2.c - l2.b * l1.c) / det);
    out.y = static_cast<float>((l1.c * l2.a - l2.c * l1.a) / det);
    return true;
}

const char* contourMethodName(ContourMethod method) {
    switch (method) {
        case ContourMethod::None: return "none";
        case ContourMethod::Gradient: return "gradient";
        case ContourMethod::Polygon: return "polygon";
    }
    return "unknown";
}

Rect PageContour::boundingBox() const {
    if (!found()) {
        return Rect();
    }
    return boundingRect(corners);
}

double PageContour::area() const {
    if (!found()) {
        return 0.0;
    }
    return contourArea(corners);
}

vector<Point2f> orderCorners(const vector<Point2f>& corners) {
    if (corners.size() != 4) {
        return corners;
    }

    // Top-left has the smallest sum, bottom-right the largest;
    // top-right has the smallest y - x, bottom-left the largest
    vector<Point2f> ordered(4);
    auto bySum = [](const Point2f& p, const Point2f& q) { return p.x + p.y < q.x + q.y; };
    auto byDiff = [](const Point2f& p, const Point2f& q) { return p.y - p.x < q.y - q.x; };

    ordered[0] = *min_element(corners.begin(), corners.end(), bySum);
    ordered[2] = *max_element(corners.begin(), corners.end(), bySum);
    ordered[1] = *min_element(corners.begin(), corners.end(), byDiff);
    ordered[3] = *max_element(corners.begin(), corners.end(), byDiff);
    return ordered;
}

Rect clampRect(const Rect& box, const Size& imageSize) {
    return box & Rect(0, 0, imageSize.width, imageSize.height);
}

Rect expandRect(const Rect& box, int margin, const Size& imageSize) {
    Rect grown(box.x - margin, box.y - margin, box.width + 2 * margin, box.height + 2 * margin);
    return clampRect(grown, imageSize);
}

const char* foldSideName(FoldSide side) {
    switch (side) {
        case FoldSide::Left: return "left";
        case FoldSide::Right: return "right";
        case FoldSide::Center: return "center";
    }
    return "center";
}

FoldSide parseFoldSide(const string& name) {
    string lower = name;
    transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) { return static_cast<char>(tolower(ch)); });
    if (lower == "left") return FoldSide::Left;
    if (lower == "right") return FoldSide::Right;
    if (lower == "center" || lower == "centre") return FoldSide::Center;
    throw invalid_argument("Unknown fold side: " + name);
}

const char* foldMethodName(FoldMethod method) {
    switch (method) {
        case FoldMethod::SingleMinimum: return "single minimum";
        case FoldMethod::NearestToCenter: return "nearest to center";
        case FoldMethod::IterationMean: return "iteration mean";
        case FoldMethod::Unavailable: return "unavailable";
    }
    return "unknown";
}

const char* pageFormatName(PageFormat format) {
    switch (format) {
        case PageFormat::A3: return "A3";
        case PageFormat::A4: return "A4";
        case PageFormat::A5: return "A5";
        case PageFormat::Letter: return "Letter";
        case PageFormat::Legal: return "Legal";
        case PageFormat::Tabloid: return "Tabloid";
        case PageFormat::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* orientationName(Orientation orientation) {
    switch (orientation) {
        case Orientation::Portrait: return "portrait";
        case Orientation::Landscape: return "landscape";
        case Orientation::Square: return "square";
    }
    return "portrait";
}

} // namespace FolioGeom
