#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace FolioGeom {

// Outcome of a geometry stage. Only DegenerateTransform is informational: it
// marks the near-zero rotation fast path.
enum class Status {
    Ok,
    InsufficientData,
    GeometryRejected,
    DegenerateTransform,
    LowConfidence
};

const char* statusName(Status status);

enum class BorderSide { Top, Bottom, Left, Right };

const char* borderSideName(BorderSide side);

// Candidate border points collected per side, in image coordinates
struct BorderPoints {
    std::vector<cv::Point2f> top;
    std::vector<cv::Point2f> bottom;
    std::vector<cv::Point2f> left;
    std::vector<cv::Point2f> right;

    std::vector<cv::Point2f>& side(BorderSide s);
    const std::vector<cv::Point2f>& side(BorderSide s) const;
    size_t total() const { return top.size() + bottom.size() + left.size() + right.size(); }
};

// Line a*x + b*y + c = 0 together with the inlier mask over its source points
struct BorderLine {
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
    std::vector<bool> inliers;
    bool valid = false;

    double distance(const cv::Point2f& p) const;
    size_t inlierCount() const;
};

// Intersects two lines; false when they are (nearly) parallel
bool intersectLines(const BorderLine& l1, const BorderLine& l2, cv::Point2f& out);

enum class ContourMethod { None, Gradient, Polygon };

const char* contourMethodName(ContourMethod method);

// Page quadrilateral ordered TL, TR, BR, BL. Either four corners or none.
struct PageContour {
    std::vector<cv::Point2f> corners;
    double angleDeg = 0.0;

    bool found() const { return corners.size() == 4; }
    void clear() { corners.clear(); angleDeg = 0.0; }
    cv::Rect boundingBox() const;
    double area() const;
};

// Orders four points as TL, TR, BR, BL using coordinate sum/difference
std::vector<cv::Point2f> orderCorners(const std::vector<cv::Point2f>& corners);

// Clamps a rectangle into an image of the given size; the result may be empty
cv::Rect clampRect(const cv::Rect& box, const cv::Size& imageSize);

// Grows a rectangle by margin on every side and clamps it to the image
cv::Rect expandRect(const cv::Rect& box, int margin, const cv::Size& imageSize);

enum class FoldSide { Left, Right, Center };

const char* foldSideName(FoldSide side);
FoldSide parseFoldSide(const std::string& name);

enum class FoldMethod { SingleMinimum, NearestToCenter, IterationMean, Unavailable };

const char* foldMethodName(FoldMethod method);

struct FoldEstimate {
    int x = 0;                   // Fold column in image coordinates
    double xSubPixel = 0.0;
    double confidence = 0.0;     // In [0, 1]
    double angleDeg = 0.0;       // Fold inclination from vertical
    int minimaCount = 0;
    double iterationSpread = 0.0;
    FoldMethod method = FoldMethod::Unavailable;
    Status status = Status::InsufficientData;
};

enum class PageFormat { A3, A4, A5, Letter, Legal, Tabloid, Unknown };
enum class Orientation { Portrait, Landscape, Square };

const char* pageFormatName(PageFormat format);
const char* orientationName(Orientation orientation);

struct DocumentFormat {
    PageFormat format = PageFormat::Unknown;
    Orientation orientation = Orientation::Portrait;
    double confidence = 0.0;
    bool byPhysicalSize = false;
    double widthCm = 0.0;        // 0 when no DPI was available
    double heightCm = 0.0;
};

} // namespace FolioGeom
