#pragma once

#include "BackgroundEstimator.hpp"
#include "EdgeRecoveryEngine.hpp"
#include "EdgeScanner.hpp"
#include "Geometry.hpp"
#include "GradientFieldBuilder.hpp"
#include "RobustLineFitter.hpp"
#include "ThresholdEstimator.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <memory>
#include <vector>

namespace FolioGeom {

class ProcessingObserver;

struct SkewEstimate {
    double angleDeg = 0.0;     // Page inclination; rotate by this angle to straighten
    double deviation = 0.0;    // Weighted standard deviation over the sides used
    int sidesUsed = 0;
};

struct ContourResult {
    Status status = Status::GeometryRejected;
    ContourMethod method = ContourMethod::None;
    PageContour contour;                     // Four corners or none
    std::array<BorderLine, 4> lines;         // Indexed top, bottom, left, right
    BorderPoints points;
    SkewEstimate skew;
    bool recoveryUsed = false;
};

// Locates the page quadrilateral: fitted border lines first, largest
// four-sided polygon of the page mask as fallback, then the skew angle.
class ContourResolver {
public:
    struct Params {
        GradientFieldBuilder::Params gradient;
        BackgroundEstimator::Params background;
        EdgeScanner::Params scanner;
        EdgeRecoveryEngine::Params recovery;
        RobustLineFitter::Params fitter;
        ThresholdEstimator::Params threshold;

        bool useGradientMethod = true;
        double minCoverage = 0.60;       // Quad bounding box must span this much of each dimension
        double maxCornerOverflow = 0.10; // Corners may lie this far outside the image
        int dilateKernel = 5;            // Polygon fallback
        int dilateIterations = 2;
        double polygonEpsilon = 0.02;    // Fraction of the contour perimeter
        double insideWeight = 1.0;       // Side intensity closer to the page interior
        double outsideWeight = 0.2;
        double outlierSigma = 1.0;
    };

    ContourResolver(const Params& params, std::unique_ptr<RobustFitStrategy> strategy);
    ContourResolver(const Params& params, std::unique_ptr<RobustFitStrategy> strategy, ProcessingObserver* observer);

    // pageMask may be empty, in which case the fallback computes its own
    ContourResult resolve(const cv::Mat& image);
    ContourResult resolve(const cv::Mat& image, const cv::Mat& pageMask);

    static size_t sideIndex(BorderSide side) { return static_cast<size_t>(side); }

    static bool quadFromLines(const std::array<BorderLine, 4>& lines, const cv::Size& imageSize,
                              const Params& params, std::vector<cv::Point2f>& quad);
    static std::vector<cv::Point2f> polygonFallback(const cv::Mat& pageMask, const Params& params);
    static SkewEstimate estimateSkew(const cv::Mat& image, const std::vector<cv::Point2f>& quad, const Params& params);

    // Inclination of a segment relative to the nearest image axis, in (-45, 45] degrees
    static double sideInclination(const cv::Point2f& p1, const cv::Point2f& p2);

private:
    Params params_;
    RobustLineFitter fitter_;
    ProcessingObserver* observer_ = nullptr;
};

} // namespace FolioGeom
