#pragma once

#include "ContourResolver.hpp"
#include "DocumentSplitter.hpp"
#include "FoldLocator.hpp"
#include "FormatClassifier.hpp"
#include "Geometry.hpp"
#include "ImageIO.hpp"
#include "PerspectiveCorrector.hpp"
#include "QualityEvaluator.hpp"
#include "RobustLineFitter.hpp"
#include <opencv2/core.hpp>
#include <cstdint>

namespace FolioGeom {

class ProcessingObserver;

struct PageResult {
    Status status = Status::InsufficientData;
    bool corrected = false;          // False means image is the untouched input
    cv::Mat image;
    cv::Mat transform;               // 2x3 CV_64F, original -> image
    PageContour contour;             // Original coordinates
    ContourMethod method = ContourMethod::None;
    CorrectionResult correction;
    double coverage = 0.0;           // Contour area over image area
    int borderUsed = 0;              // 0 = rotation only
    DocumentFormat format;

    bool foldEvaluated = false;
    FoldSide foldSide = FoldSide::Center;
    FoldEstimate fold;               // Coordinates of image
    cv::Point2d foldTop;             // Fold line end points in original coordinates
    cv::Point2d foldBottom;
    bool needsReview = false;
    SplitResult split;

    QualityReport quality;
};

// Runs one scanned page through contour detection, straightening, format
// classification and, for two-page spreads, fold detection and splitting.
class PageProcessor {
public:
    struct Params {
        ContourResolver::Params contour;
        PerspectiveCorrector::Params correction;
        FormatClassifier::Params format;
        FoldLocator::Params fold;
        DocumentSplitter::Params split;
        QualityEvaluator::Params quality;

        FitStrategyKind fitStrategy = FitStrategyKind::Ransac;
        uint64_t randomSeed = 42;        // Line fitting; the fold locator has its own
        int maxProcessingSize = 1080;    // Contour detection runs on a downscaled copy
        int contourBorder = 150;         // Margin kept around the page
        int minBorderThreshold = 50;     // Less free border than this means rotation only
        double coverageThreshold = 0.90; // Pages filling this much of the frame are left alone
        bool forceFold = false;          // Look for a fold regardless of the format
        bool autoDetectSide = true;
        FoldSide foldSide = FoldSide::Center;  // Used when autoDetectSide is off
        bool splitPages = true;
        bool evaluateQuality = false;
    };

    explicit PageProcessor(const Params& params);
    PageProcessor(const Params& params, ProcessingObserver* observer);

    PageResult process(const LoadedImage& input);
    PageResult process(const cv::Mat& image, double dpiX, double dpiY);

    const Params& params() const { return params_; }

    // Scale factor that brings the longer side down to maxSide (1 when already smaller)
    static double processingScale(const cv::Size& size, int maxSide);

    // Smallest distance from box to any image edge
    static int availableBorder(const cv::Rect& box, const cv::Size& imageSize);

private:
    void locateFold(PageResult& result);

    Params params_;
    ProcessingObserver* observer_ = nullptr;
};

} // namespace FolioGeom
