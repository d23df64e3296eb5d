#pragma once

#include "Geometry.hpp"
#include "IrregularBorderFinder.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace FolioGeom {

class ProcessingObserver;

struct CorrectionResult {
    Status status = Status::Ok;   // DegenerateTransform when the rotation was skipped
    cv::Mat image;                // Straightened and cropped page
    cv::Mat validMask;            // 255 where the output holds real image content
    cv::Mat unrotatedCrop;        // Page bounding box plus margin in the original image
    cv::Rect unrotatedBox;
    cv::Mat rotation;             // 2x3 CV_64F, original -> rotated canvas
    cv::Mat transform;            // 2x3 CV_64F, original -> output image
    cv::Size canvasSize;
    cv::Rect cropBox;             // Output region inside the rotated canvas
    std::vector<cv::Point2f> rotatedCorners;
    double angleDeg = 0.0;
    bool rotated = false;
    bool cropped = false;
    bool irregularBorderUsed = false;
};

class PerspectiveCorrector {
public:
    struct Params {
        double minAngle = 1e-3;                    // Degrees; smaller rotations are skipped
        int interpolation = cv::INTER_LANCZOS4;
        bool useIrregularBorder = true;
        IrregularBorderFinder::Params border;
    };

    // margin == 0 selects rotation-only mode: the whole rotated canvas is returned.
    static CorrectionResult correct(const cv::Mat& image, const PageContour& contour, int margin,
                                    double backgroundIntensity, const Params& params,
                                    ProcessingObserver* observer = nullptr);

    // Rotation about center plus the translation that keeps the whole image
    // inside the returned canvas
    static cv::Mat rotationMatrix(const cv::Point2f& center, double angleDeg, const cv::Size& imageSize,
                                  cv::Size& canvasSize);

    static cv::Point2d apply(const cv::Mat& transform, const cv::Point2d& p);
    static cv::Point2d toOriginal(const cv::Mat& transform, const cv::Point2d& p);

    // End points of the corrected-space vertical line x = foldX in original coordinates
    static void foldLineToOriginal(const cv::Mat& transform, double foldX, int correctedHeight,
                                   cv::Point2d& top, cv::Point2d& bottom);
};

} // namespace FolioGeom
