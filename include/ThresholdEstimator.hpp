#pragma once

#include <opencv2/core.hpp>

namespace FolioGeom {

struct ThresholdResult {
    cv::Mat mask;                // 255 = page, 0 = background
    double threshold = 0.0;
    double borderGray = 0.0;     // Mean gray level of the corner patches
    double centerGray = 0.0;
    cv::Scalar borderColor;      // Mean BGR of the corner patches, used as fill color
};

// Global page/background threshold from corner and center samples,
// followed by morphological cleanup of the resulting page mask.
class ThresholdEstimator {
public:
    struct Params {
        int minBlurKernel = 3;
        int maxBlurKernel = 51;
        int blurDivisor = 50;          // Blur kernel ~ min(h, w) / divisor
        int cornerPatch = 3;           // Side of the corner color patches
        double centerFraction = 0.30;  // Center square side relative to min(h, w)
        double thresholdRatio = 0.6;   // threshold = border + ratio * (center - border)
        int closeKernel = 15;
        int openKernel = 5;
        int smoothKernel = 20;         // Erode/dilate pair that rounds off the mask
        int smoothIterations = 5;
        int holeCloseKernel = 50;
        bool fillHoles = true;
    };

    static int blurKernelSize(const cv::Size& size, const Params& params);
    static cv::Scalar borderColor(const cv::Mat& image, int patch);
    static ThresholdResult estimate(const cv::Mat& image, const Params& params);
    static cv::Mat fillHoles(const cv::Mat& mask, const Params& params);
};

} // namespace FolioGeom
