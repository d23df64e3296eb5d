#pragma once

#include <opencv2/core.hpp>

namespace FolioGeom {

struct BackgroundStats {
    double paper = 0.0;          // Bright paper luminance (center, high percentile)
    double dark = 0.0;           // Background luminance (corners, low percentile)
    double contrastSpan = 1.0;   // max(1, paper - dark)
    double minContrast = 8.0;    // Smallest step accepted as a border
    double darkThreshold = 0.0;  // Luminance below which a side counts as background
};

class BackgroundEstimator {
public:
    struct Params {
        double cornerFraction = 0.03;    // Corner patch side relative to min(h, w)
        double centerLow = 0.30;         // Central box spans [low, high] of each dimension
        double centerHigh = 0.70;
        double darkPercentile = 10.0;
        double paperPercentile = 90.0;
        double minContrastFloor = 8.0;
        double minContrastRatio = 0.15;  // min_contrast = max(floor, ratio * span)
        double darkThresholdRatio = 0.35; // dark_threshold = paper - ratio * span
    };

    static BackgroundStats estimate(const cv::Mat& image, const Params& params);
};

} // namespace FolioGeom
