#pragma once

#include <opencv2/core.hpp>

namespace FolioGeom {

struct ImageQuality {
    double sharpness = 0.0;      // Variance of the Laplacian
    double entropy = 0.0;        // Bits per pixel over a 256-bin histogram
    double edgeDensity = 0.0;    // Fraction of Canny edge pixels
};

struct QualityReport {
    ImageQuality original;
    ImageQuality processed;
    double residualSkewDeg = 0.0;   // Of the processed image
    int skewLineCount = 0;
    bool evaluated = false;
};

// Before/after comparison of a correction on the common top-left area
class QualityEvaluator {
public:
    struct Params {
        double cannyLower = 100.0;
        double cannyUpper = 200.0;
        int houghThreshold = 200;
    };

    static QualityReport evaluate(const cv::Mat& original, const cv::Mat& processed, const Params& params);

    static ImageQuality measure(const cv::Mat& gray, const Params& params);
    static double sharpness(const cv::Mat& gray);
    static double entropy(const cv::Mat& gray);
    static double edgeDensity(const cv::Mat& gray, const Params& params);

    // Median deviation of the dominant Hough lines from the nearest image axis.
    // Returns 0 when no line passes the accumulator threshold.
    static double residualSkew(const cv::Mat& gray, const Params& params, int* lineCount = nullptr);
};

} // namespace FolioGeom
