#pragma once

#include <opencv2/core.hpp>

namespace FolioGeom {

// Directionally smoothed copies of the page plus absolute Sobel responses.
// blurredV keeps horizontal borders (long vertical kernel, short horizontal),
// blurredH keeps vertical borders. Every field has the input's size.
struct GradientField {
    cv::Mat blurredV;   // CV_8UC1
    cv::Mat blurredH;   // CV_8UC1
    cv::Mat gradX;      // |d/dx| of blurredH, CV_64FC1
    cv::Mat gradY;      // |d/dy| of blurredV, CV_64FC1

    cv::Size size() const { return blurredV.size(); }
};

class GradientFieldBuilder {
public:
    struct Params {
        int smallKernel = 5;           // Kernel across the smoothing direction
        int minLargeKernel = 15;       // Lower bound of the long kernel
        int largeKernelDivisor = 60;   // Long kernel ~ dimension / divisor
        double sigmaDivisor = 3.0;     // Gaussian sigma = kernel / divisor
        int sobelAperture = 3;
    };

    static int largeKernelSize(int dimension, const Params& params);
    static GradientField build(const cv::Mat& image, const Params& params);
};

} // namespace FolioGeom
