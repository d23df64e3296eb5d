#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace FolioGeom {

// Content-following crop: labels heavily blurred pixels as page or
// background by intensity similarity and returns the page's bounding box.
class IrregularBorderFinder {
public:
    struct Params {
        int cropMargin = 200;      // Context kept around the page box
        int minBlurKernel = 21;
        int blurDivisor = 20;      // Blur kernel ~ min(crop side) / divisor
    };

    // box is the page quadrilateral (or rotated rectangle) in image
    // coordinates. Returns an empty rectangle when no content is found.
    static cv::Rect find(const cv::Mat& image, const std::vector<cv::Point2f>& box, double backgroundIntensity,
                         const Params& params);
    static cv::Rect find(const cv::Mat& image, const std::vector<cv::Point2f>& box, double backgroundIntensity,
                         const Params& params, cv::Mat& contentMask);

    // 255 where a pixel is closer to subject than to background intensity
    static cv::Mat similarityMask(const cv::Mat& gray, double backgroundIntensity, double subjectIntensity);
    static int blurKernelSize(const cv::Size& cropSize, const Params& params);
};

} // namespace FolioGeom
