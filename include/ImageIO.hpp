#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace FolioGeom {

struct LoadedImage {
    cv::Mat pixels;       // BGR or grayscale, 8-bit
    double dpiX = 0.0;    // 0 when the resolution is unknown
    double dpiY = 0.0;

    bool hasDpi() const { return dpiX > 0.0 && dpiY > 0.0; }
};

class ImageIO {
public:
    static constexpr int kMinImageSide = 64;

    // Throws std::invalid_argument for an empty path and std::runtime_error
    // when the file cannot be decoded or is too small to process.
    static LoadedImage loadImage(const std::string& path, double dpiX = 0.0, double dpiY = 0.0);

    static cv::Mat toGray(const cv::Mat& image);
    static bool saveImage(const std::string& path, const cv::Mat& image, int jpegQuality = 95);
    static bool isReadableImage(const std::string& path);
};

} // namespace FolioGeom
