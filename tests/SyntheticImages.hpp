#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace FolioGeom {
namespace Synthetic {

// Bright axis-aligned page on a dark single-channel background
cv::Mat rectanglePage(const cv::Size& size, int background, int page, const cv::Rect& box);

// Same as rectanglePage but the page is a filled rotated rectangle
cv::Mat rotatedPage(const cv::Size& size, int background, int page, const cv::RotatedRect& box);

// Uniform image with optional Gaussian noise drawn from a fixed seed
cv::Mat uniform(const cv::Size& size, int value, double noiseSigma = 0.0, uint64_t seed = 7);

// Uniform spread with a dark vertical band [foldX - halfWidth, foldX + halfWidth]
cv::Mat foldSpread(const cv::Size& size, int value, int foldX, int halfWidth, int foldValue);

cv::Mat toBgr(const cv::Mat& gray);

// Writes image under the system temp directory and returns the full path
std::string writeTemp(const cv::Mat& image, const std::string& name);

} // namespace Synthetic
} // namespace FolioGeom
