#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace FolioGeom {

// Receives intermediate artifacts from the processing stages.
// All hooks default to no-ops; the stages never render anything themselves.
class ProcessingObserver {
public:
    virtual ~ProcessingObserver() = default;

    virtual void onImage(const std::string& stage, const cv::Mat& image) {}
    virtual void onBorderPoints(const cv::Mat& source, const BorderPoints& points) {}
    virtual void onBorderLine(BorderSide side, const BorderLine& line) {}
    virtual void onContour(const cv::Mat& source, const PageContour& contour, ContourMethod method) {}
    virtual void onProfile(const std::string& stage, const std::vector<double>& profile) {}
    virtual void onFold(const cv::Mat& image, const FoldEstimate& fold) {}
};

// Collects debug images in processing order and writes them as numbered
// files ("01_gray.jpg", "02_border_points.jpg", ...) on flush.
class DebugImageStack : public ProcessingObserver {
public:
    explicit DebugImageStack(const std::string& outputPath = "./debug/");

    void onImage(const std::string& stage, const cv::Mat& image) override;
    void onBorderPoints(const cv::Mat& source, const BorderPoints& points) override;
    void onBorderLine(BorderSide side, const BorderLine& line) override;
    void onContour(const cv::Mat& source, const PageContour& contour, ContourMethod method) override;
    void onProfile(const std::string& stage, const std::vector<double>& profile) override;
    void onFold(const cv::Mat& image, const FoldEstimate& fold) override;

    void push(const cv::Mat& image, const std::string& name);
    void flush();
    void clear();

    size_t size() const { return stack_.size(); }
    const std::string& outputPath() const { return outputPath_; }

private:
    std::string outputPath_;
    std::vector<std::pair<cv::Mat, std::string>> stack_;
    std::vector<std::pair<BorderSide, BorderLine>> lines_;
};

} // namespace FolioGeom
