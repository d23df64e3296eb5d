#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace FolioGeom {

// Backend that turns a noisy border point set into a line and inlier mask.
// vertical selects the x = m*y + q parameterisation.
class RobustFitStrategy {
public:
    virtual ~RobustFitStrategy() = default;
    virtual BorderLine fit(const std::vector<cv::Point2f>& points, bool vertical, double residualThreshold) = 0;
    virtual const char* name() const = 0;
};

// Random sample consensus over 2-point models with adaptive trial count
class RansacLineStrategy : public RobustFitStrategy {
public:
    struct Params {
        int maxTrials = 200;
        double stopProbability = 0.995;
    };

    explicit RansacLineStrategy(cv::RNG rng);
    RansacLineStrategy(cv::RNG rng, const Params& params);

    BorderLine fit(const std::vector<cv::Point2f>& points, bool vertical, double residualThreshold) override;
    const char* name() const override { return "ransac"; }

    int lastTrialCount() const { return lastTrials_; }

private:
    cv::RNG rng_;
    Params params_;
    int lastTrials_ = 0;
};

// Single total-least-squares fit; the worst residuals are flagged as outliers
class TrimmedLeastSquaresStrategy : public RobustFitStrategy {
public:
    struct Params {
        double inlierQuantile = 80.0;   // Percentile of residuals kept as inliers
    };

    TrimmedLeastSquaresStrategy() = default;
    explicit TrimmedLeastSquaresStrategy(const Params& params) : params_(params) {}

    BorderLine fit(const std::vector<cv::Point2f>& points, bool vertical, double residualThreshold) override;
    const char* name() const override { return "trimmed-least-squares"; }

private:
    Params params_;
};

enum class FitStrategyKind { Ransac, TrimmedLeastSquares };

struct LineFitResult {
    Status status = Status::InsufficientData;
    BorderLine line;
    bool vertical = false;
    double residualThreshold = 0.0;
};

class RobustLineFitter {
public:
    struct Params {
        size_t minPoints = 3;
        double minResidualThreshold = 3.0;  // Pixels
        double residualScale = 20.0;        // Threshold = max(min, scale * max(h, w) / reference)
        double referenceSize = 2000.0;
    };

    explicit RobustLineFitter(std::unique_ptr<RobustFitStrategy> strategy);
    RobustLineFitter(std::unique_ptr<RobustFitStrategy> strategy, const Params& params);

    LineFitResult fit(const std::vector<cv::Point2f>& points, const cv::Size& imageSize);

    const RobustFitStrategy& strategy() const { return *strategy_; }

    static double residualThreshold(const cv::Size& imageSize, const Params& params);
    static bool isVerticalSet(const std::vector<cv::Point2f>& points);
    static std::unique_ptr<RobustFitStrategy> makeStrategy(FitStrategyKind kind, uint64_t seed);

private:
    std::unique_ptr<RobustFitStrategy> strategy_;
    Params params_;
};

} // namespace FolioGeom
