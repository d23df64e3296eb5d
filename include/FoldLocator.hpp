#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace FolioGeom {

class ProcessingObserver;

// Finds the vertical book fold of a two-page spread as the consensus
// minimum of a brightness profile over random row subsets.
class FoldLocator {
public:
    struct Params {
        double roiStart = 0.40;          // Default search strip, fraction of width
        double roiEnd = 0.60;
        double sideRoiFraction = 0.20;   // Strip width when the fold sits near an edge
        int blurKernel = 5;
        int iterations = 20;
        int rowsPerIteration = 60;
        double rowRejectSigma = 1.5;     // Rows whose mean is further away are ignored
        double smoothingFraction = 0.01; // Profile smoothing kernel relative to image width
        int minSmoothingKernel = 3;
        int parabolaHalfWindow = 15;
        double prominenceSigma = 3.0;    // Minima must stand out by this many profile sigmas
        double minProminence = 2.0;      // Absolute floor, also the flat-profile limit
        double minPeakSpacing = 0.10;    // Fraction of ROI width
        std::array<double, 4> consistencyBands = {0.01, 0.02, 0.05, 0.10};
        std::array<double, 4> consistencyScores = {1.0, 0.8, 0.6, 0.4};
        double consistencyFloor = 0.2;
        double singleMinimumScore = 1.0;
        double fewMinimaScore = 0.7;
        double fallbackScore = 0.5;
        double variabilityGate = 0.6;
        double variabilityThreshold = 10.0;
        double variabilityDivisor = 30.0;
        double variabilityExclusion = 0.10; // Window around the fold ignored for variability
        double qualityThreshold = 0.6;      // Below this the estimate is LowConfidence
        int angleHalfWidth = 20;
        int angleRowStep = 3;
        int sideStripWidth = 20;
        int sideStripOffset = 10;
        double sideCenterContrast = 10.0;
        double sideBalance = 5.0;
        uint64_t randomSeed = 0x9E3779B97F4A7C15ULL;
    };

    explicit FoldLocator(const Params& params);
    FoldLocator(const Params& params, ProcessingObserver* observer);

    FoldEstimate locate(const cv::Mat& image);
    FoldEstimate locate(const cv::Mat& image, int roiStartX, int roiEndX);

    static double consistencyScore(double spread, double roiWidth, const Params& params);
    static FoldSide detectSide(const cv::Mat& image, const Params& params);

    // Search strip [x0, x1) for a fold on the given side of an image of this width
    static void roiForSide(FoldSide side, int width, const Params& params, int& x0, int& x1);
    static double estimateAngle(const cv::Mat& gray, int foldX, const Params& params);

private:
    FoldEstimate locateInRoi(const cv::Mat& gray, int x0, int x1);

    Params params_;
    cv::RNG rng_;
    ProcessingObserver* observer_ = nullptr;
};

} // namespace FolioGeom
