#pragma once

#include "BackgroundEstimator.hpp"
#include "Geometry.hpp"
#include "GradientFieldBuilder.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace FolioGeom {

class ProcessingObserver;

// Global per-border seeds from the mean gradient projections
struct ProjectionSeeds {
    int left = 0;
    int right = 0;
    int top = 0;
    int bottom = 0;
};

struct ScanResult {
    BorderPoints points;
    ProjectionSeeds seeds;
    int bandX = 0;                  // Accepted distance from the left/right seeds
    int bandY = 0;                  // Accepted distance from the top/bottom seeds
    std::vector<int> columns;       // x of the vertical scanlines
    std::vector<int> rows;          // y of the horizontal scanlines
};

class EdgeScanner {
public:
    struct Params {
        int scanlines = 12;             // Scanlines per axis
        double scanStart = 0.10;        // Scanlines spread over [start, end] of the dimension
        double scanEnd = 0.90;
        double gradientThreshold = 20.0;
        double prominenceRatio = 0.30;  // Peak prominence relative to the threshold
        int contrastWindow = 10;        // Samples averaged on each side of a peak
        int localMeanWindow = 31;       // Window for the luminance weighting
        double weightClipLow = 0.5;
        double weightClipHigh = 2.0;
        double polarityRatio = 0.3;     // Directional contrast must exceed ratio * min_contrast
        double minRelativeContrast = 2.0; // Percent of (paper - dark_threshold)
        double darkSideRatio = 0.2;
        double lightSideRatio = 0.6;
        double borderZone = 0.02;       // Peaks this close to the ends are always accepted
        double bandFraction = 0.05;     // Seed band relative to the dimension
        int minBand = 8;
        double seedWindowFraction = 0.125; // Seeds searched in the outer eighth of each side
        int minSeedSmoothing = 9;
        int seedSmoothingDivisor = 200;
    };

    static ScanResult scan(const cv::Mat& image, const GradientField& field, const BackgroundStats& stats,
                           const Params& params, ProcessingObserver* observer = nullptr);

    static std::vector<int> scanPositions(int dimension, const Params& params);
    static ProjectionSeeds projectionSeeds(const GradientField& field, const Params& params);
    static std::vector<int> detectPeaks(const std::vector<double>& gradient, const Params& params);

    // inwardFromStart is true for the top/left borders, where the scan enters
    // the page travelling from dark background to light paper.
    static std::vector<int> classifyPeaks(const std::vector<double>& intensity,
                                          const std::vector<double>& gradient,
                                          const std::vector<int>& peaks,
                                          bool inwardFromStart,
                                          const BackgroundStats& stats,
                                          const Params& params);
};

} // namespace FolioGeom
