#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace FolioGeom {

// 1-D helpers shared by the scanline and fold-profile stages
class SignalProfile {
public:
    struct PeakOptions {
        double minHeight = -1e300;   // Minimum peak value
        double minProminence = 0.0;  // Minimum topographic prominence
        int minDistance = 1;         // Minimum spacing between kept peaks (samples)
    };

    // Local maxima (plateaus reported at their middle sample) filtered by
    // height, prominence and distance. Indices are returned in ascending order.
    static std::vector<int> findPeaks(const std::vector<double>& signal, const PeakOptions& options);
    static double peakProminence(const std::vector<double>& signal, int peak);

    static std::vector<double> negate(const std::vector<double>& signal);

    // Centered moving average with edge replication
    static std::vector<double> movingAverage(const std::vector<double>& signal, int window);
    static std::vector<double> gaussianSmooth(const std::vector<double>& signal, int kernelSize, double sigma = 0.0);

    // Subtracts the least-squares line through (i, signal[i])
    static std::vector<double> detrendLinear(const std::vector<double>& signal);

    // Vertex of the least-squares parabola through signal[lo..hi].
    // False when the curve opens downward or the vertex leaves the window.
    static bool parabolaVertex(const std::vector<double>& signal, int lo, int hi, double& vertex);

    static double mean(const std::vector<double>& values);
    static double stddev(const std::vector<double>& values);
    static double median(std::vector<double> values);

    // Percentile with linear interpolation between order statistics, q in [0, 100]
    static double percentile(std::vector<double> values, double q);
    static double percentile(const cv::Mat& image, double q);

    static std::vector<double> rowOf(const cv::Mat& image, int row);
    static std::vector<double> columnOf(const cv::Mat& image, int col);

    static int forceOdd(int value) { return value % 2 == 0 ? value + 1 : value; }
};

} // namespace FolioGeom
