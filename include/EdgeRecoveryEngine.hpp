#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace FolioGeom {

// Rebuilds the point set of a border the scanner could not see, using the
// opposite border as a position prior and an adaptive binarization.
class EdgeRecoveryEngine {
public:
    struct Params {
        size_t minPoints = 5;            // Below this a side is considered missing
        double thresholdFactor = 0.6;    // Binarize at mean intensity * factor
        int medianKernel = 5;
        int closeKernel = 5;
        int probeCount = 12;             // Probes along the border direction
        double probeStart = 0.10;
        double probeEnd = 0.90;
        double jumpThreshold = 15.0;     // |I(p+1) - I(p-1)| accepted as an edge
        double defaultNearFraction = 0.10; // Expected border position when no prior exists
    };

    static bool needsRecovery(const std::vector<cv::Point2f>& points, const Params& params) {
        return points.size() < params.minPoints;
    }

    // Dark-foreground binary image: 255 where the pixel is darker than the threshold
    static cv::Mat binarize(const cv::Mat& image, const Params& params);

    // Expected coordinate of the border across its own direction
    static int expectedPosition(BorderSide side, const BorderPoints& points, const cv::Size& size, const Params& params);

    static std::vector<cv::Point2f> recover(const cv::Mat& image, BorderSide side, const BorderPoints& points,
                                            int band, const Params& params);
};

} // namespace FolioGeom
