#pragma once

#include "Geometry.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace FolioGeom {

struct SplitResult {
    cv::Mat left;
    cv::Mat right;
    cv::Rect leftBox;              // Empty when the left part is not produced
    cv::Rect rightBox;
    bool smartCropApplied = false;

    bool hasLeft() const { return leftBox.area() > 0; }
    bool hasRight() const { return rightBox.area() > 0; }
};

class DocumentSplitter {
public:
    struct Params {
        int margin = 50;               // Overlap kept on each side of the fold
        bool smartCrop = false;        // Trim the outer page edges
        int searchOffset = 50;         // Edge scan starts this far from the fold
        int edgeInset = 5;             // and stops this far from the image border
        int blurKernel = 5;
        double blurSigma = 1.0;
        int maxSmoothingWindow = 8;
        int minSmoothingWindow = 3;
        int maxDerivativeWindow = 3;
        double thresholdRatio = 0.75;  // Dark side must fall below ratio * max brightness
        double minDrop = 3.0;
    };

    // side names where the fold sits: Center keeps both halves, Right keeps
    // the part left of the fold, Left keeps the part right of it.
    static SplitResult split(const cv::Mat& image, int foldX, FoldSide side, const Params& params);

    // Index of the strongest bright-to-dark drop along profile, -1 if none
    static int findBrightnessDrop(const std::vector<double>& profile, const Params& params);

    // Outer page edge scanned from the fold towards the image border, -1 if none
    static int detectOuterEdge(const cv::Mat& image, int foldX, bool towardsLeft, const Params& params);
};

} // namespace FolioGeom
