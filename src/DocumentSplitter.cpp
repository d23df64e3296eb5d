#include "DocumentSplitter.hpp"
#include "ImageIO.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace FolioGeom {

int DocumentSplitter::findBrightnessDrop(const vector<double>& profile, const Params& params) {
    const int n = static_cast<int>(profile.size());
    if (n < 4) {
        return -1;
    }

    int window = max(params.minSmoothingWindow, min(params.maxSmoothingWindow, n / 3));
    vector<double> smoothed = SignalProfile::movingAverage(profile, window);
    smoothed = SignalProfile::gaussianSmooth(smoothed, 5, 1.0);

    double threshold = params.thresholdRatio * *max_element(smoothed.begin(), smoothed.end());
    int dw = max(1, min(params.maxDerivativeWindow, n / 4));

    int best = -1;
    double bestDrop = params.minDrop;
    for (int i = 0; i + dw < n; i++) {
        if (smoothed[i + dw] >= threshold) continue;
        double drop = smoothed[i] - smoothed[i + dw];
        if (drop > bestDrop) {
            bestDrop = drop;
            best = i + dw;
        }
    }
    return best;
}

int DocumentSplitter::detectOuterEdge(const Mat& image, int foldX, bool towardsLeft, const Params& params) {
    Mat gray = ImageIO::toGray(image);
    Mat blurred;
    int k = SignalProfile::forceOdd(max(1, params.blurKernel));
    GaussianBlur(gray, blurred, Size(k, k), params.blurSigma);

    Mat colMeans;
    reduce(blurred, colMeans, 0, REDUCE_AVG, CV_64F);
    const int w = gray.cols;

    vector<int> xs;
    if (towardsLeft) {
        for (int x = foldX - params.searchOffset; x >= params.edgeInset; x--) xs.push_back(x);
    } else {
        for (int x = foldX + params.searchOffset; x < w - params.edgeInset; x++) xs.push_back(x);
    }

    vector<double> profile;
    for (int x : xs) profile.push_back(colMeans.at<double>(0, x));

    int idx = findBrightnessDrop(profile, params);
    return idx >= 0 ? xs[idx] : -1;
}

SplitResult DocumentSplitter::split(const Mat& image, int foldX, FoldSide side, const Params& params) {
    if (image.empty()) {
        throw invalid_argument("Cannot split an empty image");
    }
    if (params.margin < 0) {
        throw invalid_argument("Split margin must not be negative");
    }

    const int W = image.cols;
    const int H = image.rows;
    const int F = min(max(foldX, 0), W);
    const int M = params.margin;

    SplitResult result;
    const int leftEnd = min(W, F + M);
    const int rightStart = max(0, F - M);

    if (side == FoldSide::Center || side == FoldSide::Right) {
        result.leftBox = Rect(0, 0, leftEnd, H);
    }
    if (side == FoldSide::Center || side == FoldSide::Left) {
        result.rightBox = Rect(rightStart, 0, W - rightStart, H);
    }

    if (params.smartCrop) {
        if (result.hasLeft()) {
            int edge = detectOuterEdge(image, F, true, params);
            if (edge > 0 && edge < result.leftBox.br().x) {
                result.leftBox = Rect(edge, 0, result.leftBox.br().x - edge, H);
                result.smartCropApplied = true;
            }
        }
        if (result.hasRight()) {
            int edge = detectOuterEdge(image, F, false, params);
            if (edge > result.rightBox.x && edge < W - 1) {
                result.rightBox = Rect(result.rightBox.x, 0, edge + 1 - result.rightBox.x, H);
                result.smartCropApplied = true;
            }
        }
    }

    if (result.hasLeft()) result.left = image(result.leftBox).clone();
    if (result.hasRight()) result.right = image(result.rightBox).clone();

    cout << "[INFO] Split at x=" << F << " (" << foldSideName(side) << ", margin " << M << "): left "
         << result.leftBox.width << " px, right " << result.rightBox.width << " px" << endl;
    return result;
}

} // namespace FolioGeom
