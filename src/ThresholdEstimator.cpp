#include "ThresholdEstimator.hpp"
#include "ImageIO.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace cv;
using namespace std;

namespace FolioGeom {

int ThresholdEstimator::blurKernelSize(const Size& size, const Params& params) {
    int k = (min(size.width, size.height) / params.blurDivisor) / 2 * 2 + 1;
    return min(max(k, params.minBlurKernel), params.maxBlurKernel);
}

Scalar ThresholdEstimator::borderColor(const Mat& image, int patch) {
    const int h = image.rows;
    const int w = image.cols;
    const int p = max(1, min(patch, min(h, w)));

    vector<Rect> corners = {
        Rect(0, 0, p, p),
        Rect(w - p, 0, p, p),
        Rect(0, h - p, p, p),
        Rect(w - p, h - p, p, p)
    };

    Scalar sum = Scalar::all(0);
    for (const auto& r : corners) {
        sum += mean(image(r));
    }
    return sum * 0.25;
}

Mat ThresholdEstimator::fillHoles(const Mat& mask, const Params& params) {
    // Flood the background from the corners; whatever stays unreached is a hole
    Mat flood = mask.clone();
    Mat floodMask = Mat::zeros(mask.rows + 2, mask.cols + 2, CV_8UC1);
    vector<Point> seeds = {
        Point(0, 0), Point(mask.cols - 1, 0), Point(0, mask.rows - 1), Point(mask.cols - 1, mask.rows - 1)
    };
    for (const auto& seed : seeds) {
        if (flood.at<uchar>(seed) == 0) {
            floodFill(flood, floodMask, seed, Scalar(255));
        }
    }

    Mat holes;
    bitwise_not(flood, holes);
    Mat filled = mask | holes;

    int k = min(params.holeCloseKernel, max(3, min(mask.rows, mask.cols) / 10));
    Mat kernel = getStructuringElement(MORPH_RECT, Size(k, k));
    morphologyEx(filled, filled, MORPH_CLOSE, kernel);
    return filled;
}

ThresholdResult ThresholdEstimator::estimate(const Mat& image, const Params& params) {
    if (image.empty()) {
        throw invalid_argument("Cannot threshold an empty image");
    }

    Mat gray = ImageIO::toGray(image);
    const int h = gray.rows;
    const int w = gray.cols;

    int k = blurKernelSize(gray.size(), params);
    Mat blurred;
    GaussianBlur(gray, blurred, Size(k, k), 0);

    ThresholdResult result;
    result.borderColor = borderColor(image, params.cornerPatch);
    if (image.channels() >= 3) {
        // BT.601 luma of the BGR corner color
        result.borderGray = 0.114 * result.borderColor[0] + 0.587 * result.borderColor[1] + 0.299 * result.borderColor[2];
    } else {
        result.borderGray = result.borderColor[0];
    }

    int side = max(1, static_cast<int>(min(h, w) * params.centerFraction));
    Rect center((w - side) / 2, (h - side) / 2, side, side);
    result.centerGray = mean(blurred(center))[0];
    result.threshold = result.borderGray + (result.centerGray - result.borderGray) * params.thresholdRatio;

    // Paper brighter than the background is the usual case; invert otherwise
    int type = result.centerGray >= result.borderGray ? THRESH_BINARY : THRESH_BINARY_INV;
    Mat binary;
    threshold(blurred, binary, result.threshold, 255, type);

    morphologyEx(binary, binary, MORPH_CLOSE, getStructuringElement(MORPH_RECT, Size(params.closeKernel, params.closeKernel)));
    morphologyEx(binary, binary, MORPH_OPEN, getStructuringElement(MORPH_RECT, Size(params.openKernel, params.openKernel)));

    // Scale the smoothing pass down so it cannot erase a small page
    int smooth = min(params.smoothKernel, max(3, min(h, w) / 40));
    Mat smoothKernel = getStructuringElement(MORPH_RECT, Size(smooth, smooth));
    erode(binary, binary, smoothKernel, Point(-1, -1), params.smoothIterations);
    dilate(binary, binary, smoothKernel, Point(-1, -1), params.smoothIterations);

    result.mask = params.fillHoles ? fillHoles(binary, params) : binary;

    cout << "[INFO] Threshold estimate: border=" << result.borderGray << " center=" << result.centerGray
         << " threshold=" << result.threshold << " (blur " << k << ")" << endl;
    return result;
}

} // namespace FolioGeom
