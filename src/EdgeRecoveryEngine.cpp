#include "EdgeRecoveryEngine.hpp"
#include "ImageIO.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace cv;
using namespace std;

namespace FolioGeom {

Mat EdgeRecoveryEngine::binarize(const Mat& image, const Params& params) {
    Mat gray = ImageIO::toGray(image);
    double threshValue = mean(gray)[0] * params.thresholdFactor;

    Mat binary;
    threshold(gray, binary, threshValue, 255, THRESH_BINARY_INV);
    medianBlur(binary, binary, SignalProfile::forceOdd(max(3, params.medianKernel)));

    Mat kernel = getStructuringElement(MORPH_RECT, Size(params.closeKernel, params.closeKernel));
    morphologyEx(binary, binary, MORPH_CLOSE, kernel);
    return binary;
}

int EdgeRecoveryEngine::expectedPosition(BorderSide side, const BorderPoints& points, const Size& size,
                                         const Params& params) {
    const int h = size.height;
    const int w = size.width;

    auto medianOf = [](const vector<Point2f>& pts, bool useX) {
        vector<double> values;
        for (const auto& p : pts) values.push_back(useX ? p.x : p.y);
        return SignalProfile::median(values);
    };

    double expected = 0.0;
    switch (side) {
        case BorderSide::Top:
            expected = points.bottom.empty() ? params.defaultNearFraction * h : h - medianOf(points.bottom, false);
            break;
        case BorderSide::Bottom:
            expected = points.top.empty() ? (1.0 - params.defaultNearFraction) * h : h - medianOf(points.top, false);
            break;
        case BorderSide::Left:
            expected = points.right.empty() ? params.defaultNearFraction * w : w - medianOf(points.right, true);
            break;
        case BorderSide::Right:
            expected = points.left.empty() ? (1.0 - params.defaultNearFraction) * w : w - medianOf(points.left, true);
            break;
    }

    const int limit = (side == BorderSide::Top || side == BorderSide::Bottom) ? h - 1 : w - 1;
    return min(max(static_cast<int>(lround(expected)), 0), limit);
}

vector<Point2f> EdgeRecoveryEngine::recover(const Mat& image, BorderSide side, const BorderPoints& points,
                                            int band, const Params& params) {
    Mat gray;
    medianBlur(ImageIO::toGray(image), gray, SignalProfile::forceOdd(max(3, params.medianKernel)));
    Mat binary = binarize(image, params);

    const int h = gray.rows;
    const int w = gray.cols;
    const bool horizontalBorder = side == BorderSide::Top || side == BorderSide::Bottom;
    const bool fromStart = side == BorderSide::Top || side == BorderSide::Left;

    const int expected = expectedPosition(side, points, gray.size(), params);
    const int across = horizontalBorder ? h : w;
    const int along = horizontalBorder ? w : h;
    const int lo = max(1, expected - band);
    const int hi = min(across - 2, expected + band);

    cout << "[INFO] Recovering " << borderSideName(side) << " border around " << expected
         << " (+/-" << band << " px)" << endl;

    vector<Point2f> recovered;
    if (hi < lo) {
        return recovered;
    }

    auto sample = [&](const Mat& m, int acrossPos, int alongPos) {
        return horizontalBorder ? static_cast<double>(m.at<uchar>(acrossPos, alongPos))
                                : static_cast<double>(m.at<uchar>(alongPos, acrossPos));
    };

    const int probes = max(1, params.probeCount);
    for (int i = 0; i < probes; i++) {
        double t = probes == 1 ? 0.5 : static_cast<double>(i) / (probes - 1);
        int alongPos = static_cast<int>(along * (params.probeStart + t * (params.probeEnd - params.probeStart)));
        alongPos = min(max(alongPos, 0), along - 1);

        // Walk from the image edge towards the page
        int found = -1;
        for (int step = 0; step <= hi - lo && found < 0; step++) {
            int p = fromStart ? lo + step : hi - step;
            if (fabs(sample(gray, p + 1, alongPos) - sample(gray, p - 1, alongPos)) > params.jumpThreshold) {
                found = p;
            }
        }
        for (int step = 0; step <= hi - lo && found < 0; step++) {
            int p = fromStart ? lo + step : hi - step;
            if (sample(binary, p + 1, alongPos) != sample(binary, p - 1, alongPos)) {
                found = p;
            }
        }

        if (found >= 0) {
            if (horizontalBorder) {
                recovered.emplace_back(static_cast<float>(alongPos), static_cast<float>(found));
            } else {
                recovered.emplace_back(static_cast<float>(found), static_cast<float>(alongPos));
            }
        }
    }

    cout << "[INFO] Recovered " << recovered.size() << " points for " << borderSideName(side) << " border" << endl;
    return recovered;
}

} // namespace FolioGeom
