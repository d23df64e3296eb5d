#include "BackgroundEstimator.hpp"
#include "ImageIO.hpp"
#include "SignalProfile.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace cv;
using namespace std;

namespace FolioGeom {

BackgroundStats BackgroundEstimator::estimate(const Mat& image, const Params& params) {
    if (image.empty()) {
        throw invalid_argument("Cannot estimate background of an empty image");
    }

    Mat gray = ImageIO::toGray(image);
    const int h = gray.rows;
    const int w = gray.cols;

    const int c = max(1, static_cast<int>(min(h, w) * params.cornerFraction));
    vector<Rect> corners = {
        Rect(0, 0, c, c),
        Rect(w - c, 0, c, c),
        Rect(0, h - c, c, c),
        Rect(w - c, h - c, c, c)
    };

    vector<double> cornerSamples;
    cornerSamples.reserve(4 * c * c);
    for (const auto& r : corners) {
        Mat patch = gray(r);
        for (int y = 0; y < patch.rows; y++) {
            const uchar* row = patch.ptr<uchar>(y);
            cornerSamples.insert(cornerSamples.end(), row, row + patch.cols);
        }
    }

    int x0 = static_cast<int>(w * params.centerLow);
    int x1 = max(x0 + 1, static_cast<int>(w * params.centerHigh));
    int y0 = static_cast<int>(h * params.centerLow);
    int y1 = max(y0 + 1, static_cast<int>(h * params.centerHigh));
    Mat center = gray(Rect(x0, y0, min(x1, w) - x0, min(y1, h) - y0));

    BackgroundStats stats;
    stats.dark = SignalProfile::percentile(cornerSamples, params.darkPercentile);
    stats.paper = SignalProfile::percentile(center, params.paperPercentile);
    stats.contrastSpan = max(1.0, stats.paper - stats.dark);
    stats.minContrast = max(params.minContrastFloor, params.minContrastRatio * stats.contrastSpan);
    stats.darkThreshold = stats.paper - params.darkThresholdRatio * stats.contrastSpan;

    cout << "[INFO] Background estimate: paper=" << stats.paper << " dark=" << stats.dark
         << " span=" << stats.contrastSpan << " darkThreshold=" << stats.darkThreshold << endl;
    return stats;
}

} // namespace FolioGeom
