#include "QualityEvaluator.hpp"
#include "ImageIO.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <iostream>

using namespace cv;
using namespace std;

namespace FolioGeom {

double QualityEvaluator::sharpness(const Mat& gray) {
    Mat lap;
    Laplacian(gray, lap, CV_64F);
    Scalar mu, sigma;
    meanStdDev(lap, mu, sigma);
    return sigma[0] * sigma[0];
}

double QualityEvaluator::entropy(const Mat& gray) {
    if (gray.empty()) return 0.0;

    int histSize = 256;
    float range[] = {0, 256};
    const float* ranges[] = {range};
    Mat hist;
    calcHist(&gray, 1, nullptr, Mat(), hist, 1, &histSize, ranges);

    const double total = static_cast<double>(gray.total());
    double bits = 0.0;
    for (int i = 0; i < histSize; i++) {
        double p = hist.at<float>(i) / total;
        if (p > 0.0) bits -= p * log2(p);
    }
    return bits;
}

double QualityEvaluator::edgeDensity(const Mat& gray, const Params& params) {
    if (gray.empty()) return 0.0;
    Mat edges;
    Canny(gray, edges, params.cannyLower, params.cannyUpper);
    return static_cast<double>(countNonZero(edges)) / edges.total();
}

double QualityEvaluator::residualSkew(const Mat& gray, const Params& params, int* lineCount) {
    if (lineCount) *lineCount = 0;
    if (gray.empty()) return 0.0;

    Mat edges;
    Canny(gray, edges, params.cannyLower, params.cannyUpper);
    vector<Vec2f> lines;
    HoughLines(edges, lines, 1, CV_PI / 180, params.houghThreshold);
    if (lines.empty()) return 0.0;

    vector<double> angles;
    angles.reserve(lines.size());
    for (const auto& line : lines) {
        double angle = line[1] * 180.0 / CV_PI - 90.0;
        if (angle > 45.0) angle -= 90.0;
        if (angle <= -45.0) angle += 90.0;
        angles.push_back(angle);
    }
    if (lineCount) *lineCount = static_cast<int>(angles.size());
    return SignalProfile::median(angles);
}

ImageQuality QualityEvaluator::measure(const Mat& gray, const Params& params) {
    ImageQuality q;
    q.sharpness = sharpness(gray);
    q.entropy = entropy(gray);
    q.edgeDensity = edgeDensity(gray, params);
    return q;
}

QualityReport QualityEvaluator::evaluate(const Mat& original, const Mat& processed, const Params& params) {
    QualityReport report;
    if (original.empty() || processed.empty()) {
        cout << "[WARN] Quality evaluation skipped: missing image" << endl;
        return report;
    }

    Mat grayOrig = ImageIO::toGray(original);
    Mat grayProc = ImageIO::toGray(processed);

    Rect common(0, 0, min(grayOrig.cols, grayProc.cols), min(grayOrig.rows, grayProc.rows));
    grayOrig = grayOrig(common);
    grayProc = grayProc(common);

    report.original = measure(grayOrig, params);
    report.processed = measure(grayProc, params);
    report.residualSkewDeg = residualSkew(grayProc, params, &report.skewLineCount);
    report.evaluated = true;

    cout << "[INFO] Quality: sharpness " << report.original.sharpness << " -> " << report.processed.sharpness
         << ", entropy " << report.original.entropy << " -> " << report.processed.entropy
         << ", edge density " << report.original.edgeDensity << " -> " << report.processed.edgeDensity
         << ", residual skew " << report.residualSkewDeg << " deg" << endl;
    return report;
}

} // namespace FolioGeom
