#include "EdgeScanner.hpp"
#include "ProcessingObserver.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>

using namespace cv;
using namespace std;

namespace FolioGeom {

namespace {

int argmaxIn(const vector<double>& profile, int lo, int hi) {
    lo = max(lo, 0);
    hi = min(hi, static_cast<int>(profile.size()));
    if (hi <= lo) return lo;
    return static_cast<int>(max_element(profile.begin() + lo, profile.begin() + hi) - profile.begin());
}

double rangeMean(const vector<double>& values, int lo, int hi) {
    lo = max(lo, 0);
    hi = min(hi, static_cast<int>(values.size()));
    if (hi <= lo) return 0.0;
    double sum = 0.0;
    for (int i = lo; i < hi; i++) sum += values[i];
    return sum / (hi - lo);
}

// Strongest accepted peak inside the seed band, -1 if none
int pickInBand(const vector<int>& accepted, const vector<double>& gradient, int seed, int band) {
    int best = -1;
    for (int p : accepted) {
        if (abs(p - seed) > band) continue;
        if (best < 0 || gradient[p] > gradient[best]) best = p;
    }
    return best;
}

} // namespace

vector<int> EdgeScanner::scanPositions(int dimension, const Params& params) {
    vector<int> positions;
    const int n = max(1, params.scanlines);
    const double start = dimension * params.scanStart;
    const double end = dimension * params.scanEnd;
    for (int i = 0; i < n; i++) {
        double t = n == 1 ? 0.5 : static_cast<double>(i) / (n - 1);
        int pos = static_cast<int>(start + t * (end - start));
        positions.push_back(min(max(pos, 0), dimension - 1));
    }
    return positions;
}

ProjectionSeeds EdgeScanner::projectionSeeds(const GradientField& field, const Params& params) {
    const int h = field.gradX.rows;
    const int w = field.gradX.cols;

    Mat colMeans, rowMeans;
    reduce(field.gradX, colMeans, 0, REDUCE_AVG, CV_64F);
    reduce(field.gradY, rowMeans, 1, REDUCE_AVG, CV_64F);

    auto smoothed = [&params](const vector<double>& profile, int dim) {
        int k = max(params.minSeedSmoothing, SignalProfile::forceOdd(dim / params.seedSmoothingDivisor));
        return SignalProfile::gaussianSmooth(profile, k);
    };

    vector<double> xProfile = smoothed(SignalProfile::rowOf(colMeans, 0), w);
    vector<double> yProfile = smoothed(SignalProfile::columnOf(rowMeans, 0), h);

    const int wx = max(1, static_cast<int>(w * params.seedWindowFraction));
    const int wy = max(1, static_cast<int>(h * params.seedWindowFraction));

    ProjectionSeeds seeds;
    seeds.left = argmaxIn(xProfile, 0, wx);
    seeds.right = argmaxIn(xProfile, w - wx, w);
    seeds.top = argmaxIn(yProfile, 0, wy);
    seeds.bottom = argmaxIn(yProfile, h - wy, h);
    return seeds;
}

vector<int> EdgeScanner::detectPeaks(const vector<double>& gradient, const Params& params) {
    SignalProfile::PeakOptions options;
    options.minHeight = params.gradientThreshold;
    options.minProminence = params.prominenceRatio * params.gradientThreshold;
    return SignalProfile::findPeaks(gradient, options);
}

vector<int> EdgeScanner::classifyPeaks(const vector<double>& intensity,
                                       const vector<double>& gradient,
                                       const vector<int>& peaks,
                                       bool inwardFromStart,
                                       const BackgroundStats& stats,
                                       const Params& params) {
    vector<int> accepted;
    const int L = static_cast<int>(intensity.size());
    if (L == 0) return accepted;

    // Gradients in dark stretches are boosted, in bright stretches damped
    vector<double> localMean = SignalProfile::movingAverage(intensity, params.localMeanWindow);
    const double globalMean = max(1e-6, SignalProfile::mean(localMean));

    const double sign = inwardFromStart ? 1.0 : -1.0;
    const double paperGap = max(1e-3, stats.paper - stats.darkThreshold);
    const int window = params.contrastWindow;

    for (int p : peaks) {
        if (p < params.borderZone * L || p > (1.0 - params.borderZone) * L) {
            accepted.push_back(p);
            continue;
        }
        if (p < window || p > L - window) {
            continue;
        }

        double before = rangeMean(intensity, p - window, p);
        double after = rangeMean(intensity, p, p + window);
        double contrast = after - before;

        bool polarityOk = sign * contrast > params.polarityRatio * stats.minContrast;
        bool contrastOk = fabs(contrast) / paperGap * 100.0 > params.minRelativeContrast;

        double darkSide = inwardFromStart ? before : after;
        double lightSide = inwardFromStart ? after : before;
        bool darknessOk = darkSide < stats.darkThreshold + params.darkSideRatio * paperGap &&
                          lightSide > params.lightSideRatio * stats.paper;

        double ratio = min(max(localMean[p] / globalMean, params.weightClipLow), params.weightClipHigh);
        bool strengthOk = gradient[p] / ratio >= params.gradientThreshold;

        if (polarityOk && contrastOk && darknessOk && strengthOk) {
            accepted.push_back(p);
        }
    }
    return accepted;
}

ScanResult EdgeScanner::scan(const Mat& image, const GradientField& field, const BackgroundStats& stats,
                             const Params& params, ProcessingObserver* observer) {
    const int h = field.gradY.rows;
    const int w = field.gradY.cols;

    ScanResult result;
    result.seeds = projectionSeeds(field, params);
    result.bandX = max(params.minBand, static_cast<int>(params.bandFraction * w));
    result.bandY = max(params.minBand, static_cast<int>(params.bandFraction * h));
    result.columns = scanPositions(w, params);
    result.rows = scanPositions(h, params);

    cout << "[INFO] Projection seeds: left=" << result.seeds.left << " right=" << result.seeds.right
         << " top=" << result.seeds.top << " bottom=" << result.seeds.bottom << endl;

    // Vertical scanlines cross the top and bottom borders
    for (int x : result.columns) {
        vector<double> intensity = SignalProfile::columnOf(field.blurredV, x);
        vector<double> gradient = SignalProfile::columnOf(field.gradY, x);
        vector<int> peaks = detectPeaks(gradient, params);

        int top = pickInBand(classifyPeaks(intensity, gradient, peaks, true, stats, params),
                             gradient, result.seeds.top, result.bandY);
        int bottom = pickInBand(classifyPeaks(intensity, gradient, peaks, false, stats, params),
                                gradient, result.seeds.bottom, result.bandY);
        if (top >= 0) result.points.top.emplace_back(static_cast<float>(x), static_cast<float>(top));
        if (bottom >= 0) result.points.bottom.emplace_back(static_cast<float>(x), static_cast<float>(bottom));
    }

    // Horizontal scanlines cross the left and right borders
    for (int y : result.rows) {
        vector<double> intensity = SignalProfile::rowOf(field.blurredH, y);
        vector<double> gradient = SignalProfile::rowOf(field.gradX, y);
        vector<int> peaks = detectPeaks(gradient, params);

        int left = pickInBand(classifyPeaks(intensity, gradient, peaks, true, stats, params),
                              gradient, result.seeds.left, result.bandX);
        int right = pickInBand(classifyPeaks(intensity, gradient, peaks, false, stats, params),
                               gradient, result.seeds.right, result.bandX);
        if (left >= 0) result.points.left.emplace_back(static_cast<float>(left), static_cast<float>(y));
        if (right >= 0) result.points.right.emplace_back(static_cast<float>(right), static_cast<float>(y));
    }

    cout << "[INFO] Border points: top=" << result.points.top.size() << " bottom=" << result.points.bottom.size()
         << " left=" << result.points.left.size() << " right=" << result.points.right.size() << endl;

    if (observer) {
        observer->onBorderPoints(image, result.points);
    }
    return result;
}

} // namespace FolioGeom
