#include "FoldLocator.hpp"
#include "ImageIO.hpp"
#include "ProcessingObserver.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

using namespace cv;
using namespace std;

namespace FolioGeom {

FoldLocator::FoldLocator(const Params& params)
    : FoldLocator(params, nullptr) {}

FoldLocator::FoldLocator(const Params& params, ProcessingObserver* observer)
    : params_(params), rng_(params.randomSeed), observer_(observer) {}

double FoldLocator::consistencyScore(double spread, double roiWidth, const Params& params) {
    if (roiWidth <= 0.0) return params.consistencyFloor;
    double relative = spread / roiWidth;
    for (size_t i = 0; i < params.consistencyBands.size(); i++) {
        if (relative <= params.consistencyBands[i]) {
            return params.consistencyScores[i];
        }
    }
    return params.consistencyFloor;
}

FoldSide FoldLocator::detectSide(const Mat& image, const Params& params) {
    Mat gray = ImageIO::toGray(image);
    const int w = gray.cols;
    const int strip = params.sideStripWidth;
    if (w < 2 * (strip + params.sideStripOffset) + strip) {
        return FoldSide::Center;
    }

    double left = mean(gray.colRange(params.sideStripOffset, params.sideStripOffset + strip))[0];
    double right = mean(gray.colRange(w - params.sideStripOffset - strip, w - params.sideStripOffset))[0];
    double center = mean(gray.colRange(w / 2 - strip / 2, w / 2 + strip / 2))[0];

    cout << "[INFO] Fold side brightness: left=" << left << " center=" << center << " right=" << right << endl;

    if (center < left - params.sideCenterContrast && center < right - params.sideCenterContrast) {
        return FoldSide::Center;
    }
    if (fabs(left - right) < params.sideBalance) {
        return FoldSide::Center;
    }
    return left < right ? FoldSide::Left : FoldSide::Right;
}

void FoldLocator::roiForSide(FoldSide side, int width, const Params& params, int& x0, int& x1) {
    switch (side) {
    case FoldSide::Left:
        x0 = 0;
        x1 = static_cast<int>(width * params.sideRoiFraction);
        break;
    case FoldSide::Right:
        x0 = static_cast<int>(width * (1.0 - params.sideRoiFraction));
        x1 = width;
        break;
    case FoldSide::Center:
    default:
        x0 = static_cast<int>(width * params.roiStart);
        x1 = static_cast<int>(width * params.roiEnd);
        break;
    }
}

double FoldLocator::estimateAngle(const Mat& gray, int foldX, const Params& params) {
    const int x0 = max(0, foldX - params.angleHalfWidth);
    const int x1 = min(gray.cols, foldX + params.angleHalfWidth + 1);
    if (x1 - x0 < 3 || gray.rows < 2 * params.angleRowStep) {
        return 0.0;
    }

    vector<double> ys, xs;
    for (int y = 0; y < gray.rows; y += max(1, params.angleRowStep)) {
        Mat row = gray.row(y).colRange(x0, x1);
        Point minLoc;
        minMaxLoc(row, nullptr, nullptr, &minLoc, nullptr);
        ys.push_back(y);
        xs.push_back(x0 + minLoc.x);
    }

    // Least-squares x = a*y + b; a is the tangent of the inclination
    double my = SignalProfile::mean(ys);
    double mx = SignalProfile::mean(xs);
    double syy = 0.0, sxy = 0.0;
    for (size_t i = 0; i < ys.size(); i++) {
        syy += (ys[i] - my) * (ys[i] - my);
        sxy += (ys[i] - my) * (xs[i] - mx);
    }
    if (syy <= 0.0) return 0.0;
    return atan(sxy / syy) * 180.0 / CV_PI;
}

FoldEstimate FoldLocator::locate(const Mat& image) {
    int x0 = 0, x1 = 0;
    roiForSide(FoldSide::Center, image.cols, params_, x0, x1);
    return locate(image, x0, x1);
}

FoldEstimate FoldLocator::locate(const Mat& image, int roiStartX, int roiEndX) {
    FoldEstimate estimate;
    if (image.empty()) {
        cout << "[WARN] Fold detection skipped on an empty image" << endl;
        return estimate;
    }

    const int w = image.cols;
    int x0 = min(max(roiStartX, 0), w - 1);
    int x1 = min(max(roiEndX, x0 + 1), w);
    estimate.x = (x0 + x1) / 2;
    estimate.xSubPixel = estimate.x;

    try {
        Mat gray = ImageIO::toGray(image);
        Mat blurred;
        int k = SignalProfile::forceOdd(max(1, params_.blurKernel));
        GaussianBlur(gray, blurred, Size(k, k), 0);

        estimate = locateInRoi(blurred, x0, x1);
        if (estimate.method != FoldMethod::Unavailable) {
            estimate.angleDeg = estimateAngle(blurred, estimate.x, params_);
        }
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] Fold detection failed: " << e.what() << endl;
        estimate = FoldEstimate();
        estimate.x = (x0 + x1) / 2;
        estimate.xSubPixel = estimate.x;
        estimate.status = Status::InsufficientData;
    }

    cout << "[INFO] Fold at x=" << estimate.x << " confidence " << estimate.confidence << " ("
         << foldMethodName(estimate.method) << ", " << estimate.minimaCount << " minima)" << endl;

    if (observer_) {
        observer_->onFold(image, estimate);
    }
    return estimate;
}

FoldEstimate FoldLocator::locateInRoi(const Mat& gray, int x0, int x1) {
    FoldEstimate estimate;
    const int h = gray.rows;
    const int roiW = x1 - x0;
    estimate.x = (x0 + x1) / 2;
    estimate.xSubPixel = estimate.x;

    if (roiW < 2 * params_.minSmoothingKernel + 3 || h < 3) {
        cout << "[WARN] Fold search strip of " << roiW << "x" << h << " px is too small" << endl;
        estimate.status = Status::InsufficientData;
        return estimate;
    }

    Mat roi;
    gray(Rect(x0, 0, roiW, h)).convertTo(roi, CV_64F);

    const int smoothK = max(params_.minSmoothingKernel,
                            SignalProfile::forceOdd(static_cast<int>(lround(gray.cols * params_.smoothingFraction))));
    const int iterations = max(1, params_.iterations);

    // Disjoint random row partition, one part per iteration
    vector<int> order(h);
    iota(order.begin(), order.end(), 0);
    randShuffle(order, 1.0, &rng_);

    vector<double> accumulated(roiW, 0.0);
    vector<double> positions;

    for (int it = 0; it < iterations; it++) {
        size_t begin = static_cast<size_t>(it) * h / iterations;
        size_t end = static_cast<size_t>(it + 1) * h / iterations;
        vector<int> rows(order.begin() + begin, order.begin() + end);
        if (rows.empty()) {
            rows.assign(order.begin(), order.end());
        }
        if (rows.size() > static_cast<size_t>(params_.rowsPerIteration)) {
            rows.resize(params_.rowsPerIteration);
        }

        vector<double> rowMeans;
        for (int r : rows) rowMeans.push_back(mean(roi.row(r))[0]);
        double mu = SignalProfile::mean(rowMeans);
        double sd = SignalProfile::stddev(rowMeans);

        vector<int> kept;
        for (size_t i = 0; i < rows.size(); i++) {
            if (sd <= 0.0 || fabs(rowMeans[i] - mu) <= params_.rowRejectSigma * sd) {
                kept.push_back(rows[i]);
            }
        }
        if (kept.empty()) kept = rows;

        vector<double> enhanced(roiW, 0.0);
        for (int c = 0; c < roiW; c++) {
            double sum = 0.0, sq = 0.0;
            for (int r : kept) {
                double v = roi.at<double>(r, c);
                sum += v;
                sq += v * v;
            }
            double m = sum / kept.size();
            double var = max(0.0, sq / kept.size() - m * m);
            enhanced[c] = m + sqrt(var);
        }

        vector<double> detrended = SignalProfile::detrendLinear(enhanced);
        for (int c = 0; c < roiW; c++) accumulated[c] += detrended[c];

        vector<double> smoothed = SignalProfile::gaussianSmooth(detrended, smoothK);
        auto [lo, hi] = minmax_element(smoothed.begin(), smoothed.end());
        if (*hi - *lo < params_.minProminence) {
            continue;
        }

        int idx = static_cast<int>(lo - smoothed.begin());
        double vertex = idx;
        if (!SignalProfile::parabolaVertex(smoothed, idx - params_.parabolaHalfWindow,
                                           idx + params_.parabolaHalfWindow, vertex)) {
            vertex = idx;
        }
        positions.push_back(vertex);
    }

    vector<double> profile(roiW);
    for (int c = 0; c < roiW; c++) profile[c] = accumulated[c] / iterations;
    profile = SignalProfile::gaussianSmooth(profile, smoothK);

    if (observer_) {
        observer_->onProfile("fold_profile", profile);
    }

    SignalProfile::PeakOptions options;
    options.minProminence = max(params_.prominenceSigma * SignalProfile::stddev(profile), params_.minProminence);
    options.minDistance = max(1, static_cast<int>(params_.minPeakSpacing * roiW));
    vector<int> minima = SignalProfile::findPeaks(SignalProfile::negate(profile), options);
    estimate.minimaCount = static_cast<int>(minima.size());

    const double center = (roiW - 1) / 2.0;
    double position = center;
    double base = params_.fallbackScore;

    if (minima.size() == 1) {
        int idx = minima[0];
        position = idx;
        double vertex = 0.0;
        if (SignalProfile::parabolaVertex(profile, idx - params_.parabolaHalfWindow,
                                          idx + params_.parabolaHalfWindow, vertex)) {
            position = vertex;
        }
        base = params_.singleMinimumScore;
        estimate.method = FoldMethod::SingleMinimum;
    } else if (minima.size() >= 2 && minima.size() <= 3) {
        int nearest = *min_element(minima.begin(), minima.end(), [center](int a, int b) {
            return fabs(a - center) < fabs(b - center);
        });
        position = nearest;
        base = params_.fewMinimaScore;
        estimate.method = FoldMethod::NearestToCenter;
    } else {
        if (!positions.empty()) {
            position = SignalProfile::mean(positions);
        }
        base = params_.fallbackScore;
        estimate.method = FoldMethod::IterationMean;
    }

    estimate.iterationSpread = SignalProfile::stddev(positions);
    double consistency = positions.size() < 2 ? params_.consistencyFloor
                                              : consistencyScore(estimate.iterationSpread, roiW, params_);
    double quality = (base + consistency) / 2.0;

    if (quality >= params_.variabilityGate) {
        const double half = params_.variabilityExclusion * roiW / 2.0;
        vector<double> outside;
        for (int c = 0; c < roiW; c++) {
            if (fabs(c - position) > half) outside.push_back(profile[c]);
        }
        double variability = SignalProfile::stddev(outside);
        if (variability > params_.variabilityThreshold) {
            quality -= variability / params_.variabilityDivisor;
        }
    }

    estimate.confidence = min(max(quality, 0.0), 1.0);
    estimate.xSubPixel = x0 + position;
    estimate.x = min(max(static_cast<int>(lround(estimate.xSubPixel)), x0), x1 - 1);
    estimate.status = estimate.confidence >= params_.qualityThreshold ? Status::Ok : Status::LowConfidence;
    return estimate;
}

} // namespace FolioGeom
