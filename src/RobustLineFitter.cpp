#include "RobustLineFitter.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace FolioGeom {

namespace {

// Splits points into (independent, dependent) coordinates for the chosen orientation
void splitCoordinates(const vector<Point2f>& points, bool vertical, vector<double>& u, vector<double>& v) {
    u.resize(points.size());
    v.resize(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        u[i] = vertical ? points[i].y : points[i].x;
        v[i] = vertical ? points[i].x : points[i].y;
    }
}

bool leastSquares(const vector<double>& u, const vector<double>& v, const vector<bool>& mask,
                  double& slope, double& intercept) {
    double su = 0.0, sv = 0.0;
    size_t n = 0;
    for (size_t i = 0; i < u.size(); i++) {
        if (!mask[i]) continue;
        su += u[i];
        sv += v[i];
        n++;
    }
    if (n < 2) return false;

    double mu = su / n;
    double mv = sv / n;
    double suu = 0.0, suv = 0.0;
    for (size_t i = 0; i < u.size(); i++) {
        if (!mask[i]) continue;
        suu += (u[i] - mu) * (u[i] - mu);
        suv += (u[i] - mu) * (v[i] - mv);
    }
    if (suu < 1e-12) return false;

    slope = suv / suu;
    intercept = mv - slope * mu;
    return true;
}

BorderLine toBorderLine(double slope, double intercept, bool vertical) {
    BorderLine line;
    if (vertical) {
        // x = m*y + q  ->  x - m*y - q = 0
        line.a = 1.0;
        line.b = -slope;
        line.c = -intercept;
    } else {
        // y = m*x + q  ->  m*x - y + q = 0
        line.a = slope;
        line.b = -1.0;
        line.c = intercept;
    }
    line.valid = true;
    return line;
}

} // namespace

RansacLineStrategy::RansacLineStrategy(RNG rng)
    : RansacLineStrategy(rng, Params()) {}

RansacLineStrategy::RansacLineStrategy(RNG rng, const Params& params)
    : rng_(rng), params_(params) {}

BorderLine RansacLineStrategy::fit(const vector<Point2f>& points, bool vertical, double residualThreshold) {
    lastTrials_ = 0;
    const int n = static_cast<int>(points.size());
    if (n < 2) {
        return BorderLine();
    }

    vector<double> u, v;
    splitCoordinates(points, vertical, u, v);

    vector<bool> bestMask;
    size_t bestCount = 0;
    double bestResidual = numeric_limits<double>::infinity();
    int maxTrials = params_.maxTrials;

    for (int trial = 0; trial < maxTrials; trial++) {
        lastTrials_ = trial + 1;

        int i = rng_.uniform(0, n);
        int j = rng_.uniform(0, n - 1);
        if (j >= i) j++;
        if (fabs(u[j] - u[i]) < 1e-9) {
            continue;
        }

        double m = (v[j] - v[i]) / (u[j] - u[i]);
        double q = v[i] - m * u[i];

        vector<bool> mask(n, false);
        size_t count = 0;
        double residualSum = 0.0;
        for (int k = 0; k < n; k++) {
            double r = fabs(v[k] - (m * u[k] + q));
            if (r <= residualThreshold) {
                mask[k] = true;
                count++;
                residualSum += r;
            }
        }

        if (count > bestCount || (count == bestCount && residualSum < bestResidual)) {
            bestCount = count;
            bestResidual = residualSum;
            bestMask.swap(mask);

            double inlierRatio = static_cast<double>(bestCount) / n;
            if (inlierRatio >= 1.0) {
                break;
            }
            double needed = log(1.0 - params_.stopProbability) / log(1.0 - inlierRatio * inlierRatio);
            if (std::isfinite(needed)) {
                maxTrials = min(maxTrials, max(trial + 1, static_cast<int>(ceil(needed))));
            }
        }
    }

    double slope = 0.0, intercept = 0.0;
    if (bestCount < 2 || !leastSquares(u, v, bestMask, slope, intercept)) {
        return BorderLine();
    }

    BorderLine line = toBorderLine(slope, intercept, vertical);
    line.inliers = bestMask;
    return line;
}

BorderLine TrimmedLeastSquaresStrategy::fit(const vector<Point2f>& points, bool vertical, double residualThreshold) {
    if (points.size() < 2) {
        return BorderLine();
    }

    Vec4f fitted;
    fitLine(points, fitted, DIST_L2, 0, 0.01, 0.01);
    const double vx = fitted[0], vy = fitted[1], x0 = fitted[2], y0 = fitted[3];

    BorderLine line;
    line.a = vy;
    line.b = -vx;
    line.c = vx * y0 - vy * x0;
    line.valid = true;

    vector<double> residuals(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        residuals[i] = line.distance(points[i]);
    }
    double cutoff = SignalProfile::percentile(residuals, params_.inlierQuantile);

    line.inliers.resize(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        line.inliers[i] = residuals[i] <= cutoff;
    }
    return line;
}

RobustLineFitter::RobustLineFitter(unique_ptr<RobustFitStrategy> strategy)
    : RobustLineFitter(std::move(strategy), Params()) {}

RobustLineFitter::RobustLineFitter(unique_ptr<RobustFitStrategy> strategy, const Params& params)
    : strategy_(std::move(strategy)), params_(params) {
    if (!strategy_) {
        throw invalid_argument("RobustLineFitter requires a fit strategy");
    }
}

double RobustLineFitter::residualThreshold(const Size& imageSize, const Params& params) {
    double scale = max(imageSize.width, imageSize.height) / params.referenceSize;
    return max(params.minResidualThreshold, params.residualScale * scale);
}

bool RobustLineFitter::isVerticalSet(const vector<Point2f>& points) {
    if (points.empty()) return false;

    double mx = 0.0, my = 0.0;
    for (const auto& p : points) { mx += p.x; my += p.y; }
    mx /= points.size();
    my /= points.size();

    double vx = 0.0, vy = 0.0;
    for (const auto& p : points) {
        vx += (p.x - mx) * (p.x - mx);
        vy += (p.y - my) * (p.y - my);
    }
    return vx < vy;
}

unique_ptr<RobustFitStrategy> RobustLineFitter::makeStrategy(FitStrategyKind kind, uint64_t seed) {
    if (kind == FitStrategyKind::TrimmedLeastSquares) {
        return make_unique<TrimmedLeastSquaresStrategy>();
    }
    return make_unique<RansacLineStrategy>(RNG(seed));
}

LineFitResult RobustLineFitter::fit(const vector<Point2f>& points, const Size& imageSize) {
    LineFitResult result;
    result.residualThreshold = residualThreshold(imageSize, params_);

    if (points.size() < params_.minPoints) {
        result.status = Status::InsufficientData;
        return result;
    }

    result.vertical = isVerticalSet(points);
    result.line = strategy_->fit(points, result.vertical, result.residualThreshold);
    result.status = result.line.valid ? Status::Ok : Status::InsufficientData;

    if (!result.line.valid) {
        cout << "[WARN] " << strategy_->name() << " line fit failed on " << points.size() << " points" << endl;
    }
    return result;
}

} // namespace FolioGeom
