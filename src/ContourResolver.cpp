#include "ContourResolver.hpp"
#include "ImageIO.hpp"
#include "ProcessingObserver.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace FolioGeom {

namespace {

const BorderSide kSides[] = {BorderSide::Top, BorderSide::Bottom, BorderSide::Left, BorderSide::Right};

struct WeightedStats {
    double mean = 0.0;
    double deviation = 0.0;
};

WeightedStats weightedStats(const vector<double>& values, const vector<double>& weights) {
    WeightedStats stats;
    double wsum = 0.0;
    for (size_t i = 0; i < values.size(); i++) {
        stats.mean += weights[i] * values[i];
        wsum += weights[i];
    }
    if (wsum <= 0.0) return stats;
    stats.mean /= wsum;

    double var = 0.0;
    for (size_t i = 0; i < values.size(); i++) {
        var += weights[i] * (values[i] - stats.mean) * (values[i] - stats.mean);
    }
    stats.deviation = sqrt(var / wsum);
    return stats;
}

} // namespace

ContourResolver::ContourResolver(const Params& params, unique_ptr<RobustFitStrategy> strategy)
    : ContourResolver(params, std::move(strategy), nullptr) {}

ContourResolver::ContourResolver(const Params& params, unique_ptr<RobustFitStrategy> strategy,
                                 ProcessingObserver* observer)
    : params_(params), fitter_(std::move(strategy), params.fitter), observer_(observer) {}

double ContourResolver::sideInclination(const Point2f& p1, const Point2f& p2) {
    double angle = atan2(p2.y - p1.y, p2.x - p1.x) * 180.0 / CV_PI;
    while (angle > 45.0) angle -= 90.0;
    while (angle <= -45.0) angle += 90.0;
    return angle;
}

bool ContourResolver::quadFromLines(const array<BorderLine, 4>& lines, const Size& imageSize,
                                    const Params& params, vector<Point2f>& quad) {
    const BorderLine& top = lines[sideIndex(BorderSide::Top)];
    const BorderLine& bottom = lines[sideIndex(BorderSide::Bottom)];
    const BorderLine& left = lines[sideIndex(BorderSide::Left)];
    const BorderLine& right = lines[sideIndex(BorderSide::Right)];

    Point2f tl, tr, br, bl;
    if (!intersectLines(top, left, tl) || !intersectLines(top, right, tr) ||
        !intersectLines(bottom, right, br) || !intersectLines(bottom, left, bl)) {
        cout << "[WARN] Border lines are parallel or missing, cannot intersect" << endl;
        return false;
    }

    vector<Point2f> candidate = {tl, tr, br, bl};

    const float mx = static_cast<float>(params.maxCornerOverflow * imageSize.width);
    const float my = static_cast<float>(params.maxCornerOverflow * imageSize.height);
    for (const auto& c : candidate) {
        if (c.x < -mx || c.y < -my || c.x > imageSize.width + mx || c.y > imageSize.height + my) {
            cout << "[WARN] Intersected corner (" << c.x << ", " << c.y << ") lies outside the image" << endl;
            return false;
        }
    }

    if (!isContourConvex(candidate)) {
        cout << "[WARN] Intersected quadrilateral is not convex" << endl;
        return false;
    }

    Rect box = boundingRect(candidate);
    if (box.width < params.minCoverage * imageSize.width || box.height < params.minCoverage * imageSize.height) {
        cout << "[WARN] Quadrilateral covers only " << box.width << "x" << box.height << " of "
             << imageSize.width << "x" << imageSize.height << ", rejecting" << endl;
        return false;
    }

    quad = candidate;
    return true;
}

vector<Point2f> ContourResolver::polygonFallback(const Mat& pageMask, const Params& params) {
    vector<Point2f> quad;
    if (pageMask.empty()) {
        return quad;
    }

    Mat dilated;
    Mat kernel = getStructuringElement(MORPH_RECT, Size(params.dilateKernel, params.dilateKernel));
    dilate(pageMask, dilated, kernel, Point(-1, -1), params.dilateIterations);

    vector<vector<Point>> contours;
    findContours(dilated, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);
    if (contours.empty()) {
        cout << "[WARN] Page mask has no contours" << endl;
        return quad;
    }

    auto largest = max_element(contours.begin(), contours.end(),
                               [](const vector<Point>& a, const vector<Point>& b) {
                                   return contourArea(a) < contourArea(b);
                               });

    vector<Point> approx;
    double epsilon = params.polygonEpsilon * arcLength(*largest, true);
    approxPolyDP(*largest, approx, epsilon, true);

    if (approx.size() != 4) {
        cout << "[WARN] Largest contour approximates to " << approx.size() << " vertices, rejecting" << endl;
        return quad;
    }

    for (const auto& p : approx) {
        quad.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
    }
    return quad;
}

SkewEstimate ContourResolver::estimateSkew(const Mat& image, const vector<Point2f>& quad, const Params& params) {
    SkewEstimate skew;
    if (quad.size() != 4) {
        return skew;
    }

    Mat gray = ImageIO::toGray(image);
    vector<Point> poly;
    for (const auto& p : quad) poly.emplace_back(cvRound(p.x), cvRound(p.y));

    Mat inside = Mat::zeros(gray.size(), CV_8UC1);
    fillConvexPoly(inside, poly, Scalar(255));
    Mat outside;
    bitwise_not(inside, outside);

    double insideMean = mean(gray, inside)[0];
    double outsideMean = countNonZero(outside) > 0 ? mean(gray, outside)[0] : 0.0;

    vector<double> angles;
    vector<double> weights;
    for (size_t i = 0; i < 4; i++) {
        const Point2f& p1 = quad[i];
        const Point2f& p2 = quad[(i + 1) % 4];

        LineIterator it(gray, poly[i], poly[(i + 1) % 4], 8);
        if (it.count <= 0) continue;
        double sum = 0.0;
        for (int k = 0; k < it.count; k++, ++it) {
            sum += gray.at<uchar>(it.pos());
        }
        double sideMean = sum / it.count;

        angles.push_back(sideInclination(p1, p2));
        bool interiorLike = fabs(sideMean - insideMean) <= fabs(sideMean - outsideMean);
        weights.push_back(interiorLike ? params.insideWeight : params.outsideWeight);
    }

    if (angles.empty()) {
        return skew;
    }

    WeightedStats stats = weightedStats(angles, weights);
    skew.sidesUsed = static_cast<int>(angles.size());

    // Drop sides that disagree with the weighted consensus
    vector<double> keptAngles;
    vector<double> keptWeights;
    for (size_t i = 0; i < angles.size(); i++) {
        if (fabs(angles[i] - stats.mean) <= params.outlierSigma * stats.deviation + 1e-9) {
            keptAngles.push_back(angles[i]);
            keptWeights.push_back(weights[i]);
        }
    }
    if (keptAngles.size() >= 2 && keptAngles.size() < angles.size()) {
        stats = weightedStats(keptAngles, keptWeights);
        skew.sidesUsed = static_cast<int>(keptAngles.size());
    }

    skew.angleDeg = stats.mean;
    skew.deviation = stats.deviation;
    if (fabs(skew.angleDeg) < skew.deviation) {
        skew.angleDeg = 0.0;
    }
    return skew;
}

ContourResult ContourResolver::resolve(const Mat& image) {
    return resolve(image, Mat());
}

ContourResult ContourResolver::resolve(const Mat& image, const Mat& pageMask) {
    if (image.empty()) {
        throw invalid_argument("Cannot resolve the contour of an empty image");
    }

    ContourResult result;
    Mat gray = ImageIO::toGray(image);
    const Size size = gray.size();
    vector<Point2f> quad;

    if (params_.useGradientMethod) {
        cout << "[INFO] Resolving page contour from border gradients" << endl;
        GradientField field = GradientFieldBuilder::build(gray, params_.gradient);
        BackgroundStats stats = BackgroundEstimator::estimate(gray, params_.background);
        ScanResult scan = EdgeScanner::scan(gray, field, stats, params_.scanner, observer_);
        result.points = scan.points;

        for (BorderSide side : kSides) {
            auto& pts = result.points.side(side);
            if (!EdgeRecoveryEngine::needsRecovery(pts, params_.recovery)) continue;

            bool horizontal = side == BorderSide::Top || side == BorderSide::Bottom;
            int band = horizontal ? scan.bandY : scan.bandX;
            cout << "[WARN] Only " << pts.size() << " points on " << borderSideName(side) << " border" << endl;
            vector<Point2f> recovered = EdgeRecoveryEngine::recover(gray, side, result.points, band, params_.recovery);
            if (recovered.size() > pts.size()) {
                pts = recovered;
                result.recoveryUsed = true;
            }
        }

        bool allLines = true;
        for (BorderSide side : kSides) {
            LineFitResult fit = fitter_.fit(result.points.side(side), size);
            result.lines[sideIndex(side)] = fit.line;
            if (fit.status != Status::Ok) {
                cout << "[WARN] No line for " << borderSideName(side) << " border: " << statusName(fit.status) << endl;
                allLines = false;
            } else if (observer_) {
                observer_->onBorderLine(side, fit.line);
            }
        }

        if (allLines && quadFromLines(result.lines, size, params_, quad)) {
            result.method = ContourMethod::Gradient;
        } else {
            quad.clear();
        }
    }

    if (quad.empty()) {
        cout << "[INFO] Falling back to polygon approximation of the page mask" << endl;
        Mat mask = pageMask.empty() ? ThresholdEstimator::estimate(image, params_.threshold).mask : pageMask;
        quad = polygonFallback(mask, params_);
        if (!quad.empty()) {
            result.method = ContourMethod::Polygon;
        }
    }

    if (quad.size() == 4) {
        result.contour.corners = orderCorners(quad);
        result.skew = estimateSkew(gray, result.contour.corners, params_);
        result.contour.angleDeg = result.skew.angleDeg;
        result.status = Status::Ok;
        cout << "[INFO] Page contour found by " << contourMethodName(result.method) << " method, skew "
             << result.contour.angleDeg << " deg (sd " << result.skew.deviation << ")" << endl;
    } else {
        result.contour.clear();
        result.method = ContourMethod::None;
        result.status = Status::GeometryRejected;
        cout << "[WARN] No page contour found" << endl;
    }

    if (observer_) {
        observer_->onContour(image, result.contour, result.method);
    }
    return result;
}

} // namespace FolioGeom
