#include "PerspectiveCorrector.hpp"
#include "ProcessingObserver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace FolioGeom {

Mat PerspectiveCorrector::rotationMatrix(const Point2f& center, double angleDeg, const Size& imageSize,
                                         Size& canvasSize) {
    Mat M = getRotationMatrix2D(center, angleDeg, 1.0);

    vector<Point2f> corners = {
        Point2f(0.f, 0.f),
        Point2f(static_cast<float>(imageSize.width), 0.f),
        Point2f(static_cast<float>(imageSize.width), static_cast<float>(imageSize.height)),
        Point2f(0.f, static_cast<float>(imageSize.height))
    };
    vector<Point2f> moved;
    cv::transform(corners, moved, M);

    float minX = moved[0].x, maxX = moved[0].x, minY = moved[0].y, maxY = moved[0].y;
    for (const auto& p : moved) {
        minX = min(minX, p.x);
        maxX = max(maxX, p.x);
        minY = min(minY, p.y);
        maxY = max(maxY, p.y);
    }

    M.at<double>(0, 2) -= minX;
    M.at<double>(1, 2) -= minY;
    canvasSize = Size(static_cast<int>(ceil(maxX - minX)), static_cast<int>(ceil(maxY - minY)));
    return M;
}

Point2d PerspectiveCorrector::apply(const Mat& transform, const Point2d& p) {
    const double* r0 = transform.ptr<double>(0);
    const double* r1 = transform.ptr<double>(1);
    return Point2d(r0[0] * p.x + r0[1] * p.y + r0[2], r1[0] * p.x + r1[1] * p.y + r1[2]);
}

Point2d PerspectiveCorrector::toOriginal(const Mat& transform, const Point2d& p) {
    Mat inverse;
    invertAffineTransform(transform, inverse);
    return apply(inverse, p);
}

void PerspectiveCorrector::foldLineToOriginal(const Mat& transform, double foldX, int correctedHeight,
                                              Point2d& top, Point2d& bottom) {
    Mat inverse;
    invertAffineTransform(transform, inverse);
    top = apply(inverse, Point2d(foldX, 0.0));
    bottom = apply(inverse, Point2d(foldX, static_cast<double>(correctedHeight)));
}

CorrectionResult PerspectiveCorrector::correct(const Mat& image, const PageContour& contour, int margin,
                                               double backgroundIntensity, const Params& params,
                                               ProcessingObserver* observer) {
    if (image.empty()) {
        throw invalid_argument("Cannot correct an empty image");
    }
    if (!contour.found()) {
        throw invalid_argument("Perspective correction requires a four-corner page contour");
    }

    CorrectionResult result;
    result.angleDeg = contour.angleDeg;

    RotatedRect pageRect = minAreaRect(contour.corners);
    Point2f rectPoints[4];
    pageRect.points(rectPoints);
    vector<Point2f> pageBox(rectPoints, rectPoints + 4);

    result.unrotatedBox = expandRect(boundingRect(pageBox), max(margin, 0), image.size());
    if (result.unrotatedBox.area() > 0) {
        result.unrotatedCrop = image(result.unrotatedBox).clone();
    }

    Mat rotated;
    if (fabs(contour.angleDeg) < params.minAngle) {
        cout << "[INFO] Skew " << contour.angleDeg << " deg below " << params.minAngle << ", skipping rotation" << endl;
        result.status = Status::DegenerateTransform;
        result.rotation = Mat::eye(2, 3, CV_64F);
        result.canvasSize = image.size();
        rotated = image;
        result.validMask = Mat(image.size(), CV_8UC1, Scalar(255));
    } else {
        cout << "[INFO] Rotating page by " << contour.angleDeg << " deg about (" << pageRect.center.x
             << ", " << pageRect.center.y << ")" << endl;
        result.rotation = rotationMatrix(pageRect.center, contour.angleDeg, image.size(), result.canvasSize);
        warpAffine(image, rotated, result.rotation, result.canvasSize, params.interpolation, BORDER_CONSTANT, Scalar::all(0));

        // Rotate an all-white mask the same way so padding never passes for dark content
        Mat white(image.size(), CV_8UC1, Scalar(255));
        warpAffine(white, result.validMask, result.rotation, result.canvasSize, INTER_NEAREST, BORDER_CONSTANT, Scalar(0));
        Mat padding;
        bitwise_not(result.validMask, padding);
        rotated.setTo(Scalar::all(0), padding);
        result.rotated = true;
    }

    cv::transform(contour.corners, result.rotatedCorners, result.rotation);

    Rect canvasRect(0, 0, result.canvasSize.width, result.canvasSize.height);
    result.cropBox = canvasRect;

    if (margin > 0) {
        Rect border;
        if (params.useIrregularBorder) {
            border = IrregularBorderFinder::find(rotated, result.rotatedCorners, backgroundIntensity, params.border);
        }
        if (border.area() > 0) {
            result.irregularBorderUsed = true;
        } else {
            cout << "[INFO] Using the rotated page box for cropping" << endl;
            border = clampRect(boundingRect(result.rotatedCorners), result.canvasSize);
        }

        Rect crop = expandRect(border, margin, result.canvasSize);
        if (crop.area() > 0) {
            result.cropBox = crop;
            result.cropped = crop != canvasRect;
        } else {
            cout << "[WARN] Crop box is empty, keeping the whole canvas" << endl;
        }
    } else {
        cout << "[INFO] Rotation-only mode, no crop applied" << endl;
    }

    result.transform = result.rotation.clone();
    result.transform.at<double>(0, 2) -= result.cropBox.x;
    result.transform.at<double>(1, 2) -= result.cropBox.y;

    result.image = rotated(result.cropBox).clone();
    result.validMask = result.validMask(result.cropBox).clone();

    cout << "[INFO] Corrected image: " << result.image.cols << " x " << result.image.rows
         << " (canvas " << result.canvasSize.width << " x " << result.canvasSize.height << ")" << endl;

    if (observer) {
        observer->onImage("corrected", result.image);
    }
    return result;
}

} // namespace FolioGeom
