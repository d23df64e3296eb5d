#include "PageProcessor.hpp"
#include "ProcessingObserver.hpp"
#include "ThresholdEstimator.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace FolioGeom {

PageProcessor::PageProcessor(const Params& params)
    : PageProcessor(params, nullptr) {}

PageProcessor::PageProcessor(const Params& params, ProcessingObserver* observer)
    : params_(params), observer_(observer) {}

double PageProcessor::processingScale(const Size& size, int maxSide) {
    int longer = max(size.width, size.height);
    if (maxSide <= 0 || longer <= maxSide) return 1.0;
    return static_cast<double>(maxSide) / longer;
}

int PageProcessor::availableBorder(const Rect& box, const Size& imageSize) {
    int left = box.x;
    int top = box.y;
    int right = imageSize.width - (box.x + box.width);
    int bottom = imageSize.height - (box.y + box.height);
    return max(0, min(min(left, right), min(top, bottom)));
}

PageResult PageProcessor::process(const LoadedImage& input) {
    return process(input.pixels, input.dpiX, input.dpiY);
}

PageResult PageProcessor::process(const Mat& image, double dpiX, double dpiY) {
    if (image.empty()) {
        throw invalid_argument("Cannot process an empty image");
    }

    PageResult result;
    result.image = image;
    result.transform = Mat::eye(2, 3, CV_64F);

    if (observer_) {
        observer_->onImage("input", image);
    }

    // Step 1: contour detection on a downscaled copy
    const double scale = processingScale(image.size(), params_.maxProcessingSize);
    Mat small = image;
    if (scale < 1.0) {
        resize(image, small, Size(), scale, scale, INTER_AREA);
        cout << "[INFO] Contour detection at " << small.cols << " x " << small.rows << " (scale " << scale << ")" << endl;
    }

    ThresholdResult threshold = ThresholdEstimator::estimate(small, params_.contour.threshold);
    if (observer_) {
        observer_->onImage("page_mask", threshold.mask);
    }

    ContourResolver resolver(params_.contour, RobustLineFitter::makeStrategy(params_.fitStrategy, params_.randomSeed),
                             observer_);
    ContourResult contour = resolver.resolve(small, threshold.mask);
    result.method = contour.method;

    if (!contour.contour.found()) {
        cout << "[WARN] No page contour, returning the original image" << endl;
        result.status = contour.status;
        return result;
    }

    result.contour.angleDeg = contour.contour.angleDeg;
    for (const auto& p : contour.contour.corners) {
        result.contour.corners.push_back(Point2f(static_cast<float>(p.x / scale), static_cast<float>(p.y / scale)));
    }

    // Step 2: well framed pages are passed through
    result.coverage = result.contour.area() / (static_cast<double>(image.cols) * image.rows);
    const Rect pageBox = result.contour.boundingBox();
    Size pageSize = pageBox.size();

    if (result.coverage >= params_.coverageThreshold) {
        cout << "[INFO] Page covers " << result.coverage * 100.0 << "% of the image, skipping correction" << endl;
    } else {
        // Step 3: straighten, cropping only when the scan leaves enough border
        int available = availableBorder(pageBox, image.size());
        int margin = 0;
        if (available < params_.minBorderThreshold) {
            cout << "[WARN] Available border " << available << " px below " << params_.minBorderThreshold
                 << " px, rotation only" << endl;
        } else {
            margin = min(params_.contourBorder, available);
            if (margin < params_.contourBorder) {
                cout << "[WARN] Border reduced from " << params_.contourBorder << " px to " << margin << " px" << endl;
            }
        }

        result.correction = PerspectiveCorrector::correct(image, result.contour, margin, threshold.borderGray,
                                                          params_.correction, observer_);
        result.borderUsed = margin;
        result.image = result.correction.image;
        result.transform = result.correction.transform.clone();
        result.corrected = true;
        pageSize = boundingRect(result.correction.rotatedCorners).size();
    }
    result.status = Status::Ok;

    // Step 4: format decides whether a fold is expected
    result.format = FormatClassifier::classify(pageSize.width, pageSize.height, dpiX, dpiY, params_.format);
    if (FormatClassifier::isFoldCandidate(result.format) || params_.forceFold) {
        locateFold(result);
    } else {
        cout << "[INFO] Single page, no fold detection" << endl;
    }

    if (params_.evaluateQuality && result.corrected) {
        result.quality = QualityEvaluator::evaluate(result.correction.unrotatedCrop, result.image, params_.quality);
    }
    return result;
}

void PageProcessor::locateFold(PageResult& result) {
    const Mat& page = result.image;
    result.foldSide = params_.autoDetectSide ? FoldLocator::detectSide(page, params_.fold) : params_.foldSide;
    cout << "[INFO] Fold side: " << foldSideName(result.foldSide) << endl;

    int x0 = 0, x1 = 0;
    FoldLocator::roiForSide(result.foldSide, page.cols, params_.fold, x0, x1);

    FoldLocator locator(params_.fold, observer_);
    result.fold = locator.locate(page, x0, x1);
    result.foldEvaluated = true;
    result.needsReview = result.fold.status != Status::Ok;

    if (result.fold.method == FoldMethod::Unavailable) {
        cout << "[WARN] Fold could not be located, page left unsplit" << endl;
        return;
    }
    if (result.needsReview) {
        cout << "[WARN] Fold confidence " << result.fold.confidence << " below "
             << params_.fold.qualityThreshold << ", flagged for review" << endl;
    }

    PerspectiveCorrector::foldLineToOriginal(result.transform, result.fold.xSubPixel, page.rows,
                                             result.foldTop, result.foldBottom);

    if (params_.splitPages) {
        result.split = DocumentSplitter::split(page, result.fold.x, result.foldSide, params_.split);
        if (observer_) {
            if (result.split.hasLeft()) observer_->onImage("split_left", result.split.left);
            if (result.split.hasRight()) observer_->onImage("split_right", result.split.right);
        }
    }
}

} // namespace FolioGeom
