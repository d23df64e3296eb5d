#include "IrregularBorderFinder.hpp"
#include "Geometry.hpp"
#include "ImageIO.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>

using namespace cv;
using namespace std;

namespace FolioGeom {

int IrregularBorderFinder::blurKernelSize(const Size& cropSize, const Params& params) {
    int k = min(cropSize.width, cropSize.height) / max(1, params.blurDivisor);
    return SignalProfile::forceOdd(max(params.minBlurKernel, k));
}

Mat IrregularBorderFinder::similarityMask(const Mat& gray, double backgroundIntensity, double subjectIntensity) {
    Mat g;
    gray.convertTo(g, CV_32F);
    Mat toBackground = cv::abs(g - backgroundIntensity);
    Mat toSubject = cv::abs(g - subjectIntensity);

    Mat mask;
    compare(toSubject, toBackground, mask, CMP_LT);
    return mask;
}

Rect IrregularBorderFinder::find(const Mat& image, const vector<Point2f>& box, double backgroundIntensity,
                                 const Params& params) {
    Mat unused;
    return find(image, box, backgroundIntensity, params, unused);
}

Rect IrregularBorderFinder::find(const Mat& image, const vector<Point2f>& box, double backgroundIntensity,
                                 const Params& params, Mat& contentMask) {
    if (image.empty() || box.empty()) {
        return Rect();
    }

    Rect pageBox = boundingRect(box);
    Rect region = expandRect(pageBox, params.cropMargin, image.size());
    if (region.area() <= 0) {
        cout << "[WARN] Page box lies outside the image, no irregular border" << endl;
        return Rect();
    }

    Mat gray = ImageIO::toGray(image)(region);
    int k = blurKernelSize(region.size(), params);
    Mat blurred;
    GaussianBlur(gray, blurred, Size(k, k), 0);

    // Subject sample: the page box as seen inside the crop
    Rect subjectBox = clampRect(Rect(pageBox.x - region.x, pageBox.y - region.y, pageBox.width, pageBox.height),
                                region.size());
    if (subjectBox.area() <= 0) {
        return Rect();
    }
    double subjectIntensity = mean(blurred(subjectBox))[0];

    contentMask = similarityMask(blurred, backgroundIntensity, subjectIntensity);
    vector<Point> content;
    findNonZero(contentMask, content);
    if (content.empty()) {
        cout << "[WARN] Similarity mask is empty (subject " << subjectIntensity
             << ", background " << backgroundIntensity << ")" << endl;
        return Rect();
    }

    Rect found = boundingRect(content);
    found.x += region.x;
    found.y += region.y;
    return clampRect(found, image.size());
}

} // namespace FolioGeom
