#include "GradientFieldBuilder.hpp"
#include "ImageIO.hpp"
#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace cv;
using namespace std;

namespace FolioGeom {

int GradientFieldBuilder::largeKernelSize(int dimension, const Params& params) {
    int k = SignalProfile::forceOdd(max(1, dimension / max(1, params.largeKernelDivisor)));
    return max(SignalProfile::forceOdd(params.minLargeKernel), k);
}

GradientField GradientFieldBuilder::build(const Mat& image, const Params& params) {
    if (image.empty()) {
        throw invalid_argument("Cannot build gradient field of an empty image");
    }

    Mat gray = ImageIO::toGray(image);
    const int h = gray.rows;
    const int w = gray.cols;

    const int ky = largeKernelSize(h, params);
    const int kx = largeKernelSize(w, params);
    const int ks = SignalProfile::forceOdd(max(params.smallKernel, 3));

    Mat longY = getGaussianKernel(ky, ky / params.sigmaDivisor, CV_64F);
    Mat longX = getGaussianKernel(kx, kx / params.sigmaDivisor, CV_64F);
    Mat shortK = getGaussianKernel(ks, ks / params.sigmaDivisor, CV_64F);

    GradientField field;
    sepFilter2D(gray, field.blurredV, -1, shortK, longY);
    sepFilter2D(gray, field.blurredH, -1, longX, shortK);

    Mat gy, gx;
    Sobel(field.blurredV, gy, CV_64F, 0, 1, params.sobelAperture);
    Sobel(field.blurredH, gx, CV_64F, 1, 0, params.sobelAperture);
    field.gradY = cv::abs(gy);
    field.gradX = cv::abs(gx);

    cout << "[INFO] Gradient field built with kernels " << kx << "x" << ks << " / " << ks << "x" << ky << endl;
    return field;
}

} // namespace FolioGeom
