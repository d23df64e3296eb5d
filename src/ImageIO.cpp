#include "ImageIO.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace cv;
using namespace std;

namespace FolioGeom {

LoadedImage ImageIO::loadImage(const string& path, double dpiX, double dpiY) {
    if (path.empty()) {
        throw invalid_argument("Image path cannot be empty");
    }

    cout << "[INFO] Loading image from: " << path << endl;
    Mat img = imread(path, IMREAD_COLOR);
    if (img.empty()) {
        cerr << "[ERROR] Could not load image from " << path << endl;
        cerr << "[ERROR] Please check that the file exists and is a valid image format" << endl;
        throw runtime_error("Failed to load image: " + path);
    }

    if (img.rows < kMinImageSide || img.cols < kMinImageSide) {
        throw runtime_error("Image too small (minimum " + to_string(kMinImageSide) + "x" +
                            to_string(kMinImageSide) + " pixels required)");
    }

    LoadedImage loaded;
    loaded.pixels = img;
    loaded.dpiX = dpiX > 0.0 ? dpiX : 0.0;
    loaded.dpiY = dpiY > 0.0 ? dpiY : loaded.dpiX;

    cout << "[INFO] Image loaded successfully. Shape: " << img.rows << " x " << img.cols;
    if (loaded.hasDpi()) {
        cout << " at " << loaded.dpiX << "x" << loaded.dpiY << " DPI";
    }
    cout << endl;
    return loaded;
}

Mat ImageIO::toGray(const Mat& image) {
    if (image.channels() == 1) {
        return image;
    }
    Mat gray;
    if (image.channels() == 4) {
        cvtColor(image, gray, COLOR_BGRA2GRAY);
    } else {
        cvtColor(image, gray, COLOR_BGR2GRAY);
    }
    return gray;
}

bool ImageIO::saveImage(const string& path, const Mat& image, int jpegQuality) {
    if (path.empty() || image.empty()) {
        cerr << "[ERROR] Nothing to save for path '" << path << "'" << endl;
        return false;
    }

    vector<int> flags = {IMWRITE_JPEG_QUALITY, jpegQuality};
    bool ok = false;
    try {
        ok = imwrite(path, image, flags);
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] OpenCV could not encode " << path << ": " << e.what() << endl;
        return false;
    }
    if (ok) {
        cout << "[INFO] Saved image: " << path << " (" << image.cols << " x " << image.rows << ")" << endl;
    } else {
        cerr << "[ERROR] Failed to write image: " << path << endl;
    }
    return ok;
}

bool ImageIO::isReadableImage(const string& path) {
    if (path.empty()) return false;
    return haveImageReader(path);
}

} // namespace FolioGeom
