#include "FormatClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace std;

namespace FolioGeom {

namespace {

constexpr double kCmPerInch = 2.54;
constexpr double kA3Landscape = 42.0 / 29.7;

} // namespace

const vector<FormatSpec>& FormatClassifier::standardFormats() {
    static const vector<FormatSpec> formats = {
        {PageFormat::A3, 29.7, 42.0},
        {PageFormat::A4, 21.0, 29.7},
        {PageFormat::A5, 14.8, 21.0},
        {PageFormat::Letter, 21.6, 27.9},
        {PageFormat::Legal, 21.6, 35.6},
        {PageFormat::Tabloid, 27.9, 43.2},
    };
    return formats;
}

Orientation FormatClassifier::orientationOf(int widthPx, int heightPx, const Params& params) {
    if (widthPx <= 0 || heightPx <= 0) return Orientation::Portrait;
    double ratio = static_cast<double>(widthPx) / heightPx;
    if (fabs(ratio - 1.0) < params.squareTolerance) return Orientation::Square;
    return widthPx > heightPx ? Orientation::Landscape : Orientation::Portrait;
}

DocumentFormat FormatClassifier::classify(int widthPx, int heightPx, double dpiX, double dpiY, const Params& params) {
    DocumentFormat result;
    if (widthPx <= 0 || heightPx <= 0) {
        return result;
    }
    result.orientation = orientationOf(widthPx, heightPx, params);

    if (dpiX > 0.0 && dpiY > 0.0) {
        result.widthCm = widthPx / dpiX * kCmPerInch;
        result.heightCm = heightPx / dpiY * kCmPerInch;
        const double longCm = max(result.widthCm, result.heightCm);
        const double shortCm = min(result.widthCm, result.heightCm);

        for (const auto& spec : standardFormats()) {
            if (spec.format == PageFormat::A4 && params.excludeA4Landscape &&
                result.orientation == Orientation::Landscape) {
                continue;
            }

            double dl = fabs(longCm - spec.heightCm) / spec.heightCm;
            double ds = fabs(shortCm - spec.widthCm) / spec.widthCm;
            double expectedRatio = spec.heightCm / spec.widthCm;
            double dr = fabs(longCm / shortCm - expectedRatio) / expectedRatio;
            double worst = max(dl, max(ds, dr));
            if (worst > params.sizeTolerance) continue;

            double confidence = 1.0 - worst / params.sizeTolerance;
            if (confidence > result.confidence || !result.byPhysicalSize) {
                result.format = spec.format;
                result.confidence = confidence;
                result.byPhysicalSize = true;
            }
        }

        if (result.byPhysicalSize) {
            cout << "[INFO] Format " << pageFormatName(result.format) << " " << orientationName(result.orientation)
                 << " from physical size " << result.widthCm << " x " << result.heightCm << " cm" << endl;
            return result;
        }
    }

    // Without a usable resolution only a landscape A3 spread can be told apart
    if (result.orientation == Orientation::Landscape) {
        double ratio = static_cast<double>(widthPx) / heightPx;
        double diff = fabs(ratio - kA3Landscape) / kA3Landscape;
        if (diff <= params.aspectTolerance) {
            result.format = PageFormat::A3;
            result.confidence = 1.0 - diff / params.aspectTolerance;
            cout << "[INFO] Format A3 landscape from aspect ratio " << ratio << endl;
            return result;
        }
    }

    cout << "[INFO] Format unknown for " << widthPx << " x " << heightPx << " px" << endl;
    return result;
}

bool FormatClassifier::isFoldCandidate(const DocumentFormat& format) {
    return format.format == PageFormat::A3 && format.orientation == Orientation::Landscape;
}

} // namespace FolioGeom
