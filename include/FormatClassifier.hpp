#pragma once

#include "Geometry.hpp"
#include <vector>

namespace FolioGeom {

struct FormatSpec {
    PageFormat format;
    double widthCm;    // Portrait width
    double heightCm;   // Portrait height
};

class FormatClassifier {
public:
    struct Params {
        double sizeTolerance = 0.05;     // Relative tolerance on physical size and ratio
        double aspectTolerance = 0.03;   // Ratio-only fallback against 42 : 29.7
        double squareTolerance = 0.02;   // |ratio - 1| below this is square
        bool excludeA4Landscape = true;
    };

    static const std::vector<FormatSpec>& standardFormats();
    static Orientation orientationOf(int widthPx, int heightPx, const Params& params);

    // dpiX / dpiY <= 0 means the physical size is unknown
    static DocumentFormat classify(int widthPx, int heightPx, double dpiX, double dpiY, const Params& params);

    // Landscape A3 sheets hold two facing pages and get fold detection
    static bool isFoldCandidate(const DocumentFormat& format);
};

} // namespace FolioGeom
