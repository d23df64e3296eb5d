#include "SignalProfile.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>

using namespace cv;
using namespace std;

namespace FolioGeom {

vector<int> SignalProfile::findPeaks(const vector<double>& signal, const PeakOptions& options) {
    const int n = static_cast<int>(signal.size());
    vector<int> candidates;

    int i = 1;
    while (i < n - 1) {
        if (signal[i - 1] < signal[i]) {
            int ahead = i + 1;
            while (ahead < n - 1 && signal[ahead] == signal[i]) {
                ++ahead;
            }
            if (signal[ahead] < signal[i]) {
                candidates.push_back((i + ahead - 1) / 2);
                i = ahead;
                continue;
            }
        }
        ++i;
    }

    vector<int> peaks;
    for (int p : candidates) {
        if (signal[p] < options.minHeight) continue;
        if (options.minProminence > 0.0 && peakProminence(signal, p) < options.minProminence) continue;
        peaks.push_back(p);
    }

    if (options.minDistance > 1 && peaks.size() > 1) {
        // Keep the highest peaks first, dropping neighbours that are too close
        vector<int> order(peaks.size());
        iota(order.begin(), order.end(), 0);
        sort(order.begin(), order.end(), [&](int l, int r) { return signal[peaks[l]] > signal[peaks[r]]; });

        vector<bool> keep(peaks.size(), true);
        for (int idx : order) {
            if (!keep[idx]) continue;
            for (size_t j = 0; j < peaks.size(); ++j) {
                if (static_cast<int>(j) != idx && keep[j] && abs(peaks[j] - peaks[idx]) < options.minDistance) {
                    keep[j] = false;
                }
            }
        }

        vector<int> spaced;
        for (size_t j = 0; j < peaks.size(); ++j) {
            if (keep[j]) spaced.push_back(peaks[j]);
        }
        peaks.swap(spaced);
    }

    return peaks;
}

double SignalProfile::peakProminence(const vector<double>& signal, int peak) {
    const int n = static_cast<int>(signal.size());
    const double height = signal[peak];

    double leftMin = height;
    for (int i = peak; i >= 0; --i) {
        if (signal[i] > height) break;
        leftMin = min(leftMin, signal[i]);
    }

    double rightMin = height;
    for (int i = peak; i < n; ++i) {
        if (signal[i] > height) break;
        rightMin = min(rightMin, signal[i]);
    }

    return height - max(leftMin, rightMin);
}

vector<double> SignalProfile::negate(const vector<double>& signal) {
    vector<double> out(signal.size());
    transform(signal.begin(), signal.end(), out.begin(), [](double v) { return -v; });
    return out;
}

vector<double> SignalProfile::movingAverage(const vector<double>& signal, int window) {
    const int n = static_cast<int>(signal.size());
    if (window <= 1 || n == 0) {
        return signal;
    }

    const int half = window / 2;
    vector<double> out(n);
    for (int i = 0; i < n; ++i) {
        double sum = 0.0;
        for (int k = -half; k < window - half; ++k) {
            int idx = min(max(i + k, 0), n - 1);
            sum += signal[idx];
        }
        out[i] = sum / window;
    }
    return out;
}

vector<double> SignalProfile::gaussianSmooth(const vector<double>& signal, int kernelSize, double sigma) {
    if (signal.empty() || kernelSize <= 1) {
        return signal;
    }

    Mat row(1, static_cast<int>(signal.size()), CV_64F);
    for (size_t i = 0; i < signal.size(); ++i) {
        row.at<double>(0, static_cast<int>(i)) = signal[i];
    }

    Mat smoothed;
    GaussianBlur(row, smoothed, Size(forceOdd(kernelSize), 1), sigma, 0, BORDER_REFLECT);
    return rowOf(smoothed, 0);
}

vector<double> SignalProfile::detrendLinear(const vector<double>& signal) {
    const size_t n = signal.size();
    if (n < 2) {
        return signal;
    }

    double meanX = (n - 1) / 2.0;
    double meanY = mean(signal);
    double sxy = 0.0;
    double sxx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - meanX;
        sxy += dx * (signal[i] - meanY);
        sxx += dx * dx;
    }
    double slope = sxx > 0.0 ? sxy / sxx : 0.0;
    double intercept = meanY - slope * meanX;

    vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = signal[i] - (slope * static_cast<double>(i) + intercept);
    }
    return out;
}

bool SignalProfile::parabolaVertex(const vector<double>& signal, int lo, int hi, double& vertex) {
    lo = max(lo, 0);
    hi = min(hi, static_cast<int>(signal.size()) - 1);
    if (hi - lo < 2) {
        return false;
    }

    // Normal equations for y = a*t^2 + b*t + c with t centered on the window
    double center = (lo + hi) / 2.0;
    array<double, 5> sx{};
    array<double, 3> sy{};
    for (int i = lo; i <= hi; ++i) {
        double t = i - center;
        double tp = 1.0;
        for (int k = 0; k < 5; ++k) {
            sx[k] += tp;
            if (k < 3) sy[k] += tp * signal[i];
            tp *= t;
        }
    }

    Matx33d A(sx[4], sx[3], sx[2],
              sx[3], sx[2], sx[1],
              sx[2], sx[1], sx[0]);
    Vec3d rhs(sy[2], sy[1], sy[0]);
    Vec3d coeffs;
    if (!solve(A, rhs, coeffs, DECOMP_SVD)) {
        return false;
    }

    double a = coeffs[0];
    double b = coeffs[1];
    if (!(a > 1e-12)) {
        return false;
    }

    double v = center - b / (2.0 * a);
    if (!std::isfinite(v) || v < lo || v > hi) {
        return false;
    }
    vertex = v;
    return true;
}

double SignalProfile::mean(const vector<double>& values) {
    if (values.empty()) return 0.0;
    return accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double SignalProfile::stddev(const vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double m = mean(values);
    double acc = 0.0;
    for (double v : values) acc += (v - m) * (v - m);
    return sqrt(acc / values.size());
}

double SignalProfile::median(vector<double> values) {
    return percentile(std::move(values), 50.0);
}

double SignalProfile::percentile(vector<double> values, double q) {
    if (values.empty()) return 0.0;
    sort(values.begin(), values.end());
    double pos = min(max(q, 0.0), 100.0) / 100.0 * (values.size() - 1);
    size_t lo = static_cast<size_t>(floor(pos));
    size_t hi = min(lo + 1, values.size() - 1);
    double frac = pos - lo;
    return values[lo] + (values[hi] - values[lo]) * frac;
}

double SignalProfile::percentile(const Mat& image, double q) {
    if (image.empty()) return 0.0;

    if (image.type() == CV_8UC1) {
        // Order statistics straight from the histogram
        array<size_t, 256> hist{};
        for (int y = 0; y < image.rows; ++y) {
            const uchar* row = image.ptr<uchar>(y);
            for (int x = 0; x < image.cols; ++x) {
                hist[row[x]]++;
            }
        }

        const size_t total = image.total();
        double pos = min(max(q, 0.0), 100.0) / 100.0 * (total - 1);
        size_t lo = static_cast<size_t>(floor(pos));
        size_t hi = min(lo + 1, total - 1);

        auto valueAt = [&hist](size_t rank) {
            size_t seen = 0;
            for (int v = 0; v < 256; ++v) {
                seen += hist[v];
                if (seen > rank) return static_cast<double>(v);
            }
            return 255.0;
        };

        double vlo = valueAt(lo);
        double vhi = valueAt(hi);
        return vlo + (vhi - vlo) * (pos - lo);
    }

    Mat flat;
    image.convertTo(flat, CV_64F);
    return percentile(vector<double>(flat.begin<double>(), flat.end<double>()), q);
}

vector<double> SignalProfile::rowOf(const Mat& image, int row) {
    Mat r;
    image.row(row).convertTo(r, CV_64F);
    return vector<double>(r.begin<double>(), r.end<double>());
}

vector<double> SignalProfile::columnOf(const Mat& image, int col) {
    Mat c;
    image.col(col).convertTo(c, CV_64F);
    return vector<double>(c.begin<double>(), c.end<double>());
}

} // namespace FolioGeom
