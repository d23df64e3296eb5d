#include "SignalProfile.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace FolioGeom;
using namespace std;

TEST(SignalProfileTest, FindsIsolatedPeaks) {
    vector<double> signal = {0, 1, 5, 1, 0, 0, 2, 8, 2, 0};
    vector<int> peaks = SignalProfile::findPeaks(signal, SignalProfile::PeakOptions());
    ASSERT_EQ(peaks.size(), 2u);
    EXPECT_EQ(peaks[0], 2);
    EXPECT_EQ(peaks[1], 7);
}

TEST(SignalProfileTest, PlateauReportsMiddleSample) {
    vector<double> signal = {0, 3, 3, 3, 0};
    vector<int> peaks = SignalProfile::findPeaks(signal, SignalProfile::PeakOptions());
    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_EQ(peaks[0], 2);
}

TEST(SignalProfileTest, ProminenceFilterDropsRipples) {
    vector<double> signal = {0, 10, 9, 9.5, 9, 0};
    SignalProfile::PeakOptions options;
    options.minProminence = 2.0;
    vector<int> peaks = SignalProfile::findPeaks(signal, options);
    ASSERT_EQ(peaks.size(), 1u);
    EXPECT_EQ(peaks[0], 1);
    EXPECT_DOUBLE_EQ(SignalProfile::peakProminence(signal, 3), 0.5);
}

TEST(SignalProfileTest, DistanceFilterKeepsHighestPeak) {
    vector<double> signal = {0, 4, 0, 9, 0, 0, 0, 0, 0, 3, 0};
    SignalProfile::PeakOptions options;
    options.minDistance = 4;
    vector<int> peaks = SignalProfile::findPeaks(signal, options);
    ASSERT_EQ(peaks.size(), 2u);
    EXPECT_EQ(peaks[0], 3);
    EXPECT_EQ(peaks[1], 9);
}

TEST(SignalProfileTest, DetrendRemovesLinearRamp) {
    vector<double> ramp;
    for (int i = 0; i < 50; i++) ramp.push_back(3.0 + 0.5 * i);
    vector<double> flat = SignalProfile::detrendLinear(ramp);
    for (double v : flat) {
        EXPECT_NEAR(v, 0.0, 1e-9);
    }
}

TEST(SignalProfileTest, ParabolaVertexIsSubPixel) {
    vector<double> signal;
    for (int i = 0; i < 40; i++) {
        double t = i - 17.3;
        signal.push_back(2.0 * t * t + 5.0);
    }
    double vertex = 0.0;
    ASSERT_TRUE(SignalProfile::parabolaVertex(signal, 10, 25, vertex));
    EXPECT_NEAR(vertex, 17.3, 1e-6);
}

TEST(SignalProfileTest, ParabolaVertexRejectsDownwardCurve) {
    vector<double> signal;
    for (int i = 0; i < 20; i++) {
        double t = i - 10.0;
        signal.push_back(-t * t);
    }
    double vertex = -1.0;
    EXPECT_FALSE(SignalProfile::parabolaVertex(signal, 0, 19, vertex));
    EXPECT_DOUBLE_EQ(vertex, -1.0);
}

TEST(SignalProfileTest, PercentileInterpolates) {
    vector<double> values = {4, 1, 3, 2};
    EXPECT_DOUBLE_EQ(SignalProfile::percentile(values, 0), 1.0);
    EXPECT_DOUBLE_EQ(SignalProfile::percentile(values, 100), 4.0);
    EXPECT_DOUBLE_EQ(SignalProfile::percentile(values, 50), 2.5);
    EXPECT_DOUBLE_EQ(SignalProfile::median({5, 1, 3}), 3.0);
}

TEST(SignalProfileTest, ImagePercentileMatchesVectorPercentile) {
    cv::Mat img(4, 4, CV_8UC1);
    for (int i = 0; i < 16; i++) img.at<uchar>(i / 4, i % 4) = static_cast<uchar>(i * 10);
    vector<double> values;
    for (int i = 0; i < 16; i++) values.push_back(i * 10);
    EXPECT_DOUBLE_EQ(SignalProfile::percentile(img, 25), SignalProfile::percentile(values, 25));
    EXPECT_DOUBLE_EQ(SignalProfile::percentile(img, 90), SignalProfile::percentile(values, 90));
}

TEST(SignalProfileTest, SmoothingKeepsConstantSignal) {
    vector<double> constant(30, 7.0);
    for (double v : SignalProfile::gaussianSmooth(constant, 5)) EXPECT_NEAR(v, 7.0, 1e-9);
    for (double v : SignalProfile::movingAverage(constant, 4)) EXPECT_NEAR(v, 7.0, 1e-9);
}

TEST(SignalProfileTest, StatsOnSmallSets) {
    EXPECT_DOUBLE_EQ(SignalProfile::mean({}), 0.0);
    EXPECT_DOUBLE_EQ(SignalProfile::stddev({3.0}), 0.0);
    EXPECT_DOUBLE_EQ(SignalProfile::stddev({1.0, 3.0}), 1.0);
    EXPECT_EQ(SignalProfile::forceOdd(4), 5);
    EXPECT_EQ(SignalProfile::forceOdd(7), 7);
}
