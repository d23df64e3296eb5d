#include "SyntheticImages.hpp"
#include "ThresholdEstimator.hpp"
#include <gtest/gtest.h>

using namespace FolioGeom;
using namespace cv;

TEST(ThresholdEstimatorTest, BlurKernelIsOddAndClamped) {
    ThresholdEstimator::Params params;
    EXPECT_EQ(ThresholdEstimator::blurKernelSize(Size(800, 600), params), 13);
    EXPECT_EQ(ThresholdEstimator::blurKernelSize(Size(100, 100), params), 3);
    EXPECT_EQ(ThresholdEstimator::blurKernelSize(Size(8000, 6000), params), 51);
}

TEST(ThresholdEstimatorTest, SeparatesBrightPageFromDarkBackground) {
    Mat img = Synthetic::rectanglePage(Size(800, 600), 50, 200, Rect(80, 60, 640, 480));
    ThresholdResult result = ThresholdEstimator::estimate(img, ThresholdEstimator::Params());

    EXPECT_DOUBLE_EQ(result.borderGray, 50.0);
    EXPECT_DOUBLE_EQ(result.centerGray, 200.0);
    EXPECT_NEAR(result.threshold, 140.0, 1e-9);

    ASSERT_EQ(result.mask.size(), img.size());
    EXPECT_EQ(result.mask.at<uchar>(300, 400), 255);
    EXPECT_EQ(result.mask.at<uchar>(5, 5), 0);
    EXPECT_EQ(result.mask.at<uchar>(590, 790), 0);
}

TEST(ThresholdEstimatorTest, DarkPageOnLightBackgroundIsInverted) {
    Mat img = Synthetic::rectanglePage(Size(800, 600), 220, 60, Rect(80, 60, 640, 480));
    ThresholdResult result = ThresholdEstimator::estimate(img, ThresholdEstimator::Params());
    EXPECT_EQ(result.mask.at<uchar>(300, 400), 255);
    EXPECT_EQ(result.mask.at<uchar>(5, 5), 0);
}

TEST(ThresholdEstimatorTest, FillsEnclosedHoles) {
    Mat img = Synthetic::rectanglePage(Size(800, 600), 50, 200, Rect(80, 60, 640, 480));
    img(Rect(560, 420, 40, 30)).setTo(Scalar(50));

    ThresholdResult result = ThresholdEstimator::estimate(img, ThresholdEstimator::Params());
    EXPECT_EQ(result.mask.at<uchar>(435, 580), 255);

    ThresholdEstimator::Params noFill;
    noFill.fillHoles = false;
    ThresholdResult raw = ThresholdEstimator::estimate(img, noFill);
    EXPECT_EQ(raw.mask.at<uchar>(435, 580), 0);
}

TEST(ThresholdEstimatorTest, BorderColorAveragesCornerPatches) {
    Mat img(200, 300, CV_8UC3, Scalar(10, 20, 30));
    img(Rect(50, 50, 200, 100)).setTo(Scalar(250, 250, 250));
    Scalar color = ThresholdEstimator::borderColor(img, 3);
    EXPECT_DOUBLE_EQ(color[0], 10.0);
    EXPECT_DOUBLE_EQ(color[1], 20.0);
    EXPECT_DOUBLE_EQ(color[2], 30.0);

    ThresholdResult result = ThresholdEstimator::estimate(img, ThresholdEstimator::Params());
    EXPECT_NEAR(result.borderGray, 0.114 * 10 + 0.587 * 20 + 0.299 * 30, 1e-9);
}
