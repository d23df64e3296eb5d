#include "BackgroundEstimator.hpp"
#include "SyntheticImages.hpp"
#include <gtest/gtest.h>

using namespace FolioGeom;
using namespace cv;

TEST(BackgroundEstimatorTest, SeparatesPaperFromBackground) {
    Mat img = Synthetic::rectanglePage(Size(800, 600), 50, 200, Rect(80, 60, 640, 480));
    BackgroundStats stats = BackgroundEstimator::estimate(img, BackgroundEstimator::Params());

    EXPECT_DOUBLE_EQ(stats.dark, 50.0);
    EXPECT_DOUBLE_EQ(stats.paper, 200.0);
    EXPECT_DOUBLE_EQ(stats.contrastSpan, 150.0);
    EXPECT_NEAR(stats.minContrast, 22.5, 1e-9);
    EXPECT_NEAR(stats.darkThreshold, 147.5, 1e-9);
}

TEST(BackgroundEstimatorTest, UniformImageKeepsUnitSpan) {
    Mat img = Synthetic::uniform(Size(300, 300), 128);
    BackgroundStats stats = BackgroundEstimator::estimate(img, BackgroundEstimator::Params());

    EXPECT_DOUBLE_EQ(stats.contrastSpan, 1.0);
    EXPECT_DOUBLE_EQ(stats.minContrast, 8.0);
}

TEST(BackgroundEstimatorTest, RejectsEmptyImage) {
    EXPECT_THROW(BackgroundEstimator::estimate(Mat(), BackgroundEstimator::Params()), std::invalid_argument);
}
