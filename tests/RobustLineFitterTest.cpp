#include "RobustLineFitter.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace FolioGeom;
using namespace cv;
using namespace std;

namespace {

// y = 0.05 x + 100 with noise in [-1.5, 1.5]
vector<Point2f> noisyHorizontalLine(int count, RNG& rng) {
    vector<Point2f> points;
    for (int i = 0; i < count; i++) {
        float x = 20.0f * i;
        float y = 0.05f * x + 100.0f + static_cast<float>(rng.uniform(-1.5, 1.5));
        points.emplace_back(x, y);
    }
    return points;
}

size_t coveredInliers(const BorderLine& line, const vector<Point2f>& points, size_t inlierCount, double threshold) {
    size_t covered = 0;
    for (size_t i = 0; i < inlierCount; i++) {
        if (line.distance(points[i]) <= threshold) covered++;
    }
    return covered;
}

} // namespace

TEST(RobustLineFitterTest, ResidualThresholdScalesWithImage) {
    RobustLineFitter::Params params;
    EXPECT_DOUBLE_EQ(RobustLineFitter::residualThreshold(Size(600, 400), params), 3.0);
    EXPECT_DOUBLE_EQ(RobustLineFitter::residualThreshold(Size(3000, 4000), params), 40.0);
}

TEST(RobustLineFitterTest, RansacIgnoresOutliers) {
    RNG rng(1234);
    vector<Point2f> points = noisyHorizontalLine(51, rng);
    const size_t inliers = points.size();
    for (int i = 0; i < 10; i++) {
        points.emplace_back(95.0f * i + 10.0f, 300.0f + 20.0f * i);
    }

    RobustLineFitter fitter(RobustLineFitter::makeStrategy(FitStrategyKind::Ransac, 7));
    LineFitResult result = fitter.fit(points, Size(1000, 800));

    ASSERT_EQ(result.status, Status::Ok);
    EXPECT_FALSE(result.vertical);
    EXPECT_DOUBLE_EQ(result.residualThreshold, 10.0);
    EXPECT_GE(coveredInliers(result.line, points, inliers, result.residualThreshold), inliers * 8 / 10);

    // Outliers are far above the line and must be flagged
    ASSERT_EQ(result.line.inliers.size(), points.size());
    for (size_t i = inliers; i < points.size(); i++) {
        EXPECT_FALSE(result.line.inliers[i]);
    }
    EXPECT_NEAR(-result.line.a / result.line.b, 0.05, 0.01);
}

TEST(RobustLineFitterTest, TrimmedLeastSquaresCoversNoisyLine) {
    RNG rng(99);
    vector<Point2f> points = noisyHorizontalLine(40, rng);
    const size_t inliers = points.size();
    points.emplace_back(400.0f, 160.0f);
    points.emplace_back(400.0f, 80.0f);

    RobustLineFitter fitter(RobustLineFitter::makeStrategy(FitStrategyKind::TrimmedLeastSquares, 0));
    EXPECT_STREQ(fitter.strategy().name(), "trimmed-least-squares");

    LineFitResult result = fitter.fit(points, Size(1000, 800));
    ASSERT_EQ(result.status, Status::Ok);
    EXPECT_GE(coveredInliers(result.line, points, inliers, result.residualThreshold), inliers * 8 / 10);
    EXPECT_FALSE(result.line.inliers[inliers]);
    EXPECT_FALSE(result.line.inliers[inliers + 1]);
}

TEST(RobustLineFitterTest, VerticalSetUsesXOfY) {
    vector<Point2f> points;
    for (int i = 0; i < 20; i++) {
        float y = 30.0f * i;
        points.emplace_back(300.0f + 0.02f * y, y);
    }
    ASSERT_TRUE(RobustLineFitter::isVerticalSet(points));

    RobustLineFitter fitter(RobustLineFitter::makeStrategy(FitStrategyKind::Ransac, 3));
    LineFitResult result = fitter.fit(points, Size(800, 600));
    ASSERT_EQ(result.status, Status::Ok);
    EXPECT_TRUE(result.vertical);
    EXPECT_DOUBLE_EQ(result.line.a, 1.0);
    EXPECT_NEAR(result.line.distance(Point2f(310.0f, 500.0f)), 0.0, 1e-3);
    EXPECT_EQ(result.line.inlierCount(), points.size());
}

TEST(RobustLineFitterTest, TooFewPointsIsInsufficientData) {
    RobustLineFitter fitter(RobustLineFitter::makeStrategy(FitStrategyKind::Ransac, 1));
    LineFitResult result = fitter.fit({Point2f(0, 0), Point2f(10, 1)}, Size(100, 100));
    EXPECT_EQ(result.status, Status::InsufficientData);
    EXPECT_FALSE(result.line.valid);
}

TEST(RobustLineFitterTest, CoincidentPointsCannotDefineALine) {
    RobustLineFitter fitter(RobustLineFitter::makeStrategy(FitStrategyKind::Ransac, 1));
    vector<Point2f> points(6, Point2f(50.0f, 50.0f));
    LineFitResult result = fitter.fit(points, Size(100, 100));
    EXPECT_EQ(result.status, Status::InsufficientData);
}

TEST(RobustLineFitterTest, RequiresStrategy) {
    EXPECT_THROW({ RobustLineFitter fitter(nullptr); }, std::invalid_argument);
}

TEST(RobustLineFitterTest, RansacIsReproducibleForAFixedSeed) {
    RNG rng(5);
    vector<Point2f> points = noisyHorizontalLine(30, rng);
    points.emplace_back(100.0f, 400.0f);

    RobustLineFitter first(RobustLineFitter::makeStrategy(FitStrategyKind::Ransac, 11));
    RobustLineFitter second(RobustLineFitter::makeStrategy(FitStrategyKind::Ransac, 11));
    LineFitResult a = first.fit(points, Size(800, 600));
    LineFitResult b = second.fit(points, Size(800, 600));
    EXPECT_DOUBLE_EQ(a.line.a, b.line.a);
    EXPECT_DOUBLE_EQ(a.line.c, b.line.c);
    EXPECT_EQ(a.line.inliers, b.line.inliers);
}
