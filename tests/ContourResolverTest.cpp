#include "ContourResolver.hpp"
#include "PerspectiveCorrector.hpp"
#include "SyntheticImages.hpp"
#include "ThresholdEstimator.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace FolioGeom;
using namespace cv;
using namespace std;

namespace {

ContourResolver makeResolver(const ContourResolver::Params& params) {
    return ContourResolver(params, RobustLineFitter::makeStrategy(FitStrategyKind::Ransac, 42));
}

} // namespace

TEST(ContourResolverTest, SideInclinationFoldsToNearestAxis) {
    EXPECT_NEAR(ContourResolver::sideInclination(Point2f(0, 0), Point2f(100, 0)), 0.0, 1e-9);
    EXPECT_NEAR(ContourResolver::sideInclination(Point2f(100, 0), Point2f(100, 100)), 0.0, 1e-9);
    EXPECT_NEAR(ContourResolver::sideInclination(Point2f(100, 100), Point2f(0, 100)), 0.0, 1e-9);

    double angle = 5.0 * CV_PI / 180.0;
    Point2f dir(static_cast<float>(cos(angle)), static_cast<float>(sin(angle)));
    EXPECT_NEAR(ContourResolver::sideInclination(Point2f(0, 0), dir * 100.0f), 5.0, 1e-3);
    // The right side of the same page points down and folds to the same inclination
    Point2f down(-dir.y, dir.x);
    EXPECT_NEAR(ContourResolver::sideInclination(Point2f(0, 0), down * 100.0f), 5.0, 1e-3);
}

TEST(ContourResolverTest, AxisAlignedRectangleCorners) {
    Mat img = Synthetic::rectanglePage(Size(800, 600), 50, 200, Rect(80, 60, 640, 480));
    ContourResolver resolver = makeResolver(ContourResolver::Params());
    ContourResult result = resolver.resolve(img);

    ASSERT_EQ(result.status, Status::Ok);
    EXPECT_EQ(result.method, ContourMethod::Gradient);
    ASSERT_EQ(result.contour.corners.size(), 4u);

    const Point2f expected[4] = {Point2f(80, 60), Point2f(719, 60), Point2f(719, 539), Point2f(80, 539)};
    for (int i = 0; i < 4; i++) {
        EXPECT_NEAR(result.contour.corners[i].x, expected[i].x, 3.0) << "corner " << i;
        EXPECT_NEAR(result.contour.corners[i].y, expected[i].y, 3.0) << "corner " << i;
    }
    EXPECT_NEAR(result.contour.angleDeg, 0.0, 0.1);
    EXPECT_FALSE(result.recoveryUsed);
}

TEST(ContourResolverTest, PolygonFallbackOnPageMask) {
    Mat img = Synthetic::rectanglePage(Size(800, 600), 50, 200, Rect(80, 60, 640, 480));
    ContourResolver::Params params;
    params.useGradientMethod = false;

    ContourResolver resolver = makeResolver(params);
    ContourResult result = resolver.resolve(img);

    ASSERT_EQ(result.status, Status::Ok);
    EXPECT_EQ(result.method, ContourMethod::Polygon);
    ASSERT_TRUE(result.contour.found());

    const Point2f expected[4] = {Point2f(80, 60), Point2f(719, 60), Point2f(719, 539), Point2f(80, 539)};
    for (int i = 0; i < 4; i++) {
        EXPECT_NEAR(result.contour.corners[i].x, expected[i].x, 8.0) << "corner " << i;
        EXPECT_NEAR(result.contour.corners[i].y, expected[i].y, 8.0) << "corner " << i;
    }
}

TEST(ContourResolverTest, UniformImageHasNoContour) {
    ContourResolver resolver = makeResolver(ContourResolver::Params());
    ContourResult result = resolver.resolve(Synthetic::uniform(Size(640, 480), 120));

    EXPECT_EQ(result.status, Status::GeometryRejected);
    EXPECT_EQ(result.method, ContourMethod::None);
    EXPECT_TRUE(result.contour.corners.empty());
}

TEST(ContourResolverTest, CornerCountIsAlwaysZeroOrFour) {
    vector<Mat> inputs = {
        Synthetic::uniform(Size(500, 400), 90, 12.0),
        Synthetic::rectanglePage(Size(500, 400), 30, 220, Rect(200, 150, 60, 40)),
        Synthetic::rectanglePage(Size(500, 400), 30, 220, Rect(40, 30, 420, 340)),
    };
    for (const auto& img : inputs) {
        ContourResolver resolver = makeResolver(ContourResolver::Params());
        ContourResult result = resolver.resolve(img);
        size_t n = result.contour.corners.size();
        EXPECT_TRUE(n == 0 || n == 4) << n << " corners";
        EXPECT_EQ(result.status == Status::Ok, n == 4);
    }
}

TEST(ContourResolverTest, QuadRejectedWhenTooSmall) {
    array<BorderLine, 4> lines;
    auto horizontal = [](double y) {
        BorderLine l;
        l.a = 0.0;
        l.b = -1.0;
        l.c = y;
        l.valid = true;
        return l;
    };
    auto vertical = [](double x) {
        BorderLine l;
        l.a = 1.0;
        l.b = 0.0;
        l.c = -x;
        l.valid = true;
        return l;
    };
    lines[ContourResolver::sideIndex(BorderSide::Top)] = horizontal(100);
    lines[ContourResolver::sideIndex(BorderSide::Bottom)] = horizontal(200);
    lines[ContourResolver::sideIndex(BorderSide::Left)] = vertical(100);
    lines[ContourResolver::sideIndex(BorderSide::Right)] = vertical(200);

    vector<Point2f> quad;
    EXPECT_FALSE(ContourResolver::quadFromLines(lines, Size(800, 600), ContourResolver::Params(), quad));
    EXPECT_TRUE(quad.empty());

    lines[ContourResolver::sideIndex(BorderSide::Bottom)] = horizontal(550);
    lines[ContourResolver::sideIndex(BorderSide::Right)] = vertical(700);
    ASSERT_TRUE(ContourResolver::quadFromLines(lines, Size(800, 600), ContourResolver::Params(), quad));
    ASSERT_EQ(quad.size(), 4u);
    EXPECT_NEAR(quad[2].x, 700.0, 1e-3);
    EXPECT_NEAR(quad[2].y, 550.0, 1e-3);
}

TEST(ContourResolverTest, RotatedPageIsStraightenedWithinHalfDegree) {
    Mat img = Synthetic::rotatedPage(Size(800, 640), 40, 200, RotatedRect(Point2f(400, 320), Size2f(680, 520), 7.0f));
    ContourResolver resolver = makeResolver(ContourResolver::Params());
    ContourResult first = resolver.resolve(img);

    ASSERT_TRUE(first.contour.found());
    EXPECT_NEAR(first.contour.angleDeg, 7.0, 0.5);

    CorrectionResult corrected = PerspectiveCorrector::correct(img, first.contour, 30, 40.0,
                                                               PerspectiveCorrector::Params());
    ASSERT_TRUE(corrected.rotated);

    ContourResolver again = makeResolver(ContourResolver::Params());
    ContourResult second = again.resolve(corrected.image);
    ASSERT_TRUE(second.contour.found());
    EXPECT_LT(fabs(second.contour.angleDeg), 0.5);
}
