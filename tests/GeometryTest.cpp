#include "Geometry.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace FolioGeom;
using namespace cv;
using namespace std;

TEST(GeometryTest, OrdersCornersClockwiseFromTopLeft) {
    vector<Point2f> shuffled = {Point2f(700, 520), Point2f(90, 40), Point2f(80, 530), Point2f(710, 50)};
    vector<Point2f> ordered = orderCorners(shuffled);
    ASSERT_EQ(ordered.size(), 4u);
    EXPECT_EQ(ordered[0], Point2f(90, 40));
    EXPECT_EQ(ordered[1], Point2f(710, 50));
    EXPECT_EQ(ordered[2], Point2f(700, 520));
    EXPECT_EQ(ordered[3], Point2f(80, 530));
}

TEST(GeometryTest, IntersectsPerpendicularLines) {
    BorderLine horizontal;  // y = 100
    horizontal.a = 0.0;
    horizontal.b = -1.0;
    horizontal.c = 100.0;
    horizontal.valid = true;

    BorderLine vertical;    // x = 50
    vertical.a = 1.0;
    vertical.b = 0.0;
    vertical.c = -50.0;
    vertical.valid = true;

    Point2f p;
    ASSERT_TRUE(intersectLines(horizontal, vertical, p));
    EXPECT_NEAR(p.x, 50.0, 1e-4);
    EXPECT_NEAR(p.y, 100.0, 1e-4);
}

TEST(GeometryTest, ParallelOrInvalidLinesDoNotIntersect) {
    BorderLine l1;
    l1.a = 0.0;
    l1.b = -1.0;
    l1.c = 10.0;
    l1.valid = true;
    BorderLine l2 = l1;
    l2.c = 20.0;

    Point2f p;
    EXPECT_FALSE(intersectLines(l1, l2, p));
    l2.valid = false;
    EXPECT_FALSE(intersectLines(l1, l2, p));
}

TEST(GeometryTest, ExpandRectClampsToImage) {
    Rect grown = expandRect(Rect(10, 20, 100, 50), 30, Size(200, 100));
    EXPECT_EQ(grown, Rect(0, 0, 140, 100));
    EXPECT_EQ(clampRect(Rect(-10, -10, 5, 5), Size(50, 50)).area(), 0);
}

TEST(GeometryTest, PageContourFoundOnlyWithFourCorners) {
    PageContour contour;
    EXPECT_FALSE(contour.found());
    contour.corners = {Point2f(0, 0), Point2f(10, 0), Point2f(10, 20), Point2f(0, 20)};
    EXPECT_TRUE(contour.found());
    EXPECT_NEAR(contour.area(), 200.0, 1e-6);
    contour.clear();
    EXPECT_FALSE(contour.found());
}

TEST(GeometryTest, ParsesFoldSideNames) {
    EXPECT_EQ(parseFoldSide("left"), FoldSide::Left);
    EXPECT_EQ(parseFoldSide("RIGHT"), FoldSide::Right);
    EXPECT_EQ(parseFoldSide("centre"), FoldSide::Center);
    EXPECT_THROW(parseFoldSide("middle"), std::invalid_argument);
    EXPECT_STREQ(foldSideName(FoldSide::Center), "center");
}
