#include "DocumentSplitter.hpp"
#include "SyntheticImages.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace FolioGeom;
using namespace cv;
using namespace std;

TEST(DocumentSplitterTest, CenterSplitKeepsOverlap) {
    Mat img = Synthetic::uniform(Size(1000, 600), 200);
    DocumentSplitter::Params params;
    params.margin = 50;

    SplitResult split = DocumentSplitter::split(img, 480, FoldSide::Center, params);
    ASSERT_TRUE(split.hasLeft());
    ASSERT_TRUE(split.hasRight());
    EXPECT_EQ(split.left.cols, 530);
    EXPECT_EQ(split.right.cols, 570);
    EXPECT_EQ(split.left.rows, 600);
    EXPECT_EQ(split.right.rows, 600);
    EXPECT_EQ(split.rightBox.x, 430);

    // Both halves share 2 * margin columns around the fold
    EXPECT_EQ(split.leftBox.br().x - split.rightBox.x, 100);
    EXPECT_FALSE(split.smartCropApplied);
}

TEST(DocumentSplitterTest, MarginClampsAtImageBorders) {
    Mat img = Synthetic::uniform(Size(400, 300), 200);
    DocumentSplitter::Params params;
    params.margin = 80;

    SplitResult nearLeft = DocumentSplitter::split(img, 30, FoldSide::Center, params);
    EXPECT_EQ(nearLeft.left.cols, 110);
    EXPECT_EQ(nearLeft.right.cols, 400);

    SplitResult nearRight = DocumentSplitter::split(img, 370, FoldSide::Center, params);
    EXPECT_EQ(nearRight.left.cols, 400);
    EXPECT_EQ(nearRight.right.cols, 110);
}

TEST(DocumentSplitterTest, SideFoldsKeepOnePart) {
    Mat img = Synthetic::uniform(Size(1000, 600), 200);
    DocumentSplitter::Params params;
    params.margin = 20;

    SplitResult right = DocumentSplitter::split(img, 900, FoldSide::Right, params);
    EXPECT_TRUE(right.hasLeft());
    EXPECT_FALSE(right.hasRight());
    EXPECT_TRUE(right.right.empty());
    EXPECT_EQ(right.left.cols, 920);

    SplitResult left = DocumentSplitter::split(img, 100, FoldSide::Left, params);
    EXPECT_FALSE(left.hasLeft());
    EXPECT_TRUE(left.hasRight());
    EXPECT_EQ(left.rightBox.x, 80);
    EXPECT_EQ(left.right.cols, 920);
}

TEST(DocumentSplitterTest, RejectsBadInput) {
    DocumentSplitter::Params params;
    EXPECT_THROW(DocumentSplitter::split(Mat(), 10, FoldSide::Center, params), invalid_argument);

    params.margin = -1;
    EXPECT_THROW(DocumentSplitter::split(Synthetic::uniform(Size(100, 100), 200), 50, FoldSide::Center, params),
                 invalid_argument);
}

TEST(DocumentSplitterTest, BrightnessDrop) {
    vector<double> profile(60, 200.0);
    for (size_t i = 30; i < profile.size(); i++) profile[i] = 40.0;
    int idx = DocumentSplitter::findBrightnessDrop(profile, DocumentSplitter::Params());
    EXPECT_NEAR(idx, 30, 6);

    vector<double> flat(60, 200.0);
    EXPECT_EQ(DocumentSplitter::findBrightnessDrop(flat, DocumentSplitter::Params()), -1);
    EXPECT_EQ(DocumentSplitter::findBrightnessDrop(vector<double>{200.0, 40.0}, DocumentSplitter::Params()), -1);
}

TEST(DocumentSplitterTest, SmartCropTrimsOuterEdges) {
    Mat img = Synthetic::rectanglePage(Size(1000, 600), 30, 200, Rect(100, 0, 800, 600));
    DocumentSplitter::Params params;
    params.smartCrop = true;

    SplitResult split = DocumentSplitter::split(img, 500, FoldSide::Center, params);
    EXPECT_TRUE(split.smartCropApplied);
    EXPECT_NEAR(split.leftBox.x, 100, 8);
    EXPECT_EQ(split.leftBox.br().x, 550);
    EXPECT_EQ(split.rightBox.x, 450);
    EXPECT_NEAR(split.rightBox.br().x, 900, 8);
    EXPECT_EQ(split.left.cols, split.leftBox.width);
}
