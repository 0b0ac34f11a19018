#include <gtest/gtest.h>

#include "box_geometry.hpp"

#include <opencv2/imgproc.hpp>

using namespace facecrop;

namespace {

void expectSquareInside(const CropBox& box, const cv::Size& frame) {
    EXPECT_EQ(box.height(), box.width()) << box;
    EXPECT_GT(box.height(), 0) << box;
    EXPECT_GE(box.top, 0) << box;
    EXPECT_GE(box.left, 0) << box;
    EXPECT_LE(box.bottom, frame.height) << box;
    EXPECT_LE(box.right, frame.width) << box;
}

} // namespace

TEST(BoxGeometryTest, BoundingBoxIsTightAndExclusive) {
    cv::Mat mask = cv::Mat::zeros(50, 60, CV_8UC1);
    cv::rectangle(mask, cv::Rect(10, 20, 15, 5), cv::Scalar(255), cv::FILLED);
    mask.at<uchar>(40, 3) = 255;

    auto box = boundingBox(mask);
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(*box, (CropBox{20, 41, 3, 25}));
}

TEST(BoxGeometryTest, BoundingBoxOfEmptyMask) {
    EXPECT_FALSE(boundingBox(cv::Mat::zeros(10, 10, CV_8UC1)).has_value());
}

TEST(BoxGeometryTest, ExpandIsAsymmetric) {
    // 100 tall, 80 wide
    CropBox face{100, 200, 100, 180};
    CropBox expanded = expandBox(face, ExpansionFactors(), cv::Size(400, 400));

    EXPECT_EQ(expanded.top, 100 - 55);
    EXPECT_EQ(expanded.bottom, 200 + 25);
    EXPECT_EQ(expanded.left, 100 - 36);
    EXPECT_EQ(expanded.right, 180 + 36);
}

TEST(BoxGeometryTest, ExpandTruncatesFractionalGrowth) {
    // 0.55 * 9 = 4.95, 0.25 * 9 = 2.25, 0.45 * 9 = 4.05
    CropBox face{50, 59, 50, 59};
    CropBox expanded = expandBox(face, ExpansionFactors(), cv::Size(200, 200));
    EXPECT_EQ(expanded, (CropBox{46, 61, 46, 63}));
}

TEST(BoxGeometryTest, ExpandClampsToFrame) {
    CropBox face{5, 95, 2, 58};
    CropBox expanded = expandBox(face, ExpansionFactors(), cv::Size(60, 100));
    EXPECT_EQ(expanded, (CropBox{0, 100, 0, 60}));
}

TEST(BoxGeometryTest, SquareOnCenter) {
    CropBox box{40, 60, 10, 50};
    CropBox square = makeSquare(box, cv::Size(100, 100));
    EXPECT_EQ(square, (CropBox{30, 70, 10, 50}));
}

TEST(BoxGeometryTest, SquareShiftsBackFromTopLeft) {
    CropBox box{0, 10, 0, 50};
    CropBox square = makeSquare(box, cv::Size(100, 100));
    EXPECT_EQ(square, (CropBox{0, 50, 0, 50}));
}

TEST(BoxGeometryTest, SquareShiftsBackFromBottomRight) {
    // width 60, center (95, 170) in a 100 x 200 frame
    CropBox box{90, 100, 140, 200};
    CropBox square = makeSquare(box, cv::Size(200, 100));
    EXPECT_EQ(square, (CropBox{40, 100, 140, 200}));
}

TEST(BoxGeometryTest, SquareInShortFrameUsesShortEdge) {
    // Wanted side 100 but the frame is only 30 rows tall
    CropBox box{0, 30, 50, 150};
    CropBox square = makeSquare(box, cv::Size(200, 30));
    EXPECT_EQ(square, (CropBox{0, 30, 85, 115}));
    expectSquareInside(square, cv::Size(200, 30));
}

TEST(BoxGeometryTest, SquareInvariantOverManyFrames) {
    cv::RNG rng(2024);
    for (int i = 0; i < 500; i++) {
        cv::Size frame(rng.uniform(1, 400), rng.uniform(1, 400));
        CropBox face;
        face.top = rng.uniform(0, frame.height);
        face.bottom = rng.uniform(face.top + 1, frame.height + 1);
        face.left = rng.uniform(0, frame.width);
        face.right = rng.uniform(face.left + 1, frame.width + 1);

        CropBox square = makeSquare(expandBox(face, ExpansionFactors(), frame), frame);
        expectSquareInside(square, frame);
    }
}

TEST(BoxGeometryTest, ComputeCropBoxFromMask) {
    cv::Mat mask = cv::Mat::zeros(300, 300, CV_8UC1);
    cv::rectangle(mask, cv::Rect(100, 100, 80, 100), cv::Scalar(255), cv::FILLED);

    auto box = computeCropBox(mask, ExpansionFactors());
    ASSERT_TRUE(box.has_value());
    // Expanded to rows 45..225, cols 64..216: 180 x 152, squared to 180
    EXPECT_EQ(*box, (CropBox{45, 225, 50, 230}));
    expectSquareInside(*box, mask.size());
}

TEST(BoxGeometryTest, ComputeCropBoxOfEmptyMask) {
    EXPECT_FALSE(computeCropBox(cv::Mat::zeros(30, 30, CV_8UC1), ExpansionFactors()).has_value());
}

TEST(BoxGeometryTest, ClampAndRect) {
    CropBox box{-5, 40, 10, 120};
    CropBox clamped = box.clamp(30, 100);
    EXPECT_EQ(clamped, (CropBox{0, 30, 10, 100}));
    EXPECT_EQ(clamped.toRect(), cv::Rect(10, 0, 90, 30));
    EXPECT_FALSE(clamped.empty());
    EXPECT_TRUE((CropBox{5, 5, 0, 10}).empty());
}
