#include <gtest/gtest.h>

#include "alpha_feather.hpp"

#include <limits>
#include <stdexcept>

using namespace facecrop;

TEST(AlphaFeatherTest, RatioClamping) {
    EXPECT_DOUBLE_EQ(clampFeatherRatio(0.92), 0.92);
    EXPECT_DOUBLE_EQ(clampFeatherRatio(1.5), kMaxFeatherRatio);
    EXPECT_DOUBLE_EQ(clampFeatherRatio(-0.3), 0.0);
    EXPECT_THROW(clampFeatherRatio(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

TEST(AlphaFeatherTest, OpacityRamp) {
    EXPECT_DOUBLE_EQ(featherOpacity(0.0, 0.92), 1.0);
    EXPECT_DOUBLE_EQ(featherOpacity(0.92, 0.92), 1.0);
    EXPECT_NEAR(featherOpacity(0.96, 0.92), 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(featherOpacity(1.0, 0.92), 0.0);
    EXPECT_DOUBLE_EQ(featherOpacity(1.3, 0.92), 0.0);
    EXPECT_NEAR(featherOpacity(0.5, 0.0), 0.5, 1e-9);
}

TEST(AlphaFeatherTest, SquareCropBoundaryValues) {
    cv::Mat alpha = featheredAlpha(cv::Size(100, 100), 0.92);
    ASSERT_EQ(alpha.type(), CV_8UC1);
    ASSERT_EQ(alpha.size(), cv::Size(100, 100));

    // The four pixels around the center
    EXPECT_EQ(alpha.at<uchar>(49, 49), 255);
    EXPECT_EQ(alpha.at<uchar>(50, 50), 255);
    EXPECT_EQ(alpha.at<uchar>(49, 50), 255);

    EXPECT_EQ(alpha.at<uchar>(0, 0), 0);
    EXPECT_EQ(alpha.at<uchar>(0, 99), 0);
    EXPECT_EQ(alpha.at<uchar>(99, 0), 0);
    EXPECT_EQ(alpha.at<uchar>(99, 99), 0);

    // Edge midpoints sit just inside rho = 1, deep in the ramp
    EXPECT_LT(alpha.at<uchar>(49, 0), 40);
    EXPECT_LT(alpha.at<uchar>(0, 49), 40);
}

TEST(AlphaFeatherTest, FallsOffMonotonicallyFromCenter) {
    cv::Mat alpha = featheredAlpha(cv::Size(120, 120), 0.5);
    for (int x = 61; x < 120; x++) {
        EXPECT_LE(alpha.at<uchar>(60, x), alpha.at<uchar>(60, x - 1)) << "x=" << x;
    }
}

TEST(AlphaFeatherTest, ZeroRatioIsOpaqueOnlyAtExactCenter) {
    cv::Mat alpha = featheredAlpha(cv::Size(101, 101), 0.0);
    EXPECT_EQ(alpha.at<uchar>(50, 50), 255);
    EXPECT_LT(alpha.at<uchar>(50, 51), 255);
    EXPECT_EQ(alpha.at<uchar>(0, 0), 0);
}

TEST(AlphaFeatherTest, EllipticalForNonSquareSizes) {
    // 40 rows, 200 cols
    cv::Mat alpha = featheredAlpha(cv::Size(200, 40), 0.6);

    // rho ~0.775 along each axis: 77.5 of 100 columns, 15.5 of 20 rows
    EXPECT_NEAR(alpha.at<uchar>(19, 177), alpha.at<uchar>(35, 99), 2);
    EXPECT_GT(alpha.at<uchar>(35, 99), 0);
    EXPECT_LT(alpha.at<uchar>(35, 99), 255);

    // Point symmetric about the center
    for (int y = 0; y < alpha.rows; y += 7) {
        for (int x = 0; x < alpha.cols; x += 13) {
            EXPECT_EQ(alpha.at<uchar>(y, x), alpha.at<uchar>(alpha.rows - 1 - y, alpha.cols - 1 - x));
        }
    }
}

TEST(AlphaFeatherTest, RatioAboveLimitMatchesLimit) {
    cv::Mat clamped = featheredAlpha(cv::Size(64, 64), 2.0);
    cv::Mat limit = featheredAlpha(cv::Size(64, 64), kMaxFeatherRatio);
    EXPECT_EQ(cv::countNonZero(clamped != limit), 0);
}

TEST(AlphaFeatherTest, SinglePixel) {
    cv::Mat alpha = featheredAlpha(cv::Size(1, 1), 0.92);
    EXPECT_EQ(alpha.at<uchar>(0, 0), 255);
}
