#include "stipple/core/geometry.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cmath>
#include <vector>

namespace stippler::stipple::core {
namespace gtest {

TEST(GeometryUnit, UnitSquare_CentroidAndArea) {
	const std::vector<cv::Point2d> square = {{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {1.0, 0.0}};

	EXPECT_DOUBLE_EQ(std::abs(polygonArea(square)), 1.0);

	const auto centroid = polygonCentroid(square);
	ASSERT_TRUE(centroid.has_value());
	EXPECT_DOUBLE_EQ(centroid->x, 0.5);
	EXPECT_DOUBLE_EQ(centroid->y, 0.5);
}

TEST(GeometryUnit, Area_SignFollowsOrientation) {
	const std::vector<cv::Point2d> ccw = {{0.0, 0.0}, {2.0, 0.0}, {2.0, 3.0}, {0.0, 3.0}};
	const std::vector<cv::Point2d> cw(ccw.rbegin(), ccw.rend());

	EXPECT_DOUBLE_EQ(polygonArea(ccw), 6.0);
	EXPECT_DOUBLE_EQ(polygonArea(cw), -6.0);

	// The centroid does not depend on the orientation.
	const auto a = polygonCentroid(ccw);
	const auto b = polygonCentroid(cw);
	ASSERT_TRUE(a && b);
	EXPECT_NEAR(a->x, 1.0, 1e-12);
	EXPECT_NEAR(a->y, 1.5, 1e-12);
	EXPECT_NEAR(b->x, 1.0, 1e-12);
	EXPECT_NEAR(b->y, 1.5, 1e-12);
}

TEST(GeometryUnit, Triangle_Centroid) {
	const std::vector<cv::Point2d> triangle = {{0.0, 0.0}, {6.0, 0.0}, {0.0, 3.0}};
	const auto centroid                     = polygonCentroid(triangle);
	ASSERT_TRUE(centroid.has_value());
	EXPECT_NEAR(centroid->x, 2.0, 1e-12);
	EXPECT_NEAR(centroid->y, 1.0, 1e-12);
}

TEST(GeometryUnit, DegeneratePolygon_NoCentroid) {
	EXPECT_FALSE(polygonCentroid({}).has_value());
	EXPECT_FALSE(polygonCentroid({{1.0, 1.0}, {2.0, 2.0}}).has_value());
	EXPECT_FALSE(polygonCentroid({{0.0, 0.0}, {1.0, 1.0}, {2.0, 2.0}}).has_value()); // collinear
	EXPECT_FALSE(polygonCentroid({{3.0, 3.0}, {3.0, 3.0}, {3.0, 3.0}, {3.0, 3.0}}).has_value());
}

TEST(GeometryUnit, Remap_EndpointsAndLinearity) {
	static constexpr double MAX_WEIGHT = 0.8;
	static constexpr double MIN_R      = 2.0;
	static constexpr double MAX_R      = 6.0;

	EXPECT_DOUBLE_EQ(remap(0.0, 0.0, MAX_WEIGHT, MIN_R, MAX_R), MIN_R);
	EXPECT_DOUBLE_EQ(remap(MAX_WEIGHT, 0.0, MAX_WEIGHT, MIN_R, MAX_R), MAX_R);
	EXPECT_DOUBLE_EQ(remap(MAX_WEIGHT / 2.0, 0.0, MAX_WEIGHT, MIN_R, MAX_R), (MIN_R + MAX_R) / 2.0);

	double previous = remap(0.0, 0.0, MAX_WEIGHT, MIN_R, MAX_R);
	for (int i = 1; i <= 20; ++i) {
		const double current = remap(MAX_WEIGHT * i / 20.0, 0.0, MAX_WEIGHT, MIN_R, MAX_R);
		EXPECT_GT(current, previous);
		previous = current;
	}
}

TEST(GeometryUnit, Remap_EmptyInputRange_ReturnsLowerBound) {
	EXPECT_DOUBLE_EQ(remap(0.0, 0.0, 0.0, 1.0, 4.0), 1.0);
	EXPECT_DOUBLE_EQ(remap(3.0, 3.0, 3.0, 1.0, 4.0), 1.0);
}

TEST(GeometryUnit, ClampToImage) {
	const cv::Size size(10, 5);
	EXPECT_EQ(clampToImage({-3.0, 2.0}, size), cv::Point2d(0.0, 2.0));
	EXPECT_EQ(clampToImage({12.5, 7.0}, size), cv::Point2d(9.0, 4.0));
	EXPECT_EQ(clampToImage({4.5, 3.25}, size), cv::Point2d(4.5, 3.25));
}

TEST(GeometryUnit, Background_PixelLookupIsFloored) {
	cv::Mat image(4, 4, CV_8UC1, cv::Scalar(0));
	image.at<uchar>(2, 1) = BACKGROUND; // row 2, column 1

	EXPECT_TRUE(isBackground(image, {1.0, 2.0}));
	EXPECT_TRUE(isBackground(image, {1.9, 2.9}));
	EXPECT_FALSE(isBackground(image, {2.0, 2.0}));
	EXPECT_FALSE(isBackground(image, {1.0, 1.9}));

	EXPECT_TRUE(isInside({3.99, 0.0}, image.size()));
	EXPECT_FALSE(isInside({4.0, 0.0}, image.size()));
	EXPECT_FALSE(isInside({-0.01, 0.0}, image.size()));
}

} // namespace gtest
} // namespace stippler::stipple::core
