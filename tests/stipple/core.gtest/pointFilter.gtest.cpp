#include "stipple/core/pointFilter.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

namespace stippler::stipple::core {
namespace gtest {

TEST(PointFilterUnit, Background_DropsWhitePixelsKeepsOrder) {
	cv::Mat image(5, 5, CV_8UC1, cv::Scalar(10));
	image.at<uchar>(1, 3) = BACKGROUND;

	const StippleSet input = {
	        {{0.0, 0.0}, 1.0},
	        {{3.0, 1.0}, 1.0}, // background
	        {{4.0, 4.0}, 1.0},
	        {{3.5, 1.5}, 1.0}, // background, sub-pixel
	        {{2.0, 2.0}, 1.0},
	        {{7.0, 2.0}, 1.0}, // outside
	};

	const StippleSet kept = filterBackground(image, input);
	ASSERT_EQ(kept.size(), 3u);
	EXPECT_EQ(kept[0].position, cv::Point2d(0.0, 0.0));
	EXPECT_EQ(kept[1].position, cv::Point2d(4.0, 4.0));
	EXPECT_EQ(kept[2].position, cv::Point2d(2.0, 2.0));
}

TEST(PointFilterUnit, Overlapping_FirstComeFirstServed) {
	const cv::Mat image(50, 50, CV_8UC1, cv::Scalar(0));

	const StippleSet input = {
	        {{10.0, 10.0}, 3.0},
	        {{14.0, 10.0}, 2.0}, // distance 4 < 5, overlaps the first
	        {{20.0, 10.0}, 3.0}, // distance 10 > 6, kept
	        {{26.0, 10.0}, 3.0}, // distance 6 == 6, touching counts as overlap
	        {{40.0, 40.0}, 5.0},
	};

	const StippleSet kept = filterOverlapping(image, input);
	ASSERT_EQ(kept.size(), 3u);
	EXPECT_EQ(kept[0].position, cv::Point2d(10.0, 10.0));
	EXPECT_EQ(kept[1].position, cv::Point2d(20.0, 10.0));
	EXPECT_EQ(kept[2].position, cv::Point2d(40.0, 40.0));
}

TEST(PointFilterUnit, Overlapping_LargeRadiusFoundAcrossQuadrants) {
	const cv::Mat image(200, 200, CV_8UC1, cv::Scalar(0));

	// Many small accepted dots first so the quad-tree splits, then a big dot far from the small candidate's center.
	StippleSet input;
	for (int i = 0; i < 40; ++i) {
		input.push_back({{5.0 + 4.0 * (i % 10), 5.0 + 4.0 * (i / 10)}, 1.0});
	}
	input.push_back({{150.0, 150.0}, 40.0});
	input.push_back({{115.0, 150.0}, 1.0}); // inside the big dot

	const StippleSet kept = filterOverlapping(image, input);
	ASSERT_EQ(kept.size(), 41u);
	EXPECT_EQ(kept.back().position, cv::Point2d(150.0, 150.0));
}

TEST(PointFilterUnit, Overlapping_NoPairOverlapsAndCountMonotone) {
	cv::Mat image(80, 120, CV_8UC1, cv::Scalar(60));
	image(cv::Rect(0, 0, 30, 80)).setTo(BACKGROUND);

	cv::RNG rng(17);
	StippleSet input;
	for (int i = 0; i < 600; ++i) {
		input.push_back({{rng.uniform(0.0, 120.0), rng.uniform(0.0, 80.0)}, rng.uniform(0.5, 4.0)});
	}

	const StippleSet kept = filterOverlapping(image, input);
	EXPECT_LE(kept.size(), input.size());
	EXPECT_GT(kept.size(), 0u);

	for (std::size_t i = 0; i < kept.size(); ++i) {
		EXPECT_FALSE(isBackground(image, kept[i].position));
		for (std::size_t j = i + 1; j < kept.size(); ++j) {
			const double distance = cv::norm(kept[i].position - kept[j].position);
			EXPECT_GT(distance, kept[i].radius + kept[j].radius) << i << " vs " << j;
		}
	}

	// Same input, same output.
	const StippleSet again = filterOverlapping(image, input);
	ASSERT_EQ(again.size(), kept.size());
	for (std::size_t i = 0; i < kept.size(); ++i) {
		EXPECT_EQ(again[i].position, kept[i].position);
	}
}

} // namespace gtest
} // namespace stippler::stipple::core
