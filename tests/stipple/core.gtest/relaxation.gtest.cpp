#include "stipple/core/flowField.hpp"
#include "stipple/core/pointSampler.hpp"
#include "stipple/core/relaxation.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace stippler::stipple::core {
namespace gtest {

//! Left third background, the rest a diagonal gradient without pure white.
static cv::Mat makeTestImage(int rows, int cols) {
	cv::Mat image(rows, cols, CV_8UC1, cv::Scalar(BACKGROUND));
	for (int y = 0; y < rows; ++y) {
		for (int x = cols / 3; x < cols; ++x) {
			image.at<uchar>(y, x) = static_cast<uchar>((x + y) * 250 / (rows + cols));
		}
	}
	return image;
}

static StippleSet makeUniformPoints(const cv::Mat& image, int count, std::uint64_t seed) {
	cv::RNG rng(seed);
	return samplePoints(image, count, SamplingStrategy::Uniform, rng, 2.0);
}

//! Run a few iterations. Check bounds and the background freeze after every step.
static void checkInvariants(RelaxationStrategy& strategy, const cv::Mat& image, StippleSet points, int iterations) {
	StippleSet next;
	for (int it = 0; it < iterations; ++it) {
		strategy.relax(image, points, next);
		ASSERT_EQ(next.size(), points.size()) << "iteration " << it;

		for (std::size_t i = 0; i < points.size(); ++i) {
			const cv::Point2d& p = next[i].position;
			EXPECT_GE(p.x, 0.0);
			EXPECT_GE(p.y, 0.0);
			EXPECT_LT(p.x, image.cols);
			EXPECT_LT(p.y, image.rows);

			if (isBackground(image, points[i].position)) {
				EXPECT_EQ(next[i].position, points[i].position) << "iteration " << it << " point " << i;
			}
		}
		std::swap(points, next);
	}
}

TEST(RelaxationUnit, NearestPointMap_SplitsAtBisector) {
	const StippleSet points = {{{0.0, 0.0}, 1.0}, {{9.0, 0.0}, 1.0}};
	const cv::Mat nearest   = nearestPointMap(points, cv::Size(10, 2));

	ASSERT_EQ(nearest.type(), CV_32SC1);
	for (int y = 0; y < 2; ++y) {
		for (int x = 0; x < 10; ++x) {
			EXPECT_EQ(nearest.at<int>(y, x), x < 5 ? 0 : 1) << "(" << y << "," << x << ")";
		}
	}
}

TEST(RelaxationUnit, NearestPointMap_TiesGoToLowestIndex) {
	// Pixel (1,0) is equidistant to both points.
	const StippleSet pair = {{{0.0, 0.0}, 1.0}, {{2.0, 0.0}, 1.0}};
	EXPECT_EQ(nearestPointMap(pair, cv::Size(3, 1)).at<int>(0, 1), 0);

	const StippleSet swapped = {{{2.0, 0.0}, 1.0}, {{0.0, 0.0}, 1.0}};
	EXPECT_EQ(nearestPointMap(swapped, cv::Size(3, 1)).at<int>(0, 1), 0);

	// Corners of a 3x3 image. Edge midpoints tie two corners, the center ties all four.
	const StippleSet corners = {{{0.0, 0.0}, 1.0}, {{2.0, 0.0}, 1.0}, {{0.0, 2.0}, 1.0}, {{2.0, 2.0}, 1.0}};
	const cv::Mat expected   = (cv::Mat_<int>(3, 3) << 0, 0, 1, 0, 0, 1, 2, 2, 3);

	const cv::Mat first = nearestPointMap(corners, cv::Size(3, 3));
	EXPECT_EQ(cv::countNonZero(first != expected), 0);

	// Independent of the global RNG, and leaves it untouched.
	for (int i = 0; i < 7; ++i) {
		cv::theRNG().next();
		const std::uint64_t before = cv::theRNG().state;
		const cv::Mat again        = nearestPointMap(corners, cv::Size(3, 3));
		EXPECT_EQ(cv::theRNG().state, before);
		EXPECT_EQ(cv::countNonZero(again != first), 0) << "run " << i;
	}
}

TEST(RelaxationUnit, WeightedNearest_SinglePoint_DampedFlooredStep) {
	const cv::Mat image(11, 11, CV_8UC1, cv::Scalar(0));
	WeightedNearestRelaxation strategy({false, 1.0, 3.0});

	const StippleSet current = {{{0.0, 0.0}, 3.0}};
	StippleSet next;
	const IterationStats stats = strategy.relax(image, current, next);

	// Weighted centroid (5,5). 0 + 0.25 * 5 = 1.25, floored.
	ASSERT_EQ(next.size(), 1u);
	EXPECT_EQ(next[0].position, cv::Point2d(1.0, 1.0));
	EXPECT_DOUBLE_EQ(next[0].radius, 3.0);
	EXPECT_EQ(stats.frozen, 0);
	EXPECT_EQ(stats.unassigned, 0);
}

TEST(RelaxationUnit, WeightedNearest_VariableRadius_FollowsDarkness) {
	cv::Mat image(10, 20, CV_8UC1, cv::Scalar(204)); // darkness 0.2
	image(cv::Rect(0, 0, 10, 10)).setTo(0);          // darkness 1.0

	WeightedNearestRelaxation strategy({true, 1.0, 5.0});
	const StippleSet current = {{{2.0, 5.0}, 1.0}, {{17.0, 5.0}, 1.0}};
	StippleSet next;
	const IterationStats stats = strategy.relax(image, current, next);

	ASSERT_EQ(next.size(), 2u);
	EXPECT_NEAR(stats.maxAverageWeight, 1.0, 1e-9);
	EXPECT_NEAR(next[0].radius, 5.0, 1e-9);
	EXPECT_NEAR(next[1].radius, 1.0 + 0.2 * 4.0, 1e-9);
}

TEST(RelaxationUnit, WeightedNearest_AllBackground_MinimumRadiusAndFrozen) {
	const cv::Mat image(12, 12, CV_8UC1, cv::Scalar(255));
	WeightedNearestRelaxation strategy({true, 2.0, 6.0});

	const StippleSet current = {{{1.0, 1.0}, 4.0}, {{8.0, 3.0}, 4.0}, {{5.0, 10.0}, 4.0}};
	StippleSet next;
	const IterationStats stats = strategy.relax(image, current, next);

	EXPECT_EQ(stats.frozen, 3);
	for (std::size_t i = 0; i < current.size(); ++i) {
		EXPECT_EQ(next[i].position, current[i].position);
		EXPECT_DOUBLE_EQ(next[i].radius, 2.0);
	}
}

TEST(RelaxationUnit, WeightedNearest_VariableRadius_StaysInRange) {
	const cv::Mat image = makeTestImage(40, 60);
	WeightedNearestRelaxation strategy({true, 1.0, 4.0});

	StippleSet points = makeUniformPoints(image, 80, 5);
	StippleSet next;
	for (int it = 0; it < 3; ++it) {
		strategy.relax(image, points, next);
		std::swap(points, next);
	}
	for (const auto& p: points) {
		EXPECT_GE(p.radius, 1.0 - 1e-9);
		EXPECT_LE(p.radius, 4.0 + 1e-9);
	}
}

TEST(RelaxationUnit, WeightedNearest_BoundsAndBackgroundFreeze) {
	const cv::Mat image = makeTestImage(45, 70);
	WeightedNearestRelaxation strategy({false, 1.0, 2.0});
	checkInvariants(strategy, image, makeUniformPoints(image, 120, 11), 4);
}

TEST(RelaxationUnit, WeightedNearest_Deterministic) {
	const cv::Mat image = makeTestImage(64, 130); // more than one accumulation stripe
	const StippleSet start = makeUniformPoints(image, 150, 99);

	WeightedNearestRelaxation a({true, 1.0, 3.0});
	WeightedNearestRelaxation b({true, 1.0, 3.0});
	StippleSet resultA, resultB;
	a.relax(image, start, resultA);
	b.relax(image, start, resultB);

	ASSERT_EQ(resultA.size(), resultB.size());
	for (std::size_t i = 0; i < resultA.size(); ++i) {
		EXPECT_EQ(resultA[i].position, resultB[i].position);
		EXPECT_EQ(resultA[i].radius, resultB[i].radius);
	}
}

TEST(RelaxationUnit, VoronoiFlow_InteriorPointMovesHalfwayToCentroid) {
	const cv::Mat image(50, 50, CV_8UC1, cv::Scalar(0)); // no flow bias on full foreground
	VoronoiFlowRelaxation strategy(buildFlowField(image, 3));

	// 3x3 lattice with spacing 10. The center point is shifted to (27, 25).
	StippleSet current;
	for (int gy = 0; gy < 3; ++gy) {
		for (int gx = 0; gx < 3; ++gx) {
			current.push_back({{15.0 + 10.0 * gx, 15.0 + 10.0 * gy}, 1.0});
		}
	}
	current[4].position = {27.0, 25.0};

	StippleSet next;
	const IterationStats stats = strategy.relax(image, current, next);

	// The hull points have unbounded regions and stay where they are.
	EXPECT_EQ(stats.unbounded, 8);
	for (std::size_t i = 0; i < current.size(); ++i) {
		if (i != 4u) {
			EXPECT_EQ(next[i].position, current[i].position);
		}
	}

	// Region centroid is (26.28956, 25). New position is the mean of position and centroid.
	EXPECT_NEAR(next[4].position.x, (27.0 + 26.289562289562287) / 2.0, 1e-3);
	EXPECT_NEAR(next[4].position.y, 25.0, 1e-3);
	EXPECT_EQ(strategy.lastFacets().size(), 1u);
}

TEST(RelaxationUnit, VoronoiFlow_MidTone_BlendsTruncatedFlowInThirds) {
	// Only the interior point sits on a mid tone. Same lattice as above, centroid (26.28956, 25).
	cv::Mat image(50, 50, CV_8UC1, cv::Scalar(0));
	image.at<uchar>(25, 27) = 128;

	StippleSet current;
	for (int gy = 0; gy < 3; ++gy) {
		for (int gx = 0; gx < 3; ++gx) {
			current.push_back({{15.0 + 10.0 * gx, 15.0 + 10.0 * gy}, 1.0});
		}
	}
	current[4].position = {27.0, 25.0};

	const double centroidX = 26.289562289562287;

	// 3.7 along +x truncates to 3, along -x to -3 (toward zero, not floor).
	for (const auto& [angle, displacementX]: std::vector<std::pair<double, double>>{{0.0, 3.0}, {180.0, -3.0}}) {
		FlowField flow{cv::Mat(image.size(), CV_64FC1, cv::Scalar(angle)), cv::Mat(image.size(), CV_64FC1, cv::Scalar(3.7))};
		VoronoiFlowRelaxation strategy(std::move(flow));

		StippleSet next;
		strategy.relax(image, current, next);

		EXPECT_NEAR(next[4].position.x, (27.0 + centroidX + 27.0 + displacementX) / 3.0, 1e-3) << "angle " << angle;
		EXPECT_NEAR(next[4].position.y, 25.0, 1e-3) << "angle " << angle;
	}
}

TEST(RelaxationUnit, VoronoiFlow_AllBackground_NothingMoves) {
	const cv::Mat image(30, 30, CV_8UC1, cv::Scalar(255));
	VoronoiFlowRelaxation strategy(buildFlowField(image, 3));

	const StippleSet current = makeUniformPoints(image, 40, 2);
	StippleSet next;
	const IterationStats stats = strategy.relax(image, current, next);

	EXPECT_EQ(stats.frozen, 40);
	for (std::size_t i = 0; i < current.size(); ++i) {
		EXPECT_EQ(next[i].position, current[i].position);
	}
}

TEST(RelaxationUnit, VoronoiFlow_BoundsAndBackgroundFreeze) {
	const cv::Mat image = makeTestImage(50, 80);
	VoronoiFlowRelaxation strategy(buildFlowField(image, 3));
	checkInvariants(strategy, image, makeUniformPoints(image, 150, 21), 4);
}

TEST(RelaxationUnit, RenderFrame_ImageSized) {
	const cv::Mat image = makeTestImage(30, 40);
	const StippleSet points = makeUniformPoints(image, 20, 8);

	VoronoiFlowRelaxation voronoi(buildFlowField(image, 2));
	WeightedNearestRelaxation nearest({false, 1.0, 1.0});
	StippleSet next;
	voronoi.relax(image, points, next);
	nearest.relax(image, points, next);

	for (const RelaxationStrategy* strategy: std::vector<const RelaxationStrategy*>{&voronoi, &nearest}) {
		const cv::Mat frame = strategy->renderFrame(image, next);
		EXPECT_EQ(frame.size(), image.size()) << strategy->name();
		EXPECT_EQ(frame.type(), CV_8UC3) << strategy->name();
	}
}

} // namespace gtest
} // namespace stippler::stipple::core
