#include "stipple/core/pointSampler.hpp"

#include "stipple/core/errors.hpp"

#include <algorithm>
#include <string>

namespace stippler::stipple::core {

std::size_t defaultSamplingAttempts(const int numPoints) {
	return std::max<std::size_t>(1000u, 100u * static_cast<std::size_t>(std::max(0, numPoints)));
}

static Stipple drawUniform(const cv::Mat& image, cv::RNG& rng, const double radius) {
	const int y = rng.uniform(0, image.rows);
	const int x = rng.uniform(0, image.cols);
	return Stipple{cv::Point2d(x, y), radius};
}

StippleSet samplePoints(const cv::Mat& image, const int numPoints, const SamplingStrategy strategy, cv::RNG& rng, const double radius,
                        const std::size_t maxAttempts) {
	CV_Assert(!image.empty() && image.type() == CV_8UC1);
	CV_Assert(numPoints > 0);

	StippleSet points;
	points.reserve(static_cast<std::size_t>(numPoints));

	switch (strategy) {
	case SamplingStrategy::Uniform:
		for (int i = 0; i < numPoints; ++i) {
			points.push_back(drawUniform(image, rng, radius));
		}
		break;

	case SamplingStrategy::Foreground: {
		const int foreground = cv::countNonZero(image != BACKGROUND);
		if (foreground == 0) {
			throw EmptyForegroundError("Image has no foreground pixels to place points on.");
		}

		const std::size_t budget = maxAttempts > 0u ? maxAttempts : defaultSamplingAttempts(numPoints);
		std::size_t attempts     = 0u;
		while (points.size() < static_cast<std::size_t>(numPoints)) {
			if (attempts++ >= budget) {
				throw EmptyForegroundError("Placed only " + std::to_string(points.size()) + " of " + std::to_string(numPoints) + " points within " +
				                           std::to_string(budget) + " draws (" + std::to_string(foreground) + " foreground pixels).");
			}

			Stipple candidate = drawUniform(image, rng, radius);
			if (!isBackground(image, candidate.position)) {
				points.push_back(candidate);
			}
		}
		break;
	}
	}

	return points;
}

} // namespace stippler::stipple::core
