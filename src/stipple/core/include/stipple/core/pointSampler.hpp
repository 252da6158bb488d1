#pragma once

#include "stipple/core/geometry.hpp"

#include <opencv2/core.hpp>

#include <cstddef>

namespace stippler::stipple::core {

enum class SamplingStrategy {
	Uniform,    //!< Independent uniform samples over the whole image.
	Foreground, //!< Uniform samples, rejected while they land on background pixels.
};

//! Retry budget of the foreground sampler if none is configured.
std::size_t defaultSamplingAttempts(int numPoints);

/*! Generate the initial scatter of points on integer pixel positions.
 * \param [in]     image       CV_8UC1 image.
 * \param [in]     numPoints   Number of points to generate. Must be positive.
 * \param [in]     strategy    Sampling strategy.
 * \param [in,out] rng         Random source. Determines the result together with the image.
 * \param [in]     radius      Radius assigned to every generated point.
 * \param [in]     maxAttempts Foreground sampler draw budget. 0 selects defaultSamplingAttempts(numPoints).
 * \throws         EmptyForegroundError if the image has no foreground pixel or the draw budget runs out.
 */
StippleSet samplePoints(const cv::Mat& image, int numPoints, SamplingStrategy strategy, cv::RNG& rng, double radius, std::size_t maxAttempts = 0u);

} // namespace stippler::stipple::core
