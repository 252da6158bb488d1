#pragma once

#include "stipple/core/geometry.hpp"

#include <opencv2/core/mat.hpp>

namespace stippler::stipple::core {

//! Drop points outside the image or on background pixels. Keeps the input order.
StippleSet filterBackground(const cv::Mat& image, const StippleSet& stipples);

/*! Greedy overlap-free packing for variable radius stipples.
 *  Points are visited in input order. A point is rejected if it is outside the image, on background, or if its disc
 *  touches or overlaps the disc of an already accepted point (distance <= r1 + r2). Accepted points are kept in a quad-tree.
 *
 * \note Order dependent, not optimal. Deterministic for a fixed input order.
 */
StippleSet filterOverlapping(const cv::Mat& image, const StippleSet& stipples);

} // namespace stippler::stipple::core
