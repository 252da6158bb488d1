#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <vector>

namespace stippler::stipple::core {

//! Intensity of an empty canvas pixel. Points on such pixels are frozen and filtered out.
static constexpr uchar BACKGROUND = 255;

//! A single dot of the stipple pattern.
//! \note Positions are in image pixel space: x = column, y = row.
struct Stipple {
	cv::Point2d position; //!< Dot center.
	double radius{0.0};   //!< Dot radius in pixels. Never negative.
};

using StippleSet = std::vector<Stipple>;

/*! Signed polygon area (shoelace formula).
 * \param [in] vertices Polygon vertices in order. The polygon is closed implicitly.
 * \return     Positive for counter-clockwise vertex order in a y-up frame, negative otherwise.
 */
double polygonArea(const std::vector<cv::Point2d>& vertices);

/*! Centroid of a simple polygon.
 * \param [in] vertices Polygon vertices in order.
 * \return     Centroid, or empty if the polygon is degenerate (fewer than 3 vertices or zero area).
 */
std::optional<cv::Point2d> polygonCentroid(const std::vector<cv::Point2d>& vertices);

//! Linearly map value from [inMin, inMax] to [outMin, outMax]. An empty input range maps to outMin.
double remap(double value, double inMin, double inMax, double outMin, double outMax);

//! Clamp a position to [0, width-1] x [0, height-1].
cv::Point2d clampToImage(const cv::Point2d& position, cv::Size size);

//! Pixel containing a position (floored). Not bounds checked.
cv::Point pixelOf(const cv::Point2d& position);

//! True if the position lies inside the image.
bool isInside(const cv::Point2d& position, cv::Size size);

//! True if the (in-bounds) position lies on a background pixel of the CV_8UC1 image.
bool isBackground(const cv::Mat& image, const cv::Point2d& position);

} // namespace stippler::stipple::core
