#pragma once

#include "stipple/core/geometry.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace stippler::stipple::core {

//! Voronoi facets as returned by cv::Subdiv2D.
using Facets = std::vector<std::vector<cv::Point2f>>;

cv::Mat whiteCanvas(cv::Size size); //!< 8-bit BGR canvas filled white.
cv::Mat toBgr(const cv::Mat& image); //!< Copy of a gray or BGR image as 8-bit BGR.

//! Draw filled discs for all stipples. Radii are rounded. A radius of 0 draws a single pixel.
void drawStipples(cv::Mat& canvas, const StippleSet& stipples, const cv::Scalar& color);

//! Draw the bounded facets of a Voronoi tessellation as closed polylines.
void drawVoronoi(cv::Mat& canvas, const Facets& facets, const cv::Scalar& color);

} // namespace stippler::stipple::core
