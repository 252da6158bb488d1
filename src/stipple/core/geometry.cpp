#include "stipple/core/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace stippler::stipple::core {

//! Polygons with an absolute area below this are treated as degenerate.
static constexpr double MIN_POLYGON_AREA = 1e-9;

double polygonArea(const std::vector<cv::Point2d>& vertices) {
	const std::size_t n = vertices.size();
	if (n < 3u) {
		return 0.0;
	}

	double area = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const cv::Point2d& a = vertices[i];
		const cv::Point2d& b = vertices[(i + 1) % n];
		area += a.x * b.y - b.x * a.y;
	}
	return area / 2.0;
}

std::optional<cv::Point2d> polygonCentroid(const std::vector<cv::Point2d>& vertices) {
	const double area = polygonArea(vertices);
	if (!std::isfinite(area) || std::abs(area) < MIN_POLYGON_AREA) {
		return std::nullopt;
	}

	const std::size_t n = vertices.size();
	double cx           = 0.0;
	double cy           = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const cv::Point2d& a = vertices[i];
		const cv::Point2d& b = vertices[(i + 1) % n];
		const double cross   = a.x * b.y - b.x * a.y;
		cx += (a.x + b.x) * cross;
		cy += (a.y + b.y) * cross;
	}

	return cv::Point2d(cx / (6.0 * area), cy / (6.0 * area));
}

double remap(const double value, const double inMin, const double inMax, const double outMin, const double outMax) {
	const double span = inMax - inMin;
	if (std::abs(span) < 1e-12) {
		return outMin;
	}
	return outMin + (value - inMin) * (outMax - outMin) / span;
}

cv::Point2d clampToImage(const cv::Point2d& position, const cv::Size size) {
	const double maxX = static_cast<double>(std::max(0, size.width - 1));
	const double maxY = static_cast<double>(std::max(0, size.height - 1));
	return {std::clamp(position.x, 0.0, maxX), std::clamp(position.y, 0.0, maxY)};
}

cv::Point pixelOf(const cv::Point2d& position) {
	return {cvFloor(position.x), cvFloor(position.y)};
}

bool isInside(const cv::Point2d& position, const cv::Size size) {
	const cv::Point px = pixelOf(position);
	return px.x >= 0 && px.y >= 0 && px.x < size.width && px.y < size.height;
}

bool isBackground(const cv::Mat& image, const cv::Point2d& position) {
	const cv::Point px = pixelOf(position);
	return image.at<uchar>(px.y, px.x) == BACKGROUND;
}

} // namespace stippler::stipple::core
