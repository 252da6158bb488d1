#include "stipple/core/visualization.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace stippler::stipple::core {

cv::Mat whiteCanvas(const cv::Size size) {
	return cv::Mat(size, CV_8UC3, cv::Scalar(255, 255, 255));
}

cv::Mat toBgr(const cv::Mat& image) {
	cv::Mat out;
	if (image.channels() == 1) {
		cv::cvtColor(image, out, cv::COLOR_GRAY2BGR);
	} else if (image.channels() == 4) {
		cv::cvtColor(image, out, cv::COLOR_BGRA2BGR);
	} else {
		out = image.clone();
	}
	return out;
}

void drawStipples(cv::Mat& canvas, const StippleSet& stipples, const cv::Scalar& color) {
	for (const auto& s: stipples) {
		const cv::Point center(static_cast<int>(std::lround(s.position.x)), static_cast<int>(std::lround(s.position.y)));
		const int radius = static_cast<int>(std::lround(std::max(0.0, s.radius)));
		cv::circle(canvas, center, radius, color, cv::FILLED, cv::LINE_8);
	}
}

void drawVoronoi(cv::Mat& canvas, const Facets& facets, const cv::Scalar& color) {
	const cv::Rect bounds(0, 0, canvas.cols, canvas.rows);

	// Aggregate the facets for a single polylines call. Unbounded facets reach far outside the canvas and are skipped.
	std::vector<std::vector<cv::Point>> polygons;
	polygons.reserve(facets.size());
	for (const auto& facet: facets) {
		if (facet.size() < 3u) {
			continue;
		}

		std::vector<cv::Point> polygon;
		polygon.reserve(facet.size());
		bool bounded = true;
		for (const auto& v: facet) {
			const cv::Point p(cvRound(v.x), cvRound(v.y));
			if (!bounds.contains(p)) {
				bounded = false;
				break;
			}
			polygon.push_back(p);
		}
		if (bounded) {
			polygons.push_back(std::move(polygon));
		}
	}

	cv::polylines(canvas, polygons, true, color, 1, cv::LINE_8);
}

} // namespace stippler::stipple::core
