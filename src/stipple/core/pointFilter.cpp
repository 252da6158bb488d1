#include "stipple/core/pointFilter.hpp"

#include "quadTree.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <vector>

namespace stippler::stipple::core {

static bool onForeground(const cv::Mat& image, const Stipple& s) {
	return isInside(s.position, image.size()) && !isBackground(image, s.position);
}

StippleSet filterBackground(const cv::Mat& image, const StippleSet& stipples) {
	StippleSet kept;
	kept.reserve(stipples.size());
	std::copy_if(stipples.begin(), stipples.end(), std::back_inserter(kept), [&](const Stipple& s) { return onForeground(image, s); });
	return kept;
}

StippleSet filterOverlapping(const cv::Mat& image, const StippleSet& stipples) {
	QuadTree accepted(cv::Rect2d(0.0, 0.0, image.cols, image.rows));
	double maxAcceptedRadius = 0.0;

	StippleSet kept;
	kept.reserve(stipples.size());

	std::vector<QuadTree::Entry> neighbours;
	for (const auto& candidate: stipples) {
		if (!onForeground(image, candidate)) {
			continue;
		}

		// Any overlapping disc has its center within r + (largest accepted radius).
		neighbours.clear();
		const double radius = std::max(0.0, candidate.radius);
		accepted.query(candidate.position, radius + maxAcceptedRadius, neighbours);

		const bool overlaps = std::any_of(neighbours.begin(), neighbours.end(), [&](const QuadTree::Entry& n) {
			return cv::norm(n.position - candidate.position) <= radius + n.radius;
		});
		if (overlaps) {
			continue;
		}

		accepted.insert({candidate.position, radius});
		maxAcceptedRadius = std::max(maxAcceptedRadius, radius);
		kept.push_back(candidate);
	}

	return kept;
}

} // namespace stippler::stipple::core
