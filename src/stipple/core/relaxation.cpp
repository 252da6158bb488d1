#include "stipple/core/relaxation.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <vector>

#include <opencv2/core/utility.hpp>
#include <opencv2/flann.hpp>
#include <opencv2/imgproc.hpp>

namespace stippler::stipple::core {

namespace {

//! cv::Subdiv2D reserves vertex 0 and puts the outer bounding triangle at 1..3. Real vertices start here.
static constexpr int FIRST_REAL_VERTEX = 4;

//! Rows of pixel queries sent to the KD-tree at once. Bounds the size of the query matrix.
static constexpr int QUERY_BLOCK_ROWS = 128;

//! Neighbours fetched per pixel. Equidistant candidates among them go to the lowest point index.
static constexpr int TIE_CANDIDATES = 4;

//! Seed of the RNG the KD-tree build draws its split axes and shuffles from.
static constexpr std::uint64_t TREE_SEED = 0x5717u;

//! Rows per accumulation stripe. Fixed so the reduction order does not depend on the thread count.
static constexpr int STRIPE_ROWS = 64;

//! A vertex has an unbounded Voronoi region iff it lies on the convex hull, i.e. it is connected to the outer triangle.
static bool hasUnboundedRegion(cv::Subdiv2D& subdiv, int vertex) {
	int firstEdge = 0;
	subdiv.getVertex(vertex, &firstEdge);
	if (firstEdge <= 0) {
		return true;
	}

	int edge = firstEdge;
	do {
		if (subdiv.edgeDst(edge) < FIRST_REAL_VERTEX) {
			return true;
		}
		edge = subdiv.getEdge(edge, cv::Subdiv2D::NEXT_AROUND_ORG);
	} while (edge != firstEdge);

	return false;
}

static std::vector<cv::Point2d> toPolygon(const std::vector<cv::Point2f>& facet) {
	std::vector<cv::Point2d> polygon;
	polygon.reserve(facet.size());
	for (const auto& v: facet) {
		polygon.emplace_back(v.x, v.y);
	}
	return polygon;
}

//! Reseeds cv::theRNG() for the lifetime of the guard and restores the caller's state afterwards.
class ScopedTreeSeed {
public:
	ScopedTreeSeed() : m_saved(cv::theRNG()) {
		cv::theRNG() = cv::RNG(TREE_SEED);
	}
	~ScopedTreeSeed() {
		cv::theRNG() = m_saved;
	}

	ScopedTreeSeed(const ScopedTreeSeed&)            = delete;
	ScopedTreeSeed& operator=(const ScopedTreeSeed&) = delete;

private:
	cv::RNG m_saved;
};

//! Per point running sums of the nearest-point assignment.
struct Accumulator {
	double weight{0.0};
	double weightedY{0.0};
	double weightedX{0.0};
	long count{0};
};

//! Accumulates the pixel weights of one stripe of rows into its own partial sums.
class AccumulateBody : public cv::ParallelLoopBody {
public:
	AccumulateBody(const cv::Mat& image, const cv::Mat& nearest, std::vector<std::vector<Accumulator>>& partials)
	    : m_image(image), m_nearest(nearest), m_partials(partials) {
	}

	void operator()(const cv::Range& stripes) const override {
		for (int s = stripes.start; s < stripes.end; ++s) {
			auto& sums      = m_partials[static_cast<std::size_t>(s)];
			const int yBeg  = s * STRIPE_ROWS;
			const int yEnd  = std::min(m_image.rows, yBeg + STRIPE_ROWS);

			for (int y = yBeg; y < yEnd; ++y) {
				const uchar* pixel = m_image.ptr<uchar>(y);
				const int* owner   = m_nearest.ptr<int>(y);
				for (int x = 0; x < m_image.cols; ++x) {
					const double weight = 1.0 - static_cast<double>(pixel[x]) / 255.0;
					Accumulator& acc    = sums[static_cast<std::size_t>(owner[x])];
					acc.weight += weight;
					acc.weightedY += y * weight;
					acc.weightedX += x * weight;
					++acc.count;
				}
			}
		}
	}

private:
	const cv::Mat& m_image;
	const cv::Mat& m_nearest;
	std::vector<std::vector<Accumulator>>& m_partials;
};

} // namespace

cv::Mat nearestPointMap(const StippleSet& points, const cv::Size size) {
	CV_Assert(!points.empty());

	cv::Mat features(static_cast<int>(points.size()), 2, CV_32F);
	for (std::size_t i = 0; i < points.size(); ++i) {
		float* row = features.ptr<float>(static_cast<int>(i));
		row[0]     = static_cast<float>(points[i].position.x);
		row[1]     = static_cast<float>(points[i].position.y);
	}

	const ScopedTreeSeed seed;
	cv::flann::Index tree(features, cv::flann::KDTreeIndexParams(1));
	const cv::flann::SearchParams exact(cvflann::FLANN_CHECKS_UNLIMITED);
	const int knn = std::min(TIE_CANDIDATES, static_cast<int>(points.size()));

	cv::Mat nearest(size, CV_32SC1);
	for (int y0 = 0; y0 < size.height; y0 += QUERY_BLOCK_ROWS) {
		const int rows = std::min(QUERY_BLOCK_ROWS, size.height - y0);

		cv::Mat queries(rows * size.width, 2, CV_32F);
		for (int r = 0; r < rows; ++r) {
			for (int x = 0; x < size.width; ++x) {
				float* q = queries.ptr<float>(r * size.width + x);
				q[0]     = static_cast<float>(x);
				q[1]     = static_cast<float>(y0 + r);
			}
		}

		cv::Mat indices, dists;
		tree.knnSearch(queries, indices, dists, knn, exact);

		// The search keeps whichever equidistant point it meets first. Resolve ties by index instead.
		for (int q = 0; q < queries.rows; ++q) {
			const int* index  = indices.ptr<int>(q);
			const float* dist = dists.ptr<float>(q);
			const float best  = *std::min_element(dist, dist + knn);
			int owner         = -1;
			for (int k = 0; k < knn; ++k) {
				if (dist[k] == best && index[k] >= 0 && (owner < 0 || index[k] < owner)) {
					owner = index[k];
				}
			}
			nearest.at<int>(y0 + q / size.width, q % size.width) = owner;
		}
	}

	return nearest;
}

// --- VoronoiFlowRelaxation ---

VoronoiFlowRelaxation::VoronoiFlowRelaxation(FlowField flowField) : m_flow(std::move(flowField)) {
}

IterationStats VoronoiFlowRelaxation::relax(const cv::Mat& image, const StippleSet& current, StippleSet& next) {
	CV_Assert(isValidFlowField(m_flow, image.size()));

	IterationStats stats{};
	next = current;
	m_facets.clear();
	if (current.empty()) {
		return stats;
	}

	// Tessellation of the frozen snapshot. Duplicate positions share one vertex.
	cv::Subdiv2D subdiv(cv::Rect(0, 0, image.cols, image.rows));
	std::vector<int> vertexOf(current.size());
	for (std::size_t i = 0; i < current.size(); ++i) {
		vertexOf[i] = subdiv.insert(cv::Point2f(static_cast<float>(current[i].position.x), static_cast<float>(current[i].position.y)));
	}

	Facets facets;
	std::vector<cv::Point2f> facetCenters;
	subdiv.getVoronoiFacetList(vertexOf, facets, facetCenters);
	CV_Assert(facets.size() == current.size());

	std::vector<char> unbounded(current.size(), 0);
	for (std::size_t i = 0; i < current.size(); ++i) {
		unbounded[i] = hasUnboundedRegion(subdiv, vertexOf[i]) ? 1 : 0;
		if (!unbounded[i]) {
			m_facets.push_back(facets[i]);
		}
	}

	for (std::size_t i = 0; i < current.size(); ++i) {
		const cv::Point2d position = current[i].position;
		const cv::Point px         = pixelOf(position);
		const uchar intensity      = image.at<uchar>(px.y, px.x);

		if (intensity == BACKGROUND) {
			++stats.frozen;
			continue;
		}
		if (unbounded[i] || facets[i].empty()) {
			++stats.unbounded;
			continue;
		}

		const auto centroid = polygonCentroid(toPolygon(facets[i]));
		if (!centroid) {
			++stats.degenerate;
			continue;
		}

		// Asymmetric blend: history and centroid, plus the flow displaced position on mid tones.
		cv::Point2d sum = position + *centroid;
		double divisor  = 2.0;
		if (intensity != 0) {
			const double radians   = m_flow.angle.at<double>(px.y, px.x) * std::numbers::pi / 180.0;
			const double magnitude = m_flow.magnitude.at<double>(px.y, px.x);
			const cv::Point2d displacement(std::trunc(magnitude * std::cos(radians)), std::trunc(magnitude * std::sin(radians)));
			sum += position + displacement;
			divisor = 3.0;
		}

		next[i].position = clampToImage(sum / divisor, image.size());
	}

	return stats;
}

cv::Mat VoronoiFlowRelaxation::renderFrame(const cv::Mat& image, const StippleSet& points) const {
	cv::Mat frame = toBgr(image);
	drawStipples(frame, points, cv::Scalar(255, 0, 0));
	drawVoronoi(frame, m_facets, cv::Scalar(0, 255, 0));
	return frame;
}

// --- WeightedNearestRelaxation ---

WeightedNearestRelaxation::WeightedNearestRelaxation(RadiusSettings radii) : m_radii(radii) {
}

IterationStats WeightedNearestRelaxation::relax(const cv::Mat& image, const StippleSet& current, StippleSet& next) {
	IterationStats stats{};
	next = current;
	if (current.empty()) {
		return stats;
	}

	const cv::Mat nearest = nearestPointMap(current, image.size());

	// Partitioned reduction: one partial sum per stripe, merged in stripe order.
	const int stripes = (image.rows + STRIPE_ROWS - 1) / STRIPE_ROWS;
	std::vector<std::vector<Accumulator>> partials(static_cast<std::size_t>(stripes), std::vector<Accumulator>(current.size()));
	cv::parallel_for_(cv::Range(0, stripes), AccumulateBody(image, nearest, partials));

	std::vector<Accumulator> sums(current.size());
	for (const auto& partial: partials) {
		for (std::size_t i = 0; i < sums.size(); ++i) {
			sums[i].weight += partial[i].weight;
			sums[i].weightedY += partial[i].weightedY;
			sums[i].weightedX += partial[i].weightedX;
			sums[i].count += partial[i].count;
		}
	}

	std::vector<double> averageWeight(current.size(), 0.0);
	for (std::size_t i = 0; i < current.size(); ++i) {
		const Accumulator& acc     = sums[i];
		const cv::Point2d position = current[i].position;

		averageWeight[i]       = acc.weight / static_cast<double>(std::max(acc.count, 1L));
		stats.maxAverageWeight = std::max(stats.maxAverageWeight, averageWeight[i]);

		if (isBackground(image, position)) {
			++stats.frozen;
			continue;
		}
		if (acc.weight <= 0.0) {
			++stats.unassigned;
			continue;
		}

		const cv::Point2d centroid(acc.weightedX / acc.weight, acc.weightedY / acc.weight);
		const cv::Point2d step = position + DAMPING * (centroid - position);
		next[i].position       = clampToImage(cv::Point2d(std::floor(step.x), std::floor(step.y)), image.size());
	}

	if (m_radii.variable) {
		for (std::size_t i = 0; i < next.size(); ++i) {
			next[i].radius = remap(averageWeight[i], 0.0, stats.maxAverageWeight, m_radii.minRadius, m_radii.maxRadius);
		}
	}

	return stats;
}

cv::Mat WeightedNearestRelaxation::renderFrame(const cv::Mat& image, const StippleSet& points) const {
	cv::Mat frame = whiteCanvas(image.size());
	drawStipples(frame, points, cv::Scalar(0, 0, 0));
	return frame;
}

} // namespace stippler::stipple::core
