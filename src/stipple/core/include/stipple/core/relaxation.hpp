#pragma once

#include "stipple/core/flowField.hpp"
#include "stipple/core/geometry.hpp"
#include "stipple/core/visualization.hpp"

#include <opencv2/core/mat.hpp>

#include <string_view>

namespace stippler::stipple::core {

//! Counters of one relaxation iteration.
struct IterationStats {
	int frozen{0};                 //!< Points on background pixels. Not moved.
	int unbounded{0};              //!< Points with an unbounded Voronoi region. Not moved.
	int degenerate{0};             //!< Points whose region has zero area. Not moved.
	int unassigned{0};             //!< Points that collected no weight. Not moved.
	double maxAverageWeight{0.0}; //!< Largest per-point average pixel weight (nearest-point assignment only).
};

/*! One Lloyd relaxation step. The engine owns the point set and drives the iterations,
 *  strategies only compute the next positions (and radii) from a frozen snapshot.
 */
class RelaxationStrategy {
public:
	virtual ~RelaxationStrategy() = default;

	virtual std::string_view name() const = 0;

	/*! Compute the next point set.
	 * \param [in]  image   CV_8UC1 image.
	 * \param [in]  current Snapshot of the current points. Not modified.
	 * \param [out] next    Resized to current.size(). Receives the new points in the same order.
	 * \return      Counters of this iteration.
	 * \note        Every position in `next` lies inside the image. Points on background pixels keep their position.
	 */
	virtual IterationStats relax(const cv::Mat& image, const StippleSet& current, StippleSet& next) = 0;

	//! Visualise the most recent iteration on top of the image.
	virtual cv::Mat renderFrame(const cv::Mat& image, const StippleSet& points) const = 0;
};

/*! Exact Voronoi relaxation with flow bias (single fixed radius).
 *  Each point moves to the average of its current position, its Voronoi region centroid and,
 *  on mid-tone pixels, its flow-displaced position. Positions are sub-pixel.
 */
class VoronoiFlowRelaxation : public RelaxationStrategy {
public:
	explicit VoronoiFlowRelaxation(FlowField flowField);

	std::string_view name() const override {
		return "voronoi-flow";
	}
	IterationStats relax(const cv::Mat& image, const StippleSet& current, StippleSet& next) override;
	cv::Mat renderFrame(const cv::Mat& image, const StippleSet& points) const override;

	const Facets& lastFacets() const {
		return m_facets;
	}

private:
	FlowField m_flow;
	Facets m_facets{}; //!< Bounded facets of the last tessellation. Only kept for visualisation.
};

//! Radius policy of the nearest-point relaxation.
struct RadiusSettings {
	bool variable{false};    //!< Derive radii from the local darkness each iteration.
	double minRadius{0.0};   //!< Pixels. Radius of points with zero average weight.
	double maxRadius{1.0};   //!< Pixels. Radius of the points with the largest average weight. Also the fixed radius.
};

/*! Weighted nearest-point relaxation.
 *  Every pixel adds its darkness (1 - intensity/255) to the closest point. Points take a damped step (factor DAMPING)
 *  toward the weighted centroid of their pixels and are floored to integer pixels.
 */
class WeightedNearestRelaxation : public RelaxationStrategy {
public:
	static constexpr double DAMPING = 0.25;

	explicit WeightedNearestRelaxation(RadiusSettings radii);

	std::string_view name() const override {
		return m_radii.variable ? "weighted-nearest-variable" : "weighted-nearest";
	}
	IterationStats relax(const cv::Mat& image, const StippleSet& current, StippleSet& next) override;
	cv::Mat renderFrame(const cv::Mat& image, const StippleSet& points) const override;

private:
	RadiusSettings m_radii;
};

/*! Index of the nearest point for every pixel center, found with a KD-tree.
 *  A pixel equidistant to several points belongs to the one with the lowest index. The tree is built from a fixed seed,
 *  so the result does not depend on or change the state of cv::theRNG().
 * \param [in] points Non-empty point set.
 * \param [in] size   Image size.
 * \return     CV_32SC1 matrix of the image size.
 */
cv::Mat nearestPointMap(const StippleSet& points, cv::Size size);

} // namespace stippler::stipple::core
