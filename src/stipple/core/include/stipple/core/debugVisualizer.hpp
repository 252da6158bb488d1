#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace stippler::stipple::core {

//! Single labelled image, e.g. one relaxation iteration.
struct DebugStep {
	std::string name;
	cv::Mat image;
};

//! All images of one pipeline stage (flow field, sampling, relaxation, post-processing).
struct DebugStage {
	std::string name;                //!< Empty for images added outside of a stage.
	std::vector<DebugStep> images{};
};

/*! Optional collector for intermediate images. Pipeline functions take a `DebugVisualizer*` and skip all debug rendering when it is null.
 *  The tuner renders the collected stages with buildMosaic().
 */
class DebugVisualizer {
public:
	static constexpr int TILE_WIDTH         = 320; //!< Tile width in the mosaic. Tile height follows the stage's image aspect ratio.
	static constexpr int MAX_TILES_PER_ROW  = 5;
	static constexpr int MAX_ROWS_PER_STAGE = 4; //!< Stages with more images are thinned out evenly. The last image is always kept.

	void beginStage(std::string name);              //!< Ends the active stage, if any.
	void add(std::string name, const cv::Mat& img); //!< Stores a copy. Opens an unnamed stage if none is active.
	void endStage();
	void clear();

	const std::vector<DebugStage>& stages() const {
		return m_stages;
	}

	//! One band per stage: a header bar with the stage name followed by rows of labelled tiles.
	//! Ends the active stage. Empty if no image was added.
	cv::Mat buildMosaic();

	static cv::Mat toBgr8U(const cv::Mat& in); //!< Min/max normalised 8-bit BGR copy of any single, three or four channel image.

	//! Indices of at most `limit` entries out of `count`, evenly spread and always including the last one.
	static std::vector<std::size_t> pickSteps(std::size_t count, std::size_t limit);

private:
	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{}; //!< Finished stages in insertion order.
};

} // namespace stippler::stipple::core
