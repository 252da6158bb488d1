#pragma once

#include "pipelineStep.hpp"

#include "stipple/stippleEngine.hpp"

#include <opencv2/core/mat.hpp>

#include <string>

namespace stippler::stipple {

struct Analysis {
	cv::Mat mosaic;      //!< Debug mosaic of the selected step, or an info tile on failure.
	std::string summary; //!< One line of run statistics for the status bar.
};

//! Runs the stippling pipeline with the DebugVisualizer attached and returns the mosaic of the desired PipelineStep.
class Analyser {
public:
	Analyser(cv::Mat image, StippleConfig config);

	void setVariant(RelaxationVariant variant, bool variableRadius);
	void setPointBudget(int numPoints, int iterations);

	const StippleConfig& config() const {
		return m_config;
	}

	Analysis analyse(PipelineStep step) const;

private:
	cv::Mat m_original;
	StippleConfig m_config;
};

} // namespace stippler::stipple
