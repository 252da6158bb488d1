#include "analyser.hpp"

#include "stipple/core/debugVisualizer.hpp"
#include "stipple/core/errors.hpp"
#include "stipple/core/frameSink.hpp"
#include "stipple/core/logger.hpp"

#include <fmt/format.h>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace stippler::stipple {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(200, 200, 200), 1, cv::LINE_AA);
	return tile;
}

//! Copy the named stages of a finished run into a fresh visualizer.
static void selectStages(const core::DebugVisualizer& all, std::initializer_list<std::string_view> names, core::DebugVisualizer& selected) {
	for (const auto& stage: all.stages()) {
		if (std::find(names.begin(), names.end(), stage.name) == names.end()) {
			continue;
		}
		selected.beginStage(stage.name);
		for (const auto& step: stage.images) {
			selected.add(step.name, step.image);
		}
		selected.endStage();
	}
}

Analyser::Analyser(cv::Mat image, StippleConfig config) : m_original(std::move(image)), m_config(std::move(config)) {
}

void Analyser::setVariant(const RelaxationVariant variant, const bool variableRadius) {
	m_config.variant        = variant;
	m_config.variableRadius = variableRadius;
}

void Analyser::setPointBudget(const int numPoints, const int iterations) {
	m_config.numPoints  = numPoints;
	m_config.iterations = iterations;
}

Analysis Analyser::analyse(const PipelineStep step) const {
	if (m_original.empty()) {
		return {buildInfoTile("Input Error", "Could not load image."), "No image"};
	}

	core::DebugVisualizer debugger;
	core::NullLogger logger;
	core::NullFrameSink frames;
	RunStats stats;
	try {
		StippleEngine engine(m_original, m_config, logger, frames, &debugger);
		stats = engine.stipple().stats;
	} catch (const core::StippleError& e) {
		return {buildInfoTile(std::string(core::toString(e.stage())), e.what()), fmt::format("Failed: {}", e.what())};
	}

	const std::string summary =
	        fmt::format("{}: sampled {}, kept {} after {} iterations | skipped: frozen {}, unbounded {}, degenerate {}, unassigned {}", toString(m_config.variant),
	                    stats.sampled, stats.kept, stats.iterations, stats.skips.frozen, stats.skips.unbounded, stats.skips.degenerate, stats.skips.unassigned);

	core::DebugVisualizer selected;
	switch (step) {
	case PipelineStep::FlowField:
		if (m_config.variant != RelaxationVariant::VoronoiFlow) {
			return {buildInfoTile("Flow Field", "Only the voronoi-flow variant builds a flow field."), summary};
		}
		selectStages(debugger, {"Flow Field"}, selected);
		break;
	case PipelineStep::Sampling:
		selectStages(debugger, {"Initial Points"}, selected);
		break;
	case PipelineStep::Relaxation:
		selectStages(debugger, {"Relaxation", "Relaxed Points"}, selected);
		break;
	case PipelineStep::PostProcess:
		selectStages(debugger, {"Post-processed Points"}, selected);
		break;
	case PipelineStep::All:
		selectStages(debugger, {"Flow Field", "Initial Points", "Relaxed Points", "Post-processed Points"}, selected);
		break;
	}

	cv::Mat mosaic = selected.buildMosaic();
	if (mosaic.empty()) {
		mosaic = buildInfoTile("No Debug Output", "Selected stage produced no visuals.");
	}
	return {mosaic, summary};
}

} // namespace stippler::stipple
