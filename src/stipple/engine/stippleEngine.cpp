#include "stipple/stippleEngine.hpp"

#include "stipple/core/errors.hpp"
#include "stipple/core/exporter.hpp"
#include "stipple/core/pointFilter.hpp"
#include "stipple/core/visualization.hpp"

#include <opencv2/imgproc.hpp>

#include <atomic>
#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace stippler::stipple {

using namespace core;

std::string_view toString(const RelaxationVariant variant) {
	switch (variant) {
	case RelaxationVariant::VoronoiFlow:
		return "voronoi-flow";
	case RelaxationVariant::WeightedNearest:
		return "weighted-nearest";
	}
	return "unknown";
}

static std::string_view toString(const SamplingStrategy strategy) {
	switch (strategy) {
	case SamplingStrategy::Uniform:
		return "uniform";
	case SamplingStrategy::Foreground:
		return "foreground";
	}
	return "unknown";
}

// --- Configuration ---

void StippleConfig::validate() const {
	if (numPoints <= 0) {
		throw ConfigurationError(fmt::format("numPoints must be positive, got {}", numPoints));
	}
	if (iterations <= 0) {
		throw ConfigurationError(fmt::format("iterations must be positive, got {}", iterations));
	}
	if (!(dotsPerUnit > 0.0)) {
		throw ConfigurationError(fmt::format("dotsPerUnit must be positive, got {}", dotsPerUnit));
	}
	if (!(pointUnitRadius > 0.0)) {
		throw ConfigurationError(fmt::format("pointUnitRadius must be positive, got {}", pointUnitRadius));
	}
	if (usesVariableRadius()) {
		if (!(minPointUnitRadius > 0.0)) {
			throw ConfigurationError(fmt::format("minPointUnitRadius must be positive, got {}", minPointUnitRadius));
		}
		if (minPointUnitRadius > pointUnitRadius) {
			throw ConfigurationError(fmt::format("minPointUnitRadius ({}) exceeds pointUnitRadius ({})", minPointUnitRadius, pointUnitRadius));
		}
	}
	if (preprocessWindowSize < 0) {
		throw ConfigurationError(fmt::format("preprocessWindowSize must not be negative, got {}", preprocessWindowSize));
	}
}

int StippleConfig::radiusPixels() const {
	return static_cast<int>(std::lround(pointUnitRadius * dotsPerUnit));
}

int StippleConfig::minRadiusPixels() const {
	return static_cast<int>(std::lround(minPointUnitRadius * dotsPerUnit));
}

std::string StippleConfig::describe() const {
	std::string text = fmt::format("Variant: {}\n"
	                               "Number of points: {}\n"
	                               "Iterations: {}\n"
	                               "Dots per unit: {}\n"
	                               "Point radius in units: {}\n"
	                               "Point pixel radius: {}\n",
	                               toString(variant), numPoints, iterations, dotsPerUnit, pointUnitRadius, radiusPixels());
	if (usesVariableRadius()) {
		text += fmt::format("Minimum point radius in units: {}\nMinimum point pixel radius: {}\n", minPointUnitRadius, minRadiusPixels());
	}
	if (variant == RelaxationVariant::VoronoiFlow) {
		text += fmt::format("Preprocess window size: {}\n", preprocessWindowSize);
	}
	text += fmt::format("Sampling: {}\nSeed: {}", toString(sampling), seed);
	return text;
}

std::string DebugOptions::describe() const {
	return fmt::format("Debug directory: {}\nConsole debug: {}\nText debug: {}\nVisualize debug: {}", debugDir.string(), consoleDebug, txtDebug,
	                   visualizeDebug);
}

std::unique_ptr<RelaxationStrategy> makeRelaxationStrategy(const StippleConfig& config, FlowField flowField) {
	switch (config.variant) {
	case RelaxationVariant::VoronoiFlow:
		return std::make_unique<VoronoiFlowRelaxation>(std::move(flowField));
	case RelaxationVariant::WeightedNearest: {
		RadiusSettings radii{};
		radii.variable  = config.variableRadius;
		radii.minRadius = config.minRadiusPixels();
		radii.maxRadius = config.radiusPixels();
		return std::make_unique<WeightedNearestRelaxation>(radii);
	}
	}
	throw ConfigurationError("Unknown relaxation variant.");
}

// --- Engine ---

namespace {

//! 8-bit single channel copy of the input.
cv::Mat prepareImage(const cv::Mat& image) {
	if (image.empty()) {
		throw ConfigurationError("Input image is empty.");
	}
	if (image.depth() != CV_8U) {
		throw ConfigurationError(fmt::format("Input image must be 8-bit, got depth {}", image.depth()));
	}

	cv::Mat gray;
	switch (image.channels()) {
	case 1:
		gray = image.clone();
		break;
	case 3:
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
		break;
	case 4:
		cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
		break;
	default:
		throw ConfigurationError(fmt::format("Unsupported channel count {}", image.channels()));
	}
	return gray;
}

StippleConfig validated(StippleConfig config) {
	config.validate();
	return config;
}

//! Runs before the frame sink is created. Empties the debug directory.
std::unique_ptr<Logger> makeLogger(const DebugOptions& options) {
	if (options.writesFiles()) {
		resetDirectory(options.debugDir);
	}
	if (!options.consoleDebug && !options.txtDebug) {
		return std::make_unique<NullLogger>();
	}
	return std::make_unique<DebugLogger>(options.consoleDebug, options.txtDebug ? options.debugDir / "Debug.txt" : std::filesystem::path{});
}

std::unique_ptr<FrameSink> makeFrameSink(const DebugOptions& options) {
	if (!options.visualizeDebug) {
		return std::make_unique<NullFrameSink>();
	}
	return std::make_unique<DirectoryFrameSink>(options.debugDir);
}

//! Drops a pending cancellation request when a run ends, however it ends.
class CancelReset {
public:
	explicit CancelReset(std::atomic<bool>& flag) : m_flag(flag) {
	}
	~CancelReset() {
		m_flag.store(false);
	}

	CancelReset(const CancelReset&)            = delete;
	CancelReset& operator=(const CancelReset&) = delete;

private:
	std::atomic<bool>& m_flag;
};

//! Run one pipeline stage. Logs failures and reports OpenCV errors as errors of that stage.
template <typename Fn>
auto runStage(const Stage stage, Logger& logger, Fn&& fn) -> decltype(fn()) {
	try {
		return fn();
	} catch (const StippleError& e) {
		logger.error(e.what());
		throw;
	} catch (const cv::Exception& e) {
		const StippleError error(stage, e.what());
		logger.error(error.what());
		throw error;
	}
}

} // namespace

StippleEngine::StippleEngine(const cv::Mat& image, StippleConfig config, const DebugOptions& debugOptions)
    : m_image{prepareImage(image)}, m_config{validated(std::move(config))}, m_ownedLogger{makeLogger(debugOptions)},
      m_ownedFrames{makeFrameSink(debugOptions)}, m_logger{*m_ownedLogger}, m_frames{*m_ownedFrames} {
	m_logger.info(fmt::format("Image shape: {}x{}\n{}\n{}", m_image.rows, m_image.cols, m_config.describe(), debugOptions.describe()));
}

StippleEngine::StippleEngine(const cv::Mat& image, StippleConfig config, Logger& logger, FrameSink& frames, DebugVisualizer* debugger)
    : m_image{prepareImage(image)}, m_config{validated(std::move(config))}, m_logger{logger}, m_frames{frames}, m_debugger{debugger} {
	m_logger.info(fmt::format("Image shape: {}x{}\n{}", m_image.rows, m_image.cols, m_config.describe()));
}

StippleEngine::~StippleEngine() = default;

const StippleResult& StippleEngine::stipple() {
	const CancelReset cancelReset(m_cancelled);
	m_result.reset();

	StippleResult result{};
	result.imageSize = m_image.size();

	FlowField flow{};
	if (m_config.variant == RelaxationVariant::VoronoiFlow) {
		flow = runStage(Stage::FlowField, m_logger, [&] { return buildFlowField(); });
	}
	auto strategy = makeRelaxationStrategy(m_config, std::move(flow));

	StippleSet points    = runStage(Stage::Sampling, m_logger, [&] { return sample(); });
	result.stats.sampled = points.size();

	points               = runStage(Stage::Relaxation, m_logger, [&] { return relax(*strategy, std::move(points), result.stats); });
	result.stats.relaxed = points.size();

	result.stipples   = runStage(Stage::PostProcessing, m_logger, [&] { return postprocess(points); });
	result.stats.kept = result.stipples.size();

	m_frames.finish();
	m_result = std::move(result);
	return *m_result;
}

void StippleEngine::cancel() {
	m_cancelled.store(true);
}

void StippleEngine::exportToSvg(const std::filesystem::path& path) const {
	const StippleResult& result = requireResult();
	writeSvg(path, result.stipples, result.imageSize);
	m_logger.info(fmt::format("Exported {} points to {}", result.stipples.size(), path.string()));
}

void StippleEngine::exportToPng(const std::filesystem::path& path) const {
	const StippleResult& result = requireResult();
	writePng(path, result.stipples, result.imageSize);
	m_logger.info(fmt::format("Exported preview to {}", path.string()));
}

const StippleResult& StippleEngine::requireResult() const {
	if (!m_result) {
		throw ExportError("Nothing to export. Run stipple() first.");
	}
	return *m_result;
}

FlowField StippleEngine::buildFlowField() {
	m_logger.info("Preprocessing...");
	FlowField flow = core::buildFlowField(m_image, m_config.preprocessWindowSize, m_debugger);

	if (m_frames.enabled()) {
		m_frames.snapshot("hsv_plot", flowFieldToBgr(flow));
		m_frames.snapshot("arrow_plot", drawFlowArrows(m_image, flow, cv::Scalar(0, 0, 255)));
	}
	m_logger.info("Preprocessing complete.");
	return flow;
}

StippleSet StippleEngine::sample() {
	m_logger.info("Generating points...");
	cv::RNG rng(m_config.seed);
	StippleSet points = samplePoints(m_image, m_config.numPoints, m_config.sampling, rng, m_config.radiusPixels(), m_config.maxSamplingAttempts);

	visualizePoints("initial_points", "Initial Points", points);
	m_logger.info(fmt::format("Generated {}.", points.size()));
	return points;
}

StippleSet StippleEngine::relax(RelaxationStrategy& strategy, StippleSet points, RunStats& stats) {
	m_logger.info(fmt::format("Relaxing ({})...", strategy.name()));

	StippleSet next;
	next.reserve(points.size());

	if (m_debugger) {
		m_debugger->beginStage("Relaxation");
	}

	try {
		relaxIterations(strategy, points, next, stats);
	} catch (...) {
		if (m_debugger) {
			m_debugger->endStage();
		}
		throw;
	}
	if (m_debugger) {
		m_debugger->endStage();
	}

	visualizePoints("relaxed_points", "Relaxed Points", points);
	m_logger.info("Relaxation complete.");
	return points;
}

void StippleEngine::relaxIterations(RelaxationStrategy& strategy, StippleSet& points, StippleSet& next, RunStats& stats) {
	int lastDecile = -1;
	for (int iteration = 0; iteration < m_config.iterations; ++iteration) {
		if (m_cancelled.exchange(false)) {
			throw CancelledError(iteration);
		}

		const int decile = iteration * 10 / m_config.iterations;
		if (decile != lastDecile) {
			m_logger.info(fmt::format("{}%...", iteration * 100 / m_config.iterations));
			lastDecile = decile;
		}

		IterationStats iterationStats{};
		try {
			iterationStats = strategy.relax(m_image, points, next);
		} catch (const cv::Exception& e) {
			throw StippleError(Stage::Relaxation, iteration, e.what());
		}
		std::swap(points, next);

		stats.skips.frozen += iterationStats.frozen;
		stats.skips.unbounded += iterationStats.unbounded;
		stats.skips.degenerate += iterationStats.degenerate;
		stats.skips.unassigned += iterationStats.unassigned;
		stats.skips.maxAverageWeight = iterationStats.maxAverageWeight;
		stats.iterations             = iteration + 1;

		if (iterationStats.unbounded + iterationStats.degenerate + iterationStats.unassigned > 0) {
			m_logger.debug(fmt::format("Iteration {}: {} frozen, {} unbounded, {} degenerate, {} unassigned", iteration, iterationStats.frozen,
			                           iterationStats.unbounded, iterationStats.degenerate, iterationStats.unassigned));
		}

		if (m_frames.enabled()) {
			m_frames.frame(iteration, strategy.renderFrame(m_image, points));
		}
		if (m_debugger) {
			m_debugger->add(fmt::format("Iteration {}", iteration), strategy.renderFrame(m_image, points));
		}
	}
}

StippleSet StippleEngine::postprocess(const StippleSet& relaxed) {
	m_logger.info("Postprocessing...");
	StippleSet kept = m_config.usesVariableRadius() ? filterOverlapping(m_image, relaxed) : filterBackground(m_image, relaxed);

	visualizePoints("post_processed_points", "Post-processed Points", kept);
	m_logger.info(fmt::format("Postprocessing complete. Kept {} of {} points.", kept.size(), relaxed.size()));
	return kept;
}

//! Points on white and on the input image. Written as <name>.png and <name>_overlayed.png.
void StippleEngine::visualizePoints(const std::string_view name, const std::string_view stage, const StippleSet& points) {
	if (!m_frames.enabled() && !m_debugger) {
		return;
	}

	cv::Mat onWhite = whiteCanvas(m_image.size());
	drawStipples(onWhite, points, cv::Scalar(0, 0, 0));
	cv::Mat overlayed = toBgr(m_image);
	drawStipples(overlayed, points, cv::Scalar(0, 0, 255));

	if (m_frames.enabled()) {
		m_frames.snapshot(name, onWhite);
		m_frames.snapshot(fmt::format("{}_overlayed", name), overlayed);
	}
	if (m_debugger) {
		m_debugger->beginStage(std::string(stage));
		m_debugger->add("Points", onWhite);
		m_debugger->add("Overlayed", overlayed);
		m_debugger->endStage();
	}
}

} // namespace stippler::stipple
