#pragma once

#include "stipple/core/debugVisualizer.hpp"
#include "stipple/core/flowField.hpp"
#include "stipple/core/frameSink.hpp"
#include "stipple/core/geometry.hpp"
#include "stipple/core/logger.hpp"
#include "stipple/core/pointSampler.hpp"
#include "stipple/core/relaxation.hpp"

#include <opencv2/core/mat.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stippler::stipple {

enum class RelaxationVariant {
	VoronoiFlow,     //!< Exact Voronoi regions, flow biased, fixed radius.
	WeightedNearest, //!< Weighted nearest-point regions, fixed or variable radius.
};

std::string_view toString(RelaxationVariant variant);

//! Parameters of one stippling run.
struct StippleConfig {
	int numPoints{1000};
	int iterations{10};
	double dotsPerUnit{1.0};        //!< Pixels per user unit. Scales the radii.
	double pointUnitRadius{1.0};    //!< Dot radius in user units. Maximum radius in variable radius mode.
	double minPointUnitRadius{0.5}; //!< Smallest dot radius in user units. Variable radius mode only.
	int preprocessWindowSize{3};    //!< Half width of the flow field search window. VoronoiFlow only.

	RelaxationVariant variant{RelaxationVariant::VoronoiFlow};
	bool variableRadius{false}; //!< WeightedNearest only.

	core::SamplingStrategy sampling{core::SamplingStrategy::Foreground};
	std::uint64_t seed{0u};
	std::size_t maxSamplingAttempts{0u}; //!< 0 selects core::defaultSamplingAttempts().

	//! \throws core::ConfigurationError on the first invalid value.
	void validate() const;

	int radiusPixels() const;    //!< round(pointUnitRadius * dotsPerUnit)
	int minRadiusPixels() const; //!< round(minPointUnitRadius * dotsPerUnit)

	bool usesVariableRadius() const {
		return variant == RelaxationVariant::WeightedNearest && variableRadius;
	}

	std::string describe() const; //!< Multi line summary for the log.
};

//! Where and how debug output of a run is written.
struct DebugOptions {
	std::filesystem::path debugDir{"debug"};
	bool consoleDebug{false};   //!< Print log messages to the console.
	bool txtDebug{false};       //!< Write log messages to <debugDir>/Debug.txt.
	bool visualizeDebug{false}; //!< Write stage images, iteration frames and the relaxation video to <debugDir>.

	//! True if anything is written to the debug directory.
	bool writesFiles() const {
		return txtDebug || visualizeDebug;
	}

	std::string describe() const;
};

//! Point counts and skip counters of a finished run.
struct RunStats {
	std::size_t sampled{0u};      //!< Points placed by the sampler.
	std::size_t relaxed{0u};      //!< Points after relaxation. Always equal to sampled.
	std::size_t kept{0u};         //!< Points that survived post-processing.
	int iterations{0};            //!< Relaxation iterations run.
	core::IterationStats skips{}; //!< Skip counters summed over all iterations.
};

struct StippleResult {
	core::StippleSet stipples; //!< Final points in relaxation order.
	cv::Size imageSize;        //!< Canvas size of the exports.
	RunStats stats;
};

//! Relaxation strategy of the configured variant. The flow field is only used by the VoronoiFlow variant.
std::unique_ptr<core::RelaxationStrategy> makeRelaxationStrategy(const StippleConfig& config, core::FlowField flowField = {});

/*! Runs the stippling pipeline on one grayscale image.
 *  Process: Flow field (VoronoiFlow only) -> Sampling -> Relaxation (config.iterations times) -> Post-processing.
 *  The point count stays constant during relaxation. Post-processing drops background points and, with variable radii,
 *  overlapping dots.
 *
 *  Failures throw a core::StippleError naming the failing stage. The engine keeps no partial result on failure.
 */
class StippleEngine {
public:
	/*! Engine with debug output as described by the options.
	 *  The debug directory is emptied first if any files are written to it.
	 * \throws core::ConfigurationError for an invalid image or configuration.
	 * \throws core::ExportError if the debug directory or log file cannot be created.
	 */
	StippleEngine(const cv::Mat& image, StippleConfig config, const DebugOptions& debugOptions = DebugOptions{});

	/*! Engine writing to the given collaborators. They must outlive the engine.
	 * \param [in]     image    8-bit image. Color images are converted to grayscale.
	 * \param [in]     config   Run parameters.
	 * \param [in,out] logger   Receives progress messages.
	 * \param [in,out] frames   Receives stage snapshots and iteration frames.
	 * \param [in,out] debugger Optional debug visualizer. Receives the intermediate images of every stage.
	 * \throws         core::ConfigurationError for an invalid image or configuration.
	 */
	StippleEngine(const cv::Mat& image, StippleConfig config, core::Logger& logger, core::FrameSink& frames, core::DebugVisualizer* debugger = nullptr);

	~StippleEngine();

	StippleEngine(const StippleEngine&)            = delete;
	StippleEngine& operator=(const StippleEngine&) = delete;

	//! Run the whole pipeline. Runs again from scratch on every call.
	//! \throws core::StippleError (or a subclass) naming the failed stage.
	const StippleResult& stipple();

	//! Request cancellation of the running or the next stipple() call. Checked before every relaxation iteration.
	//! A request still pending when stipple() returns or throws is dropped. Thread safe.
	void cancel();

	//! \throws core::ExportError if the file cannot be written or stipple() has not completed.
	void exportToSvg(const std::filesystem::path& path) const;
	//! \throws core::ExportError if the file cannot be written or stipple() has not completed.
	void exportToPng(const std::filesystem::path& path) const;

	//! Result of the last completed run. Empty before stipple() succeeded.
	const std::optional<StippleResult>& result() const {
		return m_result;
	}

	const cv::Mat& image() const {
		return m_image;
	}
	const StippleConfig& config() const {
		return m_config;
	}

private:
	core::FlowField buildFlowField();
	core::StippleSet sample();
	core::StippleSet relax(core::RelaxationStrategy& strategy, core::StippleSet points, RunStats& stats);
	void relaxIterations(core::RelaxationStrategy& strategy, core::StippleSet& points, core::StippleSet& next, RunStats& stats);
	core::StippleSet postprocess(const core::StippleSet& relaxed);

	void visualizePoints(std::string_view name, std::string_view stage, const core::StippleSet& points);
	const StippleResult& requireResult() const;

private:
	cv::Mat m_image;       //!< CV_8UC1 input.
	StippleConfig m_config;

	std::unique_ptr<core::Logger> m_ownedLogger{};   //!< Set if the engine created its own logger.
	std::unique_ptr<core::FrameSink> m_ownedFrames{}; //!< Set if the engine created its own frame sink.
	core::Logger& m_logger;
	core::FrameSink& m_frames;
	core::DebugVisualizer* m_debugger{nullptr};

	std::atomic<bool> m_cancelled{false};
	std::optional<StippleResult> m_result{};
};

} // namespace stippler::stipple
