#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace stippler::stipple::core {

//! Pipeline stages. Used to report where a run failed.
enum class Stage { Configuration, Sampling, FlowField, Relaxation, PostProcessing, Export };

std::string_view toString(Stage stage);

//! Base of all errors raised by the stippling pipeline.
class StippleError : public std::runtime_error {
public:
	StippleError(Stage stage, const std::string& message);
	StippleError(Stage stage, int iteration, const std::string& message); //!< Relaxation failure in a given iteration.

	Stage stage() const noexcept {
		return m_stage;
	}
	int iteration() const noexcept {
		return m_iteration;
	}

private:
	Stage m_stage;
	int m_iteration{-1}; //!< Failing relaxation iteration. -1 if not applicable.
};

//! Invalid StippleConfig or input image. Raised at construction time.
class ConfigurationError : public StippleError {
public:
	explicit ConfigurationError(const std::string& message);
};

//! The foreground sampler could not find enough non-background pixels.
class EmptyForegroundError : public StippleError {
public:
	explicit EmptyForegroundError(const std::string& message);
};

//! Writing an export or debug artifact failed.
class ExportError : public StippleError {
public:
	explicit ExportError(const std::string& message);
};

//! Run was cancelled between two relaxation iterations.
class CancelledError : public StippleError {
public:
	explicit CancelledError(int iteration);
};

} // namespace stippler::stipple::core
