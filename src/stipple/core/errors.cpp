#include "stipple/core/errors.hpp"

namespace stippler::stipple::core {

std::string_view toString(const Stage stage) {
	switch (stage) {
	case Stage::Configuration:
		return "configuration";
	case Stage::Sampling:
		return "sampling";
	case Stage::FlowField:
		return "flow-field build";
	case Stage::Relaxation:
		return "relaxation";
	case Stage::PostProcessing:
		return "post-processing";
	case Stage::Export:
		return "export";
	}
	return "unknown";
}

static std::string stageMessage(const Stage stage, const std::string& message) {
	return std::string(toString(stage)) + ": " + message;
}

StippleError::StippleError(const Stage stage, const std::string& message) : std::runtime_error(stageMessage(stage, message)), m_stage{stage} {
}

StippleError::StippleError(const Stage stage, const int iteration, const std::string& message)
    : std::runtime_error(stageMessage(stage, "iteration " + std::to_string(iteration) + ": " + message)), m_stage{stage}, m_iteration{iteration} {
}

ConfigurationError::ConfigurationError(const std::string& message) : StippleError(Stage::Configuration, message) {
}

EmptyForegroundError::EmptyForegroundError(const std::string& message) : StippleError(Stage::Sampling, message) {
}

ExportError::ExportError(const std::string& message) : StippleError(Stage::Export, message) {
}

CancelledError::CancelledError(const int iteration) : StippleError(Stage::Relaxation, iteration, "cancelled") {
}

} // namespace stippler::stipple::core
