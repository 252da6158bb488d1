#pragma once

namespace stippler {

//! Pipeline stage whose debug images are shown in the tuner.
enum class PipelineStep { FlowField, Sampling, Relaxation, PostProcess, All };

} // namespace stippler
