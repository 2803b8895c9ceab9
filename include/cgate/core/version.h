#pragma once

namespace cgate::core {

// kBuildVersion is the current software version string.
// Recorded in the RunStarted audit event of every pipeline run.
constexpr const char* kBuildVersion = "0.3";

// kStateFormatVersion is the version of the persisted pipeline-state envelope.
// Bump when the JSON layout of PipelineState changes incompatibly.
constexpr int kStateFormatVersion = 1;

}  // namespace cgate::core
