#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/core/result.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace cgate::config {

/// Parse and validate a PipelineConfig from its JSON document.
/// Throws std::invalid_argument when a value is out of range or inconsistent, and
/// nlohmann::json::exception when a required key is absent or has the wrong type.
[[nodiscard]] PipelineConfig pipeline_config_from_json(const nlohmann::json& j);

/// Serialize to JSON (deterministic, sorted keys). Recorded in the RunStarted audit event.
[[nodiscard]] nlohmann::json pipeline_config_to_json(const PipelineConfig& config);

/// Read, parse and validate the configuration file at path.
/// A failed read is retried once after `backoff`; parse and validation failures are
/// not retried. The error string names the path and the failing key or invariant.
[[nodiscard]] core::Result<PipelineConfig, std::string> load_pipeline_config(
    const std::string& path, std::chrono::milliseconds backoff = std::chrono::milliseconds{50});

}  // namespace cgate::config
