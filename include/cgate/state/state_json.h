#pragma once

#include "cgate/core/result.h"
#include "cgate/state/pipeline_state.h"

#include <nlohmann/json.hpp>

#include <string>

namespace cgate::state {

// Persisted records are integrity envelopes:
//   {"format_version": 1, "sha256": "<hex of payload.dump()>", "state": {...}}
//   {"format_version": 1, "sha256": "<hex of payload.dump()>", "checkpoint": {...}}
// Keys are sorted and the dump is compact, so identical states encode to identical bytes.
//
// Decoding maps every failure (unparseable text, wrong format version, digest
// mismatch, missing field, wrong type, unknown enum string) to
// StoreErrorCode::kCorrupted. Cross-field consistency is not checked here.

[[nodiscard]] nlohmann::json pipeline_state_to_json(const PipelineState& state);
// Throws nlohmann::json::exception or std::invalid_argument on schema errors.
[[nodiscard]] PipelineState pipeline_state_from_json(const nlohmann::json& j);

[[nodiscard]] std::string encode_state_record(const PipelineState& state);
[[nodiscard]] core::Result<PipelineState, core::StoreError> decode_state_record(
    const std::string& record);

[[nodiscard]] std::string encode_checkpoint_record(const Checkpoint& checkpoint);
[[nodiscard]] core::Result<Checkpoint, core::StoreError> decode_checkpoint_record(
    const std::string& record);

}  // namespace cgate::state
