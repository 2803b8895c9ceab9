#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cgate::storage {

// Event types written to the run log.
namespace events {
inline constexpr std::string_view kRunStarted = "RunStarted";
inline constexpr std::string_view kRunStopped = "RunStopped";
inline constexpr std::string_view kRunCompleted = "RunCompleted";
inline constexpr std::string_view kClassificationCompleted = "ClassificationCompleted";
inline constexpr std::string_view kClassificationFailed = "ClassificationFailed";
inline constexpr std::string_view kSectionStarted = "SectionStarted";
inline constexpr std::string_view kGateEvaluated = "GateEvaluated";
inline constexpr std::string_view kRetryScheduled = "RetryScheduled";
inline constexpr std::string_view kSectionCompleted = "SectionCompleted";
inline constexpr std::string_view kSectionFailed = "SectionFailed";
inline constexpr std::string_view kCheckpointCreated = "CheckpointCreated";
inline constexpr std::string_view kStateRecovered = "StateRecovered";
}  // namespace events

// AuditEvent is one entry of a run log. trace_id is the pipeline run id, payload a
// compact JSON object, refs the sections or checkpoints the event concerns.
// sequence, previous_hash and event_hash are assigned by the log on append.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
  std::uint64_t sequence{0};
  std::string previous_hash{};  // NOLINT(readability-identifier-naming)
  std::string event_hash{};     // NOLINT(readability-identifier-naming)
};

}  // namespace cgate::storage
