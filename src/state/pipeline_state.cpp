#include "cgate/state/pipeline_state.h"

#include <algorithm>
#include <stdexcept>

namespace cgate::state {

std::string run_status_to_string(RunStatus s) {
  switch (s) {
    case RunStatus::kPending:
      return "pending";
    case RunStatus::kInProgress:
      return "in_progress";
    case RunStatus::kCompleted:
      return "completed";
    case RunStatus::kFailed:
      return "failed";
    case RunStatus::kRecovered:
      return "recovered";
  }
  return "unknown";
}

RunStatus run_status_from_string(const std::string& s) {
  if (s == "pending")
    return RunStatus::kPending;
  if (s == "in_progress")
    return RunStatus::kInProgress;
  if (s == "completed")
    return RunStatus::kCompleted;
  if (s == "failed")
    return RunStatus::kFailed;
  if (s == "recovered")
    return RunStatus::kRecovered;
  throw std::invalid_argument("Unknown RunStatus: " + s);
}

std::string section_status_to_string(SectionStatus s) {
  switch (s) {
    case SectionStatus::kPending:
      return "pending";
    case SectionStatus::kInProgress:
      return "in_progress";
    case SectionStatus::kCompleted:
      return "completed";
    case SectionStatus::kFailed:
      return "failed";
    case SectionStatus::kSkipped:
      return "skipped";
  }
  return "unknown";
}

SectionStatus section_status_from_string(const std::string& s) {
  if (s == "pending")
    return SectionStatus::kPending;
  if (s == "in_progress")
    return SectionStatus::kInProgress;
  if (s == "completed")
    return SectionStatus::kCompleted;
  if (s == "failed")
    return SectionStatus::kFailed;
  if (s == "skipped")
    return SectionStatus::kSkipped;
  throw std::invalid_argument("Unknown SectionStatus: " + s);
}

bool is_allowed_transition(RunStatus from, RunStatus to) noexcept {
  if (from == to) {
    return true;
  }
  switch (from) {
    case RunStatus::kPending:
      return to == RunStatus::kInProgress;
    case RunStatus::kInProgress:
      return to == RunStatus::kCompleted || to == RunStatus::kFailed;
    case RunStatus::kRecovered:
      return to == RunStatus::kInProgress || to == RunStatus::kCompleted ||
             to == RunStatus::kFailed;
    case RunStatus::kCompleted:
    case RunStatus::kFailed:
      return false;
  }
  return false;
}

bool is_allowed_transition(SectionStatus from, SectionStatus to) noexcept {
  switch (from) {
    case SectionStatus::kPending:
      return to == SectionStatus::kPending || to == SectionStatus::kInProgress ||
             to == SectionStatus::kSkipped;
    case SectionStatus::kInProgress:
      return to == SectionStatus::kInProgress || to == SectionStatus::kCompleted ||
             to == SectionStatus::kFailed;
    case SectionStatus::kCompleted:
    case SectionStatus::kFailed:
    case SectionStatus::kSkipped:
      return from == to;
  }
  return false;
}

const SectionState* PipelineState::find_section(const std::string& name) const {
  const auto it = std::find_if(sections.begin(), sections.end(),
                               [&](const SectionState& s) { return s.name == name; });
  return it != sections.end() ? &*it : nullptr;
}

SectionState* PipelineState::find_section(const std::string& name) {
  const auto it = std::find_if(sections.begin(), sections.end(),
                               [&](const SectionState& s) { return s.name == name; });
  return it != sections.end() ? &*it : nullptr;
}

PipelineState make_empty_state(const std::string& run_id) {
  PipelineState state{};
  state.run_id = run_id;
  return state;
}

}  // namespace cgate::state
