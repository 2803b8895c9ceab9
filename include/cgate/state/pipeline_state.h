#pragma once

#include "cgate/core/version.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cgate::state {

// Overall run lifecycle:
//   pending -> in_progress -> completed
//   in_progress -> failed
//   recovered (entered only through StateStore::recover) -> in_progress | completed | failed
// Writing the current status again is always allowed.
enum class RunStatus {
  kPending,
  kInProgress,
  kCompleted,
  kFailed,
  kRecovered,
};

// Section lifecycle:
//   pending -> in_progress | skipped
//   in_progress -> in_progress | completed | failed
enum class SectionStatus {
  kPending,
  kInProgress,
  kCompleted,
  kFailed,
  kSkipped,
};

[[nodiscard]] std::string run_status_to_string(RunStatus s);
[[nodiscard]] RunStatus run_status_from_string(const std::string& s);
[[nodiscard]] std::string section_status_to_string(SectionStatus s);
[[nodiscard]] SectionStatus section_status_from_string(const std::string& s);

[[nodiscard]] bool is_allowed_transition(RunStatus from, RunStatus to) noexcept;
[[nodiscard]] bool is_allowed_transition(SectionStatus from, SectionStatus to) noexcept;

struct SectionState {
  std::string name;
  SectionStatus status{SectionStatus::kPending};
  // Number of pipeline steps finished for this section (0 = none). Never decreases
  // except through recovery.
  std::size_t last_step{0};          // NOLINT(readability-identifier-naming)
  std::size_t attempts{0};
  std::optional<double> last_score;  // NOLINT(readability-identifier-naming)
  std::string notes;

  bool operator==(const SectionState&) const = default;
};

struct ErrorEntry {
  std::string at;
  std::string section;
  std::string step;
  std::string message;

  bool operator==(const ErrorEntry&) const = default;
};

struct CheckpointRef {
  std::string name;
  std::string created_at;   // NOLINT(readability-identifier-naming)
  std::uint64_t revision{0};  // live revision the snapshot was taken at

  bool operator==(const CheckpointRef&) const = default;
};

// PipelineState is the single mutable record of one run.
// Sections keep the order in which they were first written.
struct PipelineState {
  int format_version{core::kStateFormatVersion};  // NOLINT(readability-identifier-naming)
  std::string run_id;                             // NOLINT(readability-identifier-naming)
  std::uint64_t revision{0};                      // incremented by every persisted mutation
  std::string created_at;                         // NOLINT(readability-identifier-naming)
  std::string updated_at;                         // NOLINT(readability-identifier-naming)
  std::string current_step;                       // NOLINT(readability-identifier-naming)
  std::string current_section;                    // NOLINT(readability-identifier-naming)
  RunStatus status{RunStatus::kPending};
  std::vector<SectionState> sections;
  std::vector<ErrorEntry> errors;
  std::vector<CheckpointRef> checkpoints;
  std::optional<std::string> recovered_from;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] const SectionState* find_section(const std::string& name) const;
  [[nodiscard]] SectionState* find_section(const std::string& name);

  bool operator==(const PipelineState&) const = default;
};

// Checkpoint is an immutable full snapshot of PipelineState.
struct Checkpoint {
  std::string name;
  std::string created_at;  // NOLINT(readability-identifier-naming)
  PipelineState state;

  bool operator==(const Checkpoint&) const = default;
};

// make_empty_state returns the template read() hands out when nothing is persisted:
// pending, revision 0, no timestamps, no sections.
[[nodiscard]] PipelineState make_empty_state(const std::string& run_id);

// Partial update merged by StateStore::write.
struct SectionUpdate {
  std::string name;
  std::optional<SectionStatus> status;
  std::optional<std::size_t> last_step;  // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> attempts;
  std::optional<double> last_score;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> notes;
};

// StateUpdate: scalar fields overwrite, sections merge by name, errors append.
struct StateUpdate {
  std::optional<std::string> current_step;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> current_section;  // NOLINT(readability-identifier-naming)
  std::optional<RunStatus> status;
  std::vector<SectionUpdate> sections;
  std::vector<ErrorEntry> errors;  // `at` is stamped by the store when empty
};

}  // namespace cgate::state
