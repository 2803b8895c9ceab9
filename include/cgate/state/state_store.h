#pragma once

#include "cgate/core/clock.h"
#include "cgate/core/result.h"
#include "cgate/state/pipeline_state.h"
#include "cgate/state/state_backend.h"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace cgate::state {

struct StateStoreOptions {
  // Number of steps a section passes through; a completed section has last_step == step_count.
  std::size_t step_count{1};  // NOLINT(readability-identifier-naming)
  // Pause before the single retry of a backend operation that failed with kIoFailure.
  std::chrono::milliseconds retry_backoff{0};  // NOLINT(readability-identifier-naming)
};

enum class StateHealth {
  kValid,
  kInvalid,    // parseable, but cross-field consistency is violated
  kCorrupted,  // unparseable, digest mismatch or schema-invalid
};

[[nodiscard]] std::string state_health_to_string(StateHealth h);

struct StateValidation {
  StateHealth health{StateHealth::kValid};
  std::vector<std::string> issues;
};

struct RepairOutcome {
  std::vector<std::string> fixes;
  PipelineState state;
};

struct ProgressReport {
  RunStatus status{RunStatus::kPending};
  std::string current_section;  // NOLINT(readability-identifier-naming)
  std::string current_step;     // NOLINT(readability-identifier-naming)
  std::size_t total{0};
  std::size_t pending{0};
  std::size_t in_progress{0};  // NOLINT(readability-identifier-naming)
  std::size_t completed{0};
  std::size_t failed{0};
  std::size_t skipped{0};
  double percent_complete{0.0};  // completed + skipped over total, 0..100
  std::size_t error_count{0};    // NOLINT(readability-identifier-naming)
};

// consistency_issues lists every cross-field rule `state` violates (empty when
// consistent):
// - run_id matches the store; section names are unique
// - no section's last_step exceeds step_count
// - a completed section has finished every step and does not trail an earlier section
// - current_section, when set, names a known section
// - overall status agrees with section statuses; updated_at is not before created_at
// - checkpoint names are unique
[[nodiscard]] std::vector<std::string> consistency_issues(const PipelineState& state,
                                                          const std::string& run_id,
                                                          std::size_t step_count);

// is_valid_checkpoint_name: 1-128 characters from [A-Za-z0-9._:@-], starting with a
// letter or digit.
[[nodiscard]] bool is_valid_checkpoint_name(const std::string& name) noexcept;

// StateStore is the single synchronized writer of one run's PipelineState.
//
// Every operation holds one mutex for its whole read-modify-write cycle, so concurrent
// callers never lose an update. Each mutation increments `revision`, stamps
// `updated_at` and is persisted before the call returns. Backend kIoFailure errors are
// retried once after `retry_backoff`; any other error is returned immediately.
// A corrupted live record is never rewritten except by recover().
class StateStore {
 public:
  StateStore(IStateBackend& backend, std::string run_id, core::IClock& clock,
             StateStoreOptions options = {});

  StateStore(const StateStore&) = delete;
  StateStore& operator=(const StateStore&) = delete;
  StateStore(StateStore&&) = delete;
  StateStore& operator=(StateStore&&) = delete;
  ~StateStore() = default;

  // Current state, or the empty template when nothing is persisted.
  [[nodiscard]] core::Result<PipelineState, core::StoreError> read();

  // Merges update into the live record. Errors: kInvalidTransition for a forbidden
  // status change, kInvalid for a decreasing or out-of-range last_step, kCorrupted
  // when the live record cannot be decoded.
  [[nodiscard]] core::Result<PipelineState, core::StoreError> write(const StateUpdate& update);

  // Schema and consistency check of the live record. An absent record is VALID.
  [[nodiscard]] core::Result<StateValidation, core::StoreError> validate();

  // Re-derives the offending fields of an INVALID record and persists the result.
  // A consistent record is returned unchanged with no fixes. kCorrupted records
  // cannot be repaired; recover from a checkpoint instead.
  [[nodiscard]] core::Result<RepairOutcome, core::StoreError> repair();

  // Snapshots the live record under `name` and appends a CheckpointRef to it.
  // The snapshot is the record as it was before the ref was added.
  [[nodiscard]] core::Result<CheckpointRef, core::StoreError> checkpoint(const std::string& name);

  // Replaces the live record with a validated checkpoint, marked recovered.
  // Works when the live record is corrupted or absent. The restored record keeps the
  // live checkpoint list (rebuilt from the backend when the live record is unusable;
  // snapshots that fail to decode are left out) and gets a revision above any
  // revision seen so far.
  [[nodiscard]] core::Result<PipelineState, core::StoreError> recover(const std::string& name);

  [[nodiscard]] core::Result<Checkpoint, core::StoreError> load_checkpoint(const std::string& name);
  [[nodiscard]] core::Result<std::vector<CheckpointRef>, core::StoreError> list_checkpoints();

  [[nodiscard]] core::Result<ProgressReport, core::StoreError> progress();

  [[nodiscard]] const std::string& run_id() const noexcept { return run_id_; }
  [[nodiscard]] const StateStoreOptions& options() const noexcept { return options_; }

 private:
  // All private helpers require mutex_ held.
  core::Result<std::optional<PipelineState>, core::StoreError> load_live();
  core::Result<Checkpoint, core::StoreError> load_checkpoint_locked(const std::string& name);
  core::Result<std::vector<CheckpointRef>, core::StoreError> rebuild_checkpoint_refs();
  core::Result<bool, core::StoreError> persist(PipelineState& state);

  IStateBackend& backend_;
  std::string run_id_;
  core::IClock& clock_;
  StateStoreOptions options_;
  std::mutex mutex_;
};

}  // namespace cgate::state
