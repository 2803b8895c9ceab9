#include "cgate/state/state_store.h"

#include "cgate/state/state_json.h"

#include <algorithm>
#include <set>
#include <thread>

namespace cgate::state {

namespace {

constexpr std::size_t kMaxCheckpointNameLength = 128;

// Runs op once more after `backoff` when it fails with kIoFailure.
template <typename Op>
auto with_retry(std::chrono::milliseconds backoff, Op op) -> decltype(op()) {
  auto result = op();
  if (!result.has_value() && result.error().code == core::StoreErrorCode::kIoFailure) {
    std::this_thread::sleep_for(backoff);
    result = op();
  }
  return result;
}

bool is_finished(SectionStatus s) noexcept {
  return s == SectionStatus::kCompleted || s == SectionStatus::kSkipped;
}

bool is_active(SectionStatus s) noexcept {
  return s == SectionStatus::kInProgress || s == SectionStatus::kCompleted ||
         s == SectionStatus::kFailed;
}

core::StoreError invalid(std::string message) {
  return core::StoreError{core::StoreErrorCode::kInvalid, std::move(message)};
}

}  // namespace

std::string state_health_to_string(StateHealth h) {
  switch (h) {
    case StateHealth::kValid:
      return "VALID";
    case StateHealth::kInvalid:
      return "INVALID";
    case StateHealth::kCorrupted:
      return "CORRUPTED";
  }
  return "unknown";
}

std::vector<std::string> consistency_issues(const PipelineState& state, const std::string& run_id,
                                            std::size_t step_count) {
  std::vector<std::string> issues;

  if (state.run_id != run_id) {
    issues.push_back("run_id '" + state.run_id + "' does not match store run '" + run_id + "'");
  }

  std::set<std::string> names;
  std::size_t furthest_step = 0;
  std::string furthest_section;
  for (const auto& s : state.sections) {
    if (!names.insert(s.name).second) {
      issues.push_back("section '" + s.name + "' appears more than once");
    }
    if (s.last_step > step_count) {
      issues.push_back("section '" + s.name + "' last_step " + std::to_string(s.last_step) +
                       " exceeds step count " + std::to_string(step_count));
    }
    if (s.status == SectionStatus::kCompleted) {
      if (s.last_step < step_count) {
        issues.push_back("section '" + s.name + "' is completed at step " +
                         std::to_string(s.last_step) + " of " + std::to_string(step_count));
      }
      if (s.last_step < furthest_step) {
        issues.push_back("completed section '" + s.name + "' at step " +
                         std::to_string(s.last_step) + " precedes earlier section '" +
                         furthest_section + "' at step " + std::to_string(furthest_step));
      }
    }
    if (s.last_step > furthest_step) {
      furthest_step = s.last_step;
      furthest_section = s.name;
    }
  }

  if (!state.current_section.empty() && names.count(state.current_section) == 0) {
    issues.push_back("current_section '" + state.current_section + "' is not a known section");
  }

  if (state.status == RunStatus::kCompleted) {
    for (const auto& s : state.sections) {
      if (!is_finished(s.status)) {
        issues.push_back("run is completed but section '" + s.name + "' is " +
                         section_status_to_string(s.status));
      }
    }
  }
  if (state.status == RunStatus::kPending) {
    for (const auto& s : state.sections) {
      if (is_active(s.status)) {
        issues.push_back("run is pending but section '" + s.name + "' is " +
                         section_status_to_string(s.status));
      }
    }
  }

  if (!state.created_at.empty() && state.updated_at < state.created_at) {
    issues.push_back("updated_at " + state.updated_at + " is before created_at " +
                     state.created_at);
  }

  std::set<std::string> checkpoint_names;
  for (const auto& c : state.checkpoints) {
    if (!checkpoint_names.insert(c.name).second) {
      issues.push_back("checkpoint '" + c.name + "' is listed more than once");
    }
  }

  return issues;
}

bool is_valid_checkpoint_name(const std::string& name) noexcept {
  if (name.empty() || name.size() > kMaxCheckpointNameLength) {
    return false;
  }
  const auto alnum = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
  };
  if (!alnum(name.front())) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [&](char c) {
    return alnum(c) || c == '.' || c == '_' || c == ':' || c == '@' || c == '-';
  });
}

StateStore::StateStore(IStateBackend& backend, std::string run_id, core::IClock& clock,
                       StateStoreOptions options)
    : backend_(backend), run_id_(std::move(run_id)), clock_(clock), options_(options) {}

core::Result<std::optional<PipelineState>, core::StoreError> StateStore::load_live() {
  using R = core::Result<std::optional<PipelineState>, core::StoreError>;
  auto raw = with_retry(options_.retry_backoff, [&]() { return backend_.load_current(run_id_); });
  if (!raw.has_value()) {
    return R::err(raw.error());
  }
  if (!raw.value().has_value()) {
    return R::ok(std::nullopt);
  }
  auto decoded = decode_state_record(*raw.value());
  if (!decoded.has_value()) {
    return R::err(decoded.error());
  }
  return R::ok(std::move(decoded.value()));
}

core::Result<bool, core::StoreError> StateStore::persist(PipelineState& state) {
  const std::string now = clock_.now_iso8601();
  if (state.created_at.empty()) {
    state.created_at = now;
  }
  state.revision += 1;
  state.updated_at = now;
  const std::string record = encode_state_record(state);
  return with_retry(options_.retry_backoff,
                    [&]() { return backend_.store_current(run_id_, record); });
}

core::Result<PipelineState, core::StoreError> StateStore::read() {
  using R = core::Result<PipelineState, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);
  auto live = load_live();
  if (!live.has_value()) {
    return R::err(live.error());
  }
  return R::ok(live.value().value_or(make_empty_state(run_id_)));
}

core::Result<PipelineState, core::StoreError> StateStore::write(const StateUpdate& update) {
  using R = core::Result<PipelineState, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);

  auto live = load_live();
  if (!live.has_value()) {
    return R::err(live.error());
  }
  PipelineState state = live.value().value_or(make_empty_state(run_id_));

  if (update.status.has_value() && !is_allowed_transition(state.status, *update.status)) {
    return R::err({core::StoreErrorCode::kInvalidTransition,
                   "Run status cannot move from " + run_status_to_string(state.status) + " to " +
                       run_status_to_string(*update.status)});
  }

  for (const auto& su : update.sections) {
    if (su.name.empty()) {
      return R::err(invalid("Section update without a name"));
    }
    SectionState* section = state.find_section(su.name);
    if (section == nullptr) {
      state.sections.push_back(SectionState{su.name});
      section = &state.sections.back();
    }
    if (su.status.has_value()) {
      if (!is_allowed_transition(section->status, *su.status)) {
        return R::err({core::StoreErrorCode::kInvalidTransition,
                       "Section '" + su.name + "' cannot move from " +
                           section_status_to_string(section->status) + " to " +
                           section_status_to_string(*su.status)});
      }
      section->status = *su.status;
    }
    if (su.last_step.has_value()) {
      if (*su.last_step < section->last_step) {
        return R::err(invalid("Section '" + su.name + "' last_step cannot decrease from " +
                              std::to_string(section->last_step) + " to " +
                              std::to_string(*su.last_step)));
      }
      if (*su.last_step > options_.step_count) {
        return R::err(invalid("Section '" + su.name + "' last_step " +
                              std::to_string(*su.last_step) + " exceeds step count " +
                              std::to_string(options_.step_count)));
      }
      section->last_step = *su.last_step;
    }
    if (su.attempts.has_value()) {
      section->attempts = *su.attempts;
    }
    if (su.last_score.has_value()) {
      section->last_score = su.last_score;
    }
    if (su.notes.has_value()) {
      section->notes = *su.notes;
    }
  }

  if (update.status.has_value()) {
    state.status = *update.status;
  }
  if (update.current_step.has_value()) {
    state.current_step = *update.current_step;
  }
  if (update.current_section.has_value()) {
    state.current_section = *update.current_section;
  }
  for (auto entry : update.errors) {
    if (entry.at.empty()) {
      entry.at = clock_.now_iso8601();
    }
    state.errors.push_back(std::move(entry));
  }

  auto stored = persist(state);
  if (!stored.has_value()) {
    return R::err(stored.error());
  }
  return R::ok(std::move(state));
}

core::Result<StateValidation, core::StoreError> StateStore::validate() {
  using R = core::Result<StateValidation, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);

  auto live = load_live();
  if (!live.has_value()) {
    if (live.error().code == core::StoreErrorCode::kCorrupted) {
      return R::ok(StateValidation{StateHealth::kCorrupted, {live.error().message}});
    }
    return R::err(live.error());
  }
  if (!live.value().has_value()) {
    return R::ok(StateValidation{StateHealth::kValid, {}});
  }

  auto issues = consistency_issues(*live.value(), run_id_, options_.step_count);
  const auto health = issues.empty() ? StateHealth::kValid : StateHealth::kInvalid;
  return R::ok(StateValidation{health, std::move(issues)});
}

core::Result<RepairOutcome, core::StoreError> StateStore::repair() {
  using R = core::Result<RepairOutcome, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);

  auto live = load_live();
  if (!live.has_value()) {
    return R::err(live.error());
  }
  if (!live.value().has_value()) {
    return R::err({core::StoreErrorCode::kNotFound, "No state stored for run " + run_id_});
  }
  PipelineState state = std::move(*live.value());
  std::vector<std::string> fixes;

  if (state.run_id != run_id_) {
    fixes.push_back("run_id reset to '" + run_id_ + "'");
    state.run_id = run_id_;
  }

  std::set<std::string> seen;
  std::vector<SectionState> sections;
  for (auto& s : state.sections) {
    if (!seen.insert(s.name).second) {
      fixes.push_back("dropped duplicate section '" + s.name + "'");
      continue;
    }
    if (s.last_step > options_.step_count) {
      fixes.push_back("section '" + s.name + "' last_step clamped to " +
                      std::to_string(options_.step_count));
      s.last_step = options_.step_count;
    }
    if (s.status == SectionStatus::kCompleted && s.last_step < options_.step_count) {
      fixes.push_back("section '" + s.name + "' reopened as in_progress");
      s.status = SectionStatus::kInProgress;
    }
    sections.push_back(std::move(s));
  }
  state.sections = std::move(sections);

  if (!state.current_section.empty() && state.find_section(state.current_section) == nullptr) {
    fixes.push_back("current_section '" + state.current_section + "' cleared");
    state.current_section.clear();
  }

  const bool all_finished = std::all_of(state.sections.begin(), state.sections.end(),
                                        [](const SectionState& s) { return is_finished(s.status); });
  const bool any_active = std::any_of(state.sections.begin(), state.sections.end(),
                                      [](const SectionState& s) { return is_active(s.status); });
  if ((state.status == RunStatus::kCompleted && !all_finished) ||
      (state.status == RunStatus::kPending && any_active)) {
    fixes.push_back("status " + run_status_to_string(state.status) + " re-derived as in_progress");
    state.status = RunStatus::kInProgress;
  }

  if (!state.created_at.empty() && state.updated_at < state.created_at) {
    fixes.push_back("created_at reset to " + state.updated_at);
    state.created_at = state.updated_at;
  }

  std::set<std::string> checkpoint_names;
  std::vector<CheckpointRef> refs;
  for (auto& c : state.checkpoints) {
    if (checkpoint_names.insert(c.name).second) {
      refs.push_back(std::move(c));
    } else {
      fixes.push_back("dropped duplicate checkpoint ref '" + c.name + "'");
    }
  }
  state.checkpoints = std::move(refs);

  if (!fixes.empty()) {
    auto stored = persist(state);
    if (!stored.has_value()) {
      return R::err(stored.error());
    }
  }
  return R::ok(RepairOutcome{std::move(fixes), std::move(state)});
}

core::Result<CheckpointRef, core::StoreError> StateStore::checkpoint(const std::string& name) {
  using R = core::Result<CheckpointRef, core::StoreError>;
  if (!is_valid_checkpoint_name(name)) {
    return R::err(invalid("Invalid checkpoint name: '" + name + "'"));
  }
  std::lock_guard<std::mutex> lock(mutex_);

  auto live = load_live();
  if (!live.has_value()) {
    return R::err(live.error());
  }
  if (!live.value().has_value()) {
    return R::err({core::StoreErrorCode::kNotFound, "No state stored for run " + run_id_});
  }
  PipelineState state = std::move(*live.value());

  const Checkpoint snapshot{name, clock_.now_iso8601(), state};
  const std::string record = encode_checkpoint_record(snapshot);
  auto stored = with_retry(options_.retry_backoff,
                           [&]() { return backend_.store_checkpoint(run_id_, name, record); });
  if (!stored.has_value()) {
    return R::err(stored.error());
  }

  CheckpointRef ref{name, snapshot.created_at, state.revision};
  state.checkpoints.push_back(ref);
  auto persisted = persist(state);
  if (!persisted.has_value()) {
    return R::err(persisted.error());
  }
  return R::ok(std::move(ref));
}

core::Result<Checkpoint, core::StoreError> StateStore::load_checkpoint_locked(
    const std::string& name) {
  using R = core::Result<Checkpoint, core::StoreError>;
  if (!is_valid_checkpoint_name(name)) {
    return R::err(invalid("Invalid checkpoint name: '" + name + "'"));
  }
  auto raw = with_retry(options_.retry_backoff,
                        [&]() { return backend_.load_checkpoint(run_id_, name); });
  if (!raw.has_value()) {
    return R::err(raw.error());
  }
  if (!raw.value().has_value()) {
    return R::err({core::StoreErrorCode::kNotFound, "No checkpoint named '" + name + "'"});
  }
  return decode_checkpoint_record(*raw.value());
}

core::Result<Checkpoint, core::StoreError> StateStore::load_checkpoint(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_checkpoint_locked(name);
}

core::Result<std::vector<CheckpointRef>, core::StoreError> StateStore::rebuild_checkpoint_refs() {
  using R = core::Result<std::vector<CheckpointRef>, core::StoreError>;
  auto names = with_retry(options_.retry_backoff,
                          [&]() { return backend_.list_checkpoints(run_id_); });
  if (!names.has_value()) {
    return R::err(names.error());
  }

  std::vector<CheckpointRef> refs;
  for (const auto& name : names.value()) {
    auto cp = load_checkpoint_locked(name);
    if (!cp.has_value()) {
      if (cp.error().code == core::StoreErrorCode::kCorrupted) {
        continue;  // unusable snapshot; still listed by the backend
      }
      return R::err(cp.error());
    }
    refs.push_back(CheckpointRef{name, cp.value().created_at, cp.value().state.revision});
  }
  std::stable_sort(refs.begin(), refs.end(), [](const CheckpointRef& a, const CheckpointRef& b) {
    return a.revision < b.revision;
  });
  return R::ok(std::move(refs));
}

core::Result<PipelineState, core::StoreError> StateStore::recover(const std::string& name) {
  using R = core::Result<PipelineState, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);

  auto cp = load_checkpoint_locked(name);
  if (!cp.has_value()) {
    return R::err(cp.error());
  }
  const auto issues = consistency_issues(cp.value().state, run_id_, options_.step_count);
  if (!issues.empty()) {
    return R::err(invalid("Checkpoint '" + name + "' is inconsistent: " + issues.front()));
  }

  PipelineState restored = cp.value().state;

  auto live = load_live();
  if (live.has_value() && live.value().has_value()) {
    restored.checkpoints = live.value()->checkpoints;
    restored.revision = std::max(restored.revision, live.value()->revision);
  } else if (!live.has_value() && live.error().code != core::StoreErrorCode::kCorrupted) {
    return R::err(live.error());
  } else {
    // Live record unusable or absent: the backend is the source of truth for checkpoints.
    auto refs = rebuild_checkpoint_refs();
    if (!refs.has_value()) {
      return R::err(refs.error());
    }
    restored.checkpoints = std::move(refs.value());
    for (const auto& ref : restored.checkpoints) {
      restored.revision = std::max(restored.revision, ref.revision + 1);
    }
  }

  restored.status = RunStatus::kRecovered;
  restored.recovered_from = name;
  auto stored = persist(restored);
  if (!stored.has_value()) {
    return R::err(stored.error());
  }
  return R::ok(std::move(restored));
}

core::Result<std::vector<CheckpointRef>, core::StoreError> StateStore::list_checkpoints() {
  using R = core::Result<std::vector<CheckpointRef>, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);
  auto live = load_live();
  if (live.has_value() && live.value().has_value()) {
    return R::ok(live.value()->checkpoints);
  }
  if (!live.has_value() && live.error().code != core::StoreErrorCode::kCorrupted) {
    return R::err(live.error());
  }
  return rebuild_checkpoint_refs();
}

core::Result<ProgressReport, core::StoreError> StateStore::progress() {
  using R = core::Result<ProgressReport, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);
  auto live = load_live();
  if (!live.has_value()) {
    return R::err(live.error());
  }
  const PipelineState state = live.value().value_or(make_empty_state(run_id_));

  ProgressReport report{};
  report.status = state.status;
  report.current_section = state.current_section;
  report.current_step = state.current_step;
  report.total = state.sections.size();
  report.error_count = state.errors.size();
  for (const auto& s : state.sections) {
    switch (s.status) {
      case SectionStatus::kPending:
        ++report.pending;
        break;
      case SectionStatus::kInProgress:
        ++report.in_progress;
        break;
      case SectionStatus::kCompleted:
        ++report.completed;
        break;
      case SectionStatus::kFailed:
        ++report.failed;
        break;
      case SectionStatus::kSkipped:
        ++report.skipped;
        break;
    }
  }
  if (report.total > 0) {
    report.percent_complete = 100.0 * static_cast<double>(report.completed + report.skipped) /
                              static_cast<double>(report.total);
  }
  return R::ok(report);
}

}  // namespace cgate::state
