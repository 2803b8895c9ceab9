#pragma once

#include "cgate/classification/classifier.h"
#include "cgate/config/pipeline_config.h"
#include "cgate/core/clock.h"
#include "cgate/core/id_generator.h"
#include "cgate/core/result.h"
#include "cgate/domain/item.h"
#include "cgate/pipeline/content_generator.h"
#include "cgate/pipeline/section_pipeline.h"
#include "cgate/state/pipeline_state.h"
#include "cgate/state/state_store.h"
#include "cgate/storage/audit_log.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cgate::pipeline {

// SectionRun is the fate of one catalog category in a runner invocation.
struct SectionRun {
  std::string section_id;  // NOLINT(readability-identifier-naming)
  state::SectionStatus status{state::SectionStatus::kPending};
  std::optional<double> score;
  // Finished by an earlier invocation and not run again.
  bool resumed{false};
  // Set when the section was processed by this invocation.
  std::optional<SectionOutcome> outcome;
  std::string checkpoint;  // taken after this section finished, if any
  std::string error;
};

struct RunSummary {
  std::string run_id;  // NOLINT(readability-identifier-naming)
  state::RunStatus status{state::RunStatus::kPending};
  bool stopped{false};
  classification::ClassificationBatch classification;
  std::vector<SectionRun> sections;      // catalog order
  std::vector<std::string> checkpoints;  // created by this invocation
};

// PipelineRunner drives one run end to end:
//
//   1. classify the whole batch (a failure fails the run; nothing is emitted)
//   2. register one section per catalog category; empty ones are skipped
//   3. run every pending or in_progress section on a WorkerPool of
//      pipeline.worker_count threads, handing each one its items in the batch's
//      suggested delivery order
//   4. after each finished section, checkpoint as "after:<section>@r<revision>"
//
// Re-running with the same store resumes: completed and skipped sections are kept,
// sections left in_progress are recomputed from their first step. request_stop()
// lets in-flight sections finish and prevents new ones from starting; the run stays
// in_progress and the summary is marked stopped.
//
// When the store refuses a section's state write, that section stays unfinished and
// run() returns an error without finishing the run; the run stays in_progress and the
// next invocation recomputes the section.
//
// A run whose state is failed is refused; recover it from a checkpoint first. All
// state goes through the StateStore; every stage emits an audit event traced by the
// run id.
class PipelineRunner {
 public:
  PipelineRunner(const config::PipelineConfig& config, IContentGenerator& generator,
                 state::StateStore& store, storage::IAuditLog& audit_log,
                 core::IIdGenerator& id_gen, core::IClock& clock);

  PipelineRunner(const PipelineRunner&) = delete;
  PipelineRunner& operator=(const PipelineRunner&) = delete;
  PipelineRunner(PipelineRunner&&) = delete;
  PipelineRunner& operator=(PipelineRunner&&) = delete;
  ~PipelineRunner() = default;

  [[nodiscard]] core::Result<RunSummary, std::string> run(const std::vector<domain::Item>& items);

  // Safe to call from any thread, including a generator or hook.
  void request_stop() noexcept { stop_requested_.store(true); }
  [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(); }

 private:
  struct SectionInput {
    std::vector<domain::Item> items;
    std::vector<domain::Assignment> assignments;
  };

  SectionRun process_section(const std::string& section_id, const SectionInput& input,
                             const state::SectionState& prior);
  void emit(std::string_view event_type, const nlohmann::json& payload,
            std::vector<std::string> refs = {});

  const config::PipelineConfig& config_;
  IContentGenerator& generator_;
  state::StateStore& store_;
  storage::IAuditLog& audit_log_;
  core::IIdGenerator& id_gen_;
  core::IClock& clock_;
  SectionPipeline section_pipeline_;
  std::atomic<bool> stop_requested_{false};
};

[[nodiscard]] nlohmann::json run_summary_to_json(const RunSummary& summary);

}  // namespace cgate::pipeline
