#include "cgate/pipeline/pipeline_runner.h"

#include "cgate/config/config_loader.h"
#include "cgate/core/sha256.h"
#include "cgate/core/version.h"
#include "cgate/domain/domain_json.h"
#include "cgate/pipeline/worker_pool.h"

#include <algorithm>
#include <cstdint>
#include <future>
#include <map>
#include <stdexcept>
#include <utility>

namespace cgate::pipeline {

namespace ev = storage::events;

namespace {

// Raised inside a section task when the state store itself refuses a write; the
// section cannot be marked failed through the same store.
class StoreFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

std::string describe(const core::StoreError& error) {
  return core::store_error_code_to_string(error.code) + ": " + error.message;
}

template <typename T>
T require(core::Result<T, core::StoreError> result, const std::string& context) {
  if (!result.has_value()) {
    throw StoreFailure(context + ": " + describe(result.error()));
  }
  return std::move(result.value());
}

std::string checkpoint_name(const std::string& section_id, std::uint64_t revision) {
  return "after:" + section_id + "@r" + std::to_string(revision);
}

state::StateUpdate section_update(const std::string& section_id) {
  state::StateUpdate update;
  update.sections.push_back(state::SectionUpdate{section_id});
  return update;
}

}  // namespace

PipelineRunner::PipelineRunner(const config::PipelineConfig& config, IContentGenerator& generator,
                               state::StateStore& store, storage::IAuditLog& audit_log,
                               core::IIdGenerator& id_gen, core::IClock& clock)
    : config_(config),
      generator_(generator),
      store_(store),
      audit_log_(audit_log),
      id_gen_(id_gen),
      clock_(clock),
      section_pipeline_(config, generator) {}

void PipelineRunner::emit(std::string_view event_type, const nlohmann::json& payload,
                          std::vector<std::string> refs) {
  audit_log_.append({id_gen_.next("evt"), store_.run_id(), std::string(event_type), payload.dump(),
                     clock_.now_iso8601(), std::move(refs)});
}

core::Result<RunSummary, std::string> PipelineRunner::run(const std::vector<domain::Item>& items) {
  using R = core::Result<RunSummary, std::string>;
  const std::string& run_id = store_.run_id();

  auto current = store_.read();
  if (!current.has_value()) {
    return R::err("Cannot read state of run " + run_id + ": " + describe(current.error()));
  }
  const state::PipelineState initial = current.value();

  RunSummary summary;
  summary.run_id = run_id;

  if (initial.status == state::RunStatus::kFailed) {
    return R::err("Run " + run_id + " has failed; recover it from a checkpoint to resume");
  }
  if (initial.status == state::RunStatus::kCompleted) {
    summary.status = initial.status;
    for (const auto& s : initial.sections) {
      summary.sections.push_back({s.name, s.status, s.last_score, true, std::nullopt, "", ""});
    }
    return R::ok(std::move(summary));
  }

  const std::string config_dump = config::pipeline_config_to_json(config_).dump();
  emit(ev::kRunStarted, {{"run_id", run_id},
                         {"build_version", core::kBuildVersion},
                         {"config_id", config_.config_id},
                         {"config_sha256", core::sha256_hex(config_dump)},
                         {"item_count", items.size()},
                         {"resumed", initial.revision > 0},
                         {"prior_status", state::run_status_to_string(initial.status)}});

  state::StateUpdate start;
  start.status = state::RunStatus::kInProgress;
  start.current_step = "classify";
  auto started = store_.write(start);
  if (!started.has_value()) {
    return R::err("Cannot start run " + run_id + ": " + describe(started.error()));
  }

  // ── Classification ─────────────────────────────────────────────────────────
  std::optional<classification::ClassificationBatch> batch;
  std::string classification_error;
  try {
    const classification::Classifier classifier(config_.catalog, config_.classifier);
    auto classified = classifier.classify_batch(items);
    if (classified.has_value()) {
      batch = std::move(classified.value());
    } else {
      classification_error =
          core::classification_error_code_to_string(classified.error().code) + ": " +
          classified.error().message;
    }
  } catch (const std::invalid_argument& e) {
    classification_error = std::string("invalid rule set: ") + e.what();
  }

  if (!batch.has_value()) {
    emit(ev::kClassificationFailed, {{"error", classification_error}});
    state::StateUpdate failed;
    failed.status = state::RunStatus::kFailed;
    failed.errors.push_back({"", "", "classify", classification_error});
    auto written = store_.write(failed);
    if (!written.has_value()) {
      return R::err("Classification failed (" + classification_error +
                    ") and the failure could not be recorded: " + describe(written.error()));
    }
    return R::err("Classification failed: " + classification_error);
  }
  summary.classification = *batch;

  nlohmann::json counts = nlohmann::json::object();
  for (const auto& [category, count] : batch->category_counts) {
    counts[category] = count;
  }
  nlohmann::json review = nlohmann::json::array();
  for (const auto& shortfall : batch->needs_review) {
    review.push_back({{"category_id", shortfall.category_id},
                      {"count", shortfall.count},
                      {"min_population", shortfall.min_population}});
  }
  emit(ev::kClassificationCompleted,
       {{"item_count", items.size()}, {"category_counts", counts}, {"needs_review", review}});

  // Sections receive their items in delivery order.
  std::map<std::int64_t, std::size_t> position;
  for (std::size_t i = 0; i < items.size(); ++i) {
    position.emplace(items[i].item_id, i);
  }
  std::map<std::string, SectionInput> inputs;
  for (const auto item_id : batch->suggested_order) {
    const std::size_t i = position.at(item_id);
    auto& input = inputs[batch->assignments[i].category_id];
    input.items.push_back(items[i]);
    input.assignments.push_back(batch->assignments[i]);
  }

  // ── Section registration ──────────────────────────────────────────────────
  state::StateUpdate registration;
  for (const auto& category : config_.catalog.categories) {
    const auto* known = started.value().find_section(category.category_id);
    const bool empty = inputs.count(category.category_id) == 0;
    if (known == nullptr) {
      state::SectionUpdate su{category.category_id};
      if (empty) {
        su.status = state::SectionStatus::kSkipped;
        su.notes = "no items assigned";
      }
      registration.sections.push_back(std::move(su));
    } else if (empty && known->status == state::SectionStatus::kPending) {
      state::SectionUpdate su{category.category_id};
      su.status = state::SectionStatus::kSkipped;
      su.notes = "no items assigned";
      registration.sections.push_back(std::move(su));
    }
  }
  registration.current_step = "sections";
  auto registered = store_.write(registration);
  if (!registered.has_value()) {
    return R::err("Cannot register sections of run " + run_id + ": " +
                  describe(registered.error()));
  }

  // ── Section execution ─────────────────────────────────────────────────────
  std::vector<SectionRun> runs;
  std::vector<std::size_t> scheduled;
  for (const auto& category : config_.catalog.categories) {
    const auto* s = registered.value().find_section(category.category_id);
    if (s == nullptr) {
      return R::err("Section " + category.category_id + " missing after registration");
    }
    SectionRun sr{s->name, s->status, s->last_score, false, std::nullopt, "", ""};
    if (s->status == state::SectionStatus::kPending ||
        s->status == state::SectionStatus::kInProgress) {
      scheduled.push_back(runs.size());
    } else {
      sr.resumed = true;
    }
    runs.push_back(std::move(sr));
  }

  std::vector<std::string> task_errors;
  {
    WorkerPool pool(std::max<std::size_t>(config_.pipeline.worker_count, 1));
    std::vector<std::future<void>> futures;
    futures.reserve(scheduled.size());
    for (const std::size_t index : scheduled) {
      const std::string section_id = runs[index].section_id;
      const state::SectionState prior = *registered.value().find_section(section_id);
      const SectionInput& input = inputs.at(section_id);
      futures.push_back(pool.submit([this, &runs, index, section_id, prior, &input] {
        runs[index] = process_section(section_id, input, prior);
      }));
    }
    for (auto& future : futures) {
      try {
        future.get();
      } catch (const std::exception& e) {
        task_errors.emplace_back(e.what());
      }
    }
  }

  for (const auto& sr : runs) {
    if (!sr.checkpoint.empty()) {
      summary.checkpoints.push_back(sr.checkpoint);
    }
  }
  summary.sections = std::move(runs);

  if (!task_errors.empty()) {
    return R::err("Run " + run_id + " aborted: " + task_errors.front());
  }

  nlohmann::json pending = nlohmann::json::array();
  std::string unfinished_detail;
  for (const auto& sr : summary.sections) {
    if (sr.status == state::SectionStatus::kPending ||
        sr.status == state::SectionStatus::kInProgress) {
      pending.push_back(sr.section_id);
      unfinished_detail += (unfinished_detail.empty() ? "" : "; ") + sr.section_id;
      if (!sr.error.empty()) {
        unfinished_detail += " (" + sr.error + ")";
      }
    }
  }
  if (stop_requested() && !pending.empty()) {
    emit(ev::kRunStopped, {{"unfinished_sections", pending}});
    summary.status = state::RunStatus::kInProgress;
    summary.stopped = true;
    return R::ok(std::move(summary));
  }
  // A section whose state could not be recorded is still pending or in_progress.
  // The run stays in_progress so that the next invocation recomputes it.
  if (!pending.empty()) {
    emit(ev::kRunStopped,
         {{"unfinished_sections", pending}, {"reason", "section state not recorded"}});
    return R::err("Run " + run_id + " left unfinished sections: " + unfinished_detail +
                  "; rerun to resume");
  }

  std::size_t completed = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  for (const auto& sr : summary.sections) {
    if (sr.status == state::SectionStatus::kCompleted) {
      ++completed;
    } else if (sr.status == state::SectionStatus::kFailed) {
      ++failed;
    } else if (sr.status == state::SectionStatus::kSkipped) {
      ++skipped;
    }
  }

  state::StateUpdate finish;
  finish.status = failed > 0 ? state::RunStatus::kFailed : state::RunStatus::kCompleted;
  finish.current_step = "done";
  finish.current_section = "";
  auto finished = store_.write(finish);
  if (!finished.has_value()) {
    return R::err("Cannot finish run " + run_id + ": " + describe(finished.error()));
  }
  summary.status = finished.value().status;

  emit(ev::kRunCompleted, {{"status", state::run_status_to_string(summary.status)},
                           {"completed", completed},
                           {"failed", failed},
                           {"skipped", skipped},
                           {"checkpoints", summary.checkpoints}});
  return R::ok(std::move(summary));
}

SectionRun PipelineRunner::process_section(const std::string& section_id,
                                           const SectionInput& input,
                                           const state::SectionState& prior) {
  SectionRun sr{section_id, prior.status, prior.last_score, false, std::nullopt, "", ""};
  if (stop_requested()) {
    return sr;
  }

  const std::size_t attempts = prior.attempts + 1;
  try {
    auto begin = section_update(section_id);
    begin.current_section = section_id;
    begin.current_step = std::string(kSectionSteps.front());
    begin.sections.front().status = state::SectionStatus::kInProgress;
    begin.sections.front().attempts = attempts;
    require(store_.write(begin), "start section " + section_id);
    sr.status = state::SectionStatus::kInProgress;
    emit(ev::kSectionStarted,
         {{"section_id", section_id},
          {"attempt", attempts},
          {"item_count", input.items.size()},
          {"resumed_from_step", prior.last_step}},
         {section_id});

    std::size_t recorded_step = prior.last_step;
    SectionHooks hooks;
    hooks.on_step = [&](std::string_view step, std::size_t step_number, std::size_t) {
      if (step_number <= recorded_step) {
        return;
      }
      auto progress = section_update(section_id);
      progress.current_section = section_id;
      progress.current_step = std::string(step);
      progress.sections.front().last_step = step_number;
      require(store_.write(progress), "record step " + std::string(step));
      recorded_step = step_number;
    };
    hooks.on_retry = [&](std::size_t next_iteration, const SectionEvaluation& previous) {
      emit(ev::kGateEvaluated,
           {{"section_id", section_id},
            {"iteration", next_iteration - 1},
            {"gate", scoring::gate_result_to_json(previous.gate)}},
           {section_id});
      emit(ev::kRetryScheduled,
           {{"section_id", section_id},
            {"next_iteration", next_iteration},
            {"action_items", previous.report.action_items.size()}},
           {section_id});
    };

    SectionOutcome outcome =
        section_pipeline_.run(section_id, input.items, input.assignments, hooks);
    emit(ev::kGateEvaluated,
         {{"section_id", section_id},
          {"iteration", outcome.iterations},
          {"gate", scoring::gate_result_to_json(outcome.evaluation.gate)}},
         {section_id});

    const bool passed = outcome.status != core::Outcome::kFail;
    auto end = section_update(section_id);
    end.sections.front().status =
        passed ? state::SectionStatus::kCompleted : state::SectionStatus::kFailed;
    end.sections.front().last_score = outcome.evaluation.gate.weighted_score;
    end.sections.front().notes = "gate " + core::outcome_to_string(outcome.status) + " after " +
                                 std::to_string(outcome.iterations) + " iteration(s)";
    if (!passed) {
      end.errors.push_back({"", section_id, "gate",
                            "gate FAIL with score " +
                                domain::format_quantity(outcome.evaluation.gate.weighted_score)});
    }
    const auto written = require(store_.write(end), "finish section " + section_id);
    sr.status = written.find_section(section_id)->status;
    sr.score = outcome.evaluation.gate.weighted_score;

    emit(passed ? ev::kSectionCompleted : ev::kSectionFailed,
         {{"section_id", section_id},
          {"status", core::outcome_to_string(outcome.status)},
          {"weighted_score", outcome.evaluation.gate.weighted_score},
          {"iterations", outcome.iterations},
          {"stopped_early", outcome.stopped_early}},
         {section_id});
    sr.outcome = std::move(outcome);

    if (config_.pipeline.checkpoint_after_section) {
      const std::string name = checkpoint_name(section_id, written.revision);
      const auto ref = require(store_.checkpoint(name), "checkpoint " + name);
      sr.checkpoint = ref.name;
      emit(ev::kCheckpointCreated, {{"name", ref.name}, {"revision", ref.revision}},
           {section_id, ref.name});
    }
  } catch (const StoreFailure& e) {
    sr.error = e.what();
    emit(ev::kSectionFailed, {{"section_id", section_id}, {"error", sr.error}},
         {section_id});
  } catch (const std::exception& e) {
    // Generator or scoring fault: the section fails, the run goes on.
    sr.error = e.what();
    auto fail = section_update(section_id);
    fail.sections.front().status = state::SectionStatus::kFailed;
    fail.sections.front().notes = sr.error;
    fail.errors.push_back({"", section_id, "generate", sr.error});
    auto written = store_.write(fail);
    if (written.has_value()) {
      sr.status = state::SectionStatus::kFailed;
    } else {
      sr.error += "; failure not recorded: " + describe(written.error());
    }
    emit(ev::kSectionFailed, {{"section_id", section_id}, {"error", sr.error}},
         {section_id});
  }
  return sr;
}

nlohmann::json run_summary_to_json(const RunSummary& summary) {
  nlohmann::json assignments = nlohmann::json::array();
  for (const auto& a : summary.classification.assignments) {
    assignments.push_back(domain::assignment_to_json(a));
  }
  nlohmann::json sections = nlohmann::json::array();
  for (const auto& sr : summary.sections) {
    nlohmann::json j = {{"section_id", sr.section_id},
                        {"status", state::section_status_to_string(sr.status)},
                        {"resumed", sr.resumed}};
    if (sr.score.has_value()) {
      j["score"] = *sr.score;
    }
    if (sr.outcome.has_value()) {
      j["outcome"] = section_outcome_to_json(*sr.outcome);
    }
    if (!sr.checkpoint.empty()) {
      j["checkpoint"] = sr.checkpoint;
    }
    if (!sr.error.empty()) {
      j["error"] = sr.error;
    }
    sections.push_back(std::move(j));
  }
  return {{"run_id", summary.run_id},
          {"status", state::run_status_to_string(summary.status)},
          {"stopped", summary.stopped},
          {"assignments", assignments},
          {"sections", sections},
          {"checkpoints", summary.checkpoints}};
}

}  // namespace cgate::pipeline
