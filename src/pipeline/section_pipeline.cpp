#include "cgate/pipeline/section_pipeline.h"

#include "cgate/domain/domain_json.h"
#include "cgate/validation/constraint_validator.h"

#include <utility>

namespace cgate::pipeline {

namespace {

void notify_step(const SectionHooks& hooks, std::size_t step_index, std::size_t iteration) {
  if (hooks.on_step) {
    hooks.on_step(kSectionSteps.at(step_index), step_index + 1, iteration);
  }
}

}  // namespace

SectionPipeline::SectionPipeline(const config::PipelineConfig& config,
                                 IContentGenerator& generator)
    : config_(config), generator_(generator), gate_(config.gate), reporter_(config.reporting) {}

SectionOutcome SectionPipeline::run(const std::string& section_id,
                                    const std::vector<domain::Item>& items,
                                    const std::vector<domain::Assignment>& assignments,
                                    const SectionHooks& hooks) const {
  SectionOutcome outcome;
  outcome.section_id = section_id;

  const std::size_t max_iterations =
      config_.pipeline.retry.max_iterations == 0 ? 1 : config_.pipeline.retry.max_iterations;

  GenerationRequest request{section_id, items, assignments, 1, std::nullopt};

  for (std::size_t iteration = 1; iteration <= max_iterations; ++iteration) {
    request.iteration = iteration;
    auto units = generator_.generate(request);
    notify_step(hooks, 0, iteration);

    SectionEvaluation eval;
    eval.violations = validation::validate_all(units, config_.limits);
    notify_step(hooks, 1, iteration);

    eval.quota = validation::check_units_quota(units, config_.quotas, section_id);
    eval.violations.insert(eval.violations.end(), eval.quota.violations.begin(),
                           eval.quota.violations.end());
    notify_step(hooks, 2, iteration);

    eval.gate = gate_.evaluate(eval.violations);
    notify_step(hooks, 3, iteration);

    eval.report = reporter_.report(eval.violations, eval.quota.advisories);
    notify_step(hooks, 4, iteration);

    const double score = eval.gate.weighted_score;
    const bool improved = outcome.score_history.empty() || score > outcome.score_history.back();
    outcome.score_history.push_back(score);
    outcome.iterations = iteration;
    outcome.status = eval.gate.status;
    outcome.units = std::move(units);
    outcome.evaluation = std::move(eval);

    if (outcome.status != core::Outcome::kFail) {
      break;
    }
    if (!improved && config_.pipeline.retry.stop_on_no_improvement) {
      outcome.stopped_early = true;
      break;
    }
    if (iteration == max_iterations) {
      break;
    }
    if (hooks.on_retry) {
      hooks.on_retry(iteration + 1, outcome.evaluation);
    }
    request.feedback = outcome.evaluation.report;
  }

  return outcome;
}

SectionEvaluation evaluate_units(const config::PipelineConfig& config,
                                 const std::string& section_id,
                                 const std::vector<domain::ContentUnit>& units) {
  SectionEvaluation eval;
  eval.violations = validation::validate_all(units, config.limits);
  eval.quota = validation::check_units_quota(units, config.quotas, section_id);
  eval.violations.insert(eval.violations.end(), eval.quota.violations.begin(),
                         eval.quota.violations.end());
  eval.gate = scoring::QualityGate(config.gate).evaluate(eval.violations);
  eval.report = reporting::ErrorReporter(config.reporting).report(eval.violations,
                                                                 eval.quota.advisories);
  return eval;
}

nlohmann::json section_outcome_to_json(const SectionOutcome& outcome) {
  nlohmann::json units = nlohmann::json::array();
  for (const auto& unit : outcome.units) {
    units.push_back(domain::content_unit_to_json(unit));
  }
  nlohmann::json violations = nlohmann::json::array();
  for (const auto& v : outcome.evaluation.violations) {
    violations.push_back(domain::violation_to_json(v));
  }
  nlohmann::json advisories = nlohmann::json::array();
  for (const auto& a : outcome.evaluation.quota.advisories) {
    advisories.push_back(domain::advisory_to_json(a));
  }

  const auto& quota = outcome.evaluation.quota;
  nlohmann::json quota_json = {{"outcome", core::outcome_to_string(quota.outcome)},
                               {"collection_size", quota.collection_size},
                               {"special_count", quota.special_count},
                               {"deficit", quota.deficit},
                               {"advisories", advisories}};
  if (quota.band.has_value()) {
    quota_json["band"] = {{"size_min", quota.band->size_min}, {"size_max", quota.band->size_max}};
  }

  return {{"section_id", outcome.section_id},
          {"status", core::outcome_to_string(outcome.status)},
          {"iterations", outcome.iterations},
          {"stopped_early", outcome.stopped_early},
          {"score_history", outcome.score_history},
          {"units", units},
          {"violations", violations},
          {"quota", quota_json},
          {"gate", scoring::gate_result_to_json(outcome.evaluation.gate)},
          {"report", reporting::report_to_json(outcome.evaluation.report)}};
}

}  // namespace cgate::pipeline
