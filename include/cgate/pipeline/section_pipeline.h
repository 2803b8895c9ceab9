#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/core/severity.h"
#include "cgate/domain/assignment.h"
#include "cgate/domain/content_unit.h"
#include "cgate/domain/item.h"
#include "cgate/domain/violation.h"
#include "cgate/pipeline/content_generator.h"
#include "cgate/reporting/error_reporter.h"
#include "cgate/scoring/quality_gate.h"
#include "cgate/validation/quota_checker.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cgate::pipeline {

// Steps one section passes through per iteration, in order. A section's last_step in
// the state store counts how many of these have finished.
inline constexpr std::array<std::string_view, 5> kSectionSteps = {"generate", "validate",
                                                                  "quota", "gate", "report"};

// SectionEvaluation is the verdict on one set of units.
// violations holds the validator findings followed by the quota findings; it is
// exactly what the gate scored.
struct SectionEvaluation {
  std::vector<domain::Violation> violations;
  validation::QuotaResult quota;
  scoring::GateResult gate;
  reporting::Report report;
};

struct SectionOutcome {
  std::string section_id;  // NOLINT(readability-identifier-naming)
  core::Outcome status{core::Outcome::kFail};
  std::size_t iterations{0};
  std::vector<domain::ContentUnit> units;  // last generated revision
  SectionEvaluation evaluation;            // of the last revision
  std::vector<double> score_history;       // NOLINT(readability-identifier-naming)
  bool stopped_early{false};               // NOLINT(readability-identifier-naming)
};

// Optional observers. on_step fires after a step finishes (step_number is 1-based
// into kSectionSteps); on_retry fires before a new iteration is requested.
struct SectionHooks {
  std::function<void(std::string_view step, std::size_t step_number, std::size_t iteration)>
      on_step;  // NOLINT(readability-identifier-naming)
  std::function<void(std::size_t next_iteration, const SectionEvaluation& previous)>
      on_retry;  // NOLINT(readability-identifier-naming)
};

// SectionPipeline drives one section through generate -> validate -> quota -> gate ->
// report. While the gate says FAIL it requests a revision with the report as
// feedback, up to retry.max_iterations attempts. With stop_on_no_improvement set it
// gives up as soon as a revision scores no better than the one before.
//
// Holds no mutable state; run() may be called from several workers at once as long
// as the generator is thread-safe.
class SectionPipeline {
 public:
  SectionPipeline(const config::PipelineConfig& config, IContentGenerator& generator);

  // Throws whatever the generator throws.
  [[nodiscard]] SectionOutcome run(const std::string& section_id,
                                   const std::vector<domain::Item>& items,
                                   const std::vector<domain::Assignment>& assignments,
                                   const SectionHooks& hooks = {}) const;

 private:
  const config::PipelineConfig& config_;
  IContentGenerator& generator_;
  scoring::QualityGate gate_;
  reporting::ErrorReporter reporter_;
};

// evaluate_units runs validation, quota, gate and report over a fixed set of units.
[[nodiscard]] SectionEvaluation evaluate_units(const config::PipelineConfig& config,
                                               const std::string& section_id,
                                               const std::vector<domain::ContentUnit>& units);

[[nodiscard]] nlohmann::json section_outcome_to_json(const SectionOutcome& outcome);

}  // namespace cgate::pipeline
