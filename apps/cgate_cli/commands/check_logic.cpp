#include "check_logic.h"

#include "common.h"

#include "cgate/pipeline/section_pipeline.h"

#include <iostream>
#include <stdexcept>

int run_check(const cgate::config::PipelineConfig& config, const std::string& section_id,
              const std::vector<cgate::domain::ContentUnit>& units, std::ostream& out) {
  cgate::pipeline::SectionOutcome outcome;
  outcome.section_id = section_id;
  outcome.units = units;
  try {
    outcome.evaluation = cgate::pipeline::evaluate_units(config, section_id, units);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Gate definition rejected: " << e.what() << "\n";
    return kExitError;
  }
  outcome.status = outcome.evaluation.gate.status;
  outcome.iterations = 1;
  outcome.score_history.push_back(outcome.evaluation.gate.weighted_score);

  out << cgate::pipeline::section_outcome_to_json(outcome).dump(2) << "\n";
  return outcome.status == cgate::core::Outcome::kFail ? kExitBlocked : kExitOk;
}
