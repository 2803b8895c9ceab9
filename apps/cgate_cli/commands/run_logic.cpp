#include "run_logic.h"

#include "common.h"

#include "cgate/pipeline/pipeline_runner.h"

#include <iostream>

int run_pipeline(const cgate::config::PipelineConfig& config,
                 const std::vector<cgate::domain::Item>& items,
                 cgate::pipeline::IContentGenerator& generator, cgate::state::StateStore& store,
                 cgate::storage::IAuditLog& audit_log, cgate::core::IIdGenerator& id_gen,
                 cgate::core::IClock& clock, std::ostream& out) {
  cgate::pipeline::PipelineRunner runner(config, generator, store, audit_log, id_gen, clock);
  const auto result = runner.run(items);
  if (!result.has_value()) {
    std::cerr << result.error() << "\n";
    return kExitError;
  }
  const auto& summary = result.value();
  out << cgate::pipeline::run_summary_to_json(summary).dump(2) << "\n";

  for (const auto& section : summary.sections) {
    if (!section.error.empty()) {
      std::cerr << "Section " << section.section_id << ": " << section.error << "\n";
    }
  }
  return summary.status == cgate::state::RunStatus::kFailed ? kExitBlocked : kExitOk;
}
