#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/core/clock.h"
#include "cgate/core/id_generator.h"
#include "cgate/domain/item.h"
#include "cgate/pipeline/content_generator.h"
#include "cgate/state/state_store.h"
#include "cgate/storage/audit_log.h"

#include <ostream>
#include <vector>

// run_pipeline drives a run through PipelineRunner and writes the summary to out.
// Takes only interface types; the caller owns the concrete backends.
int run_pipeline(const cgate::config::PipelineConfig& config,
                 const std::vector<cgate::domain::Item>& items,
                 cgate::pipeline::IContentGenerator& generator, cgate::state::StateStore& store,
                 cgate::storage::IAuditLog& audit_log, cgate::core::IIdGenerator& id_gen,
                 cgate::core::IClock& clock, std::ostream& out);
