#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/domain/item.h"

#include <ostream>
#include <vector>

// run_classify classifies items and writes the batch result to out.
// Returns kExitOk, or kExitError when the batch is rejected.
int run_classify(const cgate::config::PipelineConfig& config,
                 const std::vector<cgate::domain::Item>& items, std::ostream& out);
