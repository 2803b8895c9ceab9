#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/domain/content_unit.h"

#include <ostream>
#include <string>
#include <vector>

// run_check evaluates the units of one section and writes the outcome to out.
// Returns kExitOk for PASS or WARN and kExitBlocked for FAIL.
int run_check(const cgate::config::PipelineConfig& config, const std::string& section_id,
              const std::vector<cgate::domain::ContentUnit>& units, std::ostream& out);
