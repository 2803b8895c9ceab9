#pragma once

#include "cgate/core/clock.h"
#include "cgate/core/id_generator.h"
#include "cgate/state/state_store.h"
#include "cgate/storage/audit_log.h"

#include <ostream>
#include <string>

// run_state_action executes one `state` action against store and writes JSON to out.
// Store errors go to stderr and yield kExitError.
int run_state_action(const std::string& action, const std::string& checkpoint_name,
                     cgate::state::StateStore& store, cgate::storage::IAuditLog& audit_log,
                     cgate::core::IIdGenerator& id_gen, cgate::core::IClock& clock,
                     std::ostream& out);
