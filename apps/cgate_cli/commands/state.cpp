#include "state.h"

#include "common.h"
#include "state_logic.h"

#include "cgate/core/clock.h"
#include "cgate/core/id_generator.h"
#include "cgate/pipeline/section_pipeline.h"
#include "cgate/state/state_store.h"

#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct StateCliConfig {
  std::optional<std::string> run_id;
  std::string name;
  StorageOptions storage;
};

bool needs_name(const std::string& action) {
  return action == "checkpoint" || action == "recover";
}

}  // namespace

int cmd_state(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 3) {
    std::cerr << "Usage: cgate_cli state <status|validate|repair|checkpoint|recover|list|audit> "
                 "--run-id <id> (--store-dir <dir> | --db <path>) [--name <checkpoint>]\n";
    return kExitError;
  }
  const std::string action = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  const std::vector<cgate::apps::Option<StateCliConfig>> options = {
      {"--run-id", true, "Run identifier",
       [](StateCliConfig& c, const std::string& v) {
         c.run_id = v;
         return true;
       }},
      {"--name", true, "Checkpoint name",
       [](StateCliConfig& c, const std::string& v) {
         c.name = v;
         return true;
       }},
      {"--store-dir", true, "Directory for file-backed run state",
       [](StateCliConfig& c, const std::string& v) {
         c.storage.store_dir = v;
         return true;
       }},
      {"--db", true, "SQLite database for run state and audit log",
       [](StateCliConfig& c, const std::string& v) {
         c.storage.db_path = v;
         return true;
       }},
  };
  const auto parsed = cgate::apps::parse_options(argc, argv, options, 3);
  const auto& cli = parsed.config;
  if (!parsed.ok()) {
    cgate::apps::print_options(std::cerr, options);
    return kExitError;
  }
  if (!cli.run_id.has_value()) {
    std::cerr << "Error: --run-id is required\n";
    return kExitError;
  }
  if (!cgate::core::is_safe_identifier(*cli.run_id)) {
    std::cerr << "Invalid --run-id: " << *cli.run_id << "\n";
    return kExitError;
  }
  if (needs_name(action) && cli.name.empty()) {
    std::cerr << "Error: state " << action << " requires --name\n";
    return kExitError;
  }

  auto storage = open_storage(cli.storage);
  if (!storage.has_value()) {
    return kExitError;
  }

  cgate::core::SystemIdGenerator id_gen;
  cgate::core::SystemClock clock;
  cgate::state::StateStore store(*storage->backend, *cli.run_id, clock,
                                 {cgate::pipeline::kSectionSteps.size()});
  return run_state_action(action, cli.name, store, *storage->audit_log, id_gen, clock, std::cout);
}
