#include "run.h"

#include "common.h"
#include "run_logic.h"

#include "cgate/core/clock.h"
#include "cgate/core/id_generator.h"
#include "cgate/domain/domain_json.h"
#include "cgate/pipeline/content_generator.h"
#include "cgate/pipeline/section_pipeline.h"
#include "cgate/state/state_store.h"

#include "shared/arg_parser.h"

#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct RunCliConfig {
  std::optional<std::string> config_path;
  std::optional<std::string> items_path;
  std::optional<std::string> sections_path;
  std::optional<std::string> run_id;
  std::optional<std::size_t> workers;
  StorageOptions storage;
};

}  // namespace

int cmd_run(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cgate::apps::Option<RunCliConfig>> options = {
      {"--config", true, "Pipeline configuration JSON",
       [](RunCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--items", true, "Items JSON",
       [](RunCliConfig& c, const std::string& v) {
         c.items_path = v;
         return true;
       }},
      {"--sections", true, "Recorded generator output JSON",
       [](RunCliConfig& c, const std::string& v) {
         c.sections_path = v;
         return true;
       }},
      {"--run-id", true, "Run identifier to start or resume (default: a new run-... id)",
       [](RunCliConfig& c, const std::string& v) {
         c.run_id = v;
         return true;
       }},
      {"--store-dir", true, "Directory for file-backed run state",
       [](RunCliConfig& c, const std::string& v) {
         c.storage.store_dir = v;
         return true;
       }},
      {"--db", true, "SQLite database for run state and audit log",
       [](RunCliConfig& c, const std::string& v) {
         c.storage.db_path = v;
         return true;
       }},
      {"--workers", true, "Worker count (overrides pipeline.worker_count)",
       [](RunCliConfig& c, const std::string& v) {
         try {
           const auto n = std::stoul(v);
           if (n == 0) {
             std::cerr << "Invalid --workers: " << v << " (must be at least 1)\n";
             return false;
           }
           c.workers = n;
           return true;
         } catch (const std::exception&) {
           std::cerr << "Invalid --workers: " << v << "\n";
           return false;
         }
       }},
  };
  const auto parsed = cgate::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;
  if (!parsed.ok() || !cli.config_path.has_value() || !cli.items_path.has_value() ||
      !cli.sections_path.has_value()) {
    std::cerr << "Usage: cgate_cli run --config <pipeline.json> --items <items.json> "
                 "--sections <units.json> (--store-dir <dir> | --db <path>) [--run-id <id>] "
                 "[--workers <n>]\n";
    cgate::apps::print_options(std::cerr, options);
    return kExitError;
  }

  auto config = load_config(*cli.config_path);
  const auto items_json = read_json_file(*cli.items_path);
  const auto sections_json = read_json_file(*cli.sections_path);
  if (!config.has_value() || !items_json.has_value() || !sections_json.has_value()) {
    return kExitError;
  }
  if (cli.workers.has_value()) {
    config->pipeline.worker_count = *cli.workers;
  }

  std::vector<cgate::domain::Item> items;
  std::optional<cgate::pipeline::RecordedContentGenerator> generator;
  try {
    items = cgate::domain::items_from_json(*items_json);
    generator.emplace(cgate::pipeline::recorded_generator_from_json(*sections_json));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Invalid input: " << e.what() << "\n";
    return kExitError;
  }

  cgate::core::SystemIdGenerator id_gen;
  const std::string run_id = cli.run_id.has_value() ? *cli.run_id : id_gen.next("run");
  if (!cgate::core::is_safe_identifier(run_id)) {
    std::cerr << "Invalid --run-id: " << run_id << " (use 1-64 characters from [A-Za-z0-9._-])\n";
    return kExitError;
  }
  if (!cli.run_id.has_value()) {
    std::cerr << "Run id: " << run_id << "\n";
  }

  auto storage = open_storage(cli.storage);
  if (!storage.has_value()) {
    return kExitError;
  }

  cgate::core::SystemClock clock;
  cgate::state::StateStore store(
      *storage->backend, run_id, clock,
      {cgate::pipeline::kSectionSteps.size(), config->pipeline.retry.io_backoff});

  return run_pipeline(*config, items, *generator, store, *storage->audit_log, id_gen, clock,
                      std::cout);
}
