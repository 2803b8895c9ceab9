#include "classify.h"

#include "classify_logic.h"
#include "common.h"

#include "cgate/domain/domain_json.h"

#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ClassifyCliConfig {
  std::optional<std::string> config_path;
  std::optional<std::string> items_path;
};

}  // namespace

int cmd_classify(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cgate::apps::Option<ClassifyCliConfig>> options = {
      {"--config", true, "Pipeline configuration JSON",
       [](ClassifyCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--items", true, "Items JSON (array or {\"items\": [...]})",
       [](ClassifyCliConfig& c, const std::string& v) {
         c.items_path = v;
         return true;
       }},
  };
  const auto parsed = cgate::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;
  if (!parsed.ok() || !cli.config_path.has_value() || !cli.items_path.has_value()) {
    std::cerr << "Usage: cgate_cli classify --config <pipeline.json> --items <items.json>\n";
    cgate::apps::print_options(std::cerr, options);
    return kExitError;
  }

  const auto config = load_config(*cli.config_path);
  const auto items_json = read_json_file(*cli.items_path);
  if (!config.has_value() || !items_json.has_value()) {
    return kExitError;
  }

  std::vector<cgate::domain::Item> items;
  try {
    items = cgate::domain::items_from_json(*items_json);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Invalid items in " << *cli.items_path << ": " << e.what() << "\n";
    return kExitError;
  }

  return run_classify(*config, items, std::cout);
}
