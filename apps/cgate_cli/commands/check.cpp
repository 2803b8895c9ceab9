#include "check.h"

#include "check_logic.h"
#include "common.h"

#include "cgate/domain/domain_json.h"

#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CheckCliConfig {
  std::optional<std::string> config_path;
  std::optional<std::string> section_path;
};

}  // namespace

int cmd_check(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<cgate::apps::Option<CheckCliConfig>> options = {
      {"--config", true, "Pipeline configuration JSON",
       [](CheckCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--section", true, "Section units JSON",
       [](CheckCliConfig& c, const std::string& v) {
         c.section_path = v;
         return true;
       }},
  };
  const auto parsed = cgate::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;
  if (!parsed.ok() || !cli.config_path.has_value() || !cli.section_path.has_value()) {
    std::cerr << "Usage: cgate_cli check --config <pipeline.json> --section <units.json>\n";
    cgate::apps::print_options(std::cerr, options);
    return kExitError;
  }

  const auto config = load_config(*cli.config_path);
  const auto section_json = read_json_file(*cli.section_path);
  if (!config.has_value() || !section_json.has_value()) {
    return kExitError;
  }

  std::string section_id;
  std::vector<cgate::domain::ContentUnit> units;
  try {
    section_id = section_json->at("section_id").get<std::string>();
    for (const auto& unit_json : section_json->at("units")) {
      auto unit = cgate::domain::content_unit_from_json(unit_json);
      if (unit.category_id.empty()) {
        unit.category_id = section_id;
      }
      units.push_back(std::move(unit));
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Invalid section in " << *cli.section_path << ": " << e.what() << "\n";
    return kExitError;
  }

  return run_check(*config, section_id, units, std::cout);
}
