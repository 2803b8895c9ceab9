#include "cgate/pipeline/content_generator.h"

#include "cgate/domain/domain_json.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cgate::pipeline {

RecordedContentGenerator::RecordedContentGenerator(std::map<std::string, Revisions> recordings)
    : recordings_(std::move(recordings)) {}

std::vector<domain::ContentUnit> RecordedContentGenerator::generate(
    const GenerationRequest& request) {
  const auto it = recordings_.find(request.section_id);
  if (it == recordings_.end() || it->second.empty()) {
    throw std::runtime_error("No recorded units for section: " + request.section_id);
  }
  const auto& revisions = it->second;
  const std::size_t index = std::min(std::max<std::size_t>(request.iteration, 1), revisions.size()) - 1;
  return revisions[index];
}

bool RecordedContentGenerator::has_section(const std::string& section_id) const {
  return recordings_.count(section_id) > 0;
}

RecordedContentGenerator recorded_generator_from_json(const nlohmann::json& j) {
  std::map<std::string, RecordedContentGenerator::Revisions> recordings;
  for (const auto& [section_id, revisions_json] : j.at("sections").items()) {
    RecordedContentGenerator::Revisions revisions;
    for (const auto& revision_json : revisions_json) {
      std::vector<domain::ContentUnit> units;
      for (const auto& unit_json : revision_json) {
        auto unit = domain::content_unit_from_json(unit_json);
        if (unit.category_id.empty()) {
          unit.category_id = section_id;
        }
        units.push_back(std::move(unit));
      }
      revisions.push_back(std::move(units));
    }
    recordings.emplace(section_id, std::move(revisions));
  }
  return RecordedContentGenerator(std::move(recordings));
}

}  // namespace cgate::pipeline
