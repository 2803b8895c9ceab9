#include "classify_logic.h"

#include "common.h"

#include "cgate/classification/classifier.h"
#include "cgate/domain/domain_json.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>

int run_classify(const cgate::config::PipelineConfig& config,
                 const std::vector<cgate::domain::Item>& items, std::ostream& out) {
  std::optional<cgate::classification::Classifier> classifier;
  try {
    classifier.emplace(config.catalog, config.classifier);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Invalid classifier rules: " << e.what() << "\n";
    return kExitError;
  }

  const auto result = classifier->classify_batch(items);
  if (!result.has_value()) {
    std::cerr << "Classification failed ("
              << cgate::core::classification_error_code_to_string(result.error().code)
              << "): " << result.error().message << "\n";
    return kExitError;
  }
  const auto& batch = result.value();

  nlohmann::json j;
  j["ruleset_id"] = classifier->rule_set().ruleset_id;
  j["assignments"] = nlohmann::json::array();
  for (const auto& a : batch.assignments) {
    j["assignments"].push_back(cgate::domain::assignment_to_json(a));
  }
  j["category_counts"] = nlohmann::json::array();
  for (const auto& [category, count] : batch.category_counts) {
    j["category_counts"].push_back({{"category_id", category}, {"count", count}});
  }
  j["needs_review"] = nlohmann::json::array();
  for (const auto& s : batch.needs_review) {
    j["needs_review"].push_back({{"category_id", s.category_id},
                                 {"count", s.count},
                                 {"min_population", s.min_population}});
  }
  j["suggested_order"] = batch.suggested_order;
  out << j.dump(2) << "\n";
  return kExitOk;
}
