#pragma once

#include "cgate/classification/classification_rule.h"
#include "cgate/config/pipeline_config.h"

#include <memory>
#include <string>
#include <vector>

namespace cgate::classification {

// RuleSet holds the ordered classification cascade.
// Evaluation order is the vector order; tiers never decrease along it.
struct RuleSet {
  std::string ruleset_id;
  std::vector<std::unique_ptr<const ClassificationRule>> rules;
};

// make_rule_set builds the cascade in settings.rule_order.
// Throws std::invalid_argument when an id is unknown, a tier goes backwards, or the
// last rule is not a forced-choice rule.
[[nodiscard]] RuleSet make_rule_set(const config::ClassifierSettings& settings);

// known_rule_ids lists every rule id make_rule_set can resolve, in default order.
[[nodiscard]] std::vector<std::string> known_rule_ids();

}  // namespace cgate::classification
