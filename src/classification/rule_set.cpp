#include "cgate/classification/rule_set.h"

#include "cgate/classification/rules/pri_001.h"
#include "cgate/classification/rules/sec_001.h"
#include "cgate/classification/rules/sec_002.h"
#include "cgate/classification/rules/sec_003.h"
#include "cgate/classification/rules/tie_001.h"
#include "cgate/classification/rules/tie_002.h"
#include "cgate/classification/rules/tie_003.h"

#include <stdexcept>

namespace cgate::classification {

namespace {

std::unique_ptr<const ClassificationRule> make_rule(const std::string& rule_id,
                                                    const config::ClassifierSettings& s) {
  if (rule_id == "PRI-001") {
    return std::make_unique<Pri001>(s.subject_routes);
  }
  if (rule_id == "SEC-001") {
    return std::make_unique<Sec001>(s.technique_cues);
  }
  if (rule_id == "SEC-002") {
    return std::make_unique<Sec002>(s.period_cues);
  }
  if (rule_id == "SEC-003") {
    return std::make_unique<Sec003>(s.population_cues);
  }
  if (rule_id == "TIE-001") {
    return std::make_unique<Tie001>(s.foundation_order);
  }
  if (rule_id == "TIE-002") {
    return std::make_unique<Tie002>();
  }
  if (rule_id == "TIE-003") {
    return std::make_unique<Tie003>(s.testable_cues, s.fallback_category);
  }
  throw std::invalid_argument("Unknown classification rule: " + rule_id);
}

}  // namespace

std::vector<std::string> known_rule_ids() {
  return {"PRI-001", "SEC-001", "SEC-002", "SEC-003", "TIE-001", "TIE-002", "TIE-003"};
}

RuleSet make_rule_set(const config::ClassifierSettings& settings) {
  RuleSet rule_set{};
  rule_set.ruleset_id = "cascade";

  for (const auto& rule_id : settings.rule_order) {
    auto rule = make_rule(rule_id, settings);
    if (!rule_set.rules.empty() && rule->tier() < rule_set.rules.back()->tier()) {
      throw std::invalid_argument("Rule " + rule_id + " is declared after a higher-tier rule");
    }
    rule_set.rules.push_back(std::move(rule));
  }

  if (rule_set.rules.empty() || !rule_set.rules.back()->is_forced_choice()) {
    throw std::invalid_argument("Rule order must end with a forced-choice rule");
  }
  return rule_set;
}

}  // namespace cgate::classification
