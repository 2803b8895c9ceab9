#include "cgate/classification/cue_rule.h"

#include "cgate/core/normalization.h"

namespace cgate::classification {

RuleVerdict score_cues(const std::vector<std::string>& tokens, const config::CueTable& cues,
                       const config::CategoryCatalog& catalog) {
  RuleVerdict verdict;
  for (const auto& category : catalog.categories) {
    const auto it = cues.find(category.category_id);
    if (it == cues.end()) {
      continue;
    }
    std::size_t hits = 0;
    for (const auto& phrase : it->second) {
      hits += core::count_phrase(tokens, phrase);
    }
    if (hits > 0) {
      verdict.scores.push_back(CategoryScore{category.category_id, static_cast<double>(hits)});
    }
  }
  return verdict;
}

RuleVerdict CueRule::evaluate(const domain::Item& item, const config::CategoryCatalog& catalog,
                              const ClassificationContext& /*context*/,
                              const std::vector<RuleOutcome>& /*prior*/) const {
  return score_cues(core::tokenize_ascii(item.text), cues_, catalog);
}

}  // namespace cgate::classification
