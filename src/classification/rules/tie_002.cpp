#include "cgate/classification/rules/tie_002.h"

#include <algorithm>

namespace cgate::classification {

RuleVerdict Tie002::evaluate(const domain::Item& /*item*/, const config::CategoryCatalog& catalog,
                             const ClassificationContext& /*context*/,
                             const std::vector<RuleOutcome>& prior) const {
  RuleVerdict verdict;
  for (const auto& category : catalog.categories) {
    std::size_t firsts = 0;
    for (const auto& outcome : prior) {
      if (outcome.tier == domain::RuleTier::kTertiary) {
        continue;
      }
      const auto top = outcome.verdict.leaders();
      if (std::find(top.begin(), top.end(), category.category_id) != top.end()) {
        ++firsts;
      }
    }
    if (firsts > 0) {
      verdict.scores.push_back(CategoryScore{category.category_id, static_cast<double>(firsts)});
    }
  }
  return verdict;
}

}  // namespace cgate::classification
