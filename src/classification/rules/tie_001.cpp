#include "cgate/classification/rules/tie_001.h"

#include <algorithm>
#include <limits>

namespace cgate::classification {

RuleVerdict Tie001::evaluate(const domain::Item& item, const config::CategoryCatalog& catalog,
                             const ClassificationContext& context,
                             const std::vector<RuleOutcome>& prior) const {
  RuleVerdict verdict;
  if (!context.dependencies.has_dependents(item.item_id)) {
    return verdict;
  }

  const auto support = aggregate_support(catalog, prior);
  if (support.empty()) {
    return verdict;
  }

  // Categories missing from foundation_order rank after every listed one, in catalog order.
  const auto rank = [&](const std::string& category_id) {
    const auto it = std::find(foundation_order_.begin(), foundation_order_.end(), category_id);
    if (it != foundation_order_.end()) {
      return static_cast<std::size_t>(it - foundation_order_.begin());
    }
    return foundation_order_.size() + catalog.index_of(category_id).value_or(0);
  };

  std::string best;
  std::size_t best_rank = std::numeric_limits<std::size_t>::max();
  for (const auto& s : support.scores) {
    const auto r = rank(s.category_id);
    if (r < best_rank) {
      best_rank = r;
      best = s.category_id;
    }
  }
  verdict.scores.push_back(CategoryScore{best, 1.0});
  return verdict;
}

}  // namespace cgate::classification
