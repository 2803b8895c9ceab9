#pragma once

#include "cgate/classification/classification_rule.h"
#include "cgate/classification/rule_set.h"
#include "cgate/config/pipeline_config.h"
#include "cgate/core/result.h"
#include "cgate/domain/assignment.h"
#include "cgate/domain/item.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cgate::classification {

// PopulationShortfall names a category that received fewer items than its minimum.
// It is a review flag, not an error: assignments are never moved to fill it.
struct PopulationShortfall {
  std::string category_id;     // NOLINT(readability-identifier-naming)
  std::size_t count{0};        // NOLINT(readability-identifier-naming)
  std::size_t min_population{0};  // NOLINT(readability-identifier-naming)
};

struct ClassificationBatch {
  std::vector<domain::Assignment> assignments;  // input order
  // One entry per catalog category, catalog order.
  std::vector<std::pair<std::string, std::size_t>> category_counts;  // NOLINT(readability-identifier-naming)
  std::vector<PopulationShortfall> needs_review;  // NOLINT(readability-identifier-naming)
  // Delivery order of item ids: definers ahead of the items using their term.
  std::vector<std::int64_t> suggested_order;  // NOLINT(readability-identifier-naming)
};

// Classifier runs the rule cascade over items.
// Immutable after construction; classify() and classify_batch() are safe to call
// concurrently.
class Classifier {
 public:
  Classifier(config::CategoryCatalog catalog, config::ClassifierSettings settings);

  // classify assigns one item. The first rule whose verdict is decisive wins.
  // Throws std::runtime_error when a rule names a category outside the catalog, or
  // std::logic_error when no rule decides (impossible with a valid rule set).
  [[nodiscard]] domain::Assignment classify(const domain::Item& item,
                                            const config::CategoryCatalog& catalog,
                                            const ClassificationContext& context) const;

  // classify_batch assigns every item against the classifier's catalog. It computes
  // the dependency map once, retries once on a rule fault, and returns no partial
  // results on failure.
  [[nodiscard]] core::Result<ClassificationBatch, core::ClassificationError> classify_batch(
      const std::vector<domain::Item>& items) const;

  [[nodiscard]] const config::CategoryCatalog& catalog() const noexcept { return catalog_; }
  [[nodiscard]] const RuleSet& rule_set() const noexcept { return rules_; }

 private:
  config::CategoryCatalog catalog_;
  config::ClassifierSettings settings_;
  RuleSet rules_;
};

}  // namespace cgate::classification
