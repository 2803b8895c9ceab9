#pragma once

#include "cgate/classification/classification_rule.h"

namespace cgate::classification {

// TIE-002: Multi-rule dominance (tertiary tier)
// Counts, per category, how many earlier rules ranked it first. Decisive when one
// category leads more rules than any other.
class Tie002 final : public ClassificationRule {
 public:
  Tie002() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "TIE-002"; }
  [[nodiscard]] domain::RuleTier tier() const noexcept override {
    return domain::RuleTier::kTertiary;
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Prefer the category most earlier rules ranked first";
  }

  [[nodiscard]] RuleVerdict evaluate(const domain::Item& item,
                                     const config::CategoryCatalog& catalog,
                                     const ClassificationContext& context,
                                     const std::vector<RuleOutcome>& prior) const override;
};

}  // namespace cgate::classification
