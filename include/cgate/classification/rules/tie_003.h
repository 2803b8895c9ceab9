#pragma once

#include "cgate/classification/classification_rule.h"

#include <string>
#include <utility>

namespace cgate::classification {

// TIE-003: Forced choice (tertiary tier, always decisive)
// Order of preference:
// 1. most testable-cue hits
// 2. most aggregate support from earlier tiers
// 3. catalog order
// An item with no testable cues and no earlier support goes to the fallback category.
class Tie003 final : public ClassificationRule {
 public:
  Tie003(config::CueTable testable_cues, std::string fallback_category)
      : testable_cues_(std::move(testable_cues)),
        fallback_category_(std::move(fallback_category)) {}

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "TIE-003"; }
  [[nodiscard]] domain::RuleTier tier() const noexcept override {
    return domain::RuleTier::kTertiary;
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Forced choice by testable emphasis";
  }
  [[nodiscard]] bool is_forced_choice() const noexcept override { return true; }

  [[nodiscard]] RuleVerdict evaluate(const domain::Item& item,
                                     const config::CategoryCatalog& catalog,
                                     const ClassificationContext& context,
                                     const std::vector<RuleOutcome>& prior) const override;

 private:
  config::CueTable testable_cues_;
  std::string fallback_category_;
};

}  // namespace cgate::classification
