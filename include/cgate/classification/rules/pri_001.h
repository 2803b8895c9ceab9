#pragma once

#include "cgate/classification/cue_rule.h"

namespace cgate::classification {

// PRI-001: Subject routing (primary tier)
// Scores categories by subject-area phrases. Its verdict is also the basis for XREF
// shares.
class Pri001 final : public CueRule {
 public:
  explicit Pri001(config::CueTable subject_routes) : CueRule(std::move(subject_routes)) {}

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "PRI-001"; }
  [[nodiscard]] domain::RuleTier tier() const noexcept override {
    return domain::RuleTier::kPrimary;
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Route by subject area";
  }
};

}  // namespace cgate::classification
