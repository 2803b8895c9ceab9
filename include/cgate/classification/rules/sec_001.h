#pragma once

#include "cgate/classification/cue_rule.h"

namespace cgate::classification {

// SEC-001: Route by technique or method cue (secondary tier)
class Sec001 final : public CueRule {
 public:
  explicit Sec001(config::CueTable technique_cues) : CueRule(std::move(technique_cues)) {}

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "SEC-001"; }
  [[nodiscard]] domain::RuleTier tier() const noexcept override {
    return domain::RuleTier::kSecondary;
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Route by technique or method cue";
  }
};

}  // namespace cgate::classification
