#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/core/severity.h"
#include "cgate/domain/violation.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cgate::scoring {

// ScoreCategory is one weighted dimension submitted to the gate.
struct ScoreCategory {
  std::string dimension_id;                // NOLINT(readability-identifier-naming)
  double raw_score{100.0};                 // NOLINT(readability-identifier-naming)
  double weight{0.0};
  std::vector<domain::Violation> violations;
};

struct DimensionResult {
  std::string dimension_id;  // NOLINT(readability-identifier-naming)
  double raw_score{0.0};     // NOLINT(readability-identifier-naming)
  double weight{0.0};
  double contribution{0.0};  // raw_score * weight
  core::Outcome status{core::Outcome::kPass};
  std::size_t violation_count{0};  // NOLINT(readability-identifier-naming)
};

struct TriggeredAutoFail {
  std::string condition_id;  // NOLINT(readability-identifier-naming)
  std::string description;
  std::string detail;  // what was observed, e.g. "REQ-FIELD present 1 time(s)"
};

// GateResult always reports the weighted score and breakdown. When any auto-fail
// condition triggered, status is FAIL whatever the weighted score says.
struct GateResult {
  std::string gate_id;                      // NOLINT(readability-identifier-naming)
  double weighted_score{0.0};               // NOLINT(readability-identifier-naming)
  core::Outcome status{core::Outcome::kFail};
  std::vector<TriggeredAutoFail> auto_fail;  // NOLINT(readability-identifier-naming)
  std::vector<DimensionResult> breakdown;

  [[nodiscard]] bool auto_failed() const noexcept { return !auto_fail.empty(); }
};

// QualityGate aggregates weighted dimensions into PASS/WARN/FAIL.
// Immutable after construction.
class QualityGate {
 public:
  explicit QualityGate(config::GateDefinition definition);

  // build_categories turns findings into one ScoreCategory per configured dimension
  // (definition order). Each dimension starts at 100 and loses its per-rule penalty for
  // every violation routed to it, floored at 0. A violation whose rule no dimension
  // lists goes to the unassigned dimension.
  [[nodiscard]] std::vector<ScoreCategory> build_categories(
      const std::vector<domain::Violation>& violations) const;

  // score checks auto-fail conditions first, then computes sum(raw_score * weight).
  // Throws std::invalid_argument when weights do not sum to 1.0, a weight is
  // negative, or a raw score is outside [0, 100].
  [[nodiscard]] GateResult score(const std::vector<ScoreCategory>& categories) const;

  [[nodiscard]] GateResult evaluate(const std::vector<domain::Violation>& violations) const {
    return score(build_categories(violations));
  }

  [[nodiscard]] const config::GateDefinition& definition() const noexcept { return definition_; }

 private:
  config::GateDefinition definition_;
};

[[nodiscard]] nlohmann::json gate_result_to_json(const GateResult& result);

}  // namespace cgate::scoring
