#include "cgate/scoring/quality_gate.h"

#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <stdexcept>

using namespace cgate;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<scoring::ScoreCategory> uniform_categories(double raw) {
  return {{"structure", raw, 0.4, {}}, {"delivery", raw, 0.3, {}}, {"distribution", raw, 0.3, {}}};
}

}  // namespace

TEST_CASE("Clean content passes with a perfect score", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);
  const auto result = gate.evaluate({});

  CHECK(result.status == core::Outcome::kPass);
  CHECK_THAT(result.weighted_score, WithinAbs(100.0, 1e-9));
  CHECK_FALSE(result.auto_failed());
  REQUIRE(result.breakdown.size() == 3);
  CHECK(result.breakdown[0].dimension_id == "structure");
  CHECK_THAT(result.breakdown[0].contribution, WithinAbs(40.0, 1e-9));
}

TEST_CASE("Weighted score maps onto pass and warn thresholds", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);

  CHECK(gate.score(uniform_categories(90.0)).status == core::Outcome::kPass);
  CHECK(gate.score(uniform_categories(85.0)).status == core::Outcome::kWarn);
  CHECK(gate.score(uniform_categories(80.0)).status == core::Outcome::kWarn);
  CHECK(gate.score(uniform_categories(79.0)).status == core::Outcome::kFail);

  const auto mixed = gate.score({{"structure", 100.0, 0.4, {}},
                                 {"delivery", 70.0, 0.3, {}},
                                 {"distribution", 100.0, 0.3, {}}});
  CHECK_THAT(mixed.weighted_score, WithinAbs(91.0, 1e-9));
  CHECK(mixed.status == core::Outcome::kPass);
  CHECK(mixed.breakdown[1].status == core::Outcome::kWarn);
}

TEST_CASE("An auto-fail condition overrides a passing score", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);
  auto categories = uniform_categories(95.0);
  categories[0].violations.push_back(testing::violation("REQ-FIELD"));

  const auto result = gate.score(categories);
  CHECK_THAT(result.weighted_score, WithinAbs(95.0, 1e-9));
  CHECK(result.status == core::Outcome::kFail);
  REQUIRE(result.auto_fail.size() == 1);
  CHECK(result.auto_fail[0].condition_id == "AF-REQ");
  CHECK(result.auto_fail[0].detail == "REQ-FIELD present 1 time(s)");
}

TEST_CASE("Count and floor conditions trigger independently", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);

  SECTION("more than three over-long lines") {
    std::vector<domain::Violation> violations(4, testing::violation("LIMIT-CHARS"));
    const auto result = gate.evaluate(violations);
    // structure 80, weighted 92: passing on score alone.
    CHECK_THAT(result.weighted_score, WithinAbs(92.0, 1e-9));
    CHECK(result.status == core::Outcome::kFail);
    REQUIRE(result.auto_fail.size() == 1);
    CHECK(result.auto_fail[0].condition_id == "AF-CHARS");
  }
  SECTION("three over-long lines are tolerated") {
    std::vector<domain::Violation> violations(3, testing::violation("LIMIT-CHARS"));
    CHECK(gate.evaluate(violations).status == core::Outcome::kPass);
  }
  SECTION("structure below its floor") {
    auto categories = uniform_categories(100.0);
    categories[0].raw_score = 40.0;
    const auto result = gate.score(categories);
    REQUIRE(result.auto_fail.size() == 1);
    CHECK(result.auto_fail[0].condition_id == "AF-STRUCT");
    CHECK(result.auto_fail[0].detail == "structure scored 40 below floor 50");
  }
}

TEST_CASE("build_categories routes violations by rule id", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);
  const auto categories = gate.build_categories({
      testing::violation("LIMIT-LINES"),
      testing::violation("QUOTA-TARGET", core::Severity::kWarning),
      testing::violation("SOMETHING-NEW"),
  });

  REQUIRE(categories.size() == 3);
  // LIMIT-LINES (10) plus an unlisted rule routed to structure (default 5).
  CHECK_THAT(categories[0].raw_score, WithinAbs(85.0, 1e-9));
  CHECK(categories[0].violations.size() == 2);
  CHECK_THAT(categories[1].raw_score, WithinAbs(100.0, 1e-9));
  CHECK_THAT(categories[2].raw_score, WithinAbs(90.0, 1e-9));
}

TEST_CASE("Dimension scores are floored at zero", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);
  std::vector<domain::Violation> violations(6, testing::violation("REQ-FIELD"));
  const auto categories = gate.build_categories(violations);
  CHECK_THAT(categories[0].raw_score, WithinAbs(0.0, 1e-9));
}

TEST_CASE("score rejects malformed categories", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);

  CHECK_THROWS_AS(gate.score({{"structure", 100.0, 0.5, {}}, {"delivery", 100.0, 0.3, {}}}),
                  std::invalid_argument);
  CHECK_THROWS_AS(gate.score({{"structure", 120.0, 1.0, {}}}), std::invalid_argument);
  CHECK_THROWS_AS(gate.score({{"structure", 100.0, -0.2, {}}, {"delivery", 100.0, 1.2, {}}}),
                  std::invalid_argument);
}

TEST_CASE("gate_result_to_json reports breakdown and triggers", "[gate]") {
  const scoring::QualityGate gate(testing::sample_config().gate);
  const auto json = scoring::gate_result_to_json(gate.evaluate({testing::violation("REQ-FIELD")}));

  CHECK(json.at("status") == "FAIL");
  CHECK(json.at("gate_id") == "slides");
  CHECK(json.at("breakdown").size() == 3);
  CHECK(json.at("auto_fail").at(0).at("condition_id") == "AF-REQ");
}
