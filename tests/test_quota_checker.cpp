#include "cgate/validation/quota_checker.h"

#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace cgate;

TEST_CASE("Special count below the band minimum fails with a deficit", "[quota]") {
  const auto c = testing::sample_config();
  const auto r = validation::check_quota(14, 1, c.quotas, "methods");

  CHECK(r.outcome == core::Outcome::kFail);
  CHECK(r.deficit == 1);
  REQUIRE(r.band.has_value());
  CHECK(r.band->size_min == 12);
  CHECK(r.band->minimum == 2);
  REQUIRE(r.violations.size() == 1);
  CHECK(r.violations[0].rule_id == "QUOTA-MIN");
  CHECK(r.violations[0].severity == core::Severity::kError);
  CHECK(r.violations[0].location.unit_id == "methods");
  CHECK(r.violations[0].message ==
        "methods: 1 special items in 14 (band 12-15) is below minimum of 2, deficit 1");
}

TEST_CASE("Quota outcome follows the band thresholds", "[quota]") {
  const auto c = testing::sample_config();

  SECTION("minimum met but below target") {
    const auto r = validation::check_quota(14, 2, c.quotas);
    CHECK(r.outcome == core::Outcome::kWarn);
    REQUIRE(r.violations.size() == 1);
    CHECK(r.violations[0].rule_id == "QUOTA-TARGET");
    CHECK(r.violations[0].severity == core::Severity::kWarning);
  }
  SECTION("within target range") {
    const auto r = validation::check_quota(14, 3, c.quotas);
    CHECK(r.outcome == core::Outcome::kPass);
    CHECK(r.violations.empty());
    CHECK(r.advisories.empty());
  }
  SECTION("above target range and band maximum") {
    const auto r = validation::check_quota(14, 7, c.quotas);
    CHECK(r.outcome == core::Outcome::kWarn);
    REQUIRE(r.advisories.size() == 1);
    CHECK(r.advisories[0].rule_id == "QUOTA-MAX");
  }
  SECTION("no band covers the size") {
    const auto r = validation::check_quota(40, 3, c.quotas);
    CHECK(r.outcome == core::Outcome::kFail);
    CHECK_FALSE(r.band.has_value());
    REQUIRE(r.violations.size() == 1);
    CHECK(r.violations[0].rule_id == "QUOTA-NO-BAND");
  }
}

TEST_CASE("Adding a special item never worsens the quota outcome", "[quota]") {
  const auto c = testing::sample_config();
  // Up to the top of each target range; beyond it the outcome turns back to WARN.
  for (std::size_t size = 1; size <= 20; ++size) {
    const auto target_max = c.quotas.find(size)->target_max;
    for (std::size_t count = 0; count < target_max; ++count) {
      const auto before = validation::check_quota(size, count, c.quotas).outcome;
      const auto after = validation::check_quota(size, count + 1, c.quotas).outcome;
      CHECK(after <= before);
    }
  }
}

TEST_CASE("Uniform special sub-types raise a diversity advisory", "[quota]") {
  const auto c = testing::sample_config();

  SECTION("three charts") {
    const auto r = validation::check_quota(14, std::vector<std::string>{"chart", "chart", "chart"},
                                           c.quotas, "history");
    CHECK(r.outcome == core::Outcome::kPass);
    REQUIRE(r.advisories.size() == 1);
    CHECK(r.advisories[0].rule_id == "QUOTA-DIVERSITY");
    CHECK(r.advisories[0].message == "history: all 3 special items are of type 'chart'");
  }
  SECTION("mixed sub-types") {
    const auto r = validation::check_quota(
        14, std::vector<std::string>{"chart", "diagram", "chart"}, c.quotas);
    CHECK(r.advisories.empty());
  }
  SECTION("at the threshold") {
    const auto r =
        validation::check_quota(14, std::vector<std::string>{"chart", "chart"}, c.quotas);
    CHECK(r.advisories.empty());
  }
}

TEST_CASE("check_units_quota counts units with a special kind", "[quota]") {
  const auto c = testing::sample_config();
  std::vector<domain::ContentUnit> units;
  for (int i = 0; i < 10; ++i) {
    units.push_back(testing::good_slide("s" + std::to_string(i)));
  }
  units.push_back(testing::visual_slide("v1", "diagram"));
  units.push_back(testing::visual_slide("v2", "chart"));

  const auto r = validation::check_units_quota(units, c.quotas, "fundamentals");
  CHECK(r.collection_size == 12);
  CHECK(r.special_count == 2);
  CHECK(r.outcome == core::Outcome::kWarn);
}
