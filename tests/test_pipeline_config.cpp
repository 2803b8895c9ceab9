#include "cgate/config/config_loader.h"
#include "cgate/config/pipeline_config.h"

#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace cgate;

namespace {

std::string default_config_path() {
  return std::string(CGATE_CONFIG_DIR) + "/default_pipeline.json";
}

nlohmann::json default_config_json() {
  std::ifstream in(default_config_path());
  REQUIRE(in.good());
  return nlohmann::json::parse(in);
}

}  // namespace

TEST_CASE("Shipped configuration loads and validates", "[config]") {
  auto loaded = config::load_pipeline_config(default_config_path(), std::chrono::milliseconds{0});
  REQUIRE(loaded.has_value());
  const auto& c = loaded.value();

  CHECK(c.catalog.categories.size() == 5);
  CHECK(c.catalog.index_of("methods") == std::optional<std::size_t>{1});
  CHECK(c.classifier.rule_order.back() == "TIE-003");
  CHECK(c.gate.dimensions.size() == 3);
  CHECK(c.pipeline.retry.io_backoff == std::chrono::milliseconds{50});

  // Band lookup is inclusive on both ends.
  REQUIRE(c.quotas.find(12) != nullptr);
  CHECK(c.quotas.find(12)->minimum == 2);
  CHECK(c.quotas.find(15)->size_min == 12);
  CHECK(c.quotas.find(0) == nullptr);
}

TEST_CASE("Configuration JSON round-trips deterministically", "[config]") {
  const auto original = testing::sample_config();
  const auto first = config::pipeline_config_to_json(original);
  const auto reparsed = config::pipeline_config_from_json(first);
  CHECK(config::pipeline_config_to_json(reparsed).dump() == first.dump());
}

TEST_CASE("load_pipeline_config reports unreadable and malformed files", "[config]") {
  SECTION("missing file") {
    auto r = config::load_pipeline_config("/nonexistent/cgate.json", std::chrono::milliseconds{0});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == "Failed to read config file: /nonexistent/cgate.json");
  }

  SECTION("missing key names the file") {
    auto j = default_config_json();
    j.erase("gate");
    const auto path = std::filesystem::temp_directory_path() / "cgate_config_missing_gate.json";
    {
      std::ofstream out(path);
      out << j.dump();
    }
    auto r = config::load_pipeline_config(path.string(), std::chrono::milliseconds{0});
    std::filesystem::remove(path);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().find("Malformed config") == 0);
  }
}

TEST_CASE("validate_pipeline_config rejects inconsistent tables", "[config]") {
  auto c = testing::sample_config();
  REQUIRE_NOTHROW(config::validate_pipeline_config(c));

  SECTION("too few categories") {
    c.catalog.categories.resize(3);
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("fallback outside the catalog") {
    c.classifier.fallback_category = "appendix";
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("cue table naming an unknown category") {
    c.classifier.period_cues["appendix"] = {"archive"};
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("gate weights not summing to one") {
    c.gate.dimensions[0].weight = 0.5;
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("quota bands with a gap") {
    c.quotas.bands[1].size_min = 13;
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("quota minimum above target") {
    c.quotas.bands[0].minimum = 3;
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("duration limit without a speaking rate") {
    c.limits.speaking_rate_wpm = 0.0;
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("REQ-FIELD downgraded to a warning") {
    c.limits.rule_severities["REQ-FIELD"] = core::Severity::kWarning;
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }

  SECTION("unassigned dimension that does not exist") {
    c.gate.unassigned_dimension = "style";
    CHECK_THROWS_AS(config::validate_pipeline_config(c), std::invalid_argument);
  }
}

TEST_CASE("Limits and penalties fall back to defaults", "[config]") {
  const auto c = testing::sample_config();
  CHECK(c.limits.severity_for("LIMIT-LINES") == core::Severity::kError);
  CHECK(c.limits.severity_for("MARKER-MIN") == core::Severity::kWarning);
  CHECK(c.gate.penalty_for("REQ-FIELD") == 25.0);
  CHECK(c.gate.penalty_for("SOMETHING-ELSE") == 5.0);
  CHECK(c.limits.find("poster") == nullptr);
}

TEST_CASE("Severity vocabulary orders and converts", "[config][severity]") {
  CHECK(core::severity_to_string(core::Severity::kError) == "ERROR");
  CHECK(core::outcome_from_string("WARN") == core::Outcome::kWarn);
  CHECK(core::report_severity_to_string(core::ReportSeverity::kCritical) == "CRITICAL");
  CHECK(core::finding_category_from_string("distributional") ==
        core::FindingCategory::kDistributional);
  CHECK_THROWS_AS(core::severity_from_string("FATAL"), std::invalid_argument);

  CHECK(core::worst(core::Outcome::kPass, core::Outcome::kWarn) == core::Outcome::kWarn);
  CHECK(core::worst(core::Outcome::kFail, core::Outcome::kWarn) == core::Outcome::kFail);
  CHECK(core::default_report_severity(core::Severity::kError) == core::ReportSeverity::kHigh);
  CHECK(core::default_report_severity(core::Severity::kWarning) == core::ReportSeverity::kMedium);
  CHECK(core::outcome_for(core::Severity::kWarning) == core::Outcome::kWarn);
}
