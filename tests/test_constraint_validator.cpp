#include "cgate/validation/constraint_validator.h"
#include "cgate/validation/rule_ids.h"

#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace cgate;

TEST_CASE("A slide within every limit has no violations", "[validation]") {
  const auto c = testing::sample_config();
  CHECK(validation::validate(testing::good_slide("s1"), c.limits).empty());
}

TEST_CASE("Body over the line limit yields one LIMIT-LINES error", "[validation]") {
  const auto c = testing::sample_config();
  auto slide = testing::good_slide("s1");
  // Blank lines are not counted.
  slide.fields["body"] = testing::numbered_lines(9) + "\n\n   \n";

  const auto violations = validation::validate(slide, c.limits);
  REQUIRE(violations.size() == 1);
  const auto& v = violations.front();
  CHECK(v.rule_id == "LIMIT-LINES");
  CHECK(v.severity == core::Severity::kError);
  CHECK(v.location == domain::Location{"s1", "body", std::nullopt});
  REQUIRE(v.measurement.has_value());
  CHECK(v.measurement->measured == 9.0);
  CHECK(v.measurement->limit == 8.0);
  CHECK(v.message == "s1.body: 9 lines exceeds maximum of 8");
}

TEST_CASE("Values equal to their limit pass", "[validation]") {
  const auto c = testing::sample_config();
  auto slide = testing::good_slide("s1");
  slide.fields["body"] = testing::numbered_lines(8);
  slide.fields["title"] = std::string(32, 'T');

  CHECK(validation::validate(slide, c.limits).empty());
}

TEST_CASE("Missing or blank required fields are errors", "[validation]") {
  const auto c = testing::sample_config();
  auto slide = testing::good_slide("s2");
  slide.fields.erase("title");
  slide.fields["body"] = "  \n\t";

  const auto violations = validation::validate(slide, c.limits);
  REQUIRE(violations.size() == 2);
  CHECK(violations[0].rule_id == "REQ-FIELD");
  CHECK(violations[0].location.field == "title");
  CHECK(violations[0].severity == core::Severity::kError);
  CHECK(violations[0].message == "s2.title: required field 'title' is missing");
  CHECK_FALSE(violations[0].measurement.has_value());
  CHECK(violations[1].rule_id == "REQ-FIELD");
  CHECK(violations[1].location.field == "body");
}

TEST_CASE("Optional fields are only checked when present", "[validation]") {
  const auto c = testing::sample_config();
  auto slide = testing::good_slide("s3");
  slide.fields.erase("notes");
  CHECK(validation::validate(slide, c.limits).empty());
}

TEST_CASE("Character limits are per line and count code points", "[validation]") {
  const auto c = testing::sample_config();
  auto slide = testing::good_slide("s4");
  // Title line 2 is 33 characters; line 1 uses 32 two-byte characters and passes.
  std::string accented;
  for (int i = 0; i < 32; ++i) {
    accented += "\xC3\xA9";
  }
  slide.fields["title"] = accented + "\n\n" + std::string(33, 'x');

  const auto violations = validation::validate(slide, c.limits);
  REQUIRE(violations.size() == 1);
  CHECK(violations[0].rule_id == "LIMIT-CHARS");
  CHECK(violations[0].location.line == std::optional<std::size_t>{2});
  CHECK(violations[0].location.to_string() == "s4.title:2");
  CHECK(violations[0].measurement->measured == 33.0);
  CHECK(violations[0].measurement->limit == 32.0);
}

TEST_CASE("Notes are checked for words, duration and markers", "[validation]") {
  const auto c = testing::sample_config();
  auto slide = testing::good_slide("s5");

  SECTION("too few words and no pause marker") {
    slide.fields["notes"] = "Just this";
    const auto violations = validation::validate(slide, c.limits);
    REQUIRE(violations.size() == 2);
    CHECK(violations[0].rule_id == "RANGE-WORDS-MIN");
    CHECK(violations[0].severity == core::Severity::kWarning);
    CHECK(violations[1].rule_id == "MARKER-MIN");
    CHECK(violations[1].severity == core::Severity::kWarning);
    CHECK(violations[1].message == "s5.notes: marker [PAUSE] appears 0 times, minimum is 1");
  }

  SECTION("too long to deliver") {
    // 30 words at 150 wpm is 12 seconds against a 10 second limit.
    std::string notes = "[PAUSE]";
    for (int i = 0; i < 30; ++i) {
      notes += " word";
    }
    slide.fields["notes"] = notes;
    const auto violations = validation::validate(slide, c.limits);
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].rule_id == "LIMIT-DURATION");
    CHECK(violations[0].measurement->measured == 12.0);
    CHECK(violations[0].message ==
          "s5.notes: estimated 12 seconds at 150 wpm exceeds maximum of 10");
  }
}

TEST_CASE("Unknown unit types are rejected without field checks", "[validation]") {
  const auto c = testing::sample_config();
  auto unit = testing::good_slide("p1");
  unit.unit_type = "poster";

  const auto violations = validation::validate(unit, c.limits);
  REQUIRE(violations.size() == 1);
  CHECK(violations[0].rule_id == "UNIT-TYPE");
  CHECK(violations[0].message == "p1: unknown unit type 'poster'");
}

TEST_CASE("validate_all keeps unit order", "[validation]") {
  const auto c = testing::sample_config();
  auto first = testing::good_slide("a");
  first.fields.erase("body");
  auto second = testing::good_slide("b");
  second.fields["body"] = testing::numbered_lines(10);

  const auto violations = validation::validate_all({first, testing::good_slide("ok"), second},
                                                   c.limits);
  REQUIRE(violations.size() == 2);
  CHECK(violations[0].location.unit_id == "a");
  CHECK(violations[1].location.unit_id == "b");
  CHECK(violations[1].rule_id == std::string(validation::kLimitLines));
}

TEST_CASE("Configured severities apply to limit rules", "[validation]") {
  auto c = testing::sample_config();
  c.limits.rule_severities["LIMIT-LINES"] = core::Severity::kWarning;
  auto slide = testing::good_slide("s6");
  slide.fields["body"] = testing::numbered_lines(9);

  const auto violations = validation::validate(slide, c.limits);
  REQUIRE(violations.size() == 1);
  CHECK(violations[0].severity == core::Severity::kWarning);
}
