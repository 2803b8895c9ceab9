#include "cgate/classification/classifier.h"
#include "cgate/classification/dependency_mapper.h"
#include "cgate/classification/rule_set.h"

#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <map>
#include <stdexcept>

using namespace cgate;

namespace {

classification::Classifier make_classifier(const config::PipelineConfig& c) {
  return classification::Classifier(c.catalog, c.classifier);
}

const domain::Assignment& assignment_for(const classification::ClassificationBatch& batch,
                                         std::int64_t item_id) {
  const auto it = std::find_if(batch.assignments.begin(), batch.assignments.end(),
                               [&](const domain::Assignment& a) { return a.item_id == item_id; });
  REQUIRE(it != batch.assignments.end());
  return *it;
}

// 22 items with clear subject cues: 6 fundamentals, 6 methods, 5 history, 5 populations.
std::vector<domain::Item> course_items() {
  std::vector<domain::Item> items;
  std::int64_t id = 1;
  const auto add = [&](const std::string& text, int count) {
    for (int i = 0; i < count; ++i) {
      items.push_back(domain::make_item(id, text + " note " + std::to_string(id)));
      ++id;
    }
  };
  add("Concept", 6);
  add("Method", 6);
  add("History", 5);
  add("Cohort", 5);
  return items;
}

}  // namespace

// ── Rule set construction ───────────────────────────────────────────────────

TEST_CASE("make_rule_set builds the cascade in declared order", "[classifier][rules]") {
  const auto c = testing::sample_config();
  const auto rules = classification::make_rule_set(c.classifier);
  REQUIRE(rules.rules.size() == 7);
  CHECK(rules.rules.front()->rule_id() == "PRI-001");
  CHECK(rules.rules.front()->tier() == domain::RuleTier::kPrimary);
  CHECK(rules.rules[1]->tier() == domain::RuleTier::kSecondary);
  CHECK(rules.rules.back()->rule_id() == "TIE-003");
  CHECK(rules.rules.back()->is_forced_choice());
  CHECK(classification::known_rule_ids().size() == 7);
}

TEST_CASE("make_rule_set rejects malformed orders", "[classifier][rules]") {
  auto settings = testing::sample_config().classifier;

  SECTION("unknown rule id") {
    settings.rule_order = {"PRI-001", "PRI-999", "TIE-003"};
    CHECK_THROWS_AS(classification::make_rule_set(settings), std::invalid_argument);
  }
  SECTION("tier going backwards") {
    settings.rule_order = {"SEC-001", "PRI-001", "TIE-003"};
    CHECK_THROWS_AS(classification::make_rule_set(settings), std::invalid_argument);
  }
  SECTION("no forced choice at the end") {
    settings.rule_order = {"PRI-001", "SEC-001", "TIE-002"};
    CHECK_THROWS_AS(classification::make_rule_set(settings), std::invalid_argument);
  }
}

// ── Dependency mapping ──────────────────────────────────────────────────────

TEST_CASE("extract_defined_term takes up to two words before the marker",
          "[classifier][dependencies]") {
  const std::vector<std::string> markers{"is defined as", "refers to"};

  CHECK(classification::extract_defined_term("A variable is defined as a measured quantity",
                                             markers) == "variable");
  CHECK(classification::extract_defined_term("Statistical power refers to detection odds",
                                             markers) == "statistical power");
  // Leading articles are dropped.
  CHECK(classification::extract_defined_term("In short, the median refers to the middle value",
                                             markers) == "median");
  // A marker at the start has no term before it.
  CHECK(classification::extract_defined_term("Refers to nothing in particular", markers).empty());
  // Terms shorter than three characters are ignored.
  CHECK(classification::extract_defined_term("An ox is defined as a bovine", markers).empty());
  CHECK(classification::extract_defined_term("No definition here", markers).empty());
}

TEST_CASE("map_dependencies links definers to the items using their term",
          "[classifier][dependencies]") {
  const std::vector<domain::Item> items{
      domain::make_item(1, "A variable is defined as a measured quantity"),
      domain::make_item(2, "Each variable has a range"),
      domain::make_item(3, "Plots show one variable per axis"),
      domain::make_item(4, "Unrelated statement"),
  };
  const auto map = classification::map_dependencies(items, {"is defined as", "refers to"});

  REQUIRE(map.defined_terms.count(1) == 1);
  CHECK(map.defined_terms.at(1) == "variable");
  CHECK(map.has_dependents(1));
  CHECK(map.dependents_of(1) == std::vector<std::int64_t>{2, 3});
  CHECK_FALSE(map.has_dependents(2));
  CHECK(map.dependents_of(4).empty());

  CHECK(classification::map_dependencies(items, {}).defined_terms.empty());
}

TEST_CASE("delivery_order places each definer ahead of its dependents",
          "[classifier][dependencies]") {
  SECTION("chain given in reverse") {
    const std::vector<domain::Item> items{domain::make_item(30, "c"), domain::make_item(20, "b"),
                                          domain::make_item(10, "a")};
    const std::map<std::int64_t, std::vector<std::int64_t>> dependents{{10, {20}}, {20, {30}}};
    CHECK(classification::delivery_order(items, dependents) ==
          std::vector<std::int64_t>{10, 20, 30});
  }
  SECTION("cycle members follow the ordered items in input order") {
    const std::vector<domain::Item> items{domain::make_item(1, "a"), domain::make_item(2, "b"),
                                          domain::make_item(3, "c"), domain::make_item(4, "d"),
                                          domain::make_item(5, "e")};
    const std::map<std::int64_t, std::vector<std::int64_t>> dependents{
        {1, {4}}, {2, {3}}, {3, {2}}, {99, {5}}};
    CHECK(classification::delivery_order(items, dependents) ==
          std::vector<std::int64_t>{1, 5, 4, 2, 3});
  }
  SECTION("no dependencies keeps input order") {
    const std::vector<domain::Item> items{domain::make_item(7, "x"), domain::make_item(3, "y")};
    CHECK(classification::delivery_order(items, {}) == std::vector<std::int64_t>{7, 3});
  }
}

TEST_CASE("map_dependencies suggests delivering definitions first",
          "[classifier][dependencies]") {
  const std::vector<domain::Item> items{
      domain::make_item(1, "Each variable has a range"),
      domain::make_item(2, "Plots show one variable per axis"),
      domain::make_item(3, "A variable is defined as a measured quantity"),
      domain::make_item(4, "Unrelated statement"),
  };
  const auto map = classification::map_dependencies(items, {"is defined as"});
  CHECK(map.suggested_order == std::vector<std::int64_t>{3, 4, 1, 2});
  CHECK(classification::map_dependencies(items, {}).suggested_order ==
        std::vector<std::int64_t>{1, 2, 3, 4});

  const auto config = testing::sample_config();
  const auto batch = make_classifier(config).classify_batch(items);
  REQUIRE(batch.has_value());
  CHECK(batch.value().suggested_order == map.suggested_order);
}

// ── Cascade decisions ───────────────────────────────────────────────────────

TEST_CASE("Subject routes decide clear items", "[classifier]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);

  auto batch = classifier.classify_batch({domain::make_item(1, "The history of the survey"),
                                          domain::make_item(2, "A sampling method for surveys")});
  REQUIRE(batch.has_value());
  const auto& first = assignment_for(batch.value(), 1);
  CHECK(first.category_id == "history");
  CHECK(first.rule_id == "PRI-001");
  CHECK(first.tier == domain::RuleTier::kPrimary);
  CHECK(first.flags.empty());

  const auto& second = assignment_for(batch.value(), 2);
  CHECK(second.category_id == "methods");
  CHECK(second.rule_id == "PRI-001");
}

TEST_CASE("Secondary cues break a primary tie", "[classifier]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);

  // PRI-001: history 1, populations 1. SEC-002: history 1.
  auto batch = classifier.classify_batch(
      {domain::make_item(1, "This cohort study history was first told long ago")});
  REQUIRE(batch.has_value());
  const auto& a = batch.value().assignments.front();
  CHECK(a.category_id == "history");
  CHECK(a.rule_id == "SEC-002");
  CHECK(a.tier == domain::RuleTier::kSecondary);
  CHECK_FALSE(a.has_flag(domain::FlagKind::kAmbiguous));
  // Populations held half the primary support.
  REQUIRE(a.flags.size() == 1);
  CHECK(a.flags[0] == domain::Flag{domain::FlagKind::kXref, "populations"});
}

TEST_CASE("Foundation order breaks ties for items other items depend on", "[classifier]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);

  auto batch = classifier.classify_batch({
      domain::make_item(1, "Cohort method refers to tracking"),
      domain::make_item(2, "The cohort method needs time"),
  });
  REQUIRE(batch.has_value());

  const auto& definer = assignment_for(batch.value(), 1);
  CHECK(definer.category_id == "methods");
  CHECK(definer.rule_id == "TIE-001");
  REQUIRE(definer.flags.size() == 2);
  CHECK(definer.flags[0].kind == domain::FlagKind::kFrontload);
  CHECK(definer.flags[0].detail == "defines 'cohort method' used by items 2");
  CHECK(definer.flags[1] == domain::Flag{domain::FlagKind::kXref, "populations"});

  // Same support without dependents: the forced choice takes the first candidate in
  // catalog order.
  const auto& user = assignment_for(batch.value(), 2);
  CHECK(user.category_id == "methods");
  CHECK(user.rule_id == "TIE-003");
  CHECK_FALSE(user.has_flag(domain::FlagKind::kFrontload));
  CHECK_FALSE(user.has_flag(domain::FlagKind::kAmbiguous));
}

TEST_CASE("Disagreeing tiers settled by a tie-breaker are flagged ambiguous", "[classifier]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);

  // PRI-001 leaders: fundamentals, methods. SEC-001 leaders: methods, populations.
  // TIE-002 counts methods as a leader twice.
  auto batch = classifier.classify_batch(
      {domain::make_item(7, "Concept and method for a randomized sample size")});
  REQUIRE(batch.has_value());
  const auto& a = batch.value().assignments.front();
  CHECK(a.category_id == "methods");
  CHECK(a.rule_id == "TIE-002");
  CHECK(a.tier == domain::RuleTier::kTertiary);

  REQUIRE(a.flags.size() == 2);
  CHECK(a.flags[0].kind == domain::FlagKind::kAmbiguous);
  CHECK(a.flags[0].detail == "tiers disagreed; TIE-002 chose methods; runner-up: fundamentals");
  CHECK(a.flags[1] == domain::Flag{domain::FlagKind::kXref, "fundamentals"});
}

TEST_CASE("Items without any cue fall back to the configured category", "[classifier]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);

  auto batch = classifier.classify_batch({domain::make_item(1, "Plain statement")});
  REQUIRE(batch.has_value());
  const auto& a = batch.value().assignments.front();
  CHECK(a.category_id == "fundamentals");
  CHECK(a.rule_id == "TIE-003");
  CHECK(a.flags.empty());
}

TEST_CASE("Testable cues steer the forced choice", "[classifier]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);

  // No routing cue at all; "calculate" is a testable cue for methods.
  auto batch = classifier.classify_batch({domain::make_item(1, "Calculate the spread")});
  REQUIRE(batch.has_value());
  CHECK(batch.value().assignments.front().category_id == "methods");
  CHECK(batch.value().assignments.front().rule_id == "TIE-003");
}

// ── Batch classification ────────────────────────────────────────────────────

TEST_CASE("classify_batch assigns every item to exactly one category", "[classifier][batch]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);
  const auto items = course_items();
  REQUIRE(items.size() == 22);

  auto batch = classifier.classify_batch(items);
  REQUIRE(batch.has_value());
  const auto& b = batch.value();

  REQUIRE(b.assignments.size() == items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    CHECK(b.assignments[i].item_id == items[i].item_id);
    CHECK(c.catalog.contains(b.assignments[i].category_id));
  }

  std::size_t total = 0;
  REQUIRE(b.category_counts.size() == 4);
  for (const auto& [category, count] : b.category_counts) {
    CHECK(count >= 5);
    total += count;
  }
  CHECK(total == 22);
  CHECK(b.category_counts[0] == std::pair<std::string, std::size_t>{"fundamentals", 6});
  CHECK(b.category_counts[2] == std::pair<std::string, std::size_t>{"history", 5});
  CHECK(b.needs_review.empty());
}

TEST_CASE("classify_batch is deterministic", "[classifier][batch]") {
  const auto c = testing::sample_config();
  auto items = course_items();
  items.push_back(domain::make_item(23, "Concept and method for a randomized sample size"));
  items.push_back(domain::make_item(24, "Cohort method refers to tracking"));
  items.push_back(domain::make_item(25, "The cohort method needs time"));

  const auto first = make_classifier(c).classify_batch(items);
  const auto second = make_classifier(c).classify_batch(items);
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value().assignments == second.value().assignments);
  CHECK(first.value().category_counts == second.value().category_counts);
}

TEST_CASE("classify_batch flags under-populated categories for review", "[classifier][batch]") {
  const auto c = testing::sample_config();
  const auto classifier = make_classifier(c);

  auto batch = classifier.classify_batch({domain::make_item(1, "Concept one"),
                                          domain::make_item(2, "Concept two"),
                                          domain::make_item(3, "History three")});
  REQUIRE(batch.has_value());
  const auto& review = batch.value().needs_review;
  REQUIRE(review.size() == 4);
  CHECK(review[0].category_id == "fundamentals");
  CHECK(review[0].count == 2);
  CHECK(review[0].min_population == 5);
  CHECK(review[1].category_id == "methods");
  CHECK(review[1].count == 0);
  // Assignments are never moved to fill a shortfall.
  CHECK(batch.value().assignments[2].category_id == "history");
}

TEST_CASE("classify_batch refuses duplicate ids and empty catalogs", "[classifier][batch]") {
  const auto c = testing::sample_config();

  SECTION("duplicate item id") {
    auto r = make_classifier(c).classify_batch(
        {domain::make_item(4, "Concept a"), domain::make_item(4, "Concept b")});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == core::ClassificationErrorCode::kDuplicateId);
    CHECK(r.error().message == "Duplicate item id: 4");
  }

  SECTION("empty catalog") {
    const classification::Classifier classifier(config::CategoryCatalog{}, c.classifier);
    auto r = classifier.classify_batch({domain::make_item(1, "Concept")});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == core::ClassificationErrorCode::kEmptyCatalog);
  }
}

TEST_CASE("classify_batch reports a rule choosing an unknown category", "[classifier][batch]") {
  auto c = testing::sample_config();
  c.classifier.fallback_category = "appendix";
  const auto classifier = make_classifier(c);

  auto r = classifier.classify_batch(
      {domain::make_item(1, "Concept a"), domain::make_item(2, "Plain statement")});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == core::ClassificationErrorCode::kRuleFault);
  CHECK(r.error().message.find("appendix") != std::string::npos);
}
