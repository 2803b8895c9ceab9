#include "cgate/core/clock.h"
#include "cgate/core/id_generator.h"
#include "cgate/pipeline/content_generator.h"
#include "cgate/pipeline/pipeline_runner.h"
#include "cgate/state/state_backend.h"
#include "cgate/state/state_json.h"
#include "cgate/state/state_store.h"
#include "cgate/storage/audit_chain.h"
#include "cgate/storage/audit_log.h"

#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>

using namespace cgate;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

constexpr const char* kRun = "run-test";

std::vector<domain::ContentUnit> deck(const std::string& section, std::size_t size,
                                      std::size_t visuals) {
  std::vector<domain::ContentUnit> units;
  for (std::size_t i = 0; i < size; ++i) {
    const std::string id = section + "-" + std::to_string(i + 1);
    units.push_back(i < visuals ? testing::visual_slide(id, "chart", section)
                                : testing::good_slide(id, section));
  }
  return units;
}

// Two items routed to fundamentals and two to methods; history and populations stay empty.
std::vector<domain::Item> two_section_items() {
  return {domain::make_item(1, "Concept note 1"), domain::make_item(2, "Concept note 2"),
          domain::make_item(3, "Method note 3"), domain::make_item(4, "Method note 4")};
}

pipeline::RecordedContentGenerator passing_generator() {
  return pipeline::RecordedContentGenerator(
      {{"fundamentals", {deck("fundamentals", 12, 3)}}, {"methods", {deck("methods", 12, 3)}}});
}

std::size_t count_events(const std::vector<storage::AuditEvent>& events, const std::string& type) {
  return static_cast<std::size_t>(
      std::count_if(events.begin(), events.end(),
                    [&](const storage::AuditEvent& e) { return e.event_type == type; }));
}

// Shared wiring for one run over in-memory state and audit log.
struct Harness {
  config::PipelineConfig config = testing::sample_config();
  state::InMemoryStateBackend backend;
  core::SteppingClock clock;
  core::DeterministicIdGenerator ids;
  storage::InMemoryAuditLog audit;
  state::StateStore store{backend, kRun, clock, {5, std::chrono::milliseconds(0)}};
};

// Asks the runner to stop while generating the first section it sees.
class StoppingGenerator final : public pipeline::IContentGenerator {
 public:
  std::vector<domain::ContentUnit> generate(const pipeline::GenerationRequest& request) override {
    if (runner != nullptr) {
      runner->request_stop();
    }
    return inner_.generate(request);
  }

  pipeline::PipelineRunner* runner{nullptr};

 private:
  pipeline::RecordedContentGenerator inner_ = passing_generator();
};

// Throws for one section, replays passing decks for the others.
class FaultyGenerator final : public pipeline::IContentGenerator {
 public:
  explicit FaultyGenerator(std::string broken) : broken_(std::move(broken)) {}

  std::vector<domain::ContentUnit> generate(const pipeline::GenerationRequest& request) override {
    if (request.section_id == broken_) {
      throw std::runtime_error("generator offline");
    }
    return inner_.generate(request);
  }

 private:
  std::string broken_;
  pipeline::RecordedContentGenerator inner_ = passing_generator();
};

// Records the item ids handed over for each section, then replays passing decks.
class CapturingGenerator final : public pipeline::IContentGenerator {
 public:
  std::vector<domain::ContentUnit> generate(const pipeline::GenerationRequest& request) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto& ids = item_ids[request.section_id];
      ids.clear();
      for (const auto& item : request.items) {
        ids.push_back(item.item_id);
      }
    }
    return inner_.generate(request);
  }

  std::map<std::string, std::vector<std::int64_t>> item_ids;

 private:
  std::mutex mutex_;
  pipeline::RecordedContentGenerator inner_ = passing_generator();
};

// Refuses the live-record write that moves one section onto one step, a set number
// of times, with kIoFailure.
class FlakyStepBackend final : public state::IStateBackend {
 public:
  FlakyStepBackend(std::string section, std::string step, int failures)
      : section_(std::move(section)), step_(std::move(step)), failures_left_(failures) {}

  core::Result<std::optional<std::string>, core::StoreError> load_current(
      const std::string& run_id) override {
    return inner_.load_current(run_id);
  }
  core::Result<bool, core::StoreError> store_current(const std::string& run_id,
                                                     const std::string& record) override {
    const auto decoded = state::decode_state_record(record);
    if (decoded.has_value() && decoded.value().current_section == section_ &&
        decoded.value().current_step == step_ && failures_left_ > 0) {
      --failures_left_;
      return core::Result<bool, core::StoreError>::err(
          {core::StoreErrorCode::kIoFailure, "disk hiccup"});
    }
    return inner_.store_current(run_id, record);
  }
  core::Result<std::optional<std::string>, core::StoreError> load_checkpoint(
      const std::string& run_id, const std::string& name) override {
    return inner_.load_checkpoint(run_id, name);
  }
  core::Result<bool, core::StoreError> store_checkpoint(const std::string& run_id,
                                                        const std::string& name,
                                                        const std::string& record) override {
    return inner_.store_checkpoint(run_id, name, record);
  }
  core::Result<std::vector<std::string>, core::StoreError> list_checkpoints(
      const std::string& run_id) override {
    return inner_.list_checkpoints(run_id);
  }

 private:
  state::InMemoryStateBackend inner_;
  std::string section_;
  std::string step_;
  int failures_left_;
};

}  // namespace

TEST_CASE("A run classifies, processes every section and checkpoints", "[pipeline][runner]") {
  Harness h;
  auto generator = passing_generator();
  pipeline::PipelineRunner runner(h.config, generator, h.store, h.audit, h.ids, h.clock);

  const auto result = runner.run(two_section_items());
  REQUIRE(result.has_value());
  const auto& summary = result.value();

  CHECK(summary.status == state::RunStatus::kCompleted);
  CHECK_FALSE(summary.stopped);
  CHECK(summary.classification.category_counts.at("fundamentals") == 2);
  CHECK(summary.classification.category_counts.at("methods") == 2);

  REQUIRE(summary.sections.size() == 4);
  CHECK(summary.sections[0].section_id == "fundamentals");
  CHECK(summary.sections[0].status == state::SectionStatus::kCompleted);
  CHECK(summary.sections[1].status == state::SectionStatus::kCompleted);
  CHECK(summary.sections[2].status == state::SectionStatus::kSkipped);
  CHECK(summary.sections[3].status == state::SectionStatus::kSkipped);
  REQUIRE(summary.sections[0].outcome.has_value());
  CHECK(summary.sections[0].outcome->status == core::Outcome::kPass);

  REQUIRE(summary.checkpoints.size() == 2);
  for (const auto& name : summary.checkpoints) {
    CHECK_THAT(name, StartsWith("after:"));
  }

  const auto stored = h.store.read();
  REQUIRE(stored.has_value());
  CHECK(stored.value().status == state::RunStatus::kCompleted);
  CHECK(stored.value().find_section("methods")->last_step == 5);
  CHECK(stored.value().checkpoints.size() == 2);
  CHECK(h.store.validate().value().health == state::StateHealth::kValid);

  const auto events = h.audit.query(kRun);
  REQUIRE_FALSE(events.empty());
  CHECK(events.front().event_type == "RunStarted");
  CHECK(events.back().event_type == "RunCompleted");
  CHECK(count_events(events, "ClassificationCompleted") == 1);
  CHECK(count_events(events, "SectionCompleted") == 2);
  CHECK(count_events(events, "CheckpointCreated") == 2);
  CHECK(storage::verify_audit_chain(events).valid);

  const auto j = pipeline::run_summary_to_json(summary);
  CHECK(j.at("status") == "completed");
  CHECK(j.at("assignments").size() == 4);
}

TEST_CASE("A completed run is returned without new work", "[pipeline][runner]") {
  Harness h;
  auto generator = passing_generator();
  {
    pipeline::PipelineRunner first(h.config, generator, h.store, h.audit, h.ids, h.clock);
    REQUIRE(first.run(two_section_items()).has_value());
  }
  const auto event_count = h.audit.query(kRun).size();
  const auto revision = h.store.read().value().revision;

  pipeline::PipelineRunner again(h.config, generator, h.store, h.audit, h.ids, h.clock);
  const auto result = again.run(two_section_items());
  REQUIRE(result.has_value());
  CHECK(result.value().status == state::RunStatus::kCompleted);
  CHECK(std::all_of(result.value().sections.begin(), result.value().sections.end(),
                    [](const pipeline::SectionRun& s) { return s.resumed; }));
  CHECK(h.audit.query(kRun).size() == event_count);
  CHECK(h.store.read().value().revision == revision);
}

TEST_CASE("A stopped run resumes where it left off", "[pipeline][runner]") {
  Harness h;
  h.config.pipeline.worker_count = 1;

  StoppingGenerator stopping;
  {
    pipeline::PipelineRunner runner(h.config, stopping, h.store, h.audit, h.ids, h.clock);
    stopping.runner = &runner;
    const auto result = runner.run(two_section_items());
    stopping.runner = nullptr;
    REQUIRE(result.has_value());
    CHECK(result.value().stopped);
    CHECK(result.value().status == state::RunStatus::kInProgress);
    // The section in flight finishes; the next one is never started.
    CHECK(result.value().sections[0].status == state::SectionStatus::kCompleted);
    CHECK(result.value().sections[1].status == state::SectionStatus::kPending);
    CHECK(count_events(h.audit.query(kRun), "RunStopped") == 1);
  }
  CHECK(h.store.read().value().status == state::RunStatus::kInProgress);

  auto generator = passing_generator();
  pipeline::PipelineRunner resumed(h.config, generator, h.store, h.audit, h.ids, h.clock);
  const auto result = resumed.run(two_section_items());
  REQUIRE(result.has_value());
  CHECK(result.value().status == state::RunStatus::kCompleted);
  CHECK(result.value().sections[0].resumed);
  CHECK_FALSE(result.value().sections[1].resumed);
  CHECK(result.value().sections[1].status == state::SectionStatus::kCompleted);
  REQUIRE(result.value().checkpoints.size() == 1);
  CHECK_THAT(result.value().checkpoints[0], StartsWith("after:methods@r"));
  CHECK(h.store.list_checkpoints().value().size() == 2);
}

TEST_CASE("A section left in progress is recomputed", "[pipeline][runner]") {
  Harness h;
  state::StateUpdate interrupted;
  interrupted.status = state::RunStatus::kInProgress;
  interrupted.sections.push_back(state::SectionUpdate{
      "fundamentals", state::SectionStatus::kInProgress, 3, 1, std::nullopt, std::nullopt});
  REQUIRE(h.store.write(interrupted).has_value());

  auto generator = passing_generator();
  pipeline::PipelineRunner runner(h.config, generator, h.store, h.audit, h.ids, h.clock);
  const auto result = runner.run(two_section_items());
  REQUIRE(result.has_value());
  CHECK(result.value().status == state::RunStatus::kCompleted);
  CHECK_FALSE(result.value().sections[0].resumed);

  const auto section = *h.store.read().value().find_section("fundamentals");
  CHECK(section.status == state::SectionStatus::kCompleted);
  CHECK(section.last_step == 5);
  CHECK(section.attempts == 2);
}

TEST_CASE("A failing section fails the run", "[pipeline][runner]") {
  Harness h;

  SECTION("gate still failing after revisions") {
    pipeline::RecordedContentGenerator generator(
        {{"fundamentals", {deck("fundamentals", 12, 3)}}, {"methods", {deck("methods", 12, 0)}}});
    pipeline::PipelineRunner runner(h.config, generator, h.store, h.audit, h.ids, h.clock);
    const auto result = runner.run(two_section_items());
    REQUIRE(result.has_value());
    CHECK(result.value().status == state::RunStatus::kFailed);
    CHECK(result.value().sections[0].status == state::SectionStatus::kCompleted);
    CHECK(result.value().sections[1].status == state::SectionStatus::kFailed);
    CHECK(result.value().sections[1].outcome->stopped_early);
    // Failed sections are checkpointed as well.
    CHECK(result.value().checkpoints.size() == 2);
    CHECK(count_events(h.audit.query(kRun), "RetryScheduled") == 1);
  }
  SECTION("generator fault") {
    FaultyGenerator generator("methods");
    pipeline::PipelineRunner runner(h.config, generator, h.store, h.audit, h.ids, h.clock);
    const auto result = runner.run(two_section_items());
    REQUIRE(result.has_value());
    CHECK(result.value().status == state::RunStatus::kFailed);
    CHECK(result.value().sections[1].error == "generator offline");
    const auto stored = h.store.read().value();
    REQUIRE(stored.errors.size() == 1);
    CHECK(stored.errors[0].section == "methods");
  }

  // A failed run is refused until it is recovered.
  auto generator = passing_generator();
  pipeline::PipelineRunner again(h.config, generator, h.store, h.audit, h.ids, h.clock);
  const auto refused = again.run(two_section_items());
  REQUIRE_FALSE(refused.has_value());
  CHECK_THAT(refused.error(), ContainsSubstring("recover it from a checkpoint"));
}

TEST_CASE("A classification failure fails the run before any section", "[pipeline][runner]") {
  Harness h;
  auto generator = passing_generator();
  pipeline::PipelineRunner runner(h.config, generator, h.store, h.audit, h.ids, h.clock);

  auto items = two_section_items();
  items.push_back(domain::make_item(1, "Concept note again"));
  const auto result = runner.run(items);
  REQUIRE_FALSE(result.has_value());
  CHECK_THAT(result.error(), StartsWith("Classification failed"));
  CHECK_THAT(result.error(), ContainsSubstring("Duplicate item id: 1"));

  const auto stored = h.store.read().value();
  CHECK(stored.status == state::RunStatus::kFailed);
  CHECK(stored.sections.empty());
  CHECK(count_events(h.audit.query(kRun), "ClassificationFailed") == 1);
}

TEST_CASE("Sections receive definers ahead of the items using their term",
          "[pipeline][runner][dependencies]") {
  Harness h;
  h.config.pipeline.worker_count = 1;
  const std::vector<domain::Item> items{
      domain::make_item(1, "Each variable has a range"),
      domain::make_item(2, "A variable is defined as a measured concept"),
      domain::make_item(3, "Method note 3"), domain::make_item(4, "Method note 4")};

  CapturingGenerator generator;
  pipeline::PipelineRunner runner(h.config, generator, h.store, h.audit, h.ids, h.clock);
  const auto result = runner.run(items);
  REQUIRE(result.has_value());
  CHECK(result.value().status == state::RunStatus::kCompleted);
  CHECK(result.value().classification.suggested_order == std::vector<std::int64_t>{2, 3, 4, 1});

  CHECK(generator.item_ids.at("fundamentals") == std::vector<std::int64_t>{2, 1});
  CHECK(generator.item_ids.at("methods") == std::vector<std::int64_t>{3, 4});
}

TEST_CASE("A section whose state cannot be recorded keeps the run resumable",
          "[pipeline][runner]") {
  FlakyStepBackend backend("methods", "validate", 2);
  core::SteppingClock clock;
  core::DeterministicIdGenerator ids;
  storage::InMemoryAuditLog audit;
  state::StateStore store(backend, kRun, clock, {5, std::chrono::milliseconds(0)});
  auto config = testing::sample_config();
  config.pipeline.worker_count = 1;

  auto generator = passing_generator();
  {
    pipeline::PipelineRunner runner(config, generator, store, audit, ids, clock);
    const auto result = runner.run(two_section_items());
    REQUIRE_FALSE(result.has_value());
    CHECK_THAT(result.error(), ContainsSubstring("methods"));
    CHECK_THAT(result.error(), ContainsSubstring("disk hiccup"));
  }

  const auto stored = store.read();
  REQUIRE(stored.has_value());
  CHECK(stored.value().status == state::RunStatus::kInProgress);
  CHECK(stored.value().find_section("fundamentals")->status == state::SectionStatus::kCompleted);
  CHECK(stored.value().find_section("methods")->status == state::SectionStatus::kInProgress);
  CHECK(store.validate().value().health == state::StateHealth::kValid);
  CHECK(count_events(audit.query(kRun), "RunCompleted") == 0);
  CHECK(count_events(audit.query(kRun), "RunStopped") == 1);

  // The backend recovers; the next invocation recomputes the unfinished section.
  pipeline::PipelineRunner again(config, generator, store, audit, ids, clock);
  const auto resumed = again.run(two_section_items());
  REQUIRE(resumed.has_value());
  CHECK(resumed.value().status == state::RunStatus::kCompleted);
  CHECK(resumed.value().sections[0].resumed);
  CHECK_FALSE(resumed.value().sections[1].resumed);
  CHECK(store.read().value().find_section("methods")->status ==
        state::SectionStatus::kCompleted);
  CHECK(store.validate().value().health == state::StateHealth::kValid);
}
