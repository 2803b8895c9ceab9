#include "cgate/core/clock.h"
#include "cgate/state/file_state_backend.h"
#include "cgate/state/state_store.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace cgate;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test ends.
class TempDir {
 public:
  explicit TempDir(const std::string& name)
      : path_(fs::temp_directory_path() / ("cgate-" + name)) {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;

  [[nodiscard]] const fs::path& path() const { return path_; }

 private:
  fs::path path_;
};

}  // namespace

TEST_CASE("FileStateBackend stores the live record per run", "[state][file]") {
  TempDir dir("file-backend-live");
  state::FileStateBackend backend(dir.path());

  const auto absent = backend.load_current("r1");
  REQUIRE(absent.has_value());
  CHECK_FALSE(absent.value().has_value());

  REQUIRE(backend.store_current("r1", "first").has_value());
  REQUIRE(backend.store_current("r1", "second").has_value());
  REQUIRE(backend.store_current("r2", "other").has_value());

  CHECK(backend.load_current("r1").value() == std::optional<std::string>{"second"});
  CHECK(backend.load_current("r2").value() == std::optional<std::string>{"other"});
  CHECK(backend.state_path("r1") == dir.path() / "r1" / "state.json");
  CHECK(fs::exists(backend.state_path("r1")));
  // No temporary file is left behind.
  CHECK_FALSE(fs::exists(dir.path() / "r1" / "state.json.tmp"));
}

TEST_CASE("FileStateBackend checkpoints are write-once and listed in order", "[state][file]") {
  TempDir dir("file-backend-checkpoints");
  state::FileStateBackend backend(dir.path());

  CHECK(backend.list_checkpoints("r1").value().empty());

  REQUIRE(backend.store_checkpoint("r1", "after:methods@r4", "m").has_value());
  REQUIRE(backend.store_checkpoint("r1", "after:fundamentals@r2", "f").has_value());

  const auto dup = backend.store_checkpoint("r1", "after:methods@r4", "again");
  REQUIRE_FALSE(dup.has_value());
  CHECK(dup.error().code == core::StoreErrorCode::kAlreadyExists);
  CHECK(backend.load_checkpoint("r1", "after:methods@r4").value() ==
        std::optional<std::string>{"m"});

  CHECK(backend.list_checkpoints("r1").value() ==
        std::vector<std::string>{"after:fundamentals@r2", "after:methods@r4"});
  CHECK_FALSE(backend.load_checkpoint("r1", "missing").value().has_value());
}

TEST_CASE("StateStore persists across instances over files", "[state][file]") {
  TempDir dir("file-backend-store");
  core::SteppingClock clock;
  const state::StateStoreOptions options{5, std::chrono::milliseconds(0)};

  {
    state::FileStateBackend backend(dir.path());
    state::StateStore store(backend, "r1", clock, options);
    state::StateUpdate u;
    u.status = state::RunStatus::kInProgress;
    u.sections.push_back(state::SectionUpdate{"methods", state::SectionStatus::kInProgress, 2,
                                              1, std::nullopt, std::nullopt});
    REQUIRE(store.write(u).has_value());
    REQUIRE(store.checkpoint("mid").has_value());
  }

  state::FileStateBackend backend(dir.path());
  state::StateStore store(backend, "r1", clock, options);
  const auto s = store.read();
  REQUIRE(s.has_value());
  CHECK(s.value().revision == 2);
  REQUIRE(s.value().sections.size() == 1);
  CHECK(s.value().sections[0].last_step == 2);
  CHECK(s.value().checkpoints.size() == 1);

  SECTION("a truncated state file is reported as corrupted") {
    std::ofstream(backend.state_path("r1"), std::ios::trunc) << "{\"format_version\":1,";
    CHECK(store.read().error().code == core::StoreErrorCode::kCorrupted);
    const auto recovered = store.recover("mid");
    REQUIRE(recovered.has_value());
    CHECK(recovered.value().status == state::RunStatus::kRecovered);
  }
}

TEST_CASE("FileStateBackend refuses run ids that leave the store directory", "[state][file]") {
  TempDir dir("file-backend-unsafe");
  state::FileStateBackend backend(dir.path() / "store");

  for (const std::string run_id : {"../escape", ".hidden", "", "a/b"}) {
    const auto stored = backend.store_current(run_id, "record");
    REQUIRE_FALSE(stored.has_value());
    CHECK(stored.error().code == core::StoreErrorCode::kInvalid);
    CHECK(backend.load_current(run_id).error().code == core::StoreErrorCode::kInvalid);
    CHECK(backend.list_checkpoints(run_id).error().code == core::StoreErrorCode::kInvalid);
  }
  CHECK_FALSE(fs::exists(dir.path() / "escape"));
}
