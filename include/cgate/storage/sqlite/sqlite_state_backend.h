#pragma once

#include "cgate/state/state_backend.h"
#include "cgate/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace cgate::storage::sqlite {

// SqliteStateBackend implements IStateBackend on the pipeline_state and
// state_checkpoints tables (schema v1). Each store runs in its own
// BEGIN IMMEDIATE transaction, so readers never observe a partial write.
class SqliteStateBackend final : public state::IStateBackend {
 public:
  explicit SqliteStateBackend(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<std::optional<std::string>, core::StoreError> load_current(
      const std::string& run_id) override;
  [[nodiscard]] core::Result<bool, core::StoreError> store_current(
      const std::string& run_id, const std::string& record) override;
  [[nodiscard]] core::Result<std::optional<std::string>, core::StoreError> load_checkpoint(
      const std::string& run_id, const std::string& name) override;
  [[nodiscard]] core::Result<bool, core::StoreError> store_checkpoint(
      const std::string& run_id, const std::string& name, const std::string& record) override;
  [[nodiscard]] core::Result<std::vector<std::string>, core::StoreError> list_checkpoints(
      const std::string& run_id) override;

 private:
  std::shared_ptr<SqliteDb> db_;
  std::mutex mutex_;
};

}  // namespace cgate::storage::sqlite
