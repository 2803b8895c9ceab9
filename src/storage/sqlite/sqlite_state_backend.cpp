#include "cgate/storage/sqlite/sqlite_state_backend.h"

#include <sqlite3.h>

namespace cgate::storage::sqlite {

namespace {

core::StoreError io_error(sqlite3* db, const std::string& what) {
  return core::StoreError{core::StoreErrorCode::kIoFailure, what + ": " + sqlite3_errmsg(db)};
}

// Runs `body` inside BEGIN IMMEDIATE ... COMMIT, rolling back on error.
template <typename Body>
core::Result<bool, core::StoreError> in_transaction(SqliteDb& db, Body body) {
  using R = core::Result<bool, core::StoreError>;
  auto begin = db.exec("BEGIN IMMEDIATE");
  if (!begin.has_value()) {
    return R::err({core::StoreErrorCode::kIoFailure, begin.error()});
  }
  auto result = body();
  if (!result.has_value()) {
    auto rollback = db.exec("ROLLBACK");
    if (!rollback.has_value()) {
      return R::err({result.error().code, result.error().message + "; " + rollback.error()});
    }
    return result;
  }
  auto commit = db.exec("COMMIT");
  if (!commit.has_value()) {
    auto rollback = db.exec("ROLLBACK");
    return R::err({core::StoreErrorCode::kIoFailure,
                   commit.error() + (rollback.has_value() ? "" : "; " + rollback.error())});
  }
  return result;
}

core::Result<std::optional<std::string>, core::StoreError> select_record(
    sqlite3* conn, const char* sql, const std::string& a, const std::string* b) {
  using R = core::Result<std::optional<std::string>, core::StoreError>;
  PreparedStatement stmt(conn, sql);
  if (!stmt.is_valid()) {
    return R::err({core::StoreErrorCode::kIoFailure, "Failed to prepare query: " + stmt.error()});
  }
  stmt.bind_text(1, a);
  if (b != nullptr) {
    stmt.bind_text(2, *b);
  }
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return R::ok(column_string(stmt.get(), 0));
  }
  if (rc == SQLITE_DONE) {
    return R::ok(std::nullopt);
  }
  return R::err(io_error(conn, "Query failed"));
}

}  // namespace

SqliteStateBackend::SqliteStateBackend(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<std::optional<std::string>, core::StoreError> SqliteStateBackend::load_current(
    const std::string& run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return select_record(db_->connection(), "SELECT record FROM pipeline_state WHERE run_id = ?",
                       run_id, nullptr);
}

core::Result<bool, core::StoreError> SqliteStateBackend::store_current(const std::string& run_id,
                                                                       const std::string& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction(*db_, [&]() {
    using R = core::Result<bool, core::StoreError>;
    PreparedStatement stmt(db_->connection(), R"(
      INSERT INTO pipeline_state (run_id, record, updated_at)
      VALUES (?, ?, datetime('now'))
      ON CONFLICT(run_id) DO UPDATE SET record = excluded.record,
                                        updated_at = excluded.updated_at
    )");
    if (!stmt.is_valid()) {
      return R::err({core::StoreErrorCode::kIoFailure, "Failed to prepare upsert: " + stmt.error()});
    }
    stmt.bind_text(1, run_id);
    stmt.bind_text(2, record);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return R::err(io_error(db_->connection(), "Failed to store state for " + run_id));
    }
    return R::ok(true);
  });
}

core::Result<std::optional<std::string>, core::StoreError> SqliteStateBackend::load_checkpoint(
    const std::string& run_id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return select_record(db_->connection(),
                       "SELECT record FROM state_checkpoints WHERE run_id = ? AND name = ?",
                       run_id, &name);
}

core::Result<bool, core::StoreError> SqliteStateBackend::store_checkpoint(
    const std::string& run_id, const std::string& name, const std::string& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction(*db_, [&]() {
    using R = core::Result<bool, core::StoreError>;
    auto existing = select_record(
        db_->connection(), "SELECT name FROM state_checkpoints WHERE run_id = ? AND name = ?",
        run_id, &name);
    if (!existing.has_value()) {
      return R::err(existing.error());
    }
    if (existing.value().has_value()) {
      return R::err({core::StoreErrorCode::kAlreadyExists, "Checkpoint already exists: " + name});
    }

    PreparedStatement stmt(db_->connection(), R"(
      INSERT INTO state_checkpoints (run_id, name, record, created_at)
      VALUES (?, ?, ?, datetime('now'))
    )");
    if (!stmt.is_valid()) {
      return R::err({core::StoreErrorCode::kIoFailure, "Failed to prepare insert: " + stmt.error()});
    }
    stmt.bind_text(1, run_id);
    stmt.bind_text(2, name);
    stmt.bind_text(3, record);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return R::err(io_error(db_->connection(), "Failed to store checkpoint " + name));
    }
    return R::ok(true);
  });
}

core::Result<std::vector<std::string>, core::StoreError> SqliteStateBackend::list_checkpoints(
    const std::string& run_id) {
  using R = core::Result<std::vector<std::string>, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT name FROM state_checkpoints WHERE run_id = ? ORDER BY name");
  if (!stmt.is_valid()) {
    return R::err({core::StoreErrorCode::kIoFailure, "Failed to prepare listing: " + stmt.error()});
  }
  stmt.bind_text(1, run_id);

  std::vector<std::string> names;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    names.push_back(column_string(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    return R::err(io_error(db_->connection(), "Checkpoint listing failed"));
  }
  return R::ok(std::move(names));
}

}  // namespace cgate::storage::sqlite
