#include "cgate/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <array>

namespace cgate::storage::sqlite {

namespace {

struct Migration {
  int version;
  const char* sql;
};

constexpr std::array<Migration, kLatestSchemaVersion> kMigrations = {{
    {1, R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS pipeline_state (
  run_id TEXT PRIMARY KEY,
  record TEXT NOT NULL,
  updated_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS state_checkpoints (
  run_id TEXT NOT NULL,
  name TEXT NOT NULL,
  record TEXT NOT NULL,
  created_at TEXT NOT NULL,
  PRIMARY KEY(run_id, name)
);
)"},
    {2, R"(
CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  sequence INTEGER NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  refs_json TEXT NOT NULL,
  previous_hash TEXT NOT NULL,
  event_hash TEXT NOT NULL,
  UNIQUE(trace_id, sequence)
);
)"},
}};

std::string take_error(char* err_msg) {
  std::string error = err_msg != nullptr ? err_msg : "unknown error";
  sqlite3_free(err_msg);
  return error;
}

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using R = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return R::err("Failed to open " + path + ": " + error);
  }
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));

  // The CLI may hold a second connection on the same file.
  sqlite3_busy_timeout(raw, 2000);

  if (path != ":memory:") {
    auto wal = db->exec("PRAGMA journal_mode = WAL");
    if (!wal.has_value()) {
      return R::err(wal.error());
    }
  }
  return R::ok(std::move(db));
}

int SqliteDb::schema_version() const {
  PreparedStatement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid()) {
    return 0;  // no schema_version table yet
  }
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;
  }
  return sqlite3_column_int(stmt.get(), 0);
}

core::Result<int, std::string> SqliteDb::migrate() {
  using R = core::Result<int, std::string>;

  for (const auto& migration : kMigrations) {
    if (migration.version <= schema_version()) {
      continue;
    }
    const std::string script = std::string("BEGIN IMMEDIATE;") + migration.sql +
                               "INSERT INTO schema_version (version, applied_at) VALUES (" +
                               std::to_string(migration.version) +
                               ", strftime('%Y-%m-%dT%H:%M:%SZ', 'now'));COMMIT;";
    char* err_msg = nullptr;
    if (sqlite3_exec(db_.get(), script.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
      const std::string error = take_error(err_msg);
      if (sqlite3_get_autocommit(db_.get()) == 0) {
        auto rollback = exec("ROLLBACK");
        if (!rollback.has_value()) {
          return R::err("Migration " + std::to_string(migration.version) + " failed: " + error +
                        "; " + rollback.error());
        }
      }
      return R::err("Migration " + std::to_string(migration.version) + " failed: " + error);
    }
  }
  return R::ok(schema_version());
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
    return core::Result<bool, std::string>::err("SQL failed (" + sql + "): " + take_error(err_msg));
  }
  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

void PreparedStatement::bind_text(int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

std::string column_string(sqlite3_stmt* stmt, int column) {
  const auto* raw = sqlite3_column_text(stmt, column);
  if (raw == nullptr) {
    return "";
  }
  return {reinterpret_cast<const char*>(raw),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
          static_cast<std::size_t>(sqlite3_column_bytes(stmt, column))};
}

}  // namespace cgate::storage::sqlite
