#pragma once

#include "cgate/core/result.h"

#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace cgate::storage::sqlite {

// Schema history:
//   1  pipeline_state, state_checkpoints
//   2  audit_events (per-trace sequence and hash chain)
inline constexpr int kLatestSchemaVersion = 2;

// SqliteDb owns one SQLite connection. Callers serialize access to it; the state
// backend and the audit log each take their own connection when they run in parallel.
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Highest applied migration, 0 for a fresh database.
  [[nodiscard]] int schema_version() const;

  // Applies every migration above schema_version(), each in its own transaction.
  // Returns the resulting version.
  [[nodiscard]] core::Result<int, std::string> migrate();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // 1-based; the value is copied.
  void bind_text(int index, const std::string& value);

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// column_string reads a TEXT column; NULL reads as "".
[[nodiscard]] std::string column_string(sqlite3_stmt* stmt, int column);

}  // namespace cgate::storage::sqlite
