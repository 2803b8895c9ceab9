#include "cgate/storage/sqlite/sqlite_audit_log.h"

#include "cgate/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>

namespace cgate::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT event_id, trace_id, sequence, event_type, payload, created_at, refs_json,"
    " previous_hash, event_hash FROM audit_events";

AuditEvent read_row(sqlite3_stmt* stmt) {
  AuditEvent event;
  event.event_id = column_string(stmt, 0);
  event.trace_id = column_string(stmt, 1);
  event.sequence = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));
  event.event_type = column_string(stmt, 3);
  event.payload = column_string(stmt, 4);
  event.created_at = column_string(stmt, 5);
  const auto refs = nlohmann::json::parse(column_string(stmt, 6), nullptr, false);
  if (!refs.is_array()) {
    throw std::runtime_error("Unreadable refs for audit event " + event.event_id);
  }
  event.refs = refs.get<std::vector<std::string>>();
  event.previous_hash = column_string(stmt, 7);
  event.event_hash = column_string(stmt, 8);
  return event;
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

AuditEvent SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  AuditEvent stored = event;
  const auto tail = tail_of(event.trace_id);
  chain_event(stored, tail.has_value() ? &*tail : nullptr);

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO audit_events
      (event_id, trace_id, sequence, event_type, payload, created_at, refs_json,
       previous_hash, event_hash)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare audit insert: " + stmt.error());
  }
  stmt.bind_text(1, stored.event_id);
  stmt.bind_text(2, stored.trace_id);
  sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(stored.sequence));
  stmt.bind_text(4, stored.event_type);
  stmt.bind_text(5, stored.payload);
  stmt.bind_text(6, stored.created_at);
  stmt.bind_text(7, nlohmann::json(stored.refs).dump());
  stmt.bind_text(8, stored.previous_hash);
  stmt.bind_text(9, stored.event_hash);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    // Forget the cached tail; another writer may have moved it.
    tails_.erase(event.trace_id);
    throw std::runtime_error("Failed to append " + stored.event_type + " to run " +
                             stored.trace_id + ": " + sqlite3_errmsg(db_->connection()));
  }
  tails_[stored.trace_id] = stored;
  return stored;
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string sql =
      std::string(kSelectColumns) +
      (trace_id.empty() ? " ORDER BY rowid" : " WHERE trace_id = ? ORDER BY sequence");
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare audit query: " + stmt.error());
  }
  if (!trace_id.empty()) {
    stmt.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> events;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    events.push_back(read_row(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("Audit query failed: ") +
                             sqlite3_errmsg(db_->connection()));
  }
  return events;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare run listing: " + stmt.error());
  }
  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(column_string(stmt.get(), 0));
  }
  return ids;
}

std::optional<AuditEvent> SqliteAuditLog::tail_of(const std::string& trace_id) {
  const auto cached = tails_.find(trace_id);
  if (cached != tails_.end()) {
    return cached->second;
  }

  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) +
                                                " WHERE trace_id = ? ORDER BY sequence DESC LIMIT 1");
  if (!stmt.is_valid()) {
    throw std::runtime_error("Failed to prepare audit tail query: " + stmt.error());
  }
  stmt.bind_text(1, trace_id);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("Audit tail query failed: ") +
                             sqlite3_errmsg(db_->connection()));
  }
  auto tail = read_row(stmt.get());
  tails_[trace_id] = tail;
  return tail;
}

}  // namespace cgate::storage::sqlite
