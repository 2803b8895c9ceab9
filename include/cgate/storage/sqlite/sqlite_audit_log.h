#pragma once

#include "cgate/storage/audit_log.h"
#include "cgate/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace cgate::storage::sqlite {

// SqliteAuditLog keeps run logs in the audit_events table (schema v2).
// (trace_id, sequence) is unique, so a second writer that raced ahead on the same
// run makes append() throw instead of forking the chain.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  AuditEvent append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  // Last stored event of a run, cached after the first lookup. Requires mutex_.
  std::optional<AuditEvent> tail_of(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
  std::map<std::string, AuditEvent> tails_;
};

}  // namespace cgate::storage::sqlite
