#pragma once

#include "cgate/storage/audit_event.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cgate::storage {

// IAuditLog is the append-only log of pipeline runs, one hash chain per run
// (see audit_chain.h). append() chains the event itself and returns the stored copy;
// chain fields set by the caller are overwritten. It throws std::runtime_error when
// the event cannot be persisted.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;

  virtual AuditEvent append(const AuditEvent& event) = 0;

  // Events of one run in append order; an empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

  // Events of one run with the given type, in append order.
  [[nodiscard]] std::vector<AuditEvent> query_type(const std::string& trace_id,
                                                   std::string_view event_type) const;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  AuditEvent append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  std::map<std::string, std::size_t> tail_index_;  // run -> index of its last event
};

}  // namespace cgate::storage
