#include "cgate/storage/audit_log.h"

#include "cgate/storage/audit_chain.h"

#include <algorithm>
#include <iterator>

namespace cgate::storage {

std::vector<AuditEvent> IAuditLog::query_type(const std::string& trace_id,
                                              std::string_view event_type) const {
  auto all = query(trace_id);
  std::vector<AuditEvent> matching;
  std::copy_if(std::make_move_iterator(all.begin()), std::make_move_iterator(all.end()),
               std::back_inserter(matching),
               [event_type](const AuditEvent& e) { return e.event_type == event_type; });
  return matching;
}

AuditEvent InMemoryAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  AuditEvent stored = event;
  const auto tail = tail_index_.find(event.trace_id);
  chain_event(stored, tail != tail_index_.end() ? &events_[tail->second] : nullptr);

  tail_index_[event.trace_id] = events_.size();
  events_.push_back(stored);
  return stored;
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }
  std::vector<AuditEvent> run;
  std::copy_if(events_.begin(), events_.end(), std::back_inserter(run),
               [&trace_id](const AuditEvent& e) { return e.trace_id == trace_id; });
  return run;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(tail_index_.size());
  for (const auto& entry : tail_index_) {
    ids.push_back(entry.first);
  }
  return ids;
}

}  // namespace cgate::storage
