#pragma once

#include "cgate/storage/audit_event.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cgate::storage {

// previous_hash of the first event of every run.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

// hash_run_event returns the lowercase hex SHA-256 of the event's content fields
// (sorted-key JSON, sequence included, hash fields excluded) followed by previous_hash.
[[nodiscard]] std::string hash_run_event(const AuditEvent& event, std::string_view previous_hash);

// chain_event fills sequence, previous_hash and event_hash of `event` so that it
// follows `tail`, or starts a new chain when tail is null.
void chain_event(AuditEvent& event, const AuditEvent* tail);

struct ChainVerification {
  bool valid{false};
  std::size_t first_invalid_index{};  // NOLINT(readability-identifier-naming)
  std::string error;
};

// verify_audit_chain checks the events of one run in append order. The first broken
// link is reported; first_invalid_index == events.size() when the chain is intact.
//   sequence gap          an event was removed or reordered
//   previous_hash mismatch  the link to the prior event is broken
//   event_hash mismatch     the event content was altered
[[nodiscard]] ChainVerification verify_audit_chain(const std::vector<AuditEvent>& events);

}  // namespace cgate::storage
