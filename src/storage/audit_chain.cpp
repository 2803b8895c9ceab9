#include "cgate/storage/audit_chain.h"

#include "cgate/core/sha256.h"

#include <nlohmann/json.hpp>

namespace cgate::storage {

std::string hash_run_event(const AuditEvent& event, std::string_view previous_hash) {
  // nlohmann::json objects iterate in key order, so dump() is stable.
  const nlohmann::json content = {{"created_at", event.created_at},
                                  {"event_id", event.event_id},
                                  {"event_type", event.event_type},
                                  {"payload", event.payload},
                                  {"refs", event.refs},
                                  {"sequence", event.sequence},
                                  {"trace_id", event.trace_id}};
  core::Sha256 hasher;
  hasher.update(content.dump());
  hasher.update(previous_hash);
  return hasher.hex_digest();
}

void chain_event(AuditEvent& event, const AuditEvent* tail) {
  event.sequence = tail != nullptr ? tail->sequence + 1 : 0;
  event.previous_hash = tail != nullptr ? tail->event_hash : std::string(kGenesisHash);
  event.event_hash = hash_run_event(event, event.previous_hash);
}

ChainVerification verify_audit_chain(const std::vector<AuditEvent>& events) {
  std::string_view expected_previous = kGenesisHash;
  for (std::size_t i = 0; i < events.size(); ++i) {
    const AuditEvent& ev = events[i];
    const std::string at = " at index " + std::to_string(i);
    if (ev.sequence != i) {
      return {false, i,
              "sequence gap" + at + " (expected " + std::to_string(i) + ", found " +
                  std::to_string(ev.sequence) + ")"};
    }
    if (ev.previous_hash != expected_previous) {
      return {false, i, "previous_hash mismatch" + at};
    }
    if (ev.event_hash != hash_run_event(ev, ev.previous_hash)) {
      return {false, i, "event_hash mismatch" + at};
    }
    expected_previous = ev.event_hash;
  }
  return {true, events.size(), ""};
}

}  // namespace cgate::storage
