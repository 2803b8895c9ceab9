#include "state_logic.h"

#include "common.h"

#include "cgate/state/state_json.h"
#include "cgate/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace {

int report_error(const std::string& action, const cgate::core::StoreError& error) {
  std::cerr << "state " << action << " failed ("
            << cgate::core::store_error_code_to_string(error.code) << "): " << error.message
            << "\n";
  return kExitError;
}

nlohmann::json progress_to_json(const cgate::state::ProgressReport& p) {
  return {{"status", cgate::state::run_status_to_string(p.status)},
          {"current_section", p.current_section},
          {"current_step", p.current_step},
          {"total", p.total},
          {"pending", p.pending},
          {"in_progress", p.in_progress},
          {"completed", p.completed},
          {"failed", p.failed},
          {"skipped", p.skipped},
          {"percent_complete", p.percent_complete},
          {"error_count", p.error_count}};
}

nlohmann::json checkpoint_ref_to_json(const cgate::state::CheckpointRef& ref) {
  return {{"name", ref.name}, {"created_at", ref.created_at}, {"revision", ref.revision}};
}

}  // namespace

int run_state_action(const std::string& action, const std::string& checkpoint_name,
                     cgate::state::StateStore& store, cgate::storage::IAuditLog& audit_log,
                     cgate::core::IIdGenerator& id_gen, cgate::core::IClock& clock,
                     std::ostream& out) {
  if (action == "status") {
    auto state = store.read();
    if (!state.has_value()) {
      return report_error(action, state.error());
    }
    auto progress = store.progress();
    if (!progress.has_value()) {
      return report_error(action, progress.error());
    }
    out << nlohmann::json{{"progress", progress_to_json(progress.value())},
                          {"state", cgate::state::pipeline_state_to_json(state.value())}}
               .dump(2)
        << "\n";
    return kExitOk;
  }

  if (action == "validate") {
    auto validation = store.validate();
    if (!validation.has_value()) {
      return report_error(action, validation.error());
    }
    const auto& v = validation.value();
    out << nlohmann::json{{"health", cgate::state::state_health_to_string(v.health)},
                          {"issues", v.issues}}
               .dump(2)
        << "\n";
    return v.health == cgate::state::StateHealth::kValid ? kExitOk : kExitBlocked;
  }

  if (action == "repair") {
    auto repaired = store.repair();
    if (!repaired.has_value()) {
      return report_error(action, repaired.error());
    }
    out << nlohmann::json{{"fixes", repaired.value().fixes},
                          {"state", cgate::state::pipeline_state_to_json(repaired.value().state)}}
               .dump(2)
        << "\n";
    return kExitOk;
  }

  if (action == "checkpoint") {
    auto ref = store.checkpoint(checkpoint_name);
    if (!ref.has_value()) {
      return report_error(action, ref.error());
    }
    audit_log.append({id_gen.next("evt"), store.run_id(),
                      std::string(cgate::storage::events::kCheckpointCreated),
                      nlohmann::json{{"name", ref.value().name},
                                     {"revision", ref.value().revision},
                                     {"manual", true}}
                          .dump(),
                      clock.now_iso8601(), {ref.value().name}});
    out << checkpoint_ref_to_json(ref.value()).dump(2) << "\n";
    return kExitOk;
  }

  if (action == "recover") {
    auto recovered = store.recover(checkpoint_name);
    if (!recovered.has_value()) {
      return report_error(action, recovered.error());
    }
    audit_log.append({id_gen.next("evt"), store.run_id(),
                      std::string(cgate::storage::events::kStateRecovered),
                      nlohmann::json{{"checkpoint", checkpoint_name},
                                     {"revision", recovered.value().revision}}
                          .dump(),
                      clock.now_iso8601(), {checkpoint_name}});
    out << cgate::state::pipeline_state_to_json(recovered.value()).dump(2) << "\n";
    return kExitOk;
  }

  if (action == "list") {
    auto refs = store.list_checkpoints();
    if (!refs.has_value()) {
      return report_error(action, refs.error());
    }
    nlohmann::json j = nlohmann::json::array();
    for (const auto& ref : refs.value()) {
      j.push_back(checkpoint_ref_to_json(ref));
    }
    out << j.dump(2) << "\n";
    return kExitOk;
  }

  if (action == "audit") {
    const auto events = audit_log.query(store.run_id());
    const auto verification = cgate::storage::verify_audit_chain(events);
    nlohmann::json j;
    j["chain_valid"] = verification.valid;
    if (!verification.valid) {
      j["first_invalid_index"] = verification.first_invalid_index;
      j["error"] = verification.error;
    }
    j["events"] = nlohmann::json::array();
    for (const auto& event : events) {
      j["events"].push_back({{"event_id", event.event_id},
                             {"event_type", event.event_type},
                             {"created_at", event.created_at},
                             {"payload", nlohmann::json::parse(event.payload, nullptr, false)},
                             {"refs", event.refs},
                             {"event_hash", event.event_hash}});
    }
    out << j.dump(2) << "\n";
    return verification.valid ? kExitOk : kExitBlocked;
  }

  std::cerr << "Unknown state action: " << action << "\n";
  return kExitError;
}
