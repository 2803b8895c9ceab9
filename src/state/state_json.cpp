#include "cgate/state/state_json.h"

#include "cgate/core/sha256.h"

#include <stdexcept>

namespace cgate::state {

namespace {

constexpr const char* kStateKey = "state";
constexpr const char* kCheckpointKey = "checkpoint";

nlohmann::json section_to_json(const SectionState& s) {
  nlohmann::json j{{"name", s.name},
                   {"status", section_status_to_string(s.status)},
                   {"last_step", s.last_step},
                   {"attempts", s.attempts},
                   {"notes", s.notes}};
  j["last_score"] = s.last_score.has_value() ? nlohmann::json(*s.last_score) : nlohmann::json(nullptr);
  return j;
}

SectionState section_from_json(const nlohmann::json& j) {
  SectionState s{};
  s.name = j.at("name").get<std::string>();
  s.status = section_status_from_string(j.at("status").get<std::string>());
  s.last_step = j.at("last_step").get<std::size_t>();
  s.attempts = j.at("attempts").get<std::size_t>();
  s.notes = j.at("notes").get<std::string>();
  if (!j.at("last_score").is_null()) {
    s.last_score = j.at("last_score").get<double>();
  }
  return s;
}

std::string wrap(const char* key, const nlohmann::json& payload) {
  nlohmann::json envelope;
  envelope["format_version"] = core::kStateFormatVersion;
  envelope["sha256"] = core::sha256_hex(payload.dump());
  envelope[key] = payload;
  return envelope.dump();
}

core::Result<nlohmann::json, core::StoreError> unwrap(const char* key, const std::string& record) {
  using R = core::Result<nlohmann::json, core::StoreError>;
  const auto corrupted = [](std::string message) {
    return R::err({core::StoreErrorCode::kCorrupted, std::move(message)});
  };

  nlohmann::json envelope;
  try {
    envelope = nlohmann::json::parse(record);
  } catch (const nlohmann::json::parse_error& e) {
    return corrupted(std::string("Unparseable record: ") + e.what());
  }
  if (!envelope.is_object() || !envelope.contains(key) || !envelope.contains("sha256") ||
      !envelope.contains("format_version")) {
    return corrupted(std::string("Record envelope is missing '") + key + "', 'sha256' or 'format_version'");
  }
  if (!envelope.at("format_version").is_number_integer() ||
      envelope.at("format_version").get<int>() != core::kStateFormatVersion) {
    return corrupted("Unsupported format_version " + envelope.at("format_version").dump());
  }
  const auto& payload = envelope.at(key);
  if (!envelope.at("sha256").is_string() ||
      envelope.at("sha256").get<std::string>() != core::sha256_hex(payload.dump())) {
    return corrupted("Integrity digest mismatch");
  }
  return R::ok(payload);
}

}  // namespace

nlohmann::json pipeline_state_to_json(const PipelineState& state) {
  nlohmann::json sections = nlohmann::json::array();
  for (const auto& s : state.sections) {
    sections.push_back(section_to_json(s));
  }
  nlohmann::json errors = nlohmann::json::array();
  for (const auto& e : state.errors) {
    errors.push_back({{"at", e.at}, {"section", e.section}, {"step", e.step}, {"message", e.message}});
  }
  nlohmann::json checkpoints = nlohmann::json::array();
  for (const auto& c : state.checkpoints) {
    checkpoints.push_back({{"name", c.name}, {"created_at", c.created_at}, {"revision", c.revision}});
  }

  nlohmann::json j{{"format_version", state.format_version},
                   {"run_id", state.run_id},
                   {"revision", state.revision},
                   {"created_at", state.created_at},
                   {"updated_at", state.updated_at},
                   {"current_step", state.current_step},
                   {"current_section", state.current_section},
                   {"status", run_status_to_string(state.status)},
                   {"sections", sections},
                   {"errors", errors},
                   {"checkpoints", checkpoints}};
  j["recovered_from"] =
      state.recovered_from.has_value() ? nlohmann::json(*state.recovered_from) : nlohmann::json(nullptr);
  return j;
}

PipelineState pipeline_state_from_json(const nlohmann::json& j) {
  PipelineState state{};
  state.format_version = j.at("format_version").get<int>();
  state.run_id = j.at("run_id").get<std::string>();
  state.revision = j.at("revision").get<std::uint64_t>();
  state.created_at = j.at("created_at").get<std::string>();
  state.updated_at = j.at("updated_at").get<std::string>();
  state.current_step = j.at("current_step").get<std::string>();
  state.current_section = j.at("current_section").get<std::string>();
  state.status = run_status_from_string(j.at("status").get<std::string>());
  for (const auto& s : j.at("sections")) {
    state.sections.push_back(section_from_json(s));
  }
  for (const auto& e : j.at("errors")) {
    state.errors.push_back(ErrorEntry{e.at("at").get<std::string>(), e.at("section").get<std::string>(),
                                      e.at("step").get<std::string>(),
                                      e.at("message").get<std::string>()});
  }
  for (const auto& c : j.at("checkpoints")) {
    state.checkpoints.push_back(CheckpointRef{c.at("name").get<std::string>(),
                                              c.at("created_at").get<std::string>(),
                                              c.at("revision").get<std::uint64_t>()});
  }
  if (!j.at("recovered_from").is_null()) {
    state.recovered_from = j.at("recovered_from").get<std::string>();
  }
  return state;
}

std::string encode_state_record(const PipelineState& state) {
  return wrap(kStateKey, pipeline_state_to_json(state));
}

core::Result<PipelineState, core::StoreError> decode_state_record(const std::string& record) {
  using R = core::Result<PipelineState, core::StoreError>;
  auto payload = unwrap(kStateKey, record);
  if (!payload.has_value()) {
    return R::err(payload.error());
  }
  try {
    return R::ok(pipeline_state_from_json(payload.value()));
  } catch (const nlohmann::json::exception& e) {
    return R::err({core::StoreErrorCode::kCorrupted, std::string("Schema error: ") + e.what()});
  } catch (const std::invalid_argument& e) {
    return R::err({core::StoreErrorCode::kCorrupted, std::string("Schema error: ") + e.what()});
  }
}

std::string encode_checkpoint_record(const Checkpoint& checkpoint) {
  return wrap(kCheckpointKey, nlohmann::json{{"name", checkpoint.name},
                                             {"created_at", checkpoint.created_at},
                                             {"state", pipeline_state_to_json(checkpoint.state)}});
}

core::Result<Checkpoint, core::StoreError> decode_checkpoint_record(const std::string& record) {
  using R = core::Result<Checkpoint, core::StoreError>;
  auto payload = unwrap(kCheckpointKey, record);
  if (!payload.has_value()) {
    return R::err(payload.error());
  }
  try {
    const auto& j = payload.value();
    return R::ok(Checkpoint{j.at("name").get<std::string>(), j.at("created_at").get<std::string>(),
                            pipeline_state_from_json(j.at("state"))});
  } catch (const nlohmann::json::exception& e) {
    return R::err({core::StoreErrorCode::kCorrupted, std::string("Schema error: ") + e.what()});
  } catch (const std::invalid_argument& e) {
    return R::err({core::StoreErrorCode::kCorrupted, std::string("Schema error: ") + e.what()});
  }
}

}  // namespace cgate::state
