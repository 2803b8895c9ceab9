#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/state/state_backend.h"
#include "cgate/storage/audit_log.h"
#include "cgate/storage/sqlite/sqlite_db.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

// Exit codes shared by every subcommand.
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;    // usage, I/O or parse error
inline constexpr int kExitBlocked = 2;  // gate FAIL, failed run, unhealthy state

// read_json_file parses the file at path; failures are reported on stderr.
std::optional<nlohmann::json> read_json_file(const std::string& path);

// load_config reads the pipeline configuration; failures are reported on stderr.
std::optional<cgate::config::PipelineConfig> load_config(const std::string& path);

// StorageOptions selects where run state and the audit log live. Exactly one of
// store_dir and db_path must be set.
struct StorageOptions {
  std::optional<std::string> store_dir;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;    // NOLINT(readability-identifier-naming)
};

// Storage owns the state backend and audit log of one CLI invocation.
//   --store-dir: files under <dir>, audit events in <dir>/audit.db
//   --db:        both in one SQLite file, through separate connections
struct Storage {
  std::shared_ptr<cgate::storage::sqlite::SqliteDb> state_db;  // NOLINT(readability-identifier-naming)
  std::shared_ptr<cgate::storage::sqlite::SqliteDb> audit_db;  // NOLINT(readability-identifier-naming)
  std::unique_ptr<cgate::state::IStateBackend> backend;
  std::unique_ptr<cgate::storage::IAuditLog> audit_log;  // NOLINT(readability-identifier-naming)
};

// open_storage validates the options and opens both stores; failures are reported
// on stderr.
std::optional<Storage> open_storage(const StorageOptions& options);
