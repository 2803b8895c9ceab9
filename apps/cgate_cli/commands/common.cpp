#include "common.h"

#include "cgate/config/config_loader.h"
#include "cgate/state/file_state_backend.h"
#include "cgate/storage/sqlite/sqlite_audit_log.h"
#include "cgate/storage/sqlite/sqlite_state_backend.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

std::shared_ptr<cgate::storage::sqlite::SqliteDb> open_db(const std::string& path) {
  auto db_result = cgate::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return nullptr;
  }
  auto db = db_result.value();
  auto schema_result = db->migrate();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to migrate " << path << ": " << schema_result.error() << "\n";
    return nullptr;
  }
  return db;
}

}  // namespace

std::optional<nlohmann::json> read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Cannot open " << path << "\n";
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Malformed JSON in " << path << ": " << e.what() << "\n";
    return std::nullopt;
  }
}

std::optional<cgate::config::PipelineConfig> load_config(const std::string& path) {
  auto result = cgate::config::load_pipeline_config(path);
  if (!result.has_value()) {
    std::cerr << result.error() << "\n";
    return std::nullopt;
  }
  return std::move(result.value());
}

std::optional<Storage> open_storage(const StorageOptions& options) {
  if (options.store_dir.has_value() == options.db_path.has_value()) {
    std::cerr << "Error: exactly one of --store-dir and --db is required\n";
    return std::nullopt;
  }

  Storage storage;
  if (options.store_dir.has_value()) {
    const std::filesystem::path root = *options.store_dir;
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
      std::cerr << "Cannot create " << root.string() << ": " << ec.message() << "\n";
      return std::nullopt;
    }
    storage.backend = std::make_unique<cgate::state::FileStateBackend>(root);
    storage.audit_db = open_db((root / "audit.db").string());
  } else {
    storage.state_db = open_db(*options.db_path);
    if (!storage.state_db) {
      return std::nullopt;
    }
    storage.backend = std::make_unique<cgate::storage::sqlite::SqliteStateBackend>(storage.state_db);
    storage.audit_db = open_db(*options.db_path);
  }
  if (!storage.audit_db) {
    return std::nullopt;
  }
  storage.audit_log = std::make_unique<cgate::storage::sqlite::SqliteAuditLog>(storage.audit_db);
  return storage;
}
