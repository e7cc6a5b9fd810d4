#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "clientiq_core/db/database_manager.hpp"

#include <stdexcept>

namespace clientiq_core {

namespace {

// Bumped whenever company_embeddings changes shape
constexpr int kSchemaVersion = 1;

}  // namespace

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  if (is_initialized_) {
    return;
  }
  if (db_key.empty()) {
    throw std::invalid_argument("An encryption key is required to open " + db_path.string());
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on a connection of its own, so pooled connections never see a partial schema
  setup_schema(db_path, db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager::initialize must be called before requesting a connection");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  // Connections outliving a shutdown are simply closed
  if (is_initialized_) {
    pool_->return_connection(std::move(conn));
  }
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path,
                                   const std::string& db_key) {
  sqlite::database db(db_path.string());
  sqlite3* handle = db.connection().get();
  if (!handle) {
    throw std::runtime_error("Schema setup could not obtain a native handle for " +
                             db_path.string());
  }
  if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.size())) != SQLITE_OK) {
    throw std::runtime_error("Schema setup could not key " + db_path.string() + ": " +
                             std::string(sqlite3_errmsg(handle)));
  }

  int user_version = 0;
  db << "PRAGMA user_version;" >> user_version;
  if (user_version > kSchemaVersion) {
    throw std::runtime_error(db_path.string() + " has schema version " +
                             std::to_string(user_version) + ", newer than supported version " +
                             std::to_string(kSchemaVersion));
  }

  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS company_embeddings (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          company_name TEXT NOT NULL,
          source_text TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          owner_id TEXT NOT NULL,
          metadata TEXT NOT NULL DEFAULT '{}',
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  // Owner history and paging read newest first
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_company_embeddings_owner_created
      ON company_embeddings(owner_id, created_at DESC)
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_company_embeddings_name_owner
      ON company_embeddings(company_name, owner_id)
    )";
  // Candidate scans walk this one
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_company_embeddings_created
      ON company_embeddings(created_at DESC, id DESC)
    )";

  db << "PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";";
}

}  // namespace clientiq_core
