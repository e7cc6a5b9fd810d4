#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>
#include "clientiq_core/db/connection_pool.hpp"
#include <stdexcept>

namespace clientiq_core {

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  capacity_ = static_cast<size_t>(pool_size);
  idle_.reserve(capacity_);
  for (size_t i = 0; i < capacity_; ++i) {
    idle_.push_back(open_keyed_connection());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_keyed_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Could not obtain a native handle for " + db_path_);
  }

  if (sqlite3_key(handle, db_key_.c_str(), static_cast<int>(db_key_.size())) != SQLITE_OK) {
    throw std::runtime_error("Could not apply the encryption key to " + db_path_ + ": " +
                             std::string(sqlite3_errmsg(handle)));
  }

  // SQLCipher only validates the key on first read; this fails with SQLITE_NOTADB if it is wrong
  *db << "SELECT count(*) FROM sqlite_master;";

  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  idle_cv_.wait(lock, [this] { return closed_ || !idle_.empty(); });

  if (closed_) {
    throw std::runtime_error("Connection pool for " + db_path_ + " is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_ || !conn) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  idle_cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    idle_.clear();
  }
  idle_cv_.notify_all();
}

size_t ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace clientiq_core
