#pragma once

#include <memory>
#include <stdexcept>

#include <sqlite_modern_cpp.h>

#include "clientiq_core/db/database_manager.hpp"

namespace clientiq_core {

// Scoped loan of one keyed connection from the DatabaseManager's pool.
// Blocks in the constructor while every connection is lent out.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw std::runtime_error("Connection pool handed out an empty connection");
    }
  }

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& operator*() const { return *conn_; }
  sqlite::database* operator->() const { return conn_.get(); }

 private:
  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace clientiq_core
