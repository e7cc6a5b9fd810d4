#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace clientiq_core {

enum class TransactionMode {
  Deferred,
  // Takes the write lock at BEGIN
  Immediate
};

// Scoped transaction on one connection. Rolls back on scope exit unless commit() ran.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Warning: rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace clientiq_core
