#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace helpdesk_core {

/**
 * Rolls back unless commit() is reached. Claiming a task uses an IMMEDIATE
 * transaction so two workers never read the same PENDING row before either writes.
 */
class Transaction {
 public:
  enum class Mode { Deferred, Immediate };

  explicit Transaction(sqlite::database &db, Mode mode = Mode::Deferred) : db_(db) {
    db_ << (mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    open_ = true;
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

  ~Transaction() {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "[TaskQueue] Rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace helpdesk_core
