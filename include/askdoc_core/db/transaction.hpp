#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace askdoc_core {

enum class TransactionMode {
  Deferred,
  // Takes the write lock up front so a read-then-write cannot deadlock
  Immediate,
};

/**
 * @brief Scoped SQLite transaction on a borrowed connection.
 *
 * Nothing is kept unless commit() is reached; leaving the scope early, by
 * return or exception, rolls the transaction back.
 */
class Transaction {
 public:
  Transaction(sqlite::database &db, TransactionMode mode) : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "Warning: rollback of open transaction failed: " << e.what() << std::endl;
    }
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

  bool is_open() const {
    return open_;
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace askdoc_core
