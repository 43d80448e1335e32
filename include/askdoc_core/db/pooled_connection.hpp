#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

#include "askdoc_core/db/database_manager.hpp"
#include "askdoc_core/errors.hpp"

namespace askdoc_core {

// Borrows a connection for the lifetime of the guard.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw DocumentStoreError("Failed to acquire database connection");
    }
  }

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  sqlite::database *operator->() const {
    return conn_.get();
  }
  sqlite::database &operator*() const {
    return *conn_;
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace askdoc_core
