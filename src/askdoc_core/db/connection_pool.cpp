#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "askdoc_core/db/connection_pool.hpp"

#include "askdoc_core/db/sqlite_error_utils.hpp"
#include "askdoc_core/errors.hpp"

namespace askdoc_core {

std::unique_ptr<sqlite::database> ConnectionPool::open_keyed(const std::string &db_path,
                                                             const std::string &db_key) {
  std::unique_ptr<sqlite::database> db;
  try {
    db = std::make_unique<sqlite::database>(db_path);
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("open " + db_path, e));
  }

  sqlite3 *handle = db->connection().get();
  if (!handle) {
    throw DocumentStoreError("No native handle for database " + db_path);
  }
  if (sqlite3_key(handle, db_key.data(), static_cast<int>(db_key.size())) != SQLITE_OK) {
    throw DocumentStoreError("Keying database " + db_path +
                             " failed: " + std::string(sqlite3_errmsg(handle)));
  }

  try {
    // First read decrypts page 1
    *db << "SELECT count(*) FROM sqlite_master;";
  } catch (const sqlite::sqlite_exception &e) {
    if (is_wrong_key_error(e)) {
      throw DocumentStoreError("Database " + db_path +
                               " cannot be decrypted with the configured key");
    }
    throw DocumentStoreError(format_db_error("open " + db_path, e));
  }

  try {
    *db << "PRAGMA foreign_keys = ON;";
    *db << "PRAGMA journal_mode = WAL;";
    *db << "PRAGMA busy_timeout = 5000;";
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("configure " + db_path, e));
  }
  return db;
}

ConnectionPool::ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size)
    : db_path_(db_path) {
  if (pool_size < 1) {
    throw ConfigurationError("Connection pool size must be at least 1, got " +
                             std::to_string(pool_size));
  }
  idle_.reserve(static_cast<size_t>(pool_size));
  for (int i = 0; i < pool_size; ++i) {
    idle_.push_back(open_keyed(db_path_, db_key));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_cv_.wait(lock, [this] { return closed_ || !idle_.empty(); });
  if (closed_) {
    throw DocumentStoreError("Connection pool for " + db_path_ + " is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !conn) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  available_cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    idle_.clear();
  }
  available_cv_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace askdoc_core
