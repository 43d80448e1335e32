#include "askdoc_core/db/database_manager.hpp"

#include "askdoc_core/db/sqlite_error_utils.hpp"
#include "askdoc_core/errors.hpp"

namespace askdoc_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path,
                                 const std::string &db_key,
                                 int pool_size)
    : db_path_(db_path) {
  if (db_key.empty()) {
    throw ConfigurationError("Database key must not be empty");
  }
  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      throw DocumentStoreError("Cannot create database directory " +
                               db_path_.parent_path().string() + ": " + ec.message());
    }
  }

  // One-time schema setup before the pool opens its connections
  setup_schema(db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), db_key, pool_size);
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (is_shut_down_ || !pool_) {
    return;
  }
  pool_->shutdown();
  is_shut_down_ = true;
}

size_t DatabaseManager::idle_connections() const {
  return is_shut_down_ ? 0 : pool_->available();
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (is_shut_down_) {
    throw DocumentStoreError("Database " + db_path_.string() + " has been shut down");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (is_shut_down_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::string &db_key) {
  auto db = ConnectionPool::open_keyed(db_path_.string(), db_key);
  try {
    *db << R"(
        CREATE TABLE IF NOT EXISTS documents (
            id INTEGER PRIMARY KEY,
            title TEXT NOT NULL,
            chunk_count INTEGER NOT NULL,
            token_count INTEGER NOT NULL,
            page_count INTEGER NOT NULL DEFAULT 0,
            content_hash TEXT NOT NULL,
            created_at TEXT NOT NULL
        )
      )";

    // content is zstd-compressed; page_numbers is a comma separated list
    *db << R"(
        CREATE TABLE IF NOT EXISTS chunks (
            document_id INTEGER NOT NULL,
            chunk_index INTEGER NOT NULL,
            content BLOB NOT NULL,
            token_count INTEGER NOT NULL,
            page_numbers TEXT NOT NULL DEFAULT '',
            vector_blob BLOB NOT NULL,
            PRIMARY KEY (document_id, chunk_index),
            FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
        )
      )";
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("setup_schema", e));
  }
}

}  // namespace askdoc_core
