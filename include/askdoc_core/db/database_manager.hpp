#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "askdoc_core/db/connection_pool.hpp"

namespace askdoc_core {

/**
 * @brief Owns the schema and the connection pool of one encrypted database.
 *
 * Construction creates the parent directory, applies the schema on a
 * dedicated connection and then opens the pool.
 */
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, const std::string &db_key, int pool_size);
  ~DatabaseManager();

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  // Connections currently waiting in the pool
  size_t idle_connections() const;

  const std::filesystem::path &path() const {
    return db_path_;
  }

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

 private:
  void setup_schema(const std::string &db_key);

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_shut_down_ = false;
};

}  // namespace askdoc_core
