#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace askdoc_core {

/**
 * @brief Fixed set of keyed SQLCipher connections shared by request threads.
 *
 * All connections are opened and keyed up front, so a wrong key fails at
 * construction instead of on the first request.
 */
class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size);

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  // Blocks until a connection is free. Throws DocumentStoreError after shutdown().
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);

  // Closes idle connections and wakes every waiter. Connections still
  // borrowed are closed when they come back.
  void shutdown();

  size_t available() const;

  /**
   * @brief Opens one connection, applies the key and the connection pragmas.
   * @throw DocumentStoreError if the file cannot be opened or the key is wrong.
   */
  static std::unique_ptr<sqlite::database> open_keyed(const std::string &db_path,
                                                      const std::string &db_key);

 private:
  std::string db_path_;
  std::vector<std::unique_ptr<sqlite::database>> idle_;
  bool closed_ = false;
  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
};

}  // namespace askdoc_core
