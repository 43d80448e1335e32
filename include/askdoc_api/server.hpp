#pragma once
#include <crow.h>

#include <future>
#include <string>
#include <utility>

namespace askdoc_api {

/**
 * @brief Owns the Crow application and the thread it listens on.
 *
 * Routes are registered on get_app() before start(). stop() and the
 * destructor wait for in-flight requests to finish.
 */
class Server {
 public:
  // address is "host:port"; throws askdoc_core::ConfigurationError otherwise
  explicit Server(const std::string &address);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();
  void stop();

  bool is_running() const {
    return running_;
  }
  const std::string &host() const {
    return host_;
  }
  int port() const {
    return port_;
  }

  static std::pair<std::string, int> parse_host_port(const std::string &address);

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_ = 0;
  std::future<void> listener_;
  bool running_ = false;
};

}  // namespace askdoc_api
