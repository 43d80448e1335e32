#include "askdoc_api/server.hpp"

#include <cstdint>
#include <tuple>

#include "askdoc_core/errors.hpp"

namespace askdoc_api {

Server::Server(const std::string &address) {
  std::tie(host_, port_) = parse_host_port(address);
}

Server::~Server() {
  stop();
}

std::pair<std::string, int> Server::parse_host_port(const std::string &address) {
  const size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
    throw askdoc_core::ConfigurationError("Expected host:port, got '" + address + "'");
  }
  const std::string port_text = address.substr(colon + 1);
  int port = 0;
  try {
    size_t consumed = 0;
    port = std::stoi(port_text, &consumed);
    if (consumed != port_text.size()) {
      throw std::invalid_argument(port_text);
    }
  } catch (const std::logic_error &) {
    throw askdoc_core::ConfigurationError("Invalid port in '" + address + "'");
  }
  if (port <= 0 || port > 65535) {
    throw askdoc_core::ConfigurationError("Port out of range in '" + address + "'");
  }
  return {address.substr(0, colon), port};
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.port(static_cast<std::uint16_t>(port_)).bindaddr(host_);
  listener_ = std::async(std::launch::async, [this] { app_.run(); });
  running_ = true;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (listener_.valid()) {
    listener_.get();
  }
  running_ = false;
}

}  // namespace askdoc_api
