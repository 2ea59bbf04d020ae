#include "helpdesk_api/server.hpp"

#include <stdexcept>

namespace helpdesk_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).multithreaded().run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}

std::pair<std::string, int> parse_bind_address(const std::string &address) {
  std::string host_port = address;
  const auto scheme = host_port.find("://");
  if (scheme != std::string::npos) {
    host_port = host_port.substr(scheme + 3);
  }
  while (!host_port.empty() && host_port.back() == '/') {
    host_port.pop_back();
  }

  const auto colon = host_port.rfind(':');
  if (colon == std::string::npos) {
    return {host_port.empty() ? "127.0.0.1" : host_port, 8000};
  }

  const std::string port_str = host_port.substr(colon + 1);
  int port = 0;
  try {
    size_t consumed = 0;
    port = std::stoi(port_str, &consumed);
    if (consumed != port_str.size()) {
      throw std::invalid_argument(port_str);
    }
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid port in address: " + address);
  }
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Port out of range in address: " + address);
  }
  std::string host = host_port.substr(0, colon);
  return {host.empty() ? "127.0.0.1" : host, port};
}

}  // namespace helpdesk_api
