#include "scribe_api/server.hpp"

#include <iostream>

namespace scribe_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(static_cast<uint16_t>(port_)).bindaddr(host_).loglevel(crow::LogLevel::Warning).run();
  });
  std::cout << "[Api] Listening on " << host_ << ":" << port_ << std::endl;
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
}  // namespace scribe_api
