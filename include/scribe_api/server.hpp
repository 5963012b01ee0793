#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace scribe_api {
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server() = default;

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Runs the app on a background thread.
  void start();

  // Stops the app and waits for its thread.
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace scribe_api
