#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace scribe_core {

class OnlineSearchError : public std::exception {
 public:
  explicit OnlineSearchError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct OnlineHit {
  std::string text;
  float score = 0.0f;
  std::string attribution;
};

class OnlineSearchGateway {
 public:
  virtual ~OnlineSearchGateway() = default;

  // Must give up once timeout has elapsed.
  // @throws OnlineSearchError on failure or timeout.
  virtual std::vector<OnlineHit> search(const std::string &query,
                                        size_t max_results,
                                        std::chrono::milliseconds timeout) = 0;
};

}  // namespace scribe_core
