#pragma once

#include <string>
#include <vector>

namespace scribe_core {

// The embedding backend could not produce a vector.
class EmbeddingUnavailableError : public std::exception {
 public:
  explicit EmbeddingUnavailableError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class EmbeddingGateway {
 public:
  virtual ~EmbeddingGateway() = default;

  // @throws EmbeddingUnavailableError
  virtual std::vector<float> embed(const std::string &text) = 0;
};

}  // namespace scribe_core
