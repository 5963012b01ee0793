#pragma once

#include <string>
#include <vector>

namespace scribe_core {

class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class GenerationGateway {
 public:
  virtual ~GenerationGateway() = default;

  // Up to variant_count distinct completions of the prompt.
  // @throws GenerationError
  virtual std::vector<std::string> generate(const std::string &prompt, size_t variant_count) = 0;

  virtual bool is_available() = 0;
};

}  // namespace scribe_core
