#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace scribe_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Zstandard codec for chunk text stored in the index file.
 */
class CompressionService {
 public:
  // Frames claiming to expand beyond this are rejected as corrupt.
  static constexpr size_t MAX_DECOMPRESSED_BYTES = 64 * 1024 * 1024;

  /**
   * @brief Compresses text into a single zstd frame.
   * @param data The text to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The frame bytes; empty input yields an empty frame vector.
   * @throws CompressionError if zstd reports an error.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Restores text from a zstd frame produced by compress().
   * @throws CompressionError if the bytes are not a complete, sane zstd frame.
   */
  static std::string decompress(const std::vector<char> &frame);
};

}  // namespace scribe_core
