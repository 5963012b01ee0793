#include "scribe_core/services/compression_service.hpp"

#include <zstd.h>

#include <memory>

namespace scribe_core {

namespace {

struct CCtxDeleter {
  void operator()(ZSTD_CCtx *ctx) const {
    ZSTD_freeCCtx(ctx);
  }
};

struct DCtxDeleter {
  void operator()(ZSTD_DCtx *ctx) const {
    ZSTD_freeDCtx(ctx);
  }
};

std::string zstd_error(const char *operation, size_t code) {
  return std::string(operation) + " failed: " + ZSTD_getErrorName(code);
}

}  // namespace

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }

  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> ctx(ZSTD_createCCtx());
  if (!ctx) {
    throw CompressionError("Failed to allocate zstd compression context");
  }

  std::vector<char> frame(ZSTD_compressBound(data.size()));
  const size_t written = ZSTD_compressCCtx(ctx.get(), frame.data(), frame.size(), data.data(),
                                           data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError(zstd_error("ZSTD compression", written));
  }
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char> &frame) {
  if (frame.empty()) {
    return "";
  }

  const unsigned long long content_size = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Data is not a zstd frame with a known content size");
  }
  if (content_size > MAX_DECOMPRESSED_BYTES) {
    throw CompressionError("zstd frame claims " + std::to_string(content_size) +
                           " bytes, above the allowed maximum");
  }

  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx(ZSTD_createDCtx());
  if (!ctx) {
    throw CompressionError("Failed to allocate zstd decompression context");
  }

  std::string text(static_cast<size_t>(content_size), '\0');
  const size_t read =
      ZSTD_decompressDCtx(ctx.get(), text.data(), text.size(), frame.data(), frame.size());
  if (ZSTD_isError(read)) {
    throw CompressionError(zstd_error("ZSTD decompression", read));
  }
  if (read != text.size()) {
    throw CompressionError("ZSTD decompression produced a short frame");
  }
  return text;
}

}  // namespace scribe_core
