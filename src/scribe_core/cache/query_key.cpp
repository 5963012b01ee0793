#include "scribe_core/cache/query_key.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace scribe_core {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

std::string sha256_hex(const std::string &content) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> mdctx(EVP_MD_CTX_new());
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw std::runtime_error("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string normalize_query(const std::string &query) {
  std::string out;
  out.reserve(query.size());
  bool pending_space = false;
  for (unsigned char c : query) {
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

std::string make_query_key(const std::string &query) {
  return sha256_hex(normalize_query(query));
}

}  // namespace scribe_core
