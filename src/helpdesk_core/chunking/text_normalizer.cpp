#include "helpdesk_core/chunking/text_normalizer.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>

#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

namespace {

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

}  // namespace

std::string repair_utf8(const std::string& raw) {
  std::string valid;
  valid.reserve(raw.size());
  utf8::replace_invalid(raw.begin(), raw.end(), std::back_inserter(valid));
  return valid;
}

std::string normalize_text(const std::string& raw_text) {
  const std::string valid = repair_utf8(raw_text);

  std::string out;
  out.reserve(valid.size());
  bool pending_space = false;
  for (char c : valid) {
    if (is_ascii_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::string compute_content_hash(const std::string& content) {
  std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> mdctx(EVP_MD_CTX_new());
  if (!mdctx) {
    throw HelpdeskError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HelpdeskError("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw HelpdeskError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw HelpdeskError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace helpdesk_core
