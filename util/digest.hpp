#ifndef UTIL_DIGEST_HPP
#define UTIL_DIGEST_HPP

#include <memory>
#include <string>

#include "absl/strings/string_view.h"

struct evp_md_ctx_st;

namespace util {

// Incremental SHA-256, computed by libcrypto.
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  void Update(absl::string_view data);

  // Lowercase hex digest of everything passed to Update. The hasher cannot
  // be updated afterwards.
  std::string HexDigest();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

 private:
  struct ContextDeleter {
    void operator()(evp_md_ctx_st* context) const;
  };
  std::unique_ptr<evp_md_ctx_st, ContextDeleter> context_;
};

std::string Sha256Hex(absl::string_view data);

}  // namespace util

#endif
