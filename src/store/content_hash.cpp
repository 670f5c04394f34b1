#include "store/content_hash.hpp"
#include <openssl/evp.h>
#include "store/store_error.hpp"

namespace blobstore {
namespace store {

std::vector<std::uint8_t> md5_digest(const std::uint8_t* data, std::size_t size) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Content hash: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_md5(), nullptr)
      || !EVP_DigestUpdate(ctx, data, size)
      || !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Content hash: Failed to hash block");
  }

  EVP_MD_CTX_free(ctx);
  return std::vector<std::uint8_t>(hash, hash + hash_len);
}

} // namespace store
} // namespace blobstore
