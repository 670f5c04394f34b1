#ifndef BLOBSTORE_STORE_CONTENT_HASH_HPP
#define BLOBSTORE_STORE_CONTENT_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blobstore {
namespace store {

constexpr std::size_t MD5_DIGEST_SIZE = 16;

// Raw MD5 of a block, sent with each staged block so the service can reject
// a corrupted upload. Throws StoreError if OpenSSL fails.
std::vector<std::uint8_t> md5_digest(const std::uint8_t* data, std::size_t size);

} // namespace store
} // namespace blobstore

#endif // BLOBSTORE_STORE_CONTENT_HASH_HPP
