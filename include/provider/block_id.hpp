#ifndef BLOBSTORE_PROVIDER_BLOCK_ID_HPP
#define BLOBSTORE_PROVIDER_BLOCK_ID_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace blobstore {
namespace provider {

// Maps a 1-based chunk index to a block id: the index zero-padded to six
// digits, then base64 encoded. Equal width keeps the ids lexically ordered.
class BlockIdCodec {
public:
  static constexpr std::uint32_t INDEX_DIGITS = 6;
  static constexpr std::uint64_t MAX_INDEX = 999999;

  // Throws std::out_of_range for 0 or an index above MAX_INDEX
  static std::string encode(std::uint64_t index);
  // Block ids for indices 1..count, in commit order
  static std::vector<std::string> encode_range(std::uint64_t count);
};

} // namespace provider
} // namespace blobstore

#endif // BLOBSTORE_PROVIDER_BLOCK_ID_HPP
