#include "provider/block_id.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace blobstore {
namespace provider {

std::string BlockIdCodec::encode(std::uint64_t index) {
  if (index == 0 || index > MAX_INDEX) {
    throw std::out_of_range("Block id: Index " + std::to_string(index)
                            + " is outside 1.." + std::to_string(MAX_INDEX));
  }

  std::ostringstream ss;
  ss << std::setw(INDEX_DIGITS) << std::setfill('0') << index;
  const std::string padded = ss.str();

  // Base64 output is 4 characters per 3 input bytes plus the terminator
  unsigned char encoded[4 * ((INDEX_DIGITS + 2) / 3) + 1];
  int length = EVP_EncodeBlock(encoded, reinterpret_cast<const unsigned char*>(padded.data()),
                               static_cast<int>(padded.size()));
  return std::string(reinterpret_cast<const char*>(encoded), static_cast<std::size_t>(length));
}

std::vector<std::string> BlockIdCodec::encode_range(std::uint64_t count) {
  if (count > MAX_INDEX) {
    throw std::out_of_range("Block id: Block count " + std::to_string(count)
                            + " exceeds " + std::to_string(MAX_INDEX));
  }

  std::vector<std::string> block_ids;
  block_ids.reserve(count);
  for (std::uint64_t index = 1; index <= count; ++index) {
    block_ids.push_back(encode(index));
  }
  return block_ids;
}

} // namespace provider
} // namespace blobstore
