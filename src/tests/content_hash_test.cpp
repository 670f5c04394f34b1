#include <gtest/gtest.h>
#include <iomanip>
#include <sstream>
#include <string>
#include "store/content_hash.hpp"

using namespace blobstore::store;

namespace {

std::string md5_hex(const std::string& text) {
  auto digest = md5_digest(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
  std::stringstream ss;
  for (std::uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace

TEST(ContentHashTest, MatchesKnownDigests) {
  EXPECT_EQ(md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(md5_hex("The quick brown fox jumps over the lazy dog"), "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(ContentHashTest, DigestIsSixteenBytes) {
  std::string block(4096, 'x');
  auto digest = md5_digest(reinterpret_cast<const std::uint8_t*>(block.data()), block.size());
  EXPECT_EQ(digest.size(), MD5_DIGEST_SIZE);
}

TEST(ContentHashTest, DifferentBlocksHashDifferently) {
  EXPECT_NE(md5_hex("block one"), md5_hex("block two"));
}
