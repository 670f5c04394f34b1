#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include "provider/block_id.hpp"

using namespace blobstore::provider;

TEST(BlockIdTest, EncodesKnownIndices) {
  EXPECT_EQ(BlockIdCodec::encode(1), "MDAwMDAx");
  EXPECT_EQ(BlockIdCodec::encode(10), "MDAwMDEw");
  EXPECT_EQ(BlockIdCodec::encode(12), "MDAwMDEy");
  EXPECT_EQ(BlockIdCodec::encode(999999), "OTk5OTk5");
}

TEST(BlockIdTest, AllIdsHaveTheSameLength) {
  for (std::uint64_t index : {1ULL, 9ULL, 99ULL, 12345ULL, 999999ULL}) {
    EXPECT_EQ(BlockIdCodec::encode(index).size(), 8u) << "index " << index;
  }
}

TEST(BlockIdTest, DistinctIndicesGiveDistinctIds) {
  std::set<std::string> ids;
  for (std::uint64_t index = 1; index <= 5000; ++index) {
    ids.insert(BlockIdCodec::encode(index));
  }
  EXPECT_EQ(ids.size(), 5000u);
}

TEST(BlockIdTest, RejectsIndicesOutsideRange) {
  EXPECT_THROW(BlockIdCodec::encode(0), std::out_of_range);
  EXPECT_THROW(BlockIdCodec::encode(1000000), std::out_of_range);
}

TEST(BlockIdTest, EncodeRangeListsIdsInOrder) {
  auto ids = BlockIdCodec::encode_range(3);
  ASSERT_EQ(ids.size(), 3u);
  EXPECT_EQ(ids[0], BlockIdCodec::encode(1));
  EXPECT_EQ(ids[1], BlockIdCodec::encode(2));
  EXPECT_EQ(ids[2], BlockIdCodec::encode(3));

  EXPECT_TRUE(BlockIdCodec::encode_range(0).empty());
  EXPECT_THROW(BlockIdCodec::encode_range(1000000), std::out_of_range);
}
