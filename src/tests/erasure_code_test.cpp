#include <gtest/gtest.h>
#include <utility>
#include <vector>
#include "erasure/erasure_code.hpp"

using namespace dcs;
using namespace dcs::erasure;

class ErasureCodeTest : public ::testing::Test {
protected:
  ErasureCode coder{4, 2};

  Bytes pattern(size_t size) {
    Bytes data(size);
    for (size_t i = 0; i < size; ++i) {
      data[i] = static_cast<uint8_t>((i * 29) ^ 0x3c);
    }
    return data;
  }
};

TEST_F(ErasureCodeTest, ShardCounts) {
  EXPECT_EQ(coder.data_shards(), 4u);
  EXPECT_EQ(coder.parity_shards(), 2u);
  EXPECT_EQ(coder.total_shards(), 6u);
}

TEST_F(ErasureCodeTest, EncodeProducesEqualShards) {
  // 10 bytes over 4 shards: pieces of 3, 3, 2, 2 padded to 3
  auto shards = coder.encode(pattern(10));
  ASSERT_EQ(shards.size(), 4u);
  for (const auto& shard : shards) {
    EXPECT_EQ(shard.size(), 3u + 4u);
  }
  EXPECT_EQ(shards[2][2], 0);
  EXPECT_EQ(shards[3][2], 0);
  EXPECT_TRUE(coder.verify(shards));
}

TEST_F(ErasureCodeTest, ExtractIntactShards) {
  Bytes data = pattern(1000);
  auto shards = coder.encode(data);
  EXPECT_EQ(coder.extract_data(shards, data.size()), data);
}

TEST_F(ErasureCodeTest, ExtractTruncatesPadding) {
  Bytes data = pattern(13);
  EXPECT_EQ(coder.extract_data(coder.encode(data), data.size()), data);
}

TEST_F(ErasureCodeTest, RoundTripsEveryLengthAndLayout) {
  const std::vector<std::pair<size_t, size_t>> layouts = {{1, 1}, {2, 1}, {3, 2}, {4, 2}, {5, 3}, {10, 4}};
  for (const auto& [data_shards, parity_shards] : layouts) {
    ErasureCode layout_coder(data_shards, parity_shards);
    for (size_t size = 1; size <= 64; ++size) {
      Bytes data = pattern(size);
      EXPECT_EQ(layout_coder.extract_data(layout_coder.encode(data), size), data)
          << data_shards << "+" << parity_shards << " shards, " << size << " bytes";
    }
  }
}

TEST_F(ErasureCodeTest, RoundTripsAcrossCodewordBoundary) {
  // Pieces of 250..253 bytes straddle the 251-byte message block of 2 * 2 parity symbols
  for (size_t size = 4 * 249; size <= 4 * 254 + 3; ++size) {
    Bytes data = pattern(size);
    EXPECT_EQ(coder.extract_data(coder.encode(data), size), data) << size << " bytes";
  }
  Bytes data = pattern(3001);
  EXPECT_EQ(coder.extract_data(coder.encode(data), data.size()), data);
}

TEST_F(ErasureCodeTest, RoundTripsLargePayload) {
  Bytes data = pattern(2 * 1024 * 1024 + 3);
  auto shards = coder.encode(data);
  shards[1][7] ^= 0x5a;
  EXPECT_EQ(coder.extract_data(shards, data.size()), data);
}

TEST_F(ErasureCodeTest, RepairsCorruptedShards) {
  Bytes data = pattern(500);
  auto shards = coder.encode(data);

  shards[0][10] ^= 0xff;
  shards[2][0] ^= 0x01;
  shards[3][shards[3].size() - 1] ^= 0x80;
  EXPECT_FALSE(coder.verify(shards));

  auto repaired = coder.reconstruct(shards);
  EXPECT_TRUE(coder.verify(repaired));
  EXPECT_EQ(repaired, coder.encode(data));
  EXPECT_EQ(coder.extract_data(shards, data.size()), data);
}

TEST_F(ErasureCodeTest, UnrecoverableShardIsZeroFilled) {
  Bytes data = pattern(40);
  auto shards = coder.encode(data);
  for (auto& byte : shards[1]) {
    byte ^= 0x77;
  }

  auto repaired = coder.reconstruct(shards);
  ASSERT_EQ(repaired[1].size(), shards[1].size());
  EXPECT_EQ(repaired[1], Bytes(shards[1].size(), 0));
  EXPECT_EQ(repaired[0], shards[0]);

  Bytes extracted = coder.extract_data(shards, data.size());
  EXPECT_EQ(extracted.size(), data.size());
  EXPECT_NE(extracted, data);
}

TEST_F(ErasureCodeTest, RejectsBadConfiguration) {
  EXPECT_THROW(ErasureCode(0, 2), InvalidShardConfig);
  EXPECT_THROW(ErasureCode(4, 0), InvalidShardConfig);
  EXPECT_THROW(ErasureCode(4, 128), InvalidShardConfig);
  EXPECT_NO_THROW(ErasureCode(4, 127));
}

TEST_F(ErasureCodeTest, RejectsBadInput) {
  EXPECT_THROW(coder.encode(Bytes()), ErasureError);

  auto shards = coder.encode(pattern(100));
  EXPECT_THROW(coder.extract_data(shards, 200), InvalidShardConfig);
  shards.pop_back();
  EXPECT_THROW(coder.extract_data(shards, 100), InvalidShardConfig);
}
