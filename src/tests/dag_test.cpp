#include <gtest/gtest.h>
#include <string>
#include "crypto/cipher.hpp"
#include "dag/dag.hpp"
#include "dag/proto_node.hpp"
#include "encoding/hex.hpp"

using namespace dcs;
using namespace dcs::dag;
using dcs::encoding::to_hex;

class DagTest : public ::testing::Test {
protected:
  Bytes text(const std::string& s) { return Bytes(s.begin(), s.end()); }

  Bytes pattern(size_t size) {
    Bytes data(size);
    for (size_t i = 0; i < size; ++i) {
      data[i] = static_cast<uint8_t>((i * 7) ^ (i >> 8));
    }
    return data;
  }
};

TEST_F(DagTest, SplitCutsFixedSizeBlocks) {
  auto blocks = split_into_blocks(pattern(10), 4);

  ASSERT_EQ(blocks.size(), 3u);
  EXPECT_EQ(blocks[0].data.size(), 4u);
  EXPECT_EQ(blocks[1].data.size(), 4u);
  EXPECT_EQ(blocks[2].data.size(), 2u);
  for (const auto& block : blocks) {
    EXPECT_EQ(block.cid.codec(), cid::Codec::Raw);
    EXPECT_EQ(block.cid, cid::Cid::compute(block.data));
  }
}

TEST_F(DagTest, SplitRejectsBadInput) {
  EXPECT_THROW(split_into_blocks(Bytes(), 4), EmptyInput);
  EXPECT_THROW(split_into_blocks(pattern(8), 0), EncodingError);
  EXPECT_THROW(build_chunk({}), EmptyInput);
}

TEST_F(DagTest, SingleBlockChunkUsesBlockCid) {
  ChunkDag chunk = build_chunk_dag(text("hello world"), 1024);

  ASSERT_EQ(chunk.blocks.size(), 1u);
  EXPECT_EQ(chunk.cid.to_string(), "bafkreifzjut3te2nhyekklss27nh3k72ysco7y32koao5eei66wof36n5e");
  EXPECT_EQ(chunk.raw_data_size, 11u);
  EXPECT_EQ(chunk.encoded_size, 11u);
}

TEST_F(DagTest, MultiBlockChunkLinksBlocks) {
  ChunkDag chunk = build_chunk_dag(text("abcd"), 2);

  ASSERT_EQ(chunk.blocks.size(), 2u);
  EXPECT_EQ(chunk.cid.codec(), cid::Codec::DagPb);
  EXPECT_EQ(chunk.cid.to_string(), "bafybeifvr2alou24iyyf3netfnfov473wzk6u2vzn3yzl2kwpw3wcyczxu");
  EXPECT_EQ(chunk.encoded_size, 84u);
  EXPECT_EQ(chunk.raw_data_size, 4u);

  PbNode node = decode_node(encode_chunk_node(chunk.blocks));
  ASSERT_EQ(node.links.size(), 2u);
  EXPECT_EQ(node.links[0].hash, chunk.blocks[0].cid.bytes());
  EXPECT_EQ(node.links[1].tsize, 2u);
  EXPECT_FALSE(node.data.has_value());
}

TEST_F(DagTest, ChunkCidIsDeterministic) {
  Bytes data = pattern(5000);
  EXPECT_EQ(build_chunk_dag(data, 1024).cid, build_chunk_dag(data, 1024).cid);
  EXPECT_NE(build_chunk_dag(data, 1024).cid, build_chunk_dag(data, 512).cid);
}

TEST_F(DagTest, EncryptedChunkRecoversPlaintext) {
  Bytes key(crypto::Cipher::KEY_SIZE, 0x11);
  Bytes data = pattern(3000);

  ChunkDag chunk = build_chunk_dag(data, 1024, key);
  EXPECT_EQ(chunk.raw_data_size, data.size());

  Bytes sealed;
  for (const auto& block : chunk.blocks) {
    sealed.insert(sealed.end(), block.data.begin(), block.data.end());
  }
  ASSERT_EQ(sealed.size(), data.size() + crypto::Cipher::OVERHEAD);
  EXPECT_EQ(crypto::decrypt(key, sealed, DAG_ENCRYPTION_INFO), data);
}

TEST_F(DagTest, RootOverTwoChunks) {
  DagRoot root;
  root.add_link(cid::Cid::compute(text("ab")), 2, 2);
  root.add_link(cid::Cid::compute(text("cd")), 2, 2);

  EXPECT_EQ(root.link_count(), 2u);
  EXPECT_EQ(root.total_file_size(), 4u);
  EXPECT_EQ(to_hex(root.encode()),
            "12280a2401551220fb8e20fc2e4c3f248c60c39bd652f3c1347298bb977b8b4d5903b85055620603180212280a2401"
            "55122021e721c35a5823fdb452fa2f9f0a612c74fb952e06927489c6b27a43b817bed418020a0408021804");
  EXPECT_EQ(root.build().to_string(), "bafybeidx2effblqwghrg5xj3ei7u2nnpptwodmrxyyhx3ioiaa7odo4ksu");
}

TEST_F(DagTest, RootWithSingleChunkCollapses) {
  ChunkDag chunk = build_chunk_dag(pattern(4096), 1024);
  EXPECT_EQ(build_root({ChunkLink{chunk.cid, chunk.raw_data_size, chunk.encoded_size}}), chunk.cid);
}

TEST_F(DagTest, RootWithoutLinksThrows) {
  DagRoot root;
  EXPECT_THROW(root.build(), EmptyInput);
  EXPECT_THROW(root.encode(), EmptyInput);
  EXPECT_THROW(build_root({}), EmptyInput);
}

TEST_F(DagTest, RootDependsOnLinkOrder) {
  cid::Cid a = cid::Cid::compute(text("first"));
  cid::Cid b = cid::Cid::compute(text("second"));
  EXPECT_NE(build_root({{a, 5, 5}, {b, 6, 6}}), build_root({{b, 6, 6}, {a, 5, 5}}));
}

TEST_F(DagTest, ExtractBlockData) {
  Bytes data = text("payload");
  EXPECT_EQ(extract_block_data(cid::Cid::compute(data), data), data);

  Bytes unixfs{UNIXFS_TYPE_TAG, UNIXFS_TYPE_FILE, UNIXFS_DATA_TAG, 7};
  unixfs.insert(unixfs.end(), data.begin(), data.end());
  PbNode node;
  node.data = unixfs;
  Bytes encoded = encode_node(node);
  cid::Cid node_cid = cid::Cid::compute(encoded, cid::HashAlgorithm::Sha2_256, cid::Codec::DagPb);
  EXPECT_EQ(extract_block_data(node_cid, encoded), data);

  // A dag-pb block without a UnixFS payload comes back untouched
  Bytes chunk_node = encode_chunk_node(split_into_blocks(text("abcd"), 2));
  EXPECT_EQ(extract_block_data(node_cid, chunk_node), chunk_node);

  cid::Cid cbor = cid::Cid::compute(data, cid::HashAlgorithm::Sha2_256, cid::Codec::DagCbor);
  EXPECT_THROW(extract_block_data(cbor, data), EncodingError);
}

TEST_F(DagTest, BlockByCid) {
  auto blocks = split_into_blocks(pattern(100), 30);
  auto found = block_by_cid(blocks, blocks[2].cid);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->data, blocks[2].data);
  EXPECT_FALSE(block_by_cid(blocks, cid::Cid::compute(text("missing"))).has_value());
}

TEST_F(DagTest, ProtoNodeRejectsTruncation) {
  Bytes encoded = encode_chunk_node(split_into_blocks(text("abcd"), 2));
  encoded.resize(encoded.size() - 10);
  EXPECT_THROW(decode_node(encoded), EncodingError);
  EXPECT_THROW(encode_link(PbLink{}), EncodingError);
}
