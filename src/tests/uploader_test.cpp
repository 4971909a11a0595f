#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include "encoding/hex.hpp"
#include "ipc/contract_errors.hpp"
#include "ipc/storage_commitment.hpp"
#include "upload/uploader.hpp"

using namespace dcs;
using namespace dcs::upload;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class MockChainClient : public ipc::ChainClient {
public:
  MOCK_METHOD(uint64_t, chain_id, (), (const, override));
  MOCK_METHOD(Address, storage_address, (), (const, override));
  MOCK_METHOD(std::string, add_file_chunk, (const ipc::ChunkSubmission& chunk), (override));
  MOCK_METHOD(std::optional<ipc::Receipt>, transaction_receipt, (const std::string& tx_hash), (override));
  MOCK_METHOD(std::string, commit_file,
              (const Hash32& bucket_id, const std::string& file_name, uint64_t encoded_size,
               uint64_t raw_size, const Bytes& root_cid),
              (override));
};

class MockStorageNodeClient : public ipc::StorageNodeClient {
public:
  MOCK_METHOD(Hash32, node_id, (), (const, override));
  MOCK_METHOD(void, upload_block,
              (const Bytes& block_cid, const Bytes& data, const ipc::SignedCommitment& commitment),
              (override));
};

class UploaderTest : public ::testing::Test {
protected:
  NiceMock<MockChainClient> chain;
  NiceMock<MockStorageNodeClient> node;
  config::Config config;

  void SetUp() override {
    config.block_size = 64;
    config.max_blocks_in_chunk = 4;
    config.max_concurrency = 3;
    config.private_key = "ac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80";
    config.storage_contract_address = "0x4e7B1E9c3214C973Ff2fc680A9789E8579a5eD9d";
    config.retry_max_attempts = 2;
    config.retry_base_delay = 1ms;
    config.tx_poll_interval = 1ms;
    config.tx_timeout = 2000ms;

    ON_CALL(chain, transaction_receipt(_)).WillByDefault(Invoke([](const std::string& tx_hash) {
      return std::optional<ipc::Receipt>(ipc::Receipt{tx_hash, 1, true});
    }));
    ON_CALL(chain, add_file_chunk(_)).WillByDefault(Invoke([](const ipc::ChunkSubmission& chunk) {
      return "0xchunk" + std::to_string(chunk.chunk_index);
    }));
    ON_CALL(chain, commit_file(_, _, _, _, _)).WillByDefault(Return("0xcommit"));
    ON_CALL(node, node_id()).WillByDefault(Return(Hash32{}));
  }

  Bytes pattern(size_t size) {
    Bytes data(size);
    for (size_t i = 0; i < size; ++i) {
      data[i] = static_cast<uint8_t>((i * 131) >> 3);
    }
    return data;
  }

  std::string as_string(const Bytes& data) { return std::string(data.begin(), data.end()); }

  // Root over the chunks the uploader should produce for data
  cid::Cid expected_root(const Bytes& data) {
    ChunkBuilder builder(config);
    dag::DagRoot root;
    for (size_t offset = 0; offset < data.size(); offset += builder.read_size()) {
      size_t end = std::min(offset + builder.read_size(), data.size());
      dag::ChunkDag chunk = builder.build(Bytes(data.begin() + offset, data.begin() + end));
      root.add_link(chunk.cid, chunk.raw_data_size, chunk.encoded_size);
    }
    return root.build();
  }
};

TEST_F(UploaderTest, UploadsAllChunksAndCommits) {
  Bytes data = pattern(1000);
  std::istringstream input(as_string(data));
  cid::Cid root = expected_root(data);

  EXPECT_CALL(node, upload_block(_, _, _)).Times(16);
  EXPECT_CALL(chain, add_file_chunk(_)).Times(4);
  EXPECT_CALL(chain, commit_file(_, "file.bin", _, 1000u, root.bytes())).WillOnce(Return("0xcommit"));

  Uploader uploader(config, chain, node);
  FileMeta meta = uploader.upload("bucket", "file.bin", input);

  EXPECT_EQ(meta.root_cid, root);
  EXPECT_EQ(meta.raw_size, 1000u);
  EXPECT_EQ(meta.chunk_count, 4u);
  EXPECT_EQ(meta.commit_tx, "0xcommit");
  EXPECT_EQ(meta.file_name, "file.bin");
  EXPECT_EQ(meta.bucket_id, ipc::calculate_bucket_id("bucket", uploader.owner()));
}

TEST_F(UploaderTest, CommitmentsAreSignedByOwner) {
  std::istringstream input(as_string(pattern(300)));
  std::mutex mutex;
  std::set<std::pair<uint64_t, int>> seen;
  Uploader uploader(config, chain, node);
  const Address owner = uploader.owner();
  const Address contract = ipc::parse_address(config.storage_contract_address);

  EXPECT_CALL(node, upload_block(_, _, _))
      .WillRepeatedly(Invoke([&](const Bytes& block_cid, const Bytes& data, const ipc::SignedCommitment& c) {
        EXPECT_EQ(cid::Cid::from_bytes(block_cid), cid::Cid::compute(data));
        EXPECT_EQ(ipc::recover_block_signer(c.signature, contract, config.chain_id, c.data), owner);
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert({c.data.chunk_index, c.data.block_index});
      }));

  uploader.upload("bucket", "file.bin", input);

  // 256 + 44 bytes: four blocks in chunk 0 and one in chunk 1
  std::set<std::pair<uint64_t, int>> expected{{0, 0}, {0, 1}, {0, 2}, {0, 3}, {1, 0}};
  EXPECT_EQ(seen, expected);
  EXPECT_EQ(encoding::to_hex(owner), "f39fd6e51aad88f6f4ce6ab8827279cfffb92266");
}

TEST_F(UploaderTest, RejectsSmallFiles) {
  std::istringstream input(as_string(pattern(config::MIN_FILE_SIZE - 1)));
  EXPECT_CALL(node, upload_block(_, _, _)).Times(0);

  Uploader uploader(config, chain, node);
  EXPECT_THROW(uploader.upload("bucket", "small.bin", input), FileTooSmall);
}

TEST_F(UploaderTest, RejectsBadNames) {
  std::istringstream input(as_string(pattern(500)));
  Uploader uploader(config, chain, node);
  EXPECT_THROW(uploader.upload("ab", "file.bin", input), UploadError);
  EXPECT_THROW(uploader.upload("bucket", "", input), UploadError);
}

TEST_F(UploaderTest, RequiresKeyAndContract) {
  config::Config no_key = config;
  no_key.private_key.clear();
  EXPECT_THROW((Uploader{no_key, chain, node}), config::ConfigError);

  config::Config no_contract = config;
  no_contract.storage_contract_address.clear();
  EXPECT_THROW((Uploader{no_contract, chain, node}), config::ConfigError);
}

TEST_F(UploaderTest, RetriesTransientChunkSubmission) {
  std::istringstream input(as_string(pattern(200)));
  std::atomic<int> attempts{0};

  EXPECT_CALL(chain, add_file_chunk(_)).WillRepeatedly(Invoke([&](const ipc::ChunkSubmission& chunk) {
    if (attempts++ == 0) {
      throw std::runtime_error("nonce too low");
    }
    return "0xchunk" + std::to_string(chunk.chunk_index);
  }));

  Uploader uploader(config, chain, node);
  FileMeta meta = uploader.upload("bucket", "file.bin", input);
  EXPECT_EQ(attempts.load(), 2);
  EXPECT_EQ(meta.chunk_count, 1u);
}

TEST_F(UploaderTest, ContractRevertIsNotRetried) {
  std::istringstream input(as_string(pattern(200)));
  EXPECT_CALL(chain, add_file_chunk(_))
      .WillOnce(Invoke([](const ipc::ChunkSubmission&) -> std::string {
        throw std::runtime_error("execution reverted: 0x702cf740");
      }));
  EXPECT_CALL(chain, commit_file(_, _, _, _, _)).Times(0);

  Uploader uploader(config, chain, node);
  try {
    uploader.upload("bucket", "file.bin", input);
    FAIL() << "expected ContractError";
  } catch (const ipc::ContractError& e) {
    EXPECT_EQ(e.code(), ipc::ContractErrorCode::FileChunkDuplicate);
  }
}

TEST_F(UploaderTest, NodeFailureAbortsUpload) {
  std::istringstream input(as_string(pattern(1000)));
  EXPECT_CALL(node, upload_block(_, _, _)).WillRepeatedly(Invoke([](const Bytes&, const Bytes&, const ipc::SignedCommitment&) {
    throw std::runtime_error("node unavailable");
  }));
  EXPECT_CALL(chain, commit_file(_, _, _, _, _)).Times(0);

  Uploader uploader(config, chain, node);
  try {
    uploader.upload("bucket", "file.bin", input);
    FAIL() << "expected upload failure";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("node unavailable"), std::string::npos);
  }
}

TEST_F(UploaderTest, RevertedChunkTransactionFails) {
  std::istringstream input(as_string(pattern(200)));
  EXPECT_CALL(chain, transaction_receipt(_)).WillRepeatedly(Invoke([](const std::string& tx_hash) {
    return std::optional<ipc::Receipt>(ipc::Receipt{tx_hash, 1, false});
  }));

  Uploader uploader(config, chain, node);
  EXPECT_THROW(uploader.upload("bucket", "file.bin", input), ipc::TransactionFailed);
}

TEST_F(UploaderTest, ErasureCodedUpload) {
  config.data_shards = 4;
  config.parity_shards = 2;
  Bytes data = pattern(600);
  std::istringstream input(as_string(data));

  // 256-byte chunks: 256, 256, 88, each spread over four shard blocks
  EXPECT_CALL(node, upload_block(_, _, _)).Times(12);
  EXPECT_CALL(chain, commit_file(_, _, _, 600u, expected_root(data).bytes())).WillOnce(Return("0xcommit"));

  Uploader uploader(config, chain, node);
  EXPECT_TRUE(uploader.chunk_builder().erasure_coded());
  EXPECT_EQ(uploader.upload("bucket", "file.bin", input).chunk_count, 3u);
}
