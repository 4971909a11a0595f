#include <gtest/gtest.h>
#include <string>
#include "config/config.hpp"
#include "crypto/cipher.hpp"
#include "upload/chunk_builder.hpp"

using namespace dcs;
using namespace dcs::config;

class ConfigTest : public ::testing::Test {
protected:
  Config config;

  Bytes pattern(size_t size) {
    Bytes data(size);
    for (size_t i = 0; i < size; ++i) {
      data[i] = static_cast<uint8_t>(i % 251);
    }
    return data;
  }
};

TEST_F(ConfigTest, DefaultsAreValid) {
  EXPECT_NO_THROW(config.validate());
  EXPECT_FALSE(config.erasure_enabled());
  EXPECT_EQ(config.chunk_size(), config.block_size * config.max_blocks_in_chunk);
}

TEST_F(ConfigTest, ErasureChunkSize) {
  config.block_size = 1000;
  config.data_shards = 4;
  config.parity_shards = 2;
  EXPECT_TRUE(config.erasure_enabled());
  EXPECT_EQ(config.chunk_size(), 4000u);
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, RejectsInconsistentFields) {
  Config c = config;
  c.block_size = 0;
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.max_blocks_in_chunk = MAX_BLOCKS_IN_CHUNK + 1;
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.data_shards = 4;
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.data_shards = 4;
  c.parity_shards = 128;
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.max_concurrency = 0;
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.retry_max_attempts = MAX_RETRY_ATTEMPTS + 1;
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.retry_max_attempts = MAX_RETRY_ATTEMPTS;
  EXPECT_NO_THROW(c.validate());

  c = config;
  c.retry_base_delay = std::chrono::milliseconds(-1);
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.storage_contract_address = "0x1234";
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.private_key = "not hex";
  EXPECT_THROW(c.validate(), ConfigError);

  c = config;
  c.encryption_key = std::string(62, 'a');
  EXPECT_THROW(c.validate(), ConfigError);
}

TEST_F(ConfigTest, SetOption) {
  set_option(config, "--block-size", "4096");
  set_option(config, "--max-blocks", "8");
  set_option(config, "--concurrency", "3");
  set_option(config, "--chain-id", "1");
  set_option(config, "--contract", "0x4e7B1E9c3214C973Ff2fc680A9789E8579a5eD9d");
  set_option(config, "--log-level", "debug");

  EXPECT_EQ(config.block_size, 4096u);
  EXPECT_EQ(config.max_blocks_in_chunk, 8u);
  EXPECT_EQ(config.max_concurrency, 3u);
  EXPECT_EQ(config.chain_id, 1u);
  EXPECT_EQ(config.log_level, logger::severity_level::debug);
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, SetOptionErrors) {
  EXPECT_THROW(set_option(config, "--unknown", "1"), ConfigError);
  EXPECT_THROW(set_option(config, "--block-size", "12abc"), ConfigError);
  EXPECT_THROW(set_option(config, "--block-size", "-1"), ConfigError);
  EXPECT_THROW(set_option(config, "--block-size", ""), ConfigError);
  EXPECT_THROW(set_option(config, "--log-level", "loud"), ConfigError);
}

TEST_F(ConfigTest, ChunkBuilderPlain) {
  config.block_size = 100;
  config.max_blocks_in_chunk = 4;
  upload::ChunkBuilder builder(config);

  EXPECT_FALSE(builder.encrypted());
  EXPECT_FALSE(builder.erasure_coded());
  EXPECT_EQ(builder.read_size(), 400u);

  dag::ChunkDag chunk = builder.build(pattern(350));
  EXPECT_EQ(chunk.blocks.size(), 4u);
  EXPECT_EQ(chunk.raw_data_size, 350u);
}

TEST_F(ConfigTest, ChunkBuilderEncrypted) {
  config.block_size = 100;
  config.max_blocks_in_chunk = 4;
  config.encryption_key = std::string(64, '7');
  upload::ChunkBuilder builder(config);

  EXPECT_TRUE(builder.encrypted());
  EXPECT_EQ(builder.read_size(), 400u - ENCRYPTION_OVERHEAD);

  Bytes payload = pattern(builder.read_size());
  dag::ChunkDag chunk = builder.build(payload);
  EXPECT_EQ(chunk.blocks.size(), 4u);
  EXPECT_EQ(chunk.blocks.back().data.size(), 100u);
  EXPECT_EQ(chunk.raw_data_size, payload.size());
}

TEST_F(ConfigTest, ChunkBuilderErasureCoded) {
  config.block_size = 64;
  config.data_shards = 4;
  config.parity_shards = 2;
  upload::ChunkBuilder builder(config);

  EXPECT_TRUE(builder.erasure_coded());
  EXPECT_EQ(builder.read_size(), 256u);

  Bytes payload = pattern(256);
  dag::ChunkDag chunk = builder.build(payload);
  ASSERT_EQ(chunk.blocks.size(), 4u);
  EXPECT_EQ(chunk.raw_data_size, 256u);

  std::vector<Bytes> shards;
  for (const auto& block : chunk.blocks) {
    shards.push_back(block.data);
  }
  erasure::ErasureCode coder(4, 2);
  EXPECT_TRUE(coder.verify(shards));
  EXPECT_EQ(coder.extract_data(shards, payload.size()), payload);
}

TEST_F(ConfigTest, ChunkBuilderEncryptedErasure) {
  config.block_size = 64;
  config.data_shards = 3;
  config.parity_shards = 1;
  config.encryption_key = std::string(64, 'a');
  upload::ChunkBuilder builder(config);

  Bytes payload = pattern(builder.read_size());
  dag::ChunkDag chunk = builder.build(payload);

  std::vector<Bytes> shards;
  for (const auto& block : chunk.blocks) {
    shards.push_back(block.data);
  }
  erasure::ErasureCode coder(3, 1);
  Bytes sealed = coder.extract_data(shards, payload.size() + ENCRYPTION_OVERHEAD);
  Bytes key(crypto::Cipher::KEY_SIZE, 0xaa);
  EXPECT_EQ(crypto::decrypt(key, sealed, dag::DAG_ENCRYPTION_INFO), payload);

  EXPECT_THROW(builder.build(Bytes()), dag::EmptyInput);
}
