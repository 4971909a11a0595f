#include "dag/dag.hpp"
#include "dag/proto_node.hpp"
#include "crypto/cipher.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dcs::dag {

namespace {

cid::Cid block_cid(const Bytes& data) {
  return cid::Cid::compute(data, cid::HashAlgorithm::Sha2_256, cid::Codec::Raw);
}

cid::Cid node_cid(const Bytes& node) {
  return cid::Cid::compute(node, cid::HashAlgorithm::Sha2_256, cid::Codec::DagPb);
}

} // namespace

//==============================================
// BLOCKS AND CHUNKS
//==============================================

Block make_block(Bytes data) {
  cid::Cid cid = block_cid(data);
  return Block{std::move(cid), std::move(data)};
}

std::vector<Block> split_into_blocks(const Bytes& data, size_t block_size,
                                     const std::optional<Bytes>& encryption_key) {
  if (data.empty()) {
    BOOST_LOG_TRIVIAL(error) << "DAG: Refusing to split empty data";
    throw EmptyInput("no data to split into blocks");
  }
  if (block_size == 0) {
    throw EncodingError("block size must be positive");
  }

  const Bytes* payload = &data;
  Bytes sealed;
  if (encryption_key && !encryption_key->empty()) {
    sealed = crypto::encrypt(*encryption_key, data, DAG_ENCRYPTION_INFO);
    payload = &sealed;
    BOOST_LOG_TRIVIAL(debug) << "DAG: Encrypted " << data.size() << " bytes into " << sealed.size();
  }

  std::vector<Block> blocks;
  blocks.reserve((payload->size() + block_size - 1) / block_size);
  for (size_t offset = 0; offset < payload->size(); offset += block_size) {
    size_t end = std::min(offset + block_size, payload->size());
    blocks.push_back(make_block(Bytes(payload->begin() + offset, payload->begin() + end)));
    BOOST_LOG_TRIVIAL(trace) << "DAG: Block " << blocks.size() - 1 << " (" << blocks.back().data.size()
                             << " bytes) " << blocks.back().cid;
  }

  BOOST_LOG_TRIVIAL(debug) << "DAG: Split " << payload->size() << " bytes into " << blocks.size() << " blocks";
  return blocks;
}

Bytes encode_chunk_node(const std::vector<Block>& blocks) {
  PbNode node;
  node.links.reserve(blocks.size());
  for (const auto& block : blocks) {
    node.links.push_back(PbLink{block.cid.bytes(), "", block.data.size()});
  }
  return encode_node(node);
}

ChunkDag build_chunk(std::vector<Block> blocks) {
  if (blocks.empty()) {
    BOOST_LOG_TRIVIAL(error) << "DAG: Cannot build a chunk without blocks";
    throw EmptyInput("no blocks to build a chunk from");
  }

  uint64_t raw_size = 0;
  for (const auto& block : blocks) {
    raw_size += block.data.size();
  }

  if (blocks.size() == 1) {
    ChunkDag chunk{blocks.front().cid, raw_size, blocks.front().data.size(), std::move(blocks)};
    BOOST_LOG_TRIVIAL(debug) << "DAG: Single-block chunk " << chunk.cid;
    return chunk;
  }

  Bytes node = encode_chunk_node(blocks);
  ChunkDag chunk{node_cid(node), raw_size, node.size(), std::move(blocks)};
  BOOST_LOG_TRIVIAL(debug) << "DAG: Chunk " << chunk.cid << " links " << chunk.blocks.size()
                           << " blocks, node size " << chunk.encoded_size;
  return chunk;
}

ChunkDag build_chunk_dag(const Bytes& data, size_t block_size,
                         const std::optional<Bytes>& encryption_key) {
  ChunkDag chunk = build_chunk(split_into_blocks(data, block_size, encryption_key));
  chunk.raw_data_size = data.size();
  return chunk;
}

//==============================================
// FILE ROOT
//==============================================

void DagRoot::add_link(const cid::Cid& chunk_cid, uint64_t raw_data_size, uint64_t encoded_size) {
  links_.push_back(ChunkLink{chunk_cid, raw_data_size, encoded_size});
  total_file_size_ += raw_data_size;
}

Bytes DagRoot::encode() const {
  if (links_.empty()) {
    throw EmptyInput("no chunks added");
  }

  PbNode node;
  node.links.reserve(links_.size());
  for (const auto& link : links_) {
    node.links.push_back(PbLink{link.cid.bytes(), "", link.encoded_size});
  }
  node.data = encode_unixfs_file(total_file_size_);
  return encode_node(node);
}

cid::Cid DagRoot::build() const {
  if (links_.empty()) {
    BOOST_LOG_TRIVIAL(error) << "DAG: Cannot build a root without chunk links";
    throw EmptyInput("no chunks added");
  }

  if (links_.size() == 1) {
    return links_.front().cid;
  }

  cid::Cid root = node_cid(encode());
  BOOST_LOG_TRIVIAL(info) << "DAG: Built root " << root << " over " << links_.size()
                          << " chunks (" << total_file_size_ << " bytes)";
  return root;
}

cid::Cid build_root(const std::vector<ChunkLink>& links) {
  DagRoot root;
  for (const auto& link : links) {
    root.add_link(link.cid, link.raw_data_size, link.encoded_size);
  }
  return root.build();
}

//==============================================
// BLOCK PAYLOADS
//==============================================

Bytes extract_block_data(const cid::Cid& block_cid, const Bytes& data) {
  switch (block_cid.codec()) {
    case cid::Codec::Raw:
      return data;
    case cid::Codec::DagPb: {
      PbNode node;
      std::optional<Bytes> payload;
      try {
        node = decode_node(data);
        if (node.data) {
          payload = unixfs_payload(*node.data);
        }
      } catch (const EncodingError& e) {
        BOOST_LOG_TRIVIAL(warning) << "DAG: Block " << block_cid << " is not a UnixFS node: " << e.what();
        return data;
      }
      return payload ? *payload : data;
    }
    default:
      throw EncodingError(std::string("unknown CID codec ") + cid::codec_name(block_cid.codec()));
  }
}

std::optional<Block> block_by_cid(const std::vector<Block>& blocks, const cid::Cid& block_cid) {
  auto it = std::find_if(blocks.begin(), blocks.end(),
                         [&](const Block& block) { return block.cid == block_cid; });
  if (it == blocks.end()) {
    return std::nullopt;
  }
  return *it;
}

} // namespace dcs::dag
