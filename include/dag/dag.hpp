#ifndef DCS_DAG_HPP
#define DCS_DAG_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include "cid/cid.hpp"
#include "common/types.hpp"
#include "dag/dag_error.hpp"

namespace dcs::dag {

// Info string for HKDF when a chunk payload is encrypted
static constexpr std::string_view DAG_ENCRYPTION_INFO = "dag_encryption";

struct Block {
  cid::Cid cid;
  Bytes data;
};

struct ChunkDag {
  cid::Cid cid;
  uint64_t raw_data_size = 0;   // bytes read from the source, before encryption
  uint64_t encoded_size = 0;    // serialized node size, or the block size for a single block
  std::vector<Block> blocks;
};

struct ChunkLink {
  cid::Cid cid;
  uint64_t raw_data_size = 0;
  uint64_t encoded_size = 0;
};

// ---- BLOCKS AND CHUNKS ----
// Raw-codec block over data
Block make_block(Bytes data);

// Cuts data into block_size pieces (the last may be shorter). When
// encryption_key is set the whole payload is sealed first and the sealed
// bytes are split.
std::vector<Block> split_into_blocks(const Bytes& data, size_t block_size,
                                     const std::optional<Bytes>& encryption_key = std::nullopt);

// Wraps blocks into a chunk. A single block is the chunk; more than one
// is linked from a dag-pb node whose CID becomes the chunk CID.
ChunkDag build_chunk(std::vector<Block> blocks);

// split_into_blocks + build_chunk, with raw_data_size set to data.size()
ChunkDag build_chunk_dag(const Bytes& data, size_t block_size,
                         const std::optional<Bytes>& encryption_key = std::nullopt);

// dag-pb node linking blocks in order, without a Data field
Bytes encode_chunk_node(const std::vector<Block>& blocks);

// ---- FILE ROOT ----
class DagRoot {
public:
  DagRoot() = default;

  void add_link(const cid::Cid& chunk_cid, uint64_t raw_data_size, uint64_t encoded_size);

  // Root CID over the links in insertion order. One link collapses to
  // that chunk's CID.
  cid::Cid build() const;
  // Serialized root node; throws EmptyInput without links
  Bytes encode() const;

  size_t link_count() const { return links_.size(); }
  uint64_t total_file_size() const { return total_file_size_; }

private:
  std::vector<ChunkLink> links_;
  uint64_t total_file_size_ = 0;
};

// Root CID for links already ordered by chunk index
cid::Cid build_root(const std::vector<ChunkLink>& links);

// ---- BLOCK PAYLOADS ----
// raw blocks are returned as-is; dag-pb blocks yield their UnixFS payload,
// falling back to the input when the node carries none
Bytes extract_block_data(const cid::Cid& block_cid, const Bytes& data);

std::optional<Block> block_by_cid(const std::vector<Block>& blocks, const cid::Cid& block_cid);

} // namespace dcs::dag

#endif // DCS_DAG_HPP
