#ifndef DCS_DAG_PROTO_NODE_HPP
#define DCS_DAG_PROTO_NODE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "dag/dag_error.hpp"

namespace dcs::dag {

// dag-pb wire tags (field number << 3 | wire type)
static constexpr uint8_t PB_NODE_DATA_TAG = 0x0a;   // PBNode.Data, field 1
static constexpr uint8_t PB_NODE_LINK_TAG = 0x12;   // PBNode.Links, field 2
static constexpr uint8_t PB_LINK_HASH_TAG = 0x0a;   // PBLink.Hash, field 1
static constexpr uint8_t PB_LINK_NAME_TAG = 0x12;   // PBLink.Name, field 2
static constexpr uint8_t PB_LINK_TSIZE_TAG = 0x18;  // PBLink.Tsize, field 3

// UnixFS Data message
static constexpr uint8_t UNIXFS_TYPE_TAG = 0x08;      // Type, field 1
static constexpr uint8_t UNIXFS_DATA_TAG = 0x12;      // Data, field 2
static constexpr uint8_t UNIXFS_FILESIZE_TAG = 0x18;  // filesize, field 3
static constexpr uint8_t UNIXFS_TYPE_FILE = 0x02;

struct PbLink {
    Bytes hash;          // binary CID of the child
    std::string name;    // omitted from the encoding when empty
    uint64_t tsize = 0;  // omitted from the encoding when zero
};

struct PbNode {
    std::vector<PbLink> links;
    std::optional<Bytes> data;
};

// ---- ENCODING ----
Bytes encode_link(const PbLink& link);
// Links are written before Data, as the canonical dag-pb form requires
Bytes encode_node(const PbNode& node);
// UnixFS "file" header with optional filesize
Bytes encode_unixfs_file(uint64_t file_size);

// ---- DECODING ----
PbNode decode_node(const Bytes& encoded);
// Returns the Data payload of a UnixFS message, if present
std::optional<Bytes> unixfs_payload(const Bytes& unixfs);

} // namespace dcs::dag

#endif // DCS_DAG_PROTO_NODE_HPP
