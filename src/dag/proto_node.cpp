#include "dag/proto_node.hpp"
#include "encoding/varint.hpp"

namespace dcs::dag {

namespace {

void put_length_delimited(Bytes& out, uint8_t tag, const uint8_t* data, size_t size) {
    out.push_back(tag);
    encoding::put_uvarint(out, size);
    out.insert(out.end(), data, data + size);
}

void put_length_delimited(Bytes& out, uint8_t tag, const Bytes& data) {
    put_length_delimited(out, tag, data.data(), data.size());
}

// Reads a length-delimited field body starting at offset
Bytes read_length_delimited(const Bytes& in, size_t& offset) {
    uint64_t length = encoding::read_uvarint(in, offset);
    if (length > in.size() - offset) {
        throw EncodingError("length-delimited field overruns buffer");
    }
    Bytes body(in.begin() + offset, in.begin() + offset + length);
    offset += length;
    return body;
}

void skip_field(const Bytes& in, size_t& offset, uint8_t wire_type) {
    switch (wire_type) {
        case 0:
            encoding::read_uvarint(in, offset);
            break;
        case 2:
            read_length_delimited(in, offset);
            break;
        default:
            throw EncodingError("unsupported wire type " + std::to_string(wire_type));
    }
}

PbLink decode_link(const Bytes& encoded) {
    PbLink link;
    size_t offset = 0;
    while (offset < encoded.size()) {
        uint8_t tag = encoded[offset++];
        switch (tag) {
            case PB_LINK_HASH_TAG:
                link.hash = read_length_delimited(encoded, offset);
                break;
            case PB_LINK_NAME_TAG: {
                Bytes name = read_length_delimited(encoded, offset);
                link.name.assign(name.begin(), name.end());
                break;
            }
            case PB_LINK_TSIZE_TAG:
                link.tsize = encoding::read_uvarint(encoded, offset);
                break;
            default:
                skip_field(encoded, offset, tag & 0x07);
        }
    }
    return link;
}

} // namespace

//==============================================
// ENCODING
//==============================================

Bytes encode_link(const PbLink& link) {
    if (link.hash.empty()) {
        throw EncodingError("link without a hash");
    }

    Bytes out;
    put_length_delimited(out, PB_LINK_HASH_TAG, link.hash);
    if (!link.name.empty()) {
        put_length_delimited(out, PB_LINK_NAME_TAG,
                             reinterpret_cast<const uint8_t*>(link.name.data()), link.name.size());
    }
    if (link.tsize > 0) {
        out.push_back(PB_LINK_TSIZE_TAG);
        encoding::put_uvarint(out, link.tsize);
    }
    return out;
}

Bytes encode_node(const PbNode& node) {
    Bytes out;
    for (const auto& link : node.links) {
        put_length_delimited(out, PB_NODE_LINK_TAG, encode_link(link));
    }
    if (node.data && !node.data->empty()) {
        put_length_delimited(out, PB_NODE_DATA_TAG, *node.data);
    }
    return out;
}

Bytes encode_unixfs_file(uint64_t file_size) {
    Bytes out{UNIXFS_TYPE_TAG, UNIXFS_TYPE_FILE};
    if (file_size > 0) {
        out.push_back(UNIXFS_FILESIZE_TAG);
        encoding::put_uvarint(out, file_size);
    }
    return out;
}

//==============================================
// DECODING
//==============================================

PbNode decode_node(const Bytes& encoded) {
    PbNode node;
    size_t offset = 0;
    try {
        while (offset < encoded.size()) {
            uint8_t tag = encoded[offset++];
            switch (tag) {
                case PB_NODE_LINK_TAG:
                    node.links.push_back(decode_link(read_length_delimited(encoded, offset)));
                    break;
                case PB_NODE_DATA_TAG:
                    node.data = read_length_delimited(encoded, offset);
                    break;
                default:
                    skip_field(encoded, offset, tag & 0x07);
            }
        }
    } catch (const encoding::DecodeError& e) {
        throw EncodingError(std::string("malformed dag-pb node: ") + e.what());
    }
    return node;
}

std::optional<Bytes> unixfs_payload(const Bytes& unixfs) {
    size_t offset = 0;
    try {
        while (offset < unixfs.size()) {
            uint8_t tag = unixfs[offset++];
            if (tag == UNIXFS_DATA_TAG) {
                return read_length_delimited(unixfs, offset);
            }
            skip_field(unixfs, offset, tag & 0x07);
        }
    } catch (const encoding::DecodeError& e) {
        throw EncodingError(std::string("malformed UnixFS data: ") + e.what());
    }
    return std::nullopt;
}

} // namespace dcs::dag
