#include "encoding/varint.hpp"

namespace dcs::encoding {

void put_uvarint(Bytes& out, uint64_t value) {
    while (value > 0x7F) {
        out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

Bytes encode_uvarint(uint64_t value) {
    Bytes out;
    out.reserve(uvarint_size(value));
    put_uvarint(out, value);
    return out;
}

size_t uvarint_size(uint64_t value) {
    size_t size = 1;
    while (value > 0x7F) {
        value >>= 7;
        ++size;
    }
    return size;
}

uint64_t read_uvarint(const uint8_t* data, size_t size, size_t& offset) {
    uint64_t result = 0;
    unsigned shift = 0;

    for (size_t i = 0; i < MAX_VARINT_LENGTH; ++i) {
        if (offset >= size) {
            throw DecodeError("truncated varint");
        }
        uint8_t byte = data[offset++];

        // The tenth byte may only carry the single remaining bit
        if (i == MAX_VARINT_LENGTH - 1 && byte > 0x01) {
            throw DecodeError("varint overflows 64 bits");
        }

        result |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) {
            return result;
        }
        shift += 7;
    }

    throw DecodeError("varint too long");
}

} // namespace dcs::encoding
