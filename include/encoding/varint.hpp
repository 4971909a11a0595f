#ifndef DCS_ENCODING_VARINT_HPP
#define DCS_ENCODING_VARINT_HPP

#include <cstddef>
#include <cstdint>
#include "common/types.hpp"
#include "encoding/encoding_error.hpp"

namespace dcs::encoding {

// Unsigned LEB128: 7 bits per byte, least significant group first,
// continuation bit on every byte but the last.
static constexpr size_t MAX_VARINT_LENGTH = 10;

// Appends the varint encoding of value to out
void put_uvarint(Bytes& out, uint64_t value);

Bytes encode_uvarint(uint64_t value);

// Number of bytes encode_uvarint(value) produces
size_t uvarint_size(uint64_t value);

// Decodes a varint starting at data[offset] and advances offset past it.
// Throws DecodeError on truncated or overlong input.
uint64_t read_uvarint(const uint8_t* data, size_t size, size_t& offset);

inline uint64_t read_uvarint(const Bytes& data, size_t& offset) {
    return read_uvarint(data.data(), data.size(), offset);
}

} // namespace dcs::encoding

#endif // DCS_ENCODING_VARINT_HPP
