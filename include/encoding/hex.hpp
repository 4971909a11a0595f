#ifndef DCS_ENCODING_HEX_HPP
#define DCS_ENCODING_HEX_HPP

#include <string>
#include <string_view>
#include "common/types.hpp"
#include "encoding/encoding_error.hpp"

namespace dcs::encoding {

// Lowercase hex without prefix
std::string to_hex(const uint8_t* data, size_t size);

template <typename Container>
std::string to_hex(const Container& data) {
    return to_hex(data.data(), data.size());
}

// Accepts an optional "0x"/"0X" prefix and either letter case
Bytes from_hex(std::string_view text);

} // namespace dcs::encoding

#endif // DCS_ENCODING_HEX_HPP
