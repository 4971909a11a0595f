#ifndef DCS_ENCODING_MULTIBASE_HPP
#define DCS_ENCODING_MULTIBASE_HPP

#include <string>
#include <string_view>
#include "common/types.hpp"
#include "encoding/encoding_error.hpp"

namespace dcs::encoding {

// Multibase prefixes understood by the CID codec
enum class Multibase : char {
    Base16 = 'f',
    Base32 = 'b',
    Base58Btc = 'z'
};

// ---- RAW ALPHABET ENCODERS ----
std::string base32_encode(const Bytes& data);  // RFC 4648 lowercase, no padding
Bytes base32_decode(std::string_view text);    // accepts either case
std::string base58_encode(const Bytes& data);  // Bitcoin alphabet
Bytes base58_decode(std::string_view text);

// ---- PREFIXED MULTIBASE ----
std::string multibase_encode(Multibase base, const Bytes& data);
// Splits off the prefix character; throws DecodeError on unknown prefixes
Bytes multibase_decode(std::string_view text, Multibase& base);

const char* multibase_name(Multibase base);

} // namespace dcs::encoding

#endif // DCS_ENCODING_MULTIBASE_HPP
