#include "encoding/multibase.hpp"
#include "encoding/hex.hpp"
#include <algorithm>
#include <array>

namespace dcs::encoding {

namespace {

constexpr char BASE32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base32_value(char c) {
    if (c >= 'a' && c <= 'z') return c - 'a';
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return c - '2' + 26;
    return -1;
}

const std::array<int8_t, 128>& base58_table() {
    static const std::array<int8_t, 128> table = [] {
        std::array<int8_t, 128> t{};
        t.fill(-1);
        for (int i = 0; i < 58; ++i) {
            t[static_cast<uint8_t>(BASE58_ALPHABET[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table;
}

} // namespace

//==============================================
// BASE32
//==============================================

std::string base32_encode(const Bytes& data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

Bytes base32_decode(std::string_view text) {
    Bytes out;
    out.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int value = base32_value(c);
        if (value < 0) {
            throw DecodeError("invalid base32 character");
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    // Leftover bits are padding and must be zero
    if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
        throw DecodeError("invalid base32 padding");
    }
    return out;
}

//==============================================
// BASE58
//==============================================

std::string base58_encode(const Bytes& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) ~ 1.37
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256u * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string out(zeros, '1');
    for (; it != digits.end(); ++it) {
        out.push_back(BASE58_ALPHABET[*it]);
    }
    return out;
}

Bytes base58_decode(std::string_view text) {
    const auto& table = base58_table();

    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c >= 128 || table[c] < 0) {
            throw DecodeError("invalid base58 character");
        }
        uint32_t carry = static_cast<uint32_t>(table[c]);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58u * (*it);
            *it = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    Bytes out(zeros, 0);
    out.insert(out.end(), it, bytes.end());
    return out;
}

//==============================================
// MULTIBASE
//==============================================

std::string multibase_encode(Multibase base, const Bytes& data) {
    std::string out(1, static_cast<char>(base));
    switch (base) {
        case Multibase::Base16:    out += to_hex(data); break;
        case Multibase::Base32:    out += base32_encode(data); break;
        case Multibase::Base58Btc: out += base58_encode(data); break;
    }
    return out;
}

Bytes multibase_decode(std::string_view text, Multibase& base) {
    if (text.empty()) {
        throw DecodeError("empty multibase string");
    }

    std::string_view body = text.substr(1);
    switch (text[0]) {
        case 'f':
            base = Multibase::Base16;
            return from_hex(body);
        case 'b':
            base = Multibase::Base32;
            return base32_decode(body);
        case 'z':
            base = Multibase::Base58Btc;
            return base58_decode(body);
        default:
            throw DecodeError(std::string("unsupported multibase prefix '") + text[0] + "'");
    }
}

const char* multibase_name(Multibase base) {
    switch (base) {
        case Multibase::Base16:    return "base16";
        case Multibase::Base32:    return "base32";
        case Multibase::Base58Btc: return "base58btc";
        default:                   return "unknown";
    }
}

} // namespace dcs::encoding
