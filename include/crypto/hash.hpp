#ifndef DCS_CRYPTO_HASH_HPP
#define DCS_CRYPTO_HASH_HPP

#include <string>
#include <string_view>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"

namespace dcs::crypto {

// ---- OPENSSL EVP DIGESTS ----
Hash32 sha256(const uint8_t* data, size_t size);
Bytes sha512(const uint8_t* data, size_t size);
Hash32 sha3_256(const uint8_t* data, size_t size);

// ---- KECCAK ----
// Original Keccak-256 (0x01 domain padding), not FIPS-202 SHA3-256
Hash32 keccak256(const uint8_t* data, size_t size);

inline Hash32 sha256(const Bytes& data) { return sha256(data.data(), data.size()); }
inline Bytes sha512(const Bytes& data) { return sha512(data.data(), data.size()); }
inline Hash32 sha3_256(const Bytes& data) { return sha3_256(data.data(), data.size()); }
inline Hash32 keccak256(const Bytes& data) { return keccak256(data.data(), data.size()); }

inline Hash32 keccak256(std::string_view text) {
    return keccak256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// HMAC-SHA256 used for deterministic signature nonces
Hash32 hmac_sha256(const uint8_t* key, size_t key_size, const uint8_t* data, size_t size);

} // namespace dcs::crypto

#endif // DCS_CRYPTO_HASH_HPP
