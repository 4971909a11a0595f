#ifndef DCS_CRYPTO_SECP256K1_HPP
#define DCS_CRYPTO_SECP256K1_HPP

#include <string>
#include <string_view>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"

namespace dcs::crypto {

static constexpr size_t SIGNATURE_SIZE = 65;         // r (32) | s (32) | v (1)
static constexpr size_t PUBLIC_KEY_SIZE = 65;        // 0x04 | x (32) | y (32)
static constexpr uint8_t RECOVERY_ID_OFFSET = 27;

class PrivateKey {
public:
  // Throws KeyError unless 0 < secret < n
  explicit PrivateKey(const Hash32& secret);

  // Accepts 64 hex characters with or without 0x
  static PrivateKey from_hex(std::string_view hex);

  const Hash32& secret() const { return secret_; }

  // Uncompressed SEC1 encoding
  Bytes public_key() const;
  Address address() const;

private:
  Hash32 secret_;
};

// Deterministic (RFC 6979, HMAC-SHA256) low-s signature over a 32-byte
// digest. v is the recovery id plus 27.
Bytes sign_recoverable(const PrivateKey& key, const Hash32& digest);

// Recovers the uncompressed public key that produced signature over digest.
// Throws SignatureError when the signature is structurally invalid.
Bytes recover_public_key(const Hash32& digest, const Bytes& signature);

// ---- ADDRESSES ----
Address public_key_to_address(const Bytes& public_key);
// EIP-55 mixed case with 0x prefix
std::string to_checksum_address(const Address& address);

} // namespace dcs::crypto

#endif // DCS_CRYPTO_SECP256K1_HPP
