#ifndef DCS_CRYPTO_CIPHER_HPP
#define DCS_CRYPTO_CIPHER_HPP

#include <array>
#include <memory>
#include <string_view>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"

namespace dcs::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-GCM payload cipher. Sealed output layout:
//   nonce (12) | ciphertext | tag (16)
class Cipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t NONCE_SIZE = 12;   // 96-bit GCM nonce
  static constexpr size_t TAG_SIZE = 16;     // 128-bit authentication tag
  static constexpr size_t OVERHEAD = NONCE_SIZE + TAG_SIZE;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Derives the working key from parent_key and info with HKDF-SHA256
  Cipher(const Bytes& parent_key, std::string_view info);
  ~Cipher();

  Cipher(const Cipher&) = delete;
  Cipher& operator=(const Cipher&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  Bytes encrypt(const Bytes& plaintext);
  Bytes decrypt(const Bytes& sealed);


  // ---- KEY DERIVATION ----
  static std::array<uint8_t, KEY_SIZE> derive_key(const Bytes& parent_key, std::string_view info);

private:
  // ---- PARAMETERS ----
  std::array<uint8_t, KEY_SIZE> key_;
  std::unique_ptr<CipherContext> context_;

  // Generates a fresh random nonce
  std::array<uint8_t, NONCE_SIZE> generate_nonce() const;
};

// Convenience wrappers used by the DAG builder
Bytes encrypt(const Bytes& key, const Bytes& plaintext, std::string_view info);
Bytes decrypt(const Bytes& key, const Bytes& sealed, std::string_view info);

} // namespace dcs::crypto

#endif // DCS_CRYPTO_CIPHER_HPP
