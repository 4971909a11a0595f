#include "crypto/cipher.hpp"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dcs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

namespace {

struct PkeyContextDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Cipher::Cipher(const Bytes& parent_key, std::string_view info)
  : key_(derive_key(parent_key, info))
  , context_(std::make_unique<CipherContext>()) {
  BOOST_LOG_TRIVIAL(debug) << "Cipher: Initialized AES-256-GCM cipher for info '" << info << "'";
}

Cipher::~Cipher() {
  std::fill(key_.begin(), key_.end(), 0);
}

//==============================================
// KEY DERIVATION
//==============================================

std::array<uint8_t, Cipher::KEY_SIZE> Cipher::derive_key(const Bytes& parent_key, std::string_view info) {
  if (parent_key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Invalid key size: " << parent_key.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }

  std::unique_ptr<EVP_PKEY_CTX, PkeyContextDeleter> pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!pctx) {
    throw InitializationError("Cipher: Failed to create HKDF context");
  }

  std::array<uint8_t, KEY_SIZE> derived{};
  size_t out_len = derived.size();
  if (EVP_PKEY_derive_init(pctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), parent_key.data(), static_cast<int>(parent_key.size())) <= 0 ||
      EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                  static_cast<int>(info.size())) <= 0 ||
      EVP_PKEY_derive(pctx.get(), derived.data(), &out_len) <= 0) {
    throw InitializationError("Cipher: HKDF key derivation failed");
  }

  return derived;
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

Bytes Cipher::encrypt(const Bytes& plaintext) {
  BOOST_LOG_TRIVIAL(debug) << "Cipher: Encrypting " << plaintext.size() << " bytes";

  auto nonce = generate_nonce();
  EVP_CIPHER_CTX_reset(context_->get());

  if (!EVP_EncryptInit_ex(context_->get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) ||
      !EVP_EncryptInit_ex(context_->get(), nullptr, nullptr, key_.data(), nonce.data())) {
    throw EncryptionError("Cipher: Failed to initialize encryption context");
  }

  Bytes sealed(NONCE_SIZE + plaintext.size() + TAG_SIZE);
  std::copy(nonce.begin(), nonce.end(), sealed.begin());

  int outlen = 0;
  if (!plaintext.empty() &&
      !EVP_EncryptUpdate(context_->get(), sealed.data() + NONCE_SIZE, &outlen,
                         plaintext.data(), static_cast<int>(plaintext.size()))) {
    throw EncryptionError("Cipher: Failed to encrypt data");
  }

  int final_len = 0;
  if (!EVP_EncryptFinal_ex(context_->get(), sealed.data() + NONCE_SIZE + outlen, &final_len)) {
    throw EncryptionError("Cipher: Failed to finalize encryption");
  }

  if (!EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE,
                           sealed.data() + NONCE_SIZE + plaintext.size())) {
    throw EncryptionError("Cipher: Failed to read authentication tag");
  }

  BOOST_LOG_TRIVIAL(trace) << "Cipher: Sealed payload is " << sealed.size() << " bytes";
  return sealed;
}

Bytes Cipher::decrypt(const Bytes& sealed) {
  BOOST_LOG_TRIVIAL(debug) << "Cipher: Decrypting " << sealed.size() << " bytes";

  if (sealed.size() < OVERHEAD) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Sealed payload shorter than " << OVERHEAD << " bytes";
    throw DecryptionError("Cipher: Sealed payload too short");
  }

  const size_t cipher_size = sealed.size() - OVERHEAD;
  const uint8_t* nonce = sealed.data();
  const uint8_t* ciphertext = sealed.data() + NONCE_SIZE;
  Bytes tag(sealed.end() - TAG_SIZE, sealed.end());

  EVP_CIPHER_CTX_reset(context_->get());
  if (!EVP_DecryptInit_ex(context_->get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) ||
      !EVP_DecryptInit_ex(context_->get(), nullptr, nullptr, key_.data(), nonce)) {
    throw DecryptionError("Cipher: Failed to initialize decryption context");
  }

  Bytes plaintext(cipher_size);
  int outlen = 0;
  if (cipher_size > 0 &&
      !EVP_DecryptUpdate(context_->get(), plaintext.data(), &outlen,
                         ciphertext, static_cast<int>(cipher_size))) {
    throw DecryptionError("Cipher: Failed to decrypt data");
  }

  if (!EVP_CIPHER_CTX_ctrl(context_->get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag.data())) {
    throw DecryptionError("Cipher: Failed to set authentication tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(context_->get(), plaintext.data() + outlen, &final_len) <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Authentication failed for sealed payload";
    throw DecryptionError("Cipher: Authentication failed");
  }

  return plaintext;
}

//==============================================
// NONCE GENERATION
//==============================================

std::array<uint8_t, Cipher::NONCE_SIZE> Cipher::generate_nonce() const {
  std::array<uint8_t, NONCE_SIZE> nonce;
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw EncryptionError("Cipher: Failed to generate random nonce");
  }
  return nonce;
}

//==============================================
// CONVENIENCE WRAPPERS
//==============================================

Bytes encrypt(const Bytes& key, const Bytes& plaintext, std::string_view info) {
  Cipher cipher(key, info);
  return cipher.encrypt(plaintext);
}

Bytes decrypt(const Bytes& key, const Bytes& sealed, std::string_view info) {
  Cipher cipher(key, info);
  return cipher.decrypt(sealed);
}

} // namespace dcs::crypto
