#include "crypto/hash.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <memory>
#include <boost/log/trivial.hpp>

namespace dcs::crypto {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

// One-shot EVP digest into out, which must hold EVP_MD_size(md) bytes
void evp_digest(const EVP_MD* md, const uint8_t* data, size_t size, uint8_t* out) {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw HashError("failed to create hash context");
    }

    if (!EVP_DigestInit_ex(ctx.get(), md, nullptr)) {
        throw HashError("failed to initialize hash context");
    }

    if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
        throw HashError("failed to update hash");
    }

    unsigned int out_len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), out, &out_len)) {
        throw HashError("failed to finalize hash");
    }
}

} // namespace

Hash32 sha256(const uint8_t* data, size_t size) {
    Hash32 out{};
    evp_digest(EVP_sha256(), data, size, out.data());
    return out;
}

Bytes sha512(const uint8_t* data, size_t size) {
    Bytes out(64);
    evp_digest(EVP_sha512(), data, size, out.data());
    return out;
}

Hash32 sha3_256(const uint8_t* data, size_t size) {
    Hash32 out{};
    evp_digest(EVP_sha3_256(), data, size, out.data());
    return out;
}

Hash32 hmac_sha256(const uint8_t* key, size_t key_size, const uint8_t* data, size_t size) {
    Hash32 out{};
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha256(), key, static_cast<int>(key_size), data, size, out.data(), &out_len)) {
        BOOST_LOG_TRIVIAL(error) << "Hash: HMAC-SHA256 computation failed";
        throw HashError("failed to compute HMAC-SHA256");
    }
    return out;
}

} // namespace dcs::crypto
