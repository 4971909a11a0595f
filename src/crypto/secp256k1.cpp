#include "crypto/secp256k1.hpp"
#include "crypto/hash.hpp"
#include "encoding/hex.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <algorithm>
#include <memory>
#include <boost/log/trivial.hpp>

namespace dcs::crypto {

namespace {

//=================================================
// RAII WRAPPERS FOR OPENSSL BIGNUM / EC OBJECTS
//=================================================

struct BnDeleter { void operator()(BIGNUM* bn) const { BN_clear_free(bn); } };
struct BnCtxDeleter { void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); } };
struct GroupDeleter { void operator()(EC_GROUP* group) const { EC_GROUP_free(group); } };
struct PointDeleter { void operator()(EC_POINT* point) const { EC_POINT_free(point); } };

using BigNum = std::unique_ptr<BIGNUM, BnDeleter>;
using BigNumCtx = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using Group = std::unique_ptr<EC_GROUP, GroupDeleter>;
using Point = std::unique_ptr<EC_POINT, PointDeleter>;

BigNum new_bn() {
  BigNum bn(BN_new());
  if (!bn) {
    throw CryptoError("secp256k1: Failed to allocate BIGNUM");
  }
  return bn;
}

BigNum bn_from_bytes(const uint8_t* data, size_t size) {
  BigNum bn(BN_bin2bn(data, static_cast<int>(size), nullptr));
  if (!bn) {
    throw CryptoError("secp256k1: Failed to convert bytes to BIGNUM");
  }
  return bn;
}

void bn_to_bytes32(const BIGNUM* bn, uint8_t* out) {
  if (BN_bn2binpad(bn, out, 32) != 32) {
    throw CryptoError("secp256k1: Failed to serialize BIGNUM");
  }
}

// Curve parameters, built per call: EC_GROUP is not safe to share
// across threads while its precomputation is lazily populated.
struct Curve {
  Group group;
  BigNumCtx ctx;
  BigNum order;
  BigNum half_order;
  BigNum field;

  Curve()
    : group(EC_GROUP_new_by_curve_name(NID_secp256k1))
    , ctx(BN_CTX_new())
    , order(new_bn())
    , half_order(new_bn())
    , field(new_bn()) {
    if (!group || !ctx) {
      throw CryptoError("secp256k1: Failed to initialize curve");
    }
    if (!EC_GROUP_get_order(group.get(), order.get(), ctx.get()) ||
        !BN_rshift1(half_order.get(), order.get()) ||
        !EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr, ctx.get())) {
      throw CryptoError("secp256k1: Failed to read curve parameters");
    }
  }

  Point new_point() const {
    Point point(EC_POINT_new(group.get()));
    if (!point) {
      throw CryptoError("secp256k1: Failed to allocate EC point");
    }
    return point;
  }

  Bytes encode_uncompressed(const EC_POINT* point) const {
    Bytes out(PUBLIC_KEY_SIZE);
    size_t written = EC_POINT_point2oct(group.get(), point, POINT_CONVERSION_UNCOMPRESSED,
                                        out.data(), out.size(), ctx.get());
    if (written != PUBLIC_KEY_SIZE) {
      throw CryptoError("secp256k1: Failed to encode public key");
    }
    return out;
  }
};

// RFC 6979 section 3.2 candidate generator with HMAC-SHA256
class NonceGenerator {
public:
  NonceGenerator(const Hash32& secret, const Hash32& digest_mod_n) {
    v_.fill(0x01);
    k_.fill(0x00);
    step(0x00, secret, digest_mod_n);
    step(0x01, secret, digest_mod_n);
  }

  Hash32 next() {
    if (started_) {
      Bytes data(v_.begin(), v_.end());
      data.push_back(0x00);
      k_ = hmac_sha256(k_.data(), k_.size(), data.data(), data.size());
      v_ = hmac_sha256(k_.data(), k_.size(), v_.data(), v_.size());
    }
    started_ = true;
    v_ = hmac_sha256(k_.data(), k_.size(), v_.data(), v_.size());
    return v_;
  }

  ~NonceGenerator() {
    std::fill(k_.begin(), k_.end(), 0);
    std::fill(v_.begin(), v_.end(), 0);
  }

private:
  Hash32 v_;
  Hash32 k_;
  bool started_ = false;

  void step(uint8_t marker, const Hash32& secret, const Hash32& digest) {
    Bytes data(v_.begin(), v_.end());
    data.push_back(marker);
    data.insert(data.end(), secret.begin(), secret.end());
    data.insert(data.end(), digest.begin(), digest.end());
    k_ = hmac_sha256(k_.data(), k_.size(), data.data(), data.size());
    v_ = hmac_sha256(k_.data(), k_.size(), v_.data(), v_.size());
  }
};

bool in_scalar_range(const BIGNUM* value, const BIGNUM* order) {
  return !BN_is_zero(value) && !BN_is_negative(value) && BN_cmp(value, order) < 0;
}

} // namespace

//==============================================
// PRIVATE KEY
//==============================================

PrivateKey::PrivateKey(const Hash32& secret) : secret_(secret) {
  Curve curve;
  auto d = bn_from_bytes(secret_.data(), secret_.size());
  if (!in_scalar_range(d.get(), curve.order.get())) {
    throw KeyError("private key out of range");
  }
}

PrivateKey PrivateKey::from_hex(std::string_view hex) {
  Bytes raw;
  try {
    raw = encoding::from_hex(hex);
  } catch (const encoding::DecodeError& e) {
    throw KeyError(std::string("private key is not valid hex: ") + e.what());
  }
  if (raw.size() != 32) {
    throw KeyError("private key must be 32 bytes");
  }

  Hash32 secret;
  std::copy(raw.begin(), raw.end(), secret.begin());
  std::fill(raw.begin(), raw.end(), 0);
  return PrivateKey(secret);
}

Bytes PrivateKey::public_key() const {
  Curve curve;
  auto d = bn_from_bytes(secret_.data(), secret_.size());
  auto q = curve.new_point();
  if (!EC_POINT_mul(curve.group.get(), q.get(), d.get(), nullptr, nullptr, curve.ctx.get())) {
    throw KeyError("failed to derive public key");
  }
  return curve.encode_uncompressed(q.get());
}

Address PrivateKey::address() const {
  return public_key_to_address(public_key());
}

//==============================================
// SIGNING
//==============================================

Bytes sign_recoverable(const PrivateKey& key, const Hash32& digest) {
  Curve curve;
  BN_CTX* ctx = curve.ctx.get();
  const BIGNUM* n = curve.order.get();

  auto d = bn_from_bytes(key.secret().data(), key.secret().size());
  auto z = bn_from_bytes(digest.data(), digest.size());
  if (!BN_nnmod(z.get(), z.get(), n, ctx)) {
    throw SignatureError("failed to reduce digest");
  }

  Hash32 z_bytes;
  bn_to_bytes32(z.get(), z_bytes.data());
  NonceGenerator nonces(key.secret(), z_bytes);

  auto r = new_bn();
  auto s = new_bn();
  auto x = new_bn();
  auto y = new_bn();
  auto k_inv = new_bn();
  auto rd = new_bn();
  auto point = curve.new_point();
  int recovery_id = 0;

  while (true) {
    Hash32 candidate = nonces.next();
    auto k = bn_from_bytes(candidate.data(), candidate.size());
    if (!in_scalar_range(k.get(), n)) {
      continue;
    }

    if (!EC_POINT_mul(curve.group.get(), point.get(), k.get(), nullptr, nullptr, ctx) ||
        !EC_POINT_get_affine_coordinates(curve.group.get(), point.get(), x.get(), y.get(), ctx)) {
      throw SignatureError("failed to compute nonce point");
    }

    if (!BN_nnmod(r.get(), x.get(), n, ctx)) {
      throw SignatureError("failed to reduce r");
    }
    if (BN_is_zero(r.get())) {
      continue;
    }

    // s = k^-1 * (z + r * d) mod n
    if (!BN_mod_inverse(k_inv.get(), k.get(), n, ctx) ||
        !BN_mod_mul(rd.get(), r.get(), d.get(), n, ctx) ||
        !BN_mod_add(s.get(), z.get(), rd.get(), n, ctx) ||
        !BN_mod_mul(s.get(), s.get(), k_inv.get(), n, ctx)) {
      throw SignatureError("failed to compute s");
    }
    if (BN_is_zero(s.get())) {
      continue;
    }

    recovery_id = (BN_is_odd(y.get()) ? 1 : 0) | (BN_cmp(x.get(), n) >= 0 ? 2 : 0);
    break;
  }

  // Low-s normalisation flips the parity of R
  if (BN_cmp(s.get(), curve.half_order.get()) > 0) {
    if (!BN_sub(s.get(), n, s.get())) {
      throw SignatureError("failed to normalise s");
    }
    recovery_id ^= 1;
  }

  Bytes signature(SIGNATURE_SIZE);
  bn_to_bytes32(r.get(), signature.data());
  bn_to_bytes32(s.get(), signature.data() + 32);
  signature[64] = static_cast<uint8_t>(RECOVERY_ID_OFFSET + recovery_id);

  BOOST_LOG_TRIVIAL(trace) << "secp256k1: Produced signature with recovery id " << recovery_id;
  return signature;
}

//==============================================
// RECOVERY
//==============================================

Bytes recover_public_key(const Hash32& digest, const Bytes& signature) {
  if (signature.size() != SIGNATURE_SIZE) {
    throw SignatureError("signature must be 65 bytes, got " + std::to_string(signature.size()));
  }

  int recovery_id = signature[64];
  if (recovery_id >= RECOVERY_ID_OFFSET) {
    recovery_id -= RECOVERY_ID_OFFSET;
  }
  if (recovery_id < 0 || recovery_id > 3) {
    throw SignatureError("invalid recovery id");
  }

  Curve curve;
  BN_CTX* ctx = curve.ctx.get();
  const BIGNUM* n = curve.order.get();

  auto r = bn_from_bytes(signature.data(), 32);
  auto s = bn_from_bytes(signature.data() + 32, 32);
  if (!in_scalar_range(r.get(), n) || !in_scalar_range(s.get(), n)) {
    throw SignatureError("signature scalar out of range");
  }

  // R.x = r (+ n when the x coordinate overflowed the group order)
  auto x = new_bn();
  if (!BN_copy(x.get(), r.get())) {
    throw SignatureError("failed to copy r");
  }
  if (recovery_id & 2) {
    if (!BN_add(x.get(), x.get(), n)) {
      throw SignatureError("failed to lift r");
    }
  }
  if (BN_cmp(x.get(), curve.field.get()) >= 0) {
    throw SignatureError("r does not map to a curve point");
  }

  auto big_r = curve.new_point();
  if (!EC_POINT_set_compressed_coordinates(curve.group.get(), big_r.get(), x.get(), recovery_id & 1, ctx)) {
    throw SignatureError("r does not map to a curve point");
  }

  // Q = r^-1 * (s * R - z * G)
  auto z = bn_from_bytes(digest.data(), digest.size());
  auto r_inv = new_bn();
  auto u1 = new_bn();
  auto u2 = new_bn();
  if (!BN_nnmod(z.get(), z.get(), n, ctx) ||
      !BN_mod_inverse(r_inv.get(), r.get(), n, ctx) ||
      !BN_mod_mul(u1.get(), z.get(), r_inv.get(), n, ctx) ||
      !BN_mod_sub(u1.get(), n, u1.get(), n, ctx) ||
      !BN_mod_mul(u2.get(), s.get(), r_inv.get(), n, ctx)) {
    throw SignatureError("failed to compute recovery scalars");
  }

  auto q = curve.new_point();
  if (!EC_POINT_mul(curve.group.get(), q.get(), u1.get(), big_r.get(), u2.get(), ctx)) {
    throw SignatureError("failed to compute public key point");
  }
  if (EC_POINT_is_at_infinity(curve.group.get(), q.get())) {
    throw SignatureError("recovered point at infinity");
  }

  return curve.encode_uncompressed(q.get());
}

//==============================================
// ADDRESSES
//==============================================

Address public_key_to_address(const Bytes& public_key) {
  if (public_key.size() != PUBLIC_KEY_SIZE || public_key[0] != 0x04) {
    throw KeyError("expected a 65-byte uncompressed public key");
  }

  Hash32 hash = keccak256(public_key.data() + 1, public_key.size() - 1);
  Address address;
  std::copy(hash.begin() + 12, hash.end(), address.begin());
  return address;
}

std::string to_checksum_address(const Address& address) {
  std::string lower = encoding::to_hex(address);
  Hash32 hash = keccak256(std::string_view(lower));

  std::string out = "0x";
  for (size_t i = 0; i < lower.size(); ++i) {
    uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
    char c = lower[i];
    if (c >= 'a' && c <= 'f' && nibble >= 8) {
      c = static_cast<char>(c - 'a' + 'A');
    }
    out.push_back(c);
  }
  return out;
}

} // namespace dcs::crypto
