#include <gtest/gtest.h>
#include <string>
#include "crypto/hash.hpp"
#include "crypto/secp256k1.hpp"
#include "encoding/hex.hpp"

using namespace dcs;
using namespace dcs::crypto;
using dcs::encoding::to_hex;

class Secp256k1Test : public ::testing::Test {
protected:
  // Well-known development account keys
  const std::string key_hex = "ac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80";
  const std::string second_key_hex = "0x59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d";

  Hash32 digest_of(const std::string& text) {
    return keccak256(text);
  }
};

TEST_F(Secp256k1Test, DerivesKnownAddress) {
  PrivateKey key = PrivateKey::from_hex(key_hex);
  EXPECT_EQ(to_hex(key.address()), "f39fd6e51aad88f6f4ce6ab8827279cfffb92266");

  PrivateKey second = PrivateKey::from_hex(second_key_hex);
  EXPECT_EQ(to_hex(second.address()), "70997970c51812dc3a010c7d01b50e0d17dc79c8");
}

TEST_F(Secp256k1Test, PublicKeyIsUncompressed) {
  Bytes public_key = PrivateKey::from_hex(key_hex).public_key();
  ASSERT_EQ(public_key.size(), PUBLIC_KEY_SIZE);
  EXPECT_EQ(public_key[0], 0x04);
}

TEST_F(Secp256k1Test, ChecksumAddress) {
  PrivateKey key = PrivateKey::from_hex(key_hex);
  EXPECT_EQ(to_checksum_address(key.address()), "0xf39Fd6e51aad88F6F4ce6aB8827279cffFb92266");
}

TEST_F(Secp256k1Test, SignatureIsDeterministic) {
  PrivateKey key = PrivateKey::from_hex(key_hex);
  Hash32 digest = digest_of("message");

  Bytes first = sign_recoverable(key, digest);
  Bytes second = sign_recoverable(key, digest);

  ASSERT_EQ(first.size(), SIGNATURE_SIZE);
  EXPECT_EQ(first, second);
  EXPECT_TRUE(first[64] == 27 || first[64] == 28) << "v = " << static_cast<int>(first[64]);
}

TEST_F(Secp256k1Test, SignatureHasLowS) {
  PrivateKey key = PrivateKey::from_hex(key_hex);
  for (int i = 0; i < 16; ++i) {
    Bytes signature = sign_recoverable(key, digest_of("low-s " + std::to_string(i)));
    // n/2 starts with 0x7fffffff...5d576e73...
    EXPECT_LT(signature[32], 0x80) << "s not normalised for message " << i;
  }
}

TEST_F(Secp256k1Test, RecoverMatchesSigner) {
  PrivateKey key = PrivateKey::from_hex(second_key_hex);
  for (int i = 0; i < 8; ++i) {
    Hash32 digest = digest_of("recover " + std::to_string(i));
    Bytes signature = sign_recoverable(key, digest);
    EXPECT_EQ(public_key_to_address(recover_public_key(digest, signature)), key.address());
  }
}

TEST_F(Secp256k1Test, RecoverAcceptsRawRecoveryId) {
  PrivateKey key = PrivateKey::from_hex(key_hex);
  Hash32 digest = digest_of("raw v");
  Bytes signature = sign_recoverable(key, digest);
  signature[64] -= RECOVERY_ID_OFFSET;
  EXPECT_EQ(public_key_to_address(recover_public_key(digest, signature)), key.address());
}

TEST_F(Secp256k1Test, DifferentDigestRecoversDifferentAddress) {
  PrivateKey key = PrivateKey::from_hex(key_hex);
  Bytes signature = sign_recoverable(key, digest_of("signed"));
  EXPECT_NE(public_key_to_address(recover_public_key(digest_of("other"), signature)), key.address());
}

TEST_F(Secp256k1Test, RejectsInvalidKeys) {
  EXPECT_THROW(PrivateKey::from_hex("00"), KeyError);
  EXPECT_THROW(PrivateKey::from_hex(std::string(64, '0')), KeyError);
  EXPECT_THROW(PrivateKey::from_hex(std::string(64, 'f')), KeyError);
  EXPECT_THROW(PrivateKey::from_hex(std::string(64, 'x')), KeyError);
}

TEST_F(Secp256k1Test, RejectsMalformedSignatures) {
  Hash32 digest = digest_of("x");
  EXPECT_THROW(recover_public_key(digest, Bytes(64, 1)), SignatureError);

  Bytes zero_r(SIGNATURE_SIZE, 0);
  zero_r[64] = 27;
  EXPECT_THROW(recover_public_key(digest, zero_r), SignatureError);

  Bytes bad_v = sign_recoverable(PrivateKey::from_hex(key_hex), digest);
  bad_v[64] = 35;
  EXPECT_THROW(recover_public_key(digest, bad_v), SignatureError);
}
