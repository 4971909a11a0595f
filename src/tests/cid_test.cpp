#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "cid/cid.hpp"
#include "crypto/hash.hpp"
#include "encoding/hex.hpp"

using namespace dcs;
using namespace dcs::cid;
using dcs::encoding::Multibase;
using dcs::encoding::from_hex;
using dcs::encoding::to_hex;

class CidTest : public ::testing::Test {
protected:
  const Bytes hello = Bytes{'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd'};
  const std::string hello_digest = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";
  const std::string hello_raw_v1 = "bafkreifzjut3te2nhyekklss27nh3k72ysco7y32koao5eei66wof36n5e";
  const std::string hello_v0 = "QmaozNR7DZHQK1ZcU9p7QdrshMvXqWK6gpu5rmrkPdT3L4";
};

TEST_F(CidTest, ComputeRawV1) {
  Cid cid = Cid::compute(hello);

  EXPECT_EQ(cid.version(), Cid::V1);
  EXPECT_EQ(cid.codec(), Codec::Raw);
  EXPECT_EQ(cid.hash().algorithm, HashAlgorithm::Sha2_256);
  EXPECT_EQ(to_hex(cid.hash().digest), hello_digest);
  EXPECT_EQ(cid.to_string(), hello_raw_v1);
  EXPECT_EQ(to_hex(cid.bytes()), "01551220" + hello_digest);
}

TEST_F(CidTest, AlternateBases) {
  Cid cid = Cid::compute(hello);
  EXPECT_EQ(cid.to_string(Multibase::Base16), "f01551220" + hello_digest);
  EXPECT_EQ(cid.to_string(Multibase::Base58Btc), "zb2rhj7crUKTQYRGCRATFaQ6YFLTde2YzdqbbhAASkL9uRDXn");
}

TEST_F(CidTest, DecodeKeepsBase) {
  Cid cid = Cid::decode("zb2rhj7crUKTQYRGCRATFaQ6YFLTde2YzdqbbhAASkL9uRDXn");
  EXPECT_EQ(cid.base(), Multibase::Base58Btc);
  EXPECT_EQ(cid, Cid::compute(hello));
  EXPECT_EQ(cid.to_string(), "zb2rhj7crUKTQYRGCRATFaQ6YFLTde2YzdqbbhAASkL9uRDXn");
}

TEST_F(CidTest, VersionZero) {
  Cid cid = Cid::decode(hello_v0);
  EXPECT_EQ(cid.version(), Cid::V0);
  EXPECT_EQ(cid.codec(), Codec::DagPb);
  EXPECT_EQ(to_hex(cid.hash().digest), hello_digest);
  EXPECT_EQ(cid.to_string(), hello_v0);
  EXPECT_EQ(cid.bytes().size(), 34u);

  EXPECT_EQ(Cid::from_bytes(cid.bytes()), cid);
  EXPECT_EQ(Cid::compute(hello, HashAlgorithm::Sha2_256, Codec::DagPb, Cid::V0).to_string(), hello_v0);
}

TEST_F(CidTest, VersionZeroRequiresDagPbSha256) {
  EXPECT_THROW(Cid::compute(hello, HashAlgorithm::Sha2_256, Codec::Raw, Cid::V0), MalformedCid);
  EXPECT_THROW(Cid::compute(hello, HashAlgorithm::Keccak256, Codec::DagPb, Cid::V0), MalformedCid);
}

TEST_F(CidTest, OtherHashFunctions) {
  Cid sha3 = Cid::compute(hello, HashAlgorithm::Sha3_256);
  EXPECT_EQ(sha3.hash().digest.size(), 32u);
  EXPECT_EQ(Cid::decode(sha3.to_string()), sha3);

  Cid sha512 = Cid::compute(hello, HashAlgorithm::Sha2_512, Codec::DagPb);
  EXPECT_EQ(sha512.hash().digest.size(), 64u);
  EXPECT_EQ(Cid::decode(sha512.to_string()), sha512);
  EXPECT_NE(sha3, Cid::compute(hello));
}

TEST_F(CidTest, VerifyAcceptsMatchingData) {
  EXPECT_NO_THROW(verify(Cid::compute(hello), hello));
  EXPECT_NO_THROW(verify_raw(hello_raw_v1, hello));
  EXPECT_NO_THROW(verify_raw(hello_v0, hello));
}

TEST_F(CidTest, VerifyRejectsTamperedData) {
  Bytes tampered = hello;
  tampered[0] = 'H';

  try {
    verify_raw(hello_raw_v1, tampered);
    FAIL() << "expected CidMismatch";
  } catch (const CidMismatch& e) {
    std::string message = e.what();
    EXPECT_NE(message.find(hello_raw_v1), std::string::npos);
    EXPECT_NE(message.find(Cid::compute(tampered).to_string()), std::string::npos);
  }
}

TEST_F(CidTest, VerifyUsesProvidedParameters) {
  Cid keccak = Cid::compute(hello, HashAlgorithm::Keccak256, Codec::DagPb);
  EXPECT_NO_THROW(verify(keccak, hello));
  EXPECT_THROW(verify(keccak, Bytes{1, 2, 3}), CidMismatch);
}

TEST_F(CidTest, MalformedInput) {
  EXPECT_THROW(Cid::decode(""), MalformedCid);
  EXPECT_THROW(Cid::decode("x123"), MalformedCid);
  EXPECT_THROW(Cid::decode("bafkrei"), MalformedCid);
  EXPECT_THROW(verify_raw("not a cid", hello), MalformedCid);
  EXPECT_THROW(Cid::from_bytes(Bytes()), MalformedCid);

  Bytes trailing = Cid::compute(hello).bytes();
  trailing.push_back(0);
  EXPECT_THROW(Cid::from_bytes(trailing), MalformedCid);

  Bytes truncated = Cid::compute(hello).bytes();
  truncated.pop_back();
  EXPECT_THROW(Cid::from_bytes(truncated), MalformedCid);

  Bytes unknown_hash = from_hex("01551104aabbccdd");
  EXPECT_THROW(Cid::from_bytes(unknown_hash), MalformedCid);
}

TEST_F(CidTest, RejectsUnknownCodec) {
  // 0x72 libp2p-key, 0x0129 dag-json (two-byte varint)
  EXPECT_THROW(Cid::from_bytes(from_hex("01721220" + hello_digest)), MalformedCid);
  EXPECT_THROW(Cid::from_bytes(from_hex("01a9021220" + hello_digest)), MalformedCid);
  EXPECT_THROW(Cid::decode("f01721220" + hello_digest), MalformedCid);

  EXPECT_EQ(Cid::from_bytes(from_hex("01711220" + hello_digest)).codec(), Codec::DagCbor);
  EXPECT_EQ(Cid::decode("f01551220" + hello_digest).to_string(Multibase::Base32), hello_raw_v1);
}

TEST_F(CidTest, UnsupportedVersion) {
  Bytes v2 = Cid::compute(hello).bytes();
  v2[0] = 0x02;
  EXPECT_THROW(Cid::from_bytes(v2), cid::UnsupportedVersion);
  EXPECT_THROW(Cid::compute(hello, HashAlgorithm::Sha2_256, Codec::Raw, 2), cid::UnsupportedVersion);
}

TEST_F(CidTest, FromByteArrayCid) {
  Hash32 digest{};
  Bytes raw = from_hex(hello_digest);
  std::copy(raw.begin(), raw.end(), digest.begin());

  Cid cid = from_byte_array_cid(digest);
  EXPECT_EQ(cid.version(), Cid::V1);
  EXPECT_EQ(cid.codec(), Codec::DagPb);
  EXPECT_EQ(cid.hash().digest, raw);
  EXPECT_EQ(cid.to_string(), "bafybeifzjut3te2nhyekklss27nh3k72ysco7y32koao5eei66wof36n5e");
}
