#ifndef DCS_CID_HPP
#define DCS_CID_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include "common/types.hpp"
#include "cid/cid_error.hpp"
#include "encoding/multibase.hpp"

namespace dcs::cid {

// Multicodec content types
enum class Codec : uint64_t {
    Raw = 0x55,
    DagPb = 0x70,
    DagCbor = 0x71
};

// Multihash function codes
enum class HashAlgorithm : uint64_t {
    Sha2_256 = 0x12,
    Sha2_512 = 0x13,
    Sha3_256 = 0x16,
    Keccak256 = 0x1b
};

const char* codec_name(Codec codec);
const char* hash_name(HashAlgorithm algorithm);
size_t digest_size(HashAlgorithm algorithm);

// Hash digest prefixed with its function code and length
struct Multihash {
    HashAlgorithm algorithm = HashAlgorithm::Sha2_256;
    Bytes digest;

    // Hashes data with the given algorithm
    static Multihash compute(const uint8_t* data, size_t size, HashAlgorithm algorithm);
    // Parses a multihash starting at data[offset]; advances offset
    static Multihash decode(const uint8_t* data, size_t size, size_t& offset);

    Bytes bytes() const;

    bool operator==(const Multihash& other) const {
        return algorithm == other.algorithm && digest == other.digest;
    }
};

class Cid {
public:
    static constexpr uint64_t V0 = 0;
    static constexpr uint64_t V1 = 1;

    // ---- CONSTRUCTION ----
    // Version 0 implies dag-pb, sha2-256 and base58btc
    Cid(uint64_t version, Codec codec, Multihash hash,
        encoding::Multibase base = encoding::Multibase::Base32);

    // Hashes data and wraps the digest into a CID
    static Cid compute(const Bytes& data,
                       HashAlgorithm algorithm = HashAlgorithm::Sha2_256,
                       Codec codec = Codec::Raw,
                       uint64_t version = V1);

    // ---- DECODING ----
    // Text form: base58 "Qm..." for v0, multibase for v1
    static Cid decode(std::string_view text);
    // Binary form: bare multihash for v0, version|codec|multihash for v1
    static Cid from_bytes(const uint8_t* data, size_t size);
    static Cid from_bytes(const Bytes& data) { return from_bytes(data.data(), data.size()); }


    // ---- ENCODING ----
    Bytes bytes() const;
    std::string to_string() const;
    // Re-encodes a v1 CID under a different multibase
    std::string to_string(encoding::Multibase base) const;


    // ---- GETTERS ----
    uint64_t version() const { return version_; }
    Codec codec() const { return codec_; }
    const Multihash& hash() const { return hash_; }
    encoding::Multibase base() const { return base_; }

    bool operator==(const Cid& other) const {
        return version_ == other.version_ && codec_ == other.codec_ && hash_ == other.hash_;
    }
    bool operator!=(const Cid& other) const { return !(*this == other); }

private:
    uint64_t version_;
    Codec codec_;
    Multihash hash_;
    encoding::Multibase base_;
};

std::ostream& operator<<(std::ostream& os, const Cid& cid);

// ---- VERIFICATION ----
// Recomputes the CID of data with the provided CID's hash function, version,
// codec and base; throws CidMismatch if the two differ.
void verify(const Cid& provided, const Bytes& data);
// Decodes provided first; undecodable input throws MalformedCid
void verify_raw(std::string_view provided, const Bytes& data);

// On-chain CIDs are stored as a bare sha2-256 digest of a dag-pb node
Cid from_byte_array_cid(const Hash32& digest);

} // namespace dcs::cid

#endif // DCS_CID_HPP
