#include "cid/cid.hpp"
#include "crypto/hash.hpp"
#include "encoding/varint.hpp"
#include <boost/log/trivial.hpp>

namespace dcs::cid {

namespace {

constexpr size_t CID_V0_STRING_LENGTH = 46;
constexpr size_t CID_V0_BINARY_LENGTH = 34;

bool is_supported_hash(uint64_t code) {
    switch (static_cast<HashAlgorithm>(code)) {
        case HashAlgorithm::Sha2_256:
        case HashAlgorithm::Sha2_512:
        case HashAlgorithm::Sha3_256:
        case HashAlgorithm::Keccak256:
            return true;
        default:
            return false;
    }
}

bool is_supported_codec(uint64_t code) {
    switch (static_cast<Codec>(code)) {
        case Codec::Raw:
        case Codec::DagPb:
        case Codec::DagCbor:
            return true;
        default:
            return false;
    }
}

} // namespace

//==============================================
// NAMES
//==============================================

const char* codec_name(Codec codec) {
    switch (codec) {
        case Codec::Raw:     return "raw";
        case Codec::DagPb:   return "dag-pb";
        case Codec::DagCbor: return "dag-cbor";
        default:             return "unknown";
    }
}

const char* hash_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Sha2_256:  return "sha2-256";
        case HashAlgorithm::Sha2_512:  return "sha2-512";
        case HashAlgorithm::Sha3_256:  return "sha3-256";
        case HashAlgorithm::Keccak256: return "keccak-256";
        default:                       return "unknown";
    }
}

size_t digest_size(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha2_512 ? 64 : 32;
}

//==============================================
// MULTIHASH
//==============================================

Multihash Multihash::compute(const uint8_t* data, size_t size, HashAlgorithm algorithm) {
    Multihash mh;
    mh.algorithm = algorithm;

    switch (algorithm) {
        case HashAlgorithm::Sha2_256: {
            auto d = crypto::sha256(data, size);
            mh.digest.assign(d.begin(), d.end());
            break;
        }
        case HashAlgorithm::Sha2_512:
            mh.digest = crypto::sha512(data, size);
            break;
        case HashAlgorithm::Sha3_256: {
            auto d = crypto::sha3_256(data, size);
            mh.digest.assign(d.begin(), d.end());
            break;
        }
        case HashAlgorithm::Keccak256: {
            auto d = crypto::keccak256(data, size);
            mh.digest.assign(d.begin(), d.end());
            break;
        }
        default:
            throw MalformedCid("unsupported hash algorithm 0x" +
                               std::to_string(static_cast<uint64_t>(algorithm)));
    }
    return mh;
}

Multihash Multihash::decode(const uint8_t* data, size_t size, size_t& offset) {
    uint64_t code = 0;
    uint64_t length = 0;
    try {
        code = encoding::read_uvarint(data, size, offset);
        length = encoding::read_uvarint(data, size, offset);
    } catch (const encoding::DecodeError& e) {
        throw MalformedCid(std::string("invalid multihash header: ") + e.what());
    }

    if (!is_supported_hash(code)) {
        throw MalformedCid("unsupported multihash code " + std::to_string(code));
    }

    Multihash mh;
    mh.algorithm = static_cast<HashAlgorithm>(code);
    if (length != digest_size(mh.algorithm)) {
        throw MalformedCid("digest length " + std::to_string(length) + " does not match " +
                           hash_name(mh.algorithm));
    }
    if (size - offset < length) {
        throw MalformedCid("truncated multihash digest");
    }

    mh.digest.assign(data + offset, data + offset + length);
    offset += length;
    return mh;
}

Bytes Multihash::bytes() const {
    Bytes out;
    out.reserve(digest.size() + 2);
    encoding::put_uvarint(out, static_cast<uint64_t>(algorithm));
    encoding::put_uvarint(out, digest.size());
    out.insert(out.end(), digest.begin(), digest.end());
    return out;
}

//==============================================
// CONSTRUCTION
//==============================================

Cid::Cid(uint64_t version, Codec codec, Multihash hash, encoding::Multibase base)
  : version_(version)
  , codec_(codec)
  , hash_(std::move(hash))
  , base_(base) {
    if (version_ > V1) {
        throw UnsupportedVersion(std::to_string(version_));
    }
    if (version_ == V0) {
        if (codec_ != Codec::DagPb || hash_.algorithm != HashAlgorithm::Sha2_256) {
            throw MalformedCid("CIDv0 requires dag-pb content hashed with sha2-256");
        }
        base_ = encoding::Multibase::Base58Btc;
    }
}

Cid Cid::compute(const Bytes& data, HashAlgorithm algorithm, Codec codec, uint64_t version) {
    if (version > V1) {
        throw UnsupportedVersion(std::to_string(version));
    }
    return Cid(version, codec, Multihash::compute(data.data(), data.size(), algorithm));
}

//==============================================
// DECODING
//==============================================

Cid Cid::decode(std::string_view text) {
    if (text.empty()) {
        throw MalformedCid("empty CID string");
    }

    if (text.size() == CID_V0_STRING_LENGTH && text.substr(0, 2) == "Qm") {
        Bytes raw;
        try {
            raw = encoding::base58_decode(text);
        } catch (const encoding::DecodeError& e) {
            throw MalformedCid(e.what());
        }
        return from_bytes(raw);
    }

    encoding::Multibase base;
    Bytes raw;
    try {
        raw = encoding::multibase_decode(text, base);
    } catch (const encoding::DecodeError& e) {
        throw MalformedCid(e.what());
    }

    Cid cid = from_bytes(raw);
    if (cid.version_ == V0) {
        throw MalformedCid("CIDv0 must not carry a multibase prefix");
    }
    cid.base_ = base;
    return cid;
}

Cid Cid::from_bytes(const uint8_t* data, size_t size) {
    if (size == 0) {
        throw MalformedCid("empty CID bytes");
    }

    size_t offset = 0;
    if (size == CID_V0_BINARY_LENGTH && data[0] == 0x12 && data[1] == 0x20) {
        Multihash mh = Multihash::decode(data, size, offset);
        return Cid(V0, Codec::DagPb, std::move(mh), encoding::Multibase::Base58Btc);
    }

    uint64_t version = 0;
    uint64_t codec = 0;
    try {
        version = encoding::read_uvarint(data, size, offset);
        if (version != V1) {
            throw UnsupportedVersion(std::to_string(version));
        }
        codec = encoding::read_uvarint(data, size, offset);
    } catch (const encoding::DecodeError& e) {
        throw MalformedCid(std::string("invalid CID header: ") + e.what());
    }
    if (!is_supported_codec(codec)) {
        throw MalformedCid("unsupported codec " + std::to_string(codec));
    }

    Multihash mh = Multihash::decode(data, size, offset);
    if (offset != size) {
        throw MalformedCid("trailing bytes after multihash");
    }
    return Cid(V1, static_cast<Codec>(codec), std::move(mh));
}

//==============================================
// ENCODING
//==============================================

Bytes Cid::bytes() const {
    if (version_ == V0) {
        return hash_.bytes();
    }

    Bytes out;
    encoding::put_uvarint(out, version_);
    encoding::put_uvarint(out, static_cast<uint64_t>(codec_));
    Bytes mh = hash_.bytes();
    out.insert(out.end(), mh.begin(), mh.end());
    return out;
}

std::string Cid::to_string() const {
    return to_string(base_);
}

std::string Cid::to_string(encoding::Multibase base) const {
    if (version_ == V0) {
        return encoding::base58_encode(bytes());
    }
    return encoding::multibase_encode(base, bytes());
}

std::ostream& operator<<(std::ostream& os, const Cid& cid) {
    return os << cid.to_string();
}

//==============================================
// VERIFICATION
//==============================================

void verify(const Cid& provided, const Bytes& data) {
    BOOST_LOG_TRIVIAL(debug) << "CID: Verifying " << data.size() << " bytes against " << provided;

    if (provided.version() > Cid::V1) {
        throw UnsupportedVersion(std::to_string(provided.version()));
    }

    Multihash digest = Multihash::compute(data.data(), data.size(), provided.hash().algorithm);
    Cid calculated = provided.version() == Cid::V0
        ? Cid(Cid::V0, Codec::DagPb, std::move(digest), encoding::Multibase::Base58Btc)
        : Cid(Cid::V1, provided.codec(), std::move(digest), provided.base());

    if (calculated.bytes() != provided.bytes()) {
        BOOST_LOG_TRIVIAL(error) << "CID: Mismatch, provided " << provided << ", calculated " << calculated;
        throw CidMismatch("provided " + provided.to_string() + ", calculated " + calculated.to_string());
    }
}

void verify_raw(std::string_view provided, const Bytes& data) {
    Cid cid = Cid::decode(provided);
    verify(cid, data);
}

Cid from_byte_array_cid(const Hash32& digest) {
    Multihash mh;
    mh.algorithm = HashAlgorithm::Sha2_256;
    mh.digest.assign(digest.begin(), digest.end());
    return Cid(Cid::V1, Codec::DagPb, std::move(mh));
}

} // namespace dcs::cid
