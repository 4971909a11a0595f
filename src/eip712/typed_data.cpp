#include "eip712/typed_data.hpp"
#include "crypto/hash.hpp"
#include "encoding/hex.hpp"
#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace dcs::eip712 {

namespace {

const TypeSchema DOMAIN_SCHEMA = {
    {"name", "string"},
    {"version", "string"},
    {"chainId", "uint256"},
    {"verifyingContract", "address"},
};

const std::string DOMAIN_TYPE = "EIP712Domain";

// Parses the width suffix of "uintN"/"bytesN"; returns 0 when absent
size_t type_width(const std::string& type, size_t prefix_length) {
    if (type.size() == prefix_length) {
        return 0;
    }
    size_t width = 0;
    for (size_t i = prefix_length; i < type.size(); ++i) {
        if (type[i] < '0' || type[i] > '9') {
            throw SignatureSchemaMismatch("malformed type " + type);
        }
        width = width * 10 + static_cast<size_t>(type[i] - '0');
        if (width > 256) {
            throw SignatureSchemaMismatch("malformed type " + type);
        }
    }
    return width;
}

template <typename T>
const T& expect(const Value& value, const TypedField& field) {
    const T* typed = std::get_if<T>(&value);
    if (!typed) {
        throw SignatureSchemaMismatch("field " + field.name + " does not hold a " + field.type + " value");
    }
    return *typed;
}

// One 32-byte word of the struct encoding
Hash32 encode_value(const TypedField& field, const Value& value) {
    Hash32 word{};
    const std::string& type = field.type;

    if (type == "bytes") {
        return crypto::keccak256(expect<Bytes>(value, field));
    }
    if (type == "string") {
        return crypto::keccak256(expect<std::string>(value, field));
    }
    if (type == "address") {
        const Address& address = expect<Address>(value, field);
        std::copy(address.begin(), address.end(), word.begin() + (word.size() - address.size()));
        return word;
    }
    if (type == "bool") {
        word.back() = expect<bool>(value, field) ? 1 : 0;
        return word;
    }
    if (type.rfind("uint", 0) == 0) {
        size_t bits = type_width(type, 4);
        if (bits == 0) {
            bits = 256;
        }
        if (bits % 8 != 0) {
            throw SignatureSchemaMismatch("malformed type " + type);
        }
        const Uint256& number = expect<Uint256>(value, field);
        if (number.bit_length() > bits) {
            throw SignatureSchemaMismatch("value of " + field.name + " does not fit in " + type);
        }
        return number.bytes;
    }
    if (type.rfind("bytes", 0) == 0) {
        size_t width = type_width(type, 5);
        if (width == 0 || width > 32) {
            throw SignatureSchemaMismatch("malformed type " + type);
        }
        const Bytes& data = expect<Bytes>(value, field);
        if (data.size() != width) {
            throw SignatureSchemaMismatch("field " + field.name + " must be " + std::to_string(width) +
                                          " bytes, got " + std::to_string(data.size()));
        }
        std::copy(data.begin(), data.end(), word.begin());
        return word;
    }

    throw SignatureSchemaMismatch("unsupported field type " + type);
}

} // namespace

//==============================================
// UINT256
//==============================================

Uint256 Uint256::from_uint64(uint64_t value) {
    Uint256 number;
    boost::endian::store_big_u64(number.bytes.data() + number.bytes.size() - sizeof(uint64_t), value);
    return number;
}

size_t Uint256::bit_length() const {
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (bytes[i] != 0) {
            size_t bits = 8;
            while (!(bytes[i] & (1u << (bits - 1)))) {
                --bits;
            }
            return (bytes.size() - i - 1) * 8 + bits;
        }
    }
    return 0;
}

//==============================================
// HASHING
//==============================================

std::string encode_type(const std::string& primary_type, const TypeSchema& schema) {
    std::string encoded = primary_type + "(";
    for (size_t i = 0; i < schema.size(); ++i) {
        if (i > 0) {
            encoded += ",";
        }
        encoded += schema[i].type + " " + schema[i].name;
    }
    encoded += ")";
    return encoded;
}

Hash32 type_hash(const std::string& primary_type, const TypeSchema& schema) {
    return crypto::keccak256(encode_type(primary_type, schema));
}

Hash32 hash_struct(const std::string& primary_type, const TypeSchema& schema, const Message& message) {
    Bytes encoded;
    encoded.reserve(32 * (schema.size() + 1));

    Hash32 type_word = type_hash(primary_type, schema);
    encoded.insert(encoded.end(), type_word.begin(), type_word.end());

    for (const auto& field : schema) {
        auto it = message.find(field.name);
        if (it == message.end()) {
            BOOST_LOG_TRIVIAL(error) << "EIP712: " << primary_type << " message lacks field " << field.name;
            throw SignatureSchemaMismatch("missing field " + field.name);
        }
        Hash32 word = encode_value(field, it->second);
        encoded.insert(encoded.end(), word.begin(), word.end());
    }

    if (message.size() != schema.size()) {
        BOOST_LOG_TRIVIAL(error) << "EIP712: " << primary_type << " message has fields outside its schema";
        throw SignatureSchemaMismatch("message has " + std::to_string(message.size()) +
                                      " fields, schema has " + std::to_string(schema.size()));
    }

    return crypto::keccak256(encoded);
}

Hash32 domain_separator(const Domain& domain) {
    Message message = {
        {"name", domain.name},
        {"version", domain.version},
        {"chainId", Uint256::from_uint64(domain.chain_id)},
        {"verifyingContract", domain.verifying_contract},
    };
    return hash_struct(DOMAIN_TYPE, DOMAIN_SCHEMA, message);
}

Hash32 typed_data_digest(const Domain& domain, const std::string& primary_type,
                         const TypeSchema& schema, const Message& message) {
    Hash32 separator = domain_separator(domain);
    Hash32 struct_hash = hash_struct(primary_type, schema, message);

    Bytes preimage{0x19, 0x01};
    preimage.insert(preimage.end(), separator.begin(), separator.end());
    preimage.insert(preimage.end(), struct_hash.begin(), struct_hash.end());

    Hash32 digest = crypto::keccak256(preimage);
    BOOST_LOG_TRIVIAL(trace) << "EIP712: " << primary_type << " digest " << encoding::to_hex(digest);
    return digest;
}

//==============================================
// SIGNING
//==============================================

Bytes sign(const crypto::PrivateKey& key, const Domain& domain, const std::string& primary_type,
           const TypeSchema& schema, const Message& message) {
    Hash32 digest = typed_data_digest(domain, primary_type, schema, message);
    Bytes signature = crypto::sign_recoverable(key, digest);
    BOOST_LOG_TRIVIAL(debug) << "EIP712: Signed " << primary_type << " for "
                             << crypto::to_checksum_address(domain.verifying_contract);
    return signature;
}

Address recover_signer_address(const Bytes& signature, const Domain& domain,
                               const std::string& primary_type, const TypeSchema& schema,
                               const Message& message) {
    Hash32 digest = typed_data_digest(domain, primary_type, schema, message);
    return crypto::public_key_to_address(crypto::recover_public_key(digest, signature));
}

} // namespace dcs::eip712
