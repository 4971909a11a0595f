#ifndef DCS_EIP712_TYPED_DATA_HPP
#define DCS_EIP712_TYPED_DATA_HPP

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/secp256k1.hpp"

namespace dcs::eip712 {

class SignatureSchemaMismatch : public crypto::CryptoError {
public:
    explicit SignatureSchemaMismatch(const std::string& message)
        : crypto::CryptoError("Signature schema mismatch: " + message) {}
};

// 256-bit unsigned integer, big-endian
struct Uint256 {
    Hash32 bytes{};

    static Uint256 from_uint64(uint64_t value);
    static Uint256 from_bytes(const Hash32& big_endian) { return Uint256{big_endian}; }
    // Number of significant bits
    size_t bit_length() const;

    bool operator==(const Uint256& other) const { return bytes == other.bytes; }
};

struct Domain {
    std::string name;
    std::string version;
    uint64_t chain_id = 0;
    Address verifying_contract{};
};

struct TypedField {
    std::string name;
    std::string type;
};

// Field order is part of the type hash
using TypeSchema = std::vector<TypedField>;

// bytes / bytesN -> Bytes, string -> std::string, uintN -> Uint256,
// address -> Address, bool -> bool
using Value = std::variant<Bytes, std::string, Uint256, Address, bool>;
using Message = std::map<std::string, Value>;

// ---- HASHING ----
// "Primary(type1 name1,type2 name2,...)"
std::string encode_type(const std::string& primary_type, const TypeSchema& schema);
Hash32 type_hash(const std::string& primary_type, const TypeSchema& schema);

// Throws SignatureSchemaMismatch when a field is missing, has the wrong
// value kind, an unsupported type, or a value too wide for its type
Hash32 hash_struct(const std::string& primary_type, const TypeSchema& schema, const Message& message);

Hash32 domain_separator(const Domain& domain);

// keccak256(0x19 0x01 | domain separator | struct hash)
Hash32 typed_data_digest(const Domain& domain, const std::string& primary_type,
                         const TypeSchema& schema, const Message& message);

// ---- SIGNING ----
Bytes sign(const crypto::PrivateKey& key, const Domain& domain, const std::string& primary_type,
           const TypeSchema& schema, const Message& message);

// Different inputs recover a different address rather than failing
Address recover_signer_address(const Bytes& signature, const Domain& domain,
                               const std::string& primary_type, const TypeSchema& schema,
                               const Message& message);

} // namespace dcs::eip712

#endif // DCS_EIP712_TYPED_DATA_HPP
