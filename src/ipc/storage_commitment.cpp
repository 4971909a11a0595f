#include "ipc/storage_commitment.hpp"
#include "crypto/hash.hpp"
#include "encoding/hex.hpp"
#include <algorithm>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace dcs::ipc {

//==============================================
// EIP-712 DOMAIN
//==============================================

eip712::Message StorageData::to_message() const {
    return eip712::Message{
        {"chunkCID", chunk_cid},
        {"blockCID", Bytes(block_cid.begin(), block_cid.end())},
        {"chunkIndex", eip712::Uint256::from_uint64(chunk_index)},
        {"blockIndex", eip712::Uint256::from_uint64(block_index)},
        {"nodeId", Bytes(node_id.begin(), node_id.end())},
        {"nonce", nonce},
        {"deadline", eip712::Uint256::from_uint64(deadline)},
        {"bucketId", Bytes(bucket_id.begin(), bucket_id.end())},
    };
}

const eip712::TypeSchema& storage_data_schema() {
    static const eip712::TypeSchema schema = {
        {"chunkCID", "bytes"},
        {"blockCID", "bytes32"},
        {"chunkIndex", "uint256"},
        {"blockIndex", "uint8"},
        {"nodeId", "bytes32"},
        {"nonce", "uint256"},
        {"deadline", "uint256"},
        {"bucketId", "bytes32"},
    };
    return schema;
}

eip712::Domain storage_domain(const Address& storage_address, uint64_t chain_id) {
    return eip712::Domain{STORAGE_DOMAIN_NAME, STORAGE_DOMAIN_VERSION, chain_id, storage_address};
}

//==============================================
// IDENTIFIERS
//==============================================

Address parse_address(std::string_view address) {
    Bytes raw;
    try {
        raw = encoding::from_hex(address);
    } catch (const encoding::DecodeError& e) {
        BOOST_LOG_TRIVIAL(error) << "IPC: Address is not hex: " << address;
        throw InvalidAddress(std::string(address) + " (" + e.what() + ")");
    }
    if (raw.size() != Address().size()) {
        BOOST_LOG_TRIVIAL(error) << "IPC: Address has " << raw.size() << " bytes, expected 20";
        throw InvalidAddress("address must be a 20-byte hex string, got " + std::to_string(raw.size()) + " bytes");
    }

    Address parsed;
    std::copy(raw.begin(), raw.end(), parsed.begin());
    return parsed;
}

Hash32 calculate_bucket_id(std::string_view bucket_name, const Address& owner) {
    Bytes preimage(bucket_name.begin(), bucket_name.end());
    preimage.insert(preimage.end(), owner.begin(), owner.end());
    return crypto::keccak256(preimage);
}

Hash32 calculate_bucket_id(std::string_view bucket_name, std::string_view owner_address) {
    return calculate_bucket_id(bucket_name, parse_address(owner_address));
}

Hash32 calculate_file_id(const Hash32& bucket_id, std::string_view file_name) {
    Bytes preimage(bucket_id.begin(), bucket_id.end());
    preimage.insert(preimage.end(), file_name.begin(), file_name.end());
    return crypto::keccak256(preimage);
}

eip712::Uint256 generate_nonce() {
    eip712::Uint256 nonce;
    if (RAND_bytes(nonce.bytes.data(), static_cast<int>(nonce.bytes.size())) != 1) {
        BOOST_LOG_TRIVIAL(error) << "IPC: Failed to generate nonce";
        throw crypto::CryptoError("Failed to generate random nonce");
    }
    return nonce;
}

//==============================================
// SIGNING
//==============================================

Bytes sign_block(const crypto::PrivateKey& key, const Address& storage_address, uint64_t chain_id,
                 const StorageData& data) {
    BOOST_LOG_TRIVIAL(trace) << "IPC: Signing block " << static_cast<int>(data.block_index) << " of chunk "
                             << data.chunk_index;
    return eip712::sign(key, storage_domain(storage_address, chain_id), STORAGE_DATA_TYPE,
                        storage_data_schema(), data.to_message());
}

Bytes sign_block(std::string_view private_key_hex, std::string_view storage_address, uint64_t chain_id,
                 const StorageData& data) {
    return sign_block(crypto::PrivateKey::from_hex(private_key_hex), parse_address(storage_address),
                      chain_id, data);
}

Address recover_block_signer(const Bytes& signature, const Address& storage_address, uint64_t chain_id,
                             const StorageData& data) {
    return eip712::recover_signer_address(signature, storage_domain(storage_address, chain_id),
                                          STORAGE_DATA_TYPE, storage_data_schema(), data.to_message());
}

} // namespace dcs::ipc
