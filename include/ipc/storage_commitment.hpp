#ifndef DCS_IPC_STORAGE_COMMITMENT_HPP
#define DCS_IPC_STORAGE_COMMITMENT_HPP

#include <cstdint>
#include <string_view>
#include "common/types.hpp"
#include "crypto/secp256k1.hpp"
#include "eip712/typed_data.hpp"
#include "ipc/ipc_error.hpp"

namespace dcs::ipc {

// ---- EIP-712 DOMAIN ----
static constexpr const char* STORAGE_DOMAIN_NAME = "Storage";
static constexpr const char* STORAGE_DOMAIN_VERSION = "1";
static constexpr const char* STORAGE_DATA_TYPE = "StorageData";

// Fields a storage node countersigns for one block
struct StorageData {
    Bytes chunk_cid;                 // binary CID of the chunk
    Hash32 block_cid{};              // digest of the block CID
    uint64_t chunk_index = 0;
    uint8_t block_index = 0;
    Hash32 node_id{};
    eip712::Uint256 nonce;
    uint64_t deadline = 0;           // unix seconds
    Hash32 bucket_id{};

    eip712::Message to_message() const;
};

struct SignedCommitment {
    StorageData data;
    Bytes signature;
};

// StorageData(bytes chunkCID,bytes32 blockCID,uint256 chunkIndex,uint8 blockIndex,
//             bytes32 nodeId,uint256 nonce,uint256 deadline,bytes32 bucketId)
const eip712::TypeSchema& storage_data_schema();

eip712::Domain storage_domain(const Address& storage_address, uint64_t chain_id);

// ---- IDENTIFIERS ----
// 40 hex characters, optional 0x; anything else throws InvalidAddress
Address parse_address(std::string_view address);

// keccak256(bucket name | owner address)
Hash32 calculate_bucket_id(std::string_view bucket_name, const Address& owner);
Hash32 calculate_bucket_id(std::string_view bucket_name, std::string_view owner_address);

// keccak256(bucket id | file name)
Hash32 calculate_file_id(const Hash32& bucket_id, std::string_view file_name);

// Uniformly random 256-bit commitment nonce
eip712::Uint256 generate_nonce();

// ---- SIGNING ----
Bytes sign_block(const crypto::PrivateKey& key, const Address& storage_address, uint64_t chain_id,
                 const StorageData& data);
Bytes sign_block(std::string_view private_key_hex, std::string_view storage_address, uint64_t chain_id,
                 const StorageData& data);

Address recover_block_signer(const Bytes& signature, const Address& storage_address, uint64_t chain_id,
                             const StorageData& data);

} // namespace dcs::ipc

#endif // DCS_IPC_STORAGE_COMMITMENT_HPP
