#ifndef DCS_IPC_CLIENTS_HPP
#define DCS_IPC_CLIENTS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "ipc/storage_commitment.hpp"

namespace dcs::ipc {

struct Receipt {
    std::string tx_hash;
    uint64_t block_number = 0;
    bool success = false;
};

// One chunk as the storage contract records it
struct ChunkSubmission {
    Hash32 bucket_id{};
    std::string file_name;
    uint64_t chunk_index = 0;
    Bytes chunk_cid;
    uint64_t raw_size = 0;
    uint64_t encoded_size = 0;
    std::vector<Hash32> block_cids;
    std::vector<uint64_t> block_sizes;
};

// Contract boundary. Implementations wrap a JSON-RPC endpoint.
class ChainClient {
public:
    virtual ~ChainClient() = default;

    virtual uint64_t chain_id() const = 0;
    virtual Address storage_address() const = 0;

    // Returns the transaction hash
    virtual std::string add_file_chunk(const ChunkSubmission& chunk) = 0;

    // Empty while the transaction is not mined
    virtual std::optional<Receipt> transaction_receipt(const std::string& tx_hash) = 0;

    virtual std::string commit_file(const Hash32& bucket_id, const std::string& file_name,
                                    uint64_t encoded_size, uint64_t raw_size, const Bytes& root_cid) = 0;
};

// Storage node boundary
class StorageNodeClient {
public:
    virtual ~StorageNodeClient() = default;

    virtual Hash32 node_id() const = 0;

    virtual void upload_block(const Bytes& block_cid, const Bytes& data, const SignedCommitment& commitment) = 0;
};

} // namespace dcs::ipc

#endif // DCS_IPC_CLIENTS_HPP
