#ifndef DCS_UPLOADER_HPP
#define DCS_UPLOADER_HPP

#include <cstdint>
#include <functional>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include "cid/cid.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "crypto/secp256k1.hpp"
#include "dag/dag.hpp"
#include "ipc/clients.hpp"
#include "retry/retry.hpp"
#include "upload/chunk_builder.hpp"
#include "upload/upload_state.hpp"

namespace dcs::upload {

struct FileMeta {
    cid::Cid root_cid;
    Hash32 bucket_id{};
    std::string file_name;
    uint64_t raw_size = 0;
    uint64_t encoded_size = 0;
    uint64_t chunk_count = 0;
    std::string commit_tx;
};

// Streams a file into chunks, uploads every block with a signed commitment,
// registers the chunks on chain and commits the file root
class Uploader {
public:
    // ---- CONSTRUCTOR ----
    // Validates config; the private key and contract address are required
    Uploader(config::Config config, ipc::ChainClient& chain, ipc::StorageNodeClient& node);

    Uploader(const Uploader&) = delete;
    Uploader& operator=(const Uploader&) = delete;

    // ---- UPLOAD ----
    FileMeta upload(const std::string& bucket_name, const std::string& file_name, std::istream& input);

    // Aborts the running upload: queued chunks are skipped and
    // confirmation waits stop at their next poll
    void cancel();

    const ChunkBuilder& chunk_builder() const { return builder_; }

    const Address& owner() const { return owner_; }

private:
    // ---- PARAMETERS ----
    config::Config config_;
    ipc::ChainClient& chain_;
    ipc::StorageNodeClient& node_;
    crypto::PrivateKey key_;
    Address owner_;
    Address storage_address_;
    ChunkBuilder builder_;
    retry::WithRetry retry_;

    std::mutex cancel_mutex_;
    retry::CancellationToken* active_cancel_ = nullptr;

    // ---- CHUNK PIPELINE ----
    void process_chunk(uint64_t index, const Bytes& payload, const Hash32& bucket_id,
                       const std::string& file_name, UploadState& state,
                       const retry::CancellationToken& cancel);
    void upload_blocks(uint64_t index, const dag::ChunkDag& chunk, const Hash32& bucket_id,
                       const retry::CancellationToken& cancel);
    std::string submit_with_retry(const std::function<std::string()>& submit,
                                  const retry::CancellationToken& cancel);
};

} // namespace dcs::upload

#endif // DCS_UPLOADER_HPP
