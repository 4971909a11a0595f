#ifndef DCS_UPLOAD_STATE_HPP
#define DCS_UPLOAD_STATE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cid/cid.hpp"
#include "dag/dag.hpp"
#include "upload/upload_error.hpp"

namespace dcs::upload {

// A chunk whose commitment was submitted but not yet confirmed on chain
struct PendingChunk {
    uint64_t index = 0;
    dag::ChunkLink link;
    size_t block_count = 0;
    std::string tx_hash;
};

// Per-file bookkeeping shared by all chunk workers. Every method locks.
class UploadState {
public:
    UploadState() = default;

    UploadState(const UploadState&) = delete;
    UploadState& operator=(const UploadState&) = delete;

    // ---- CHUNK LIFECYCLE ----
    // Records the chunk as pending, adds it to the totals and stores its
    // root link under index. Resubmitting an index replaces the earlier
    // chunk and its share of the totals. Throws StateSealed after seal().
    void pre_create_chunk(uint64_t index, const dag::ChunkDag& chunk, const std::string& tx_hash);

    // Drops the pending entry; returns false if it was already gone
    bool chunk_confirmed(uint64_t index);

    // Snapshot ordered by chunk index
    std::vector<PendingChunk> list_pending_chunks() const;

    // ---- ROOT ----
    // Builds the file root from the links sorted by chunk index. The first
    // call fixes the root; later calls return it unchanged. Throws
    // ChunksPending while any chunk is unconfirmed.
    cid::Cid seal();

    std::optional<cid::Cid> root_cid() const;
    bool committed() const;

    // ---- TOTALS ----
    uint64_t chunk_count() const;
    uint64_t raw_size() const;
    uint64_t encoded_size() const;
    size_t pending_count() const;

private:
    mutable std::mutex mutex_;

    std::map<uint64_t, PendingChunk> pending_;
    std::map<uint64_t, dag::ChunkLink> links_;

    uint64_t chunk_count_ = 0;
    uint64_t raw_size_ = 0;
    uint64_t encoded_size_ = 0;

    bool committed_ = false;
    std::optional<cid::Cid> root_;
};

} // namespace dcs::upload

#endif // DCS_UPLOAD_STATE_HPP
