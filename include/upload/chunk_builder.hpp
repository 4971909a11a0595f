#ifndef DCS_UPLOAD_CHUNK_BUILDER_HPP
#define DCS_UPLOAD_CHUNK_BUILDER_HPP

#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "dag/dag.hpp"
#include "erasure/erasure_code.hpp"

namespace dcs::upload {

// Turns one chunk payload into its DAG: encrypts when an encryption key is
// configured, then either cuts blocks or, with erasure coding enabled,
// makes one block per shard
class ChunkBuilder {
public:
    explicit ChunkBuilder(const config::Config& config);

    dag::ChunkDag build(const Bytes& payload) const;

    // Plaintext bytes per chunk, leaving room for the encryption overhead
    size_t read_size() const;

    bool encrypted() const { return encryption_key_.has_value(); }
    bool erasure_coded() const { return erasure_.has_value(); }

private:
    size_t block_size_;
    size_t chunk_size_;
    std::optional<Bytes> encryption_key_;
    std::optional<erasure::ErasureCode> erasure_;
};

} // namespace dcs::upload

#endif // DCS_UPLOAD_CHUNK_BUILDER_HPP
