#include "upload/chunk_builder.hpp"
#include "crypto/cipher.hpp"
#include "encoding/hex.hpp"
#include <boost/log/trivial.hpp>

namespace dcs::upload {

ChunkBuilder::ChunkBuilder(const config::Config& config)
    : block_size_(config.block_size),
      chunk_size_(config.chunk_size()) {
    if (!config.encryption_key.empty()) {
        encryption_key_ = encoding::from_hex(config.encryption_key);
        if (chunk_size_ <= config::ENCRYPTION_OVERHEAD) {
            throw config::ConfigError("chunk size too small for encryption overhead");
        }
    }
    if (config.erasure_enabled()) {
        erasure_.emplace(config.data_shards, config.parity_shards);
    }
}

size_t ChunkBuilder::read_size() const {
    return encryption_key_ ? chunk_size_ - config::ENCRYPTION_OVERHEAD : chunk_size_;
}

dag::ChunkDag ChunkBuilder::build(const Bytes& payload) const {
    if (!erasure_) {
        return dag::build_chunk_dag(payload, block_size_, encryption_key_);
    }

    if (payload.empty()) {
        throw dag::EmptyInput("no data to encode");
    }

    Bytes sealed = encryption_key_ ? crypto::encrypt(*encryption_key_, payload, dag::DAG_ENCRYPTION_INFO) : payload;

    std::vector<dag::Block> blocks;
    for (auto& shard : erasure_->encode(sealed)) {
        blocks.push_back(dag::make_block(std::move(shard)));
    }
    BOOST_LOG_TRIVIAL(debug) << "Uploader: Erasure coded " << payload.size() << " bytes into "
                             << blocks.size() << " shard blocks";

    dag::ChunkDag chunk = dag::build_chunk(std::move(blocks));
    chunk.raw_data_size = payload.size();
    return chunk;
}

} // namespace dcs::upload
