#include "erasure/erasure_code.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dcs::erasure {

//==============================================
// CONSTRUCTOR
//==============================================

size_t ErasureCode::checked_ecc(size_t data_shards, size_t parity_shards) {
    if (data_shards == 0 || parity_shards == 0) {
        BOOST_LOG_TRIVIAL(error) << "Erasure: Data and parity shards must be > 0";
        throw InvalidShardConfig("data and parity shards must be > 0");
    }
    if (parity_shards * 2 >= ReedSolomon::FIELD_SIZE) {
        BOOST_LOG_TRIVIAL(error) << "Erasure: " << parity_shards << " parity shards exceed the codeword";
        throw InvalidShardConfig("2 * parity shards must be < 255");
    }
    return parity_shards * 2;
}

ErasureCode::ErasureCode(size_t data_shards, size_t parity_shards)
    : data_shards_(data_shards),
      parity_shards_(parity_shards),
      codec_(checked_ecc(data_shards, parity_shards)) {
    BOOST_LOG_TRIVIAL(debug) << "Erasure: Coder with " << data_shards_ << " data and "
                             << parity_shards_ << " parity shards";
}

//==============================================
// ENCODING
//==============================================

std::vector<Bytes> ErasureCode::encode(const Bytes& data) const {
    if (data.empty()) {
        BOOST_LOG_TRIVIAL(error) << "Erasure: Nothing to encode";
        throw ErasureError("no data to encode");
    }

    // The first (size % shards) pieces take one extra byte
    const size_t base = data.size() / data_shards_;
    const size_t extra = data.size() % data_shards_;
    const size_t shard_size = base + (extra ? 1 : 0);

    std::vector<Bytes> shards;
    shards.reserve(data_shards_);
    size_t offset = 0;
    for (size_t i = 0; i < data_shards_; ++i) {
        size_t len = base + (i < extra ? 1 : 0);
        Bytes piece(data.begin() + static_cast<long>(offset),
                    data.begin() + static_cast<long>(offset + len));
        piece.resize(shard_size, 0);
        offset += len;

        shards.push_back(codec_.encode(piece));
        BOOST_LOG_TRIVIAL(trace) << "Erasure: Shard " << i << " encoded to " << shards.back().size() << " bytes";
    }

    BOOST_LOG_TRIVIAL(debug) << "Erasure: Encoded " << data.size() << " bytes into " << shards.size()
                             << " shards of " << shards.front().size() << " bytes";
    return shards;
}

//==============================================
// VERIFICATION AND RECOVERY
//==============================================

bool ErasureCode::verify(const std::vector<Bytes>& shards) const {
    for (size_t i = 0; i < shards.size(); ++i) {
        if (!codec_.check(shards[i])) {
            BOOST_LOG_TRIVIAL(debug) << "Erasure: Shard " << i << " failed verification";
            return false;
        }
    }
    return true;
}

std::vector<Bytes> ErasureCode::reconstruct(const std::vector<Bytes>& shards) const {
    std::vector<Bytes> recovered;
    recovered.reserve(shards.size());

    for (size_t i = 0; i < shards.size(); ++i) {
        try {
            recovered.push_back(codec_.encode(codec_.decode(shards[i])));
        } catch (const ErasureUndecodable& e) {
            BOOST_LOG_TRIVIAL(warning) << "Erasure: Shard " << i << " is unrecoverable, zero-filling "
                                       << shards[i].size() << " bytes: " << e.what();
            recovered.emplace_back(shards[i].size(), 0);
        }
    }
    return recovered;
}

Bytes ErasureCode::extract_data(const std::vector<Bytes>& shards, size_t original_size) const {
    if (shards.size() != data_shards_) {
        BOOST_LOG_TRIVIAL(error) << "Erasure: Expected " << data_shards_ << " shards, got " << shards.size();
        throw InvalidShardConfig("expected " + std::to_string(data_shards_) + " shards, got " +
                                 std::to_string(shards.size()));
    }

    std::vector<Bytes> usable;
    const std::vector<Bytes>* source = &shards;
    if (!verify(shards)) {
        BOOST_LOG_TRIVIAL(info) << "Erasure: Shard set damaged, reconstructing";
        usable = reconstruct(shards);
        source = &usable;
    }

    // Same split as encode(): piece i holds base + 1 bytes while i < extra,
    // the rest of each decoded shard is padding
    const size_t base = original_size / data_shards_;
    const size_t extra = original_size % data_shards_;

    Bytes data;
    data.reserve(original_size);
    for (size_t i = 0; i < source->size(); ++i) {
        Bytes piece = codec_.decode((*source)[i]);
        const size_t len = base + (i < extra ? 1 : 0);
        if (piece.size() < len) {
            BOOST_LOG_TRIVIAL(error) << "Erasure: Shard " << i << " holds " << piece.size()
                                     << " bytes, expected at least " << len;
            throw InvalidShardConfig("shard " + std::to_string(i) + " is too short for " +
                                     std::to_string(original_size) + " bytes");
        }
        data.insert(data.end(), piece.begin(), piece.begin() + static_cast<long>(len));
    }
    return data;
}

} // namespace dcs::erasure
