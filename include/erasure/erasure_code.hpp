#ifndef DCS_ERASURE_CODE_HPP
#define DCS_ERASURE_CODE_HPP

#include <cstddef>
#include <vector>
#include "common/types.hpp"
#include "erasure/erasure_error.hpp"
#include "erasure/reed_solomon.hpp"

namespace dcs::erasure {

// Splits a payload into data_shards pieces and protects each piece with
// 2 * parity_shards Reed-Solomon symbols. Stateless after construction.
class ErasureCode {
public:
    ErasureCode(size_t data_shards, size_t parity_shards);

    // ---- ENCODING ----
    std::vector<Bytes> encode(const Bytes& data) const;

    // ---- VERIFICATION AND RECOVERY ----
    bool verify(const std::vector<Bytes>& shards) const;

    // Corrects every shard it can. A shard that cannot be decoded comes back
    // as zeros of the same length, which is not the original content.
    std::vector<Bytes> reconstruct(const std::vector<Bytes>& shards) const;

    // Decodes the shard set back into the first original_size bytes of the
    // payload, reconstructing first when verify() fails
    Bytes extract_data(const std::vector<Bytes>& shards, size_t original_size) const;

    // ---- GETTERS ----
    size_t data_shards() const { return data_shards_; }
    size_t parity_shards() const { return parity_shards_; }
    size_t total_shards() const { return data_shards_ + parity_shards_; }

private:
    size_t data_shards_;
    size_t parity_shards_;
    ReedSolomon codec_;

    static size_t checked_ecc(size_t data_shards, size_t parity_shards);
};

} // namespace dcs::erasure

#endif // DCS_ERASURE_CODE_HPP
