#ifndef DCS_ERASURE_REED_SOLOMON_HPP
#define DCS_ERASURE_REED_SOLOMON_HPP

#include <cstdint>
#include <vector>
#include "common/types.hpp"
#include "erasure/erasure_error.hpp"

namespace dcs::erasure {

// Systematic Reed-Solomon codec over GF(2^8) (primitive polynomial 0x11d,
// generator 2, first consecutive root 0). Messages longer than one codeword
// are cut into (255 - ecc_symbols) byte pieces, each followed by its
// ecc_symbols parity bytes.
class ReedSolomon {
public:
    static constexpr size_t FIELD_SIZE = 255;   // max codeword length

    explicit ReedSolomon(size_t ecc_symbols);

    // ---- CODEWORDS ----
    Bytes encode(const Bytes& message) const;

    // Corrects up to ecc_symbols/2 errors per codeword, or more when their
    // positions are listed in erasures (indexes into encoded). Returns the
    // message without parity; throws ErasureUndecodable.
    Bytes decode(const Bytes& encoded, const std::vector<size_t>& erasures = {}) const;

    // True if every codeword has all-zero syndromes. Never corrects.
    bool check(const Bytes& encoded) const;

    size_t ecc_symbols() const { return nsym_; }
    size_t message_block_size() const { return FIELD_SIZE - nsym_; }

private:
    size_t nsym_;
    std::vector<uint8_t> generator_;

    Bytes encode_block(const uint8_t* message, size_t size) const;
    Bytes decode_block(Bytes codeword, const std::vector<size_t>& erasures) const;
    std::vector<uint8_t> syndromes(const Bytes& codeword) const;
};

} // namespace dcs::erasure

#endif // DCS_ERASURE_REED_SOLOMON_HPP
