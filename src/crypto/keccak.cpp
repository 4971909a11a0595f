#include "crypto/hash.hpp"
#include <array>
#include <cstring>

namespace dcs::crypto {

namespace {

constexpr size_t KECCAK256_RATE = 136;  // (1600 - 2 * 256) / 8
constexpr int KECCAK_ROUNDS = 24;

constexpr std::array<uint64_t, KECCAK_ROUNDS> ROUND_CONSTANTS = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

// Rotation offsets indexed by lane x + 5 * y
constexpr std::array<unsigned, 25> ROTATIONS = {
     0,  1, 62, 28, 27,
    36, 44,  6, 55, 20,
     3, 10, 43, 25, 39,
    41, 45, 15, 21,  8,
    18,  2, 61, 56, 14
};

inline uint64_t rotl(uint64_t value, unsigned shift) {
    return shift == 0 ? value : (value << shift) | (value >> (64 - shift));
}

void keccak_f1600(std::array<uint64_t, 25>& a) {
    for (int round = 0; round < KECCAK_ROUNDS; ++round) {
        // Theta
        uint64_t c[5];
        for (int x = 0; x < 5; ++x) {
            c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
        }
        for (int x = 0; x < 5; ++x) {
            uint64_t d = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
            for (int y = 0; y < 25; y += 5) {
                a[y + x] ^= d;
            }
        }

        // Rho and pi
        std::array<uint64_t, 25> b{};
        for (int x = 0; x < 5; ++x) {
            for (int y = 0; y < 5; ++y) {
                b[y + 5 * ((2 * x + 3 * y) % 5)] = rotl(a[x + 5 * y], ROTATIONS[x + 5 * y]);
            }
        }

        // Chi
        for (int y = 0; y < 25; y += 5) {
            for (int x = 0; x < 5; ++x) {
                a[y + x] = b[y + x] ^ (~b[y + (x + 1) % 5] & b[y + (x + 2) % 5]);
            }
        }

        // Iota
        a[0] ^= ROUND_CONSTANTS[round];
    }
}

uint64_t load_le64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

void absorb_block(std::array<uint64_t, 25>& state, const uint8_t* block) {
    for (size_t i = 0; i < KECCAK256_RATE / 8; ++i) {
        state[i] ^= load_le64(block + 8 * i);
    }
    keccak_f1600(state);
}

} // namespace

Hash32 keccak256(const uint8_t* data, size_t size) {
    std::array<uint64_t, 25> state{};

    size_t offset = 0;
    while (size - offset >= KECCAK256_RATE) {
        absorb_block(state, data + offset);
        offset += KECCAK256_RATE;
    }

    // Final block with multi-rate padding
    std::array<uint8_t, KECCAK256_RATE> last{};
    size_t remaining = size - offset;
    if (remaining > 0) {
        std::memcpy(last.data(), data + offset, remaining);
    }
    last[remaining] ^= 0x01;
    last[KECCAK256_RATE - 1] ^= 0x80;
    absorb_block(state, last.data());

    Hash32 out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
    }
    return out;
}

} // namespace dcs::crypto
