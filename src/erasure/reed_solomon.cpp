#include "erasure/reed_solomon.hpp"
#include <algorithm>
#include <array>

namespace dcs::erasure {

namespace {

using Poly = std::vector<uint8_t>;

constexpr unsigned PRIMITIVE_POLY = 0x11d;

//==============================================
// GF(2^8) ARITHMETIC
//==============================================

struct GaloisTables {
    std::array<uint8_t, 512> exp{};
    std::array<uint8_t, 256> log{};

    GaloisTables() {
        unsigned x = 1;
        for (size_t i = 0; i < 255; ++i) {
            exp[i] = static_cast<uint8_t>(x);
            log[x] = static_cast<uint8_t>(i);
            x <<= 1;
            if (x & 0x100) {
                x ^= PRIMITIVE_POLY;
            }
        }
        // Doubled so that exp[log a + log b] needs no reduction
        for (size_t i = 255; i < exp.size(); ++i) {
            exp[i] = exp[i - 255];
        }
    }
};

const GaloisTables& gf() {
    static const GaloisTables tables;
    return tables;
}

uint8_t gf_mul(uint8_t a, uint8_t b) {
    if (a == 0 || b == 0) {
        return 0;
    }
    return gf().exp[gf().log[a] + gf().log[b]];
}

uint8_t gf_div(uint8_t a, uint8_t b) {
    if (b == 0) {
        throw ErasureUndecodable("division by zero in GF(256)");
    }
    if (a == 0) {
        return 0;
    }
    return gf().exp[(gf().log[a] + 255 - gf().log[b]) % 255];
}

uint8_t gf_pow(uint8_t a, long power) {
    long e = (static_cast<long>(gf().log[a]) * power) % 255;
    if (e < 0) {
        e += 255;
    }
    return gf().exp[static_cast<size_t>(e)];
}

uint8_t gf_inverse(uint8_t a) {
    return gf().exp[255 - gf().log[a]];
}

//==============================================
// POLYNOMIALS (highest degree first)
//==============================================

Poly poly_add(const Poly& p, const Poly& q) {
    Poly r(std::max(p.size(), q.size()), 0);
    for (size_t i = 0; i < p.size(); ++i) {
        r[i + r.size() - p.size()] = p[i];
    }
    for (size_t i = 0; i < q.size(); ++i) {
        r[i + r.size() - q.size()] ^= q[i];
    }
    return r;
}

Poly poly_mul(const Poly& p, const Poly& q) {
    Poly r(p.size() + q.size() - 1, 0);
    for (size_t j = 0; j < q.size(); ++j) {
        for (size_t i = 0; i < p.size(); ++i) {
            r[i + j] ^= gf_mul(p[i], q[j]);
        }
    }
    return r;
}

Poly poly_scale(const Poly& p, uint8_t x) {
    Poly r(p.size());
    for (size_t i = 0; i < p.size(); ++i) {
        r[i] = gf_mul(p[i], x);
    }
    return r;
}

uint8_t poly_eval(const uint8_t* p, size_t size, uint8_t x) {
    uint8_t y = p[0];
    for (size_t i = 1; i < size; ++i) {
        y = gf_mul(y, x) ^ p[i];
    }
    return y;
}

uint8_t poly_eval(const Poly& p, uint8_t x) {
    return poly_eval(p.data(), p.size(), x);
}

Poly generator_poly(size_t nsym) {
    Poly g{1};
    for (size_t i = 0; i < nsym; ++i) {
        g = poly_mul(g, Poly{1, gf_pow(2, static_cast<long>(i))});
    }
    return g;
}

//==============================================
// DECODER STAGES
//==============================================

// Syndromes with the erasure contributions removed
Poly forney_syndromes(const Poly& synd, const std::vector<size_t>& positions, size_t n) {
    Poly fsynd(synd.begin() + 1, synd.end());
    for (size_t pos : positions) {
        uint8_t x = gf_pow(2, static_cast<long>(n - 1 - pos));
        for (size_t j = 0; j + 1 < fsynd.size(); ++j) {
            fsynd[j] = gf_mul(fsynd[j], x) ^ fsynd[j + 1];
        }
    }
    return fsynd;
}

// Berlekamp-Massey over the Forney syndromes
Poly find_error_locator(const Poly& synd, size_t nsym, size_t erase_count) {
    Poly err_loc{1};
    Poly old_loc{1};

    for (size_t k = 0; k < nsym - erase_count; ++k) {
        uint8_t delta = synd[k];
        for (size_t j = 1; j < err_loc.size(); ++j) {
            delta ^= gf_mul(err_loc[err_loc.size() - 1 - j], synd[k - j]);
        }
        old_loc.push_back(0);

        if (delta != 0) {
            if (old_loc.size() > err_loc.size()) {
                Poly new_loc = poly_scale(old_loc, delta);
                old_loc = poly_scale(err_loc, gf_inverse(delta));
                err_loc = std::move(new_loc);
            }
            err_loc = poly_add(err_loc, poly_scale(old_loc, delta));
        }
    }

    auto first = std::find_if(err_loc.begin(), err_loc.end(), [](uint8_t c) { return c != 0; });
    err_loc.erase(err_loc.begin(), first);

    long errs = static_cast<long>(err_loc.size()) - 1;
    long ec = static_cast<long>(erase_count);
    if ((errs - ec) * 2 + ec > static_cast<long>(nsym)) {
        throw ErasureUndecodable("too many errors to correct");
    }
    return err_loc;
}

// Chien search on the reversed locator
std::vector<size_t> find_errors(const Poly& err_loc_reversed, size_t n) {
    size_t errs = err_loc_reversed.size() - 1;
    std::vector<size_t> positions;
    for (size_t i = 0; i < n; ++i) {
        if (poly_eval(err_loc_reversed, gf_pow(2, static_cast<long>(i))) == 0) {
            positions.push_back(n - 1 - i);
        }
    }
    if (positions.size() != errs) {
        throw ErasureUndecodable("could not locate all errors");
    }
    return positions;
}

void correct_errata(Bytes& codeword, const Poly& synd, const std::vector<size_t>& positions) {
    const size_t n = codeword.size();

    std::vector<uint8_t> locators;
    Poly errata_loc{1};
    for (size_t pos : positions) {
        uint8_t x = gf_pow(2, static_cast<long>(n - 1 - pos));
        locators.push_back(x);
        errata_loc = poly_mul(errata_loc, poly_add(Poly{1}, Poly{x, 0}));
    }

    // Evaluator: (S(x) * Lambda(x)) mod x^len(Lambda)
    Poly reversed_synd(synd.rbegin(), synd.rend());
    Poly product = poly_mul(reversed_synd, errata_loc);
    Poly evaluator(product.end() - static_cast<long>(errata_loc.size()), product.end());

    for (size_t i = 0; i < locators.size(); ++i) {
        uint8_t xi = locators[i];
        uint8_t xi_inv = gf_inverse(xi);

        uint8_t prime = 1;
        for (size_t j = 0; j < locators.size(); ++j) {
            if (j != i) {
                prime = gf_mul(prime, 1 ^ gf_mul(xi_inv, locators[j]));
            }
        }
        if (prime == 0) {
            throw ErasureUndecodable("duplicate errata position");
        }

        uint8_t y = gf_mul(xi, poly_eval(evaluator, xi_inv));
        codeword[positions[i]] ^= gf_div(y, prime);
    }
}

bool all_zero(const Poly& p) {
    return std::all_of(p.begin(), p.end(), [](uint8_t c) { return c == 0; });
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

ReedSolomon::ReedSolomon(size_t ecc_symbols)
    : nsym_(ecc_symbols) {
    if (nsym_ == 0 || nsym_ >= FIELD_SIZE) {
        throw InvalidShardConfig("ecc symbols must be in [1, 254], got " + std::to_string(nsym_));
    }
    generator_ = generator_poly(nsym_);
}

//==============================================
// ENCODING
//==============================================

Bytes ReedSolomon::encode_block(const uint8_t* message, size_t size) const {
    Bytes out(size + nsym_, 0);
    std::copy(message, message + size, out.begin());

    for (size_t i = 0; i < size; ++i) {
        uint8_t coef = out[i];
        if (coef != 0) {
            for (size_t j = 1; j < generator_.size(); ++j) {
                out[i + j] ^= gf_mul(generator_[j], coef);
            }
        }
    }

    // Division clobbered the message part; restore it
    std::copy(message, message + size, out.begin());
    return out;
}

Bytes ReedSolomon::encode(const Bytes& message) const {
    Bytes out;
    const size_t step = message_block_size();
    out.reserve(message.size() + ((message.size() + step - 1) / step) * nsym_);

    for (size_t offset = 0; offset < message.size(); offset += step) {
        size_t len = std::min(step, message.size() - offset);
        Bytes block = encode_block(message.data() + offset, len);
        out.insert(out.end(), block.begin(), block.end());
    }
    return out;
}

//==============================================
// DECODING
//==============================================

std::vector<uint8_t> ReedSolomon::syndromes(const Bytes& codeword) const {
    Poly synd(nsym_ + 1, 0);
    for (size_t i = 0; i < nsym_; ++i) {
        synd[i + 1] = poly_eval(codeword.data(), codeword.size(), gf_pow(2, static_cast<long>(i)));
    }
    return synd;
}

Bytes ReedSolomon::decode_block(Bytes codeword, const std::vector<size_t>& erasures) const {
    if (codeword.size() <= nsym_) {
        throw ErasureUndecodable("codeword shorter than its parity");
    }
    if (erasures.size() > nsym_) {
        throw ErasureUndecodable("too many erasures to correct");
    }
    for (size_t pos : erasures) {
        codeword[pos] = 0;
    }

    Poly synd = syndromes(codeword);
    if (!all_zero(synd)) {
        Poly fsynd = forney_syndromes(synd, erasures, codeword.size());
        Poly err_loc = find_error_locator(fsynd, nsym_, erasures.size());
        std::reverse(err_loc.begin(), err_loc.end());
        std::vector<size_t> positions = find_errors(err_loc, codeword.size());

        positions.insert(positions.begin(), erasures.begin(), erasures.end());
        correct_errata(codeword, synd, positions);

        if (!all_zero(syndromes(codeword))) {
            throw ErasureUndecodable("could not correct codeword");
        }
    }

    codeword.resize(codeword.size() - nsym_);
    return codeword;
}

Bytes ReedSolomon::decode(const Bytes& encoded, const std::vector<size_t>& erasures) const {
    Bytes out;
    for (size_t offset = 0; offset < encoded.size(); offset += FIELD_SIZE) {
        size_t len = std::min(FIELD_SIZE, encoded.size() - offset);

        std::vector<size_t> local;
        for (size_t pos : erasures) {
            if (pos >= offset && pos < offset + len) {
                local.push_back(pos - offset);
            }
        }

        Bytes block(encoded.begin() + static_cast<long>(offset),
                    encoded.begin() + static_cast<long>(offset + len));
        Bytes message = decode_block(std::move(block), local);
        out.insert(out.end(), message.begin(), message.end());
    }
    return out;
}

bool ReedSolomon::check(const Bytes& encoded) const {
    for (size_t offset = 0; offset < encoded.size(); offset += FIELD_SIZE) {
        size_t len = std::min(FIELD_SIZE, encoded.size() - offset);
        if (len <= nsym_) {
            return false;
        }
        Bytes block(encoded.begin() + static_cast<long>(offset),
                    encoded.begin() + static_cast<long>(offset + len));
        if (!all_zero(syndromes(block))) {
            return false;
        }
    }
    return true;
}

} // namespace dcs::erasure
