#include "tmdsprobe/ecc.hpp"
#include "tmdsprobe/logging.hpp"
#include <algorithm>
#include <bit>

namespace tmdsprobe {
namespace bch {

// ============================================================================
// HDMI BCH(31,24) encoder
// ============================================================================
uint8_t encode(uint32_t header) {
    uint32_t lfsr = 0;

    // Process 24 data bits (MSB first)
    for (int i = HEADER_BITS - 1; i >= 0; i--) {
        uint32_t bit = (header >> i) & 1;
        uint32_t feedback = bit ^ ((lfsr >> (DEGREE - 1)) & 1);

        lfsr = (lfsr << 1) & ((1u << DEGREE) - 1);
        if (feedback) {
            lfsr ^= HDMI_TAPS;
        }
    }

    // Bit 7 is always zero
    return static_cast<uint8_t>(lfsr & PARITY_MASK);
}

std::optional<uint32_t> encodeWith(uint32_t data, int data_bits, uint32_t polynomial, int degree) {
    if (degree < 1 || degree > 31 || data_bits < 0 || data_bits > 32) {
        return std::nullopt;
    }

    const uint32_t mask = (1u << degree) - 1;
    const uint32_t taps = polynomial & mask;
    uint32_t lfsr = 0;

    for (int i = data_bits - 1; i >= 0; i--) {
        uint32_t bit = (data >> i) & 1;
        uint32_t feedback = bit ^ ((lfsr >> (degree - 1)) & 1);

        lfsr = (lfsr << 1) & mask;
        if (feedback) {
            lfsr ^= taps;
        }
    }

    return lfsr;
}

int bitErrors(uint32_t a, uint32_t b) {
    return std::popcount(a ^ b);
}

Verification verify(uint32_t header, uint8_t received) {
    Verification v;
    v.expected = encode(header);
    v.bit_errors = bitErrors(v.expected, received);
    v.match = (v.bit_errors == 0);
    LOG_ECC(TRACE, "header=0x%06X received=0x%02X expected=0x%02X errors=%d",
            header, received, v.expected, v.bit_errors);
    return v;
}

// ============================================================================
// Polynomial search
// ============================================================================
std::vector<CandidateScore> testPolynomials(uint32_t header, uint32_t received,
                                            const std::vector<Candidate>& candidates) {
    std::vector<CandidateScore> scores;
    scores.reserve(candidates.size());

    for (const auto& c : candidates) {
        auto computed = encodeWith(header, HEADER_BITS, c.polynomial, c.degree);
        if (!computed) {
            LOG_ECC(WARN, "Skipping %s: invalid degree %d", c.name.c_str(), c.degree);
            continue;
        }

        CandidateScore s;
        s.candidate = c;
        s.computed = *computed;
        s.bit_errors = bitErrors(*computed, received);
        scores.push_back(s);

        LOG_ECC(DEBUG, "%s poly=0x%02X -> 0x%02X (%d bit errors)",
                c.name.c_str(), c.polynomial, *computed, s.bit_errors);
    }

    std::stable_sort(scores.begin(), scores.end(),
                     [](const CandidateScore& a, const CandidateScore& b) {
                         return a.bit_errors < b.bit_errors;
                     });
    return scores;
}

const std::vector<Candidate>& commonPolynomials() {
    static const std::vector<Candidate> list = [] {
        const uint32_t polys[] = {
            0b10000011,
            0b10001101,     // HDMI
            0b11000001,
            0b11110111,
            0b11001011,
            0b10011101,
            0b10111111,
            0b10001001,
            0b10010001,
            0b10101101,
        };
        std::vector<Candidate> out;
        for (uint32_t p : polys) {
            out.push_back(Candidate{polynomialToString(p, DEGREE), p, DEGREE});
        }
        return out;
    }();
    return list;
}

std::string polynomialToString(uint32_t polynomial, int degree) {
    std::string out;
    for (int i = degree; i >= 0; i--) {
        // Leading term is implied even if the caller left it out
        bool set = (i == degree) || ((polynomial >> i) & 1);
        if (!set) continue;
        if (!out.empty()) out += " + ";
        if (i == 0) {
            out += "1";
        } else if (i == 1) {
            out += "x";
        } else {
            out += "x^" + std::to_string(i);
        }
    }
    return out;
}

} // namespace bch
} // namespace tmdsprobe
