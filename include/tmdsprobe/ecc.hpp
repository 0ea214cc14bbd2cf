#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace tmdsprobe {

/**
 * BCH(31,24) Packet Header ECC
 *
 * HDMI protects the 24-bit packet header {HB0, HB1, HB2} with a shortened
 * binary BCH code: generator G(x) = x^7 + x^3 + x^2 + 1, computed by a 7-bit
 * LFSR over the header bits, most significant first. The parity byte is
 * the 7-bit register with bit 7 always zero.
 *
 * The same LFSR parameterized by an arbitrary generator backs the polynomial
 * search used to diagnose ECC mismatches against captured hardware. Nothing
 * here holds state.
 */
namespace bch {

constexpr int HEADER_BITS = 24;
constexpr int DEGREE = 7;
constexpr uint32_t HDMI_POLYNOMIAL = 0x8D;       // x^7 + x^3 + x^2 + 1 (leading term included)
constexpr uint32_t HDMI_TAPS = 0x0D;             // Non-leading terms: x^3, x^2, x^0
constexpr uint32_t PARITY_MASK = 0x7F;

// Pack header bytes MSB first: hb0 << 16 | hb1 << 8 | hb2
inline uint32_t headerWord(uint8_t hb0, uint8_t hb1, uint8_t hb2) {
    return (static_cast<uint32_t>(hb0) << 16) | (static_cast<uint32_t>(hb1) << 8) | hb2;
}

// HDMI header parity for a 24-bit header word
uint8_t encode(uint32_t header);

// Generic LFSR parity.
// polynomial includes the x^degree term; degree must be in [1, 31].
// Returns nullopt for an out-of-range degree.
std::optional<uint32_t> encodeWith(uint32_t data, int data_bits, uint32_t polynomial, int degree);

// Number of differing bits
int bitErrors(uint32_t a, uint32_t b);

// Result of checking a received parity against the header
struct Verification {
    uint8_t expected = 0;
    int bit_errors = 0;
    bool match = false;
};

Verification verify(uint32_t header, uint8_t received);

// Candidate generator for the polynomial search
struct Candidate {
    std::string name;           // e.g. "x^7 + x^3 + x^2 + 1"
    uint32_t polynomial = 0;    // Leading term included
    int degree = DEGREE;
};

struct CandidateScore {
    Candidate candidate;
    uint32_t computed = 0;
    int bit_errors = 0;

    bool isPerfect() const { return bit_errors == 0; }
};

// Score every candidate against a (header, received parity) pair.
// Sorted by ascending bit errors; ties keep the input order.
// Candidates with an invalid degree are skipped.
std::vector<CandidateScore> testPolynomials(uint32_t header, uint32_t received,
                                            const std::vector<Candidate>& candidates);

// Ten common degree-7 generators (includes the HDMI one)
const std::vector<Candidate>& commonPolynomials();

// "x^7 + x^3 + x^2 + 1"
std::string polynomialToString(uint32_t polynomial, int degree);

} // namespace bch

} // namespace tmdsprobe
