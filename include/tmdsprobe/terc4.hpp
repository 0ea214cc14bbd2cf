#pragma once

#include "types.hpp"
#include <array>

namespace tmdsprobe {

/**
 * TERC4 Codec
 *
 * TMDS Error Reduction Coding, 4-bit: the 16 ten-bit codes used on every
 * TMDS channel during a data island. The table is a bijection, so decode is
 * its exact inverse. Codes outside the table decode to "no match", which the
 * segment decoder records as an anomaly for that sample.
 *
 * The preamble and guard-band constants are the same on all three channels.
 * Note the guard pattern is also the code for symbol 0x8.
 */
namespace terc4 {

constexpr size_t SYMBOL_COUNT = 16;
constexpr uint32_t CODE_MASK = 0x3FF;            // 10-bit TMDS character

constexpr uint32_t PREAMBLE_CODE = 0b1101010100;
constexpr uint32_t GUARD_CODE    = 0b1011001100;

// Symbol -> code
extern const std::array<uint32_t, SYMBOL_COUNT> CODE_TABLE;

// Encode 4-bit symbol (upper bits ignored)
uint32_t encode(uint8_t symbol);

// Decode a 10-bit code, nullopt if it is not one of the 16 valid codes
std::optional<uint8_t> decode(uint32_t code);

// Decode a captured bus value; unknown input stays unknown
Nibble decode(const BusValue& code);

// True if code is one of the 16 data codes
bool isValidCode(uint32_t code);

inline bool isPreamble(const BusValue& code) { return code && *code == PREAMBLE_CODE; }
inline bool isGuard(const BusValue& code) { return code && *code == GUARD_CODE; }

} // namespace terc4

} // namespace tmdsprobe
