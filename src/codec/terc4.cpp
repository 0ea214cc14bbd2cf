#include "tmdsprobe/terc4.hpp"

namespace tmdsprobe {
namespace terc4 {

// HDMI 1.4 Table 5-12 (bit 0 transmitted first)
const std::array<uint32_t, SYMBOL_COUNT> CODE_TABLE = {
    0b1010011100,   // 0x0
    0b1001100011,   // 0x1
    0b1011100100,   // 0x2
    0b1011100010,   // 0x3
    0b0101110001,   // 0x4
    0b0100011110,   // 0x5
    0b0110001110,   // 0x6
    0b0100111100,   // 0x7
    0b1011001100,   // 0x8
    0b0100111001,   // 0x9
    0b0110011100,   // 0xA
    0b1011000110,   // 0xB
    0b1010001110,   // 0xC
    0b1001110001,   // 0xD
    0b0101100011,   // 0xE
    0b1011000011,   // 0xF
};

namespace {

// 1024-entry reverse table, built once from CODE_TABLE.
// -1 marks codes that are not TERC4 characters.
struct DecodeTable {
    std::array<int8_t, CODE_MASK + 1> symbol;

    DecodeTable() {
        symbol.fill(-1);
        for (size_t s = 0; s < SYMBOL_COUNT; s++) {
            symbol[CODE_TABLE[s]] = static_cast<int8_t>(s);
        }
    }
};

const DecodeTable& decodeTable() {
    static const DecodeTable table;
    return table;
}

} // anonymous namespace

uint32_t encode(uint8_t symbol) {
    return CODE_TABLE[symbol & 0x0F];
}

std::optional<uint8_t> decode(uint32_t code) {
    if (code > CODE_MASK) return std::nullopt;
    int8_t s = decodeTable().symbol[code];
    if (s < 0) return std::nullopt;
    return static_cast<uint8_t>(s);
}

Nibble decode(const BusValue& code) {
    if (!code) return std::nullopt;
    return decode(*code);
}

bool isValidCode(uint32_t code) {
    return decode(code).has_value();
}

} // namespace terc4
} // namespace tmdsprobe
