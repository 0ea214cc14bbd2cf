#pragma once

// Synthetic data islands for the tests: TERC4 rows, signal traces and CSV text
// shaped like a Gowin analyzer export.

#include "tmdsprobe/ecc.hpp"
#include "tmdsprobe/island.hpp"
#include "tmdsprobe/terc4.hpp"
#include <array>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace testutil {

using namespace tmdsprobe;

using CodeRow = std::array<BusValue, CHANNEL_COUNT>;

// TMDS control token (CTL 00), not a TERC4 character
constexpr uint32_t CONTROL_CODE = 0b1101010100;

inline CodeRow codes(uint32_t c0, uint32_t c1, uint32_t c2) {
    return CodeRow{c0, c1, c2};
}

inline CodeRow symbols(uint8_t n0, uint8_t n1, uint8_t n2) {
    return CodeRow{terc4::encode(n0), terc4::encode(n1), terc4::encode(n2)};
}

// 4 rows carrying one byte per channel, bits [2i+1:2i] on row i.
// `high` fills the two upper symbol bits, which byte assembly ignores.
inline std::vector<CodeRow> byteWindow(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t high = 0) {
    std::vector<CodeRow> rows;
    for (int i = 0; i < 4; i++) {
        auto piece = [&](uint8_t b) {
            return static_cast<uint8_t>(((b >> (2 * i)) & 0x3) | ((high & 0x3) << 2));
        };
        rows.push_back(symbols(piece(b0), piece(b1), piece(b2)));
    }
    return rows;
}

struct PacketLayout {
    std::array<uint8_t, 3> header{0x02, 0x00, 0x00};
    std::optional<uint8_t> ecc;                       // Default: BCH of the header
    std::vector<std::array<uint8_t, 3>> subpackets;   // Bytes on channels 0, 1, 2
    size_t preamble = 8;
    bool leading_guard = true;
    bool trailing_guard = true;
};

inline std::vector<CodeRow> packetRows(const PacketLayout& layout) {
    std::vector<CodeRow> rows;
    auto append = [&rows](const std::vector<CodeRow>& more) {
        rows.insert(rows.end(), more.begin(), more.end());
    };
    const CodeRow guard = codes(terc4::GUARD_CODE, terc4::GUARD_CODE, terc4::GUARD_CODE);

    for (size_t i = 0; i < layout.preamble; i++) {
        rows.push_back(codes(terc4::PREAMBLE_CODE, terc4::PREAMBLE_CODE, terc4::PREAMBLE_CODE));
    }
    if (layout.leading_guard) {
        rows.push_back(guard);
        rows.push_back(guard);
    }

    append(byteWindow(layout.header[0], layout.header[1], layout.header[2]));
    uint8_t ecc = layout.ecc.value_or(
        bch::encode(bch::headerWord(layout.header[0], layout.header[1], layout.header[2])));
    append(byteWindow(ecc, 0x00, 0x00));

    for (const auto& sp : layout.subpackets) {
        append(byteWindow(sp[0], sp[1], sp[2]));
    }

    if (layout.trailing_guard) {
        rows.push_back(guard);
        rows.push_back(guard);
    }
    return rows;
}

// Island built directly from rows, no preamble indicator
inline DataIsland makeIsland(const std::vector<CodeRow>& rows) {
    DataIsland island;
    for (size_t i = 0; i < rows.size(); i++) {
        IslandSample s;
        s.index = i;
        s.time = static_cast<int64_t>(i);
        s.line_count = static_cast<uint32_t>(650 + i);
        s.channels = rows[i];
        island.samples.push_back(s);
    }
    return island;
}

/**
 * TraceBuilder
 *
 * Appends rows to a SignalTraces: idle stretches with the gate low, islands
 * with the gate high, and line counter wraps. The line counter counts up by
 * one per row; time advances 40 per row.
 */
class TraceBuilder {
public:
    explicit TraceBuilder(uint32_t h_start = 600, bool with_enable = true, bool with_preamble = true,
                          bool with_line_counter = true)
        : h_(h_start), with_enable_(with_enable), with_preamble_(with_preamble),
          with_line_counter_(with_line_counter) {}

    TraceBuilder& idle(size_t n) {
        for (size_t i = 0; i < n; i++) {
            push(false, false, codes(CONTROL_CODE, CONTROL_CODE, CONTROL_CODE));
        }
        return *this;
    }

    TraceBuilder& island(const std::vector<CodeRow>& rows, size_t preamble_rows = 8) {
        for (size_t i = 0; i < rows.size(); i++) {
            push(true, i < preamble_rows, rows[i]);
        }
        return *this;
    }

    // Gate held high over arbitrary rows
    TraceBuilder& gated(size_t n, const CodeRow& row) {
        for (size_t i = 0; i < n; i++) push(true, false, row);
        return *this;
    }

    // Next row restarts the line counter
    TraceBuilder& wrapLine(uint32_t to = 0) {
        h_ = to;
        return *this;
    }

    const SignalTraces& traces() const { return t_; }

private:
    void push(bool gate, bool preamble, const CodeRow& row) {
        t_.time.push_back(static_cast<int64_t>(t_.time.size()) * 40);
        if (with_enable_) t_.island_enable.push_back(gate);
        if (with_preamble_) t_.preamble.push_back(preamble);
        if (with_line_counter_) t_.line_counter.push_back(h_);
        h_++;
        for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
            t_.channels[ch].push_back(row[ch]);
        }
    }

    SignalTraces t_;
    uint32_t h_;
    bool with_enable_;
    bool with_preamble_;
    bool with_line_counter_;
};

// Gowin-style CSV export of a set of traces (10-bit channels, 12-bit counters)
inline std::string toCsv(const SignalTraces& t) {
    std::ostringstream out;
    out << "Gowin Analyzer Oscilloscope export\n";
    out << "\n";

    const char* channel_names[CHANNEL_COUNT] = {
        "u_hdmi/tmds_encoded_red", "u_hdmi/tmds_encoded_green", "u_hdmi/tmds_encoded_blue"};

    out << "Time(time unit: ns)";
    if (t.hasEnable()) out << ",u_hdmi/data_island_enable";
    if (t.hasPreamble()) out << ",u_hdmi/preamble_active";
    if (t.hasLineCounter()) {
        for (int bit = 11; bit >= 0; bit--) out << ",u_hdmi/horizontal_counter[" << bit << "]";
    }
    for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
        for (int bit = 9; bit >= 0; bit--) out << "," << channel_names[ch] << "[" << bit << "]";
    }
    out << "\n";

    auto bits = [&out](const BusValue& v, int width) {
        for (int bit = width - 1; bit >= 0; bit--) {
            if (!v) out << ",X";
            else out << "," << ((*v >> bit) & 1);
        }
    };
    auto flag = [&out](const std::optional<bool>& b) {
        if (!b) out << ",X";
        else out << "," << (*b ? 1 : 0);
    };

    for (size_t r = 0; r < t.size(); r++) {
        out << t.time[r];
        if (t.hasEnable()) flag(t.island_enable[r]);
        if (t.hasPreamble()) flag(t.preamble[r]);
        if (t.hasLineCounter()) bits(t.line_counter[r], 12);
        for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) bits(t.channels[ch][r], 10);
        out << "\n";
    }
    return out.str();
}

} // namespace testutil
