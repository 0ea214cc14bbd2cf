#include "text_report.hpp"
#include "tmdsprobe/ecc.hpp"
#include "tmdsprobe/logging.hpp"
#include "tmdsprobe/terc4.hpp"
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <variant>

namespace tmdsprobe {
namespace report {

namespace {

std::string strprintf(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list sizing;
    va_copy(sizing, args);
    int len = vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);

    std::string out;
    if (len > 0) {
        out.resize(static_cast<size_t>(len) + 1);
        vsnprintf(out.data(), out.size(), fmt, args);
        out.resize(static_cast<size_t>(len));
    }
    va_end(args);
    return out;
}

// Unknown comparisons leave a blank of the same width
const char* matchColumn(Match m) {
    switch (m) {
        case Match::MATCH:    return "OK ";
        case Match::MISMATCH: return "ERR";
        default:              return "   ";
    }
}

const char* eccStatus(Match m) {
    switch (m) {
        case Match::MATCH:    return "OK";
        case Match::MISMATCH: return "MISMATCH";
        default:              return "N/A";
    }
}

// Time index in the report's unit; scaled only when a period is known
std::string formatTime(double value, const TimeBase& tb) {
    if (tb.period != 1.0) {
        return strprintf("%.2f %s", value * tb.period, tb.unit.c_str());
    }
    return strprintf("%.1f %s", value, tb.unit.c_str());
}

std::string formatTime(int64_t value, const TimeBase& tb) {
    if (tb.period != 1.0) {
        return strprintf("%.2f %s", static_cast<double>(value) * tb.period, tb.unit.c_str());
    }
    return strprintf("%lld %s", static_cast<long long>(value), tb.unit.c_str());
}

std::string pcmField(const std::optional<int32_t>& v) {
    if (!v) return "      --";
    return strprintf("%8d (0x%06X)", *v, static_cast<unsigned>(*v) & 0xFFFFFFu);
}

// Top 16 bits of a 24-bit sample
std::string pcm16(const std::optional<int32_t>& v) {
    if (!v) return "    --";
    return strprintf("%6d", static_cast<int16_t>((*v >> 8) & 0xFFFF));
}

} // anonymous namespace

std::string hexCode(const BusValue& value) {
    return value ? strprintf("0x%03X", *value) : "----";
}

std::string hexByte(const std::optional<uint8_t>& value) {
    return value ? strprintf("0x%02X", *value) : "--";
}

std::string hexNibble(const Nibble& value) {
    return value ? strprintf("0x%X", *value) : "--";
}

std::string countOrNA(const BusValue& value) {
    return value ? std::to_string(*value) : "N/A";
}

void writeBanner(std::ostream& out, const std::string& title, size_t width) {
    out << "\n" << std::string(width, '=') << "\n";
    out << title << "\n";
    out << std::string(width, '=') << "\n";
}

// ============================================================================
// Packets
// ============================================================================

void writeSegment(std::ostream& out, const SegmentDetail& segment) {
    if (segment.samples.empty()) return;

    out << "  " << segmentKindToString(segment.kind) << ":";
    if (!segment.confirmed) out << " (by offset)";
    if (size_t anomalies = segment.anomalyCount()) {
        out << " (" << anomalies << " invalid TERC4 codes)";
    }
    out << "\n";

    static const char channel_tags[CHANNEL_COUNT] = {'R', 'G', 'B'};

    for (const auto& s : segment.samples) {
        out << strprintf("    H:%4s Time:%6lld |",
                         s.line_count ? std::to_string(*s.line_count).c_str() : "---",
                         static_cast<long long>(s.time));
        for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
            const SymbolDetail& sym = s.channels[ch];
            out << (ch == 0 ? " " : "  ")
                << channel_tags[ch] << ":" << hexCode(sym.code) << "/" << hexCode(sym.expected)
                << " " << matchColumn(sym.match);
            if (sym.nibble) {
                out << " nib:" << hexNibble(sym.nibble);
            }
        }
        out << "\n";
    }
}

void writePayload(std::ostream& out, const Payload& payload) {
    if (const auto* audio = std::get_if<AudioSamplePayload>(&payload)) {
        out << "  Audio Samples (" << audio->subpackets.size() << " of "
            << audio->available_subpackets << " sub-packets):\n";
        for (size_t i = 0; i < audio->subpackets.size(); i++) {
            const AudioSubPacket& sp = audio->subpackets[i];
            out << "    Sample " << i << ":\n";
            out << "      Present flags: " << hexByte(sp.present) << "\n";
            out << "      Left:  " << pcmField(sp.left) << "\n";
            out << "      Right: " << pcmField(sp.right) << "\n";
            out << "      (16-bit: L=" << pcm16(sp.left) << ", R=" << pcm16(sp.right) << ")\n";
        }
    } else if (const auto* acr = std::get_if<ClockRegenPayload>(&payload)) {
        out << "  Audio Clock Regeneration:\n";
        out << "    CTS: " << (acr->cts ? std::to_string(*acr->cts) : "--") << "\n";
        out << "    N:   " << (acr->n ? std::to_string(*acr->n) : "--");
        if (acr->rate) out << " (" << audioRateToString(*acr->rate) << ")";
        out << "\n";
    }
}

void writePacket(std::ostream& out, const Packet& packet, size_t number, bool segments) {
    const PacketHeader& h = packet.header;
    const EccResult& ecc = packet.ecc;

    out << "\nPacket #" << number << "\n";
    out << "  H_COUNT range: " << countOrNA(packet.start_line_count)
        << " -> " << countOrNA(packet.end_line_count) << "\n";
    out << "  Samples captured: " << packet.total_samples
        << " (ended by " << terminationToString(packet.termination) << ")\n";

    if (h.type) {
        out << "  Packet Type: " << h.label() << strprintf(" (0x%02X)", h.type->raw) << "\n";
    } else {
        out << "  Packet Type: " << h.label() << "\n";
    }
    out << "  Header Bytes: HB0=" << hexByte(h.bytes[0]) << ", HB1=" << hexByte(h.bytes[1])
        << ", HB2=" << hexByte(h.bytes[2]) << "\n";
    out << "  ECC Byte: received=" << hexByte(ecc.received) << ", expected=" << hexByte(ecc.expected)
        << ", status=" << eccStatus(ecc.match);
    if (ecc.match == Match::MISMATCH && ecc.bit_errors) {
        out << " (" << *ecc.bit_errors << " bit errors)";
    }
    out << "\n";
    out << "  Payload samples: " << packet.payload_samples << "\n";

    writePayload(out, packet.payload);

    if (segments) {
        for (const auto& seg : packet.segments) {
            writeSegment(out, seg);
        }
    }
}

// ============================================================================
// Timing / sync
// ============================================================================

void writeIslandDurations(std::ostream& out, const std::optional<timing::IslandDurations>& d,
                          const TimeBase& time_base) {
    if (!d) {
        out << "\n[!] No data islands detected\n";
        return;
    }
    out << "\nTotal data islands: " << d->count << "\n";
    out << "Average duration: " << formatTime(d->average, time_base) << "\n";
    out << "Min duration: " << formatTime(d->min, time_base) << "\n";
    out << "Max duration: " << formatTime(d->max, time_base) << "\n";
}

void writeTiming(std::ostream& out, const std::optional<timing::TimingReport>& report) {
    writeBanner(out, "TIMING ANALYSIS");
    if (!report) {
        out << "[-] Horizontal counter not found\n";
        return;
    }

    const timing::AxisTiming& h = report->horizontal;
    const auto& v = report->vertical;

    out << "\nCapture Range:\n";
    out << "  H_COUNT: " << h.range.min << " to " << h.range.max << " (of " << h.total << " total)\n";
    if (v) {
        out << "  V_COUNT: " << v->range.min << " to " << v->range.max << " (of " << v->total << " total)\n";
    }

    out << "\nFrame Position Analysis:\n";
    out << "  Horizontal: " << timing::frameRegionToString(h.region, "Horizontal") << "\n";
    if (v) {
        out << "  Vertical: " << timing::frameRegionToString(v->region, "Vertical") << "\n";
        out << "\n  Line Information:\n";
        if (v->range.min == v->range.max) {
            out << "    Single line: " << v->range.min << "\n";
        } else {
            out << "    Multiple lines: " << v->range.min << " to " << v->range.max << "\n";
            out << "    Total lines captured: " << v->range.span() << "\n";
        }
    }

    out << "\n  Capture Coverage:\n";
    out << "    Horizontal: " << h.range.span() << "/" << h.total
        << strprintf(" pixels (%.1f%%)", h.coverage()) << "\n";
    if (auto frame = report->frameCoverage()) {
        out << "    Vertical: " << v->range.span() << "/" << v->total
            << strprintf(" lines (%.1f%%)", v->coverage()) << "\n";
        out << "    Total frame: " << static_cast<uint64_t>(h.range.span()) * v->range.span()
            << "/" << static_cast<uint64_t>(h.total) * v->total
            << strprintf(" pixels (%.2f%%)", *frame) << "\n";
    }

    if (!h.wraps.empty()) {
        out << "\n  Horizontal line transitions: " << h.wraps.size() << "\n";
        if (h.detected_total) {
            out << "  Detected H_TOTAL: " << *h.detected_total << "\n";
            if (*h.detected_total != h.total) {
                out << "    [!] Warning: Expected " << h.total << ", got " << *h.detected_total << "\n";
            }
        }
    }
    if (v && !v->wraps.empty()) {
        out << "\n  Frame transitions: " << v->wraps.size() << "\n";
        if (v->detected_total) {
            out << "  Detected V_TOTAL: " << *v->detected_total << "\n";
            if (*v->detected_total != v->total) {
                out << "    [!] Warning: Expected " << v->total << ", got " << *v->detected_total << "\n";
            }
        }
    }

    out << "\n  Data Island Timing Context:\n";
    if (h.region == timing::FrameRegion::BLANKING) {
        out << "    [+] Capture includes horizontal blanking\n";
    } else {
        out << "    [-] Capture starts in the active video region\n";
    }
    if (v && v->region == timing::FrameRegion::BLANKING) {
        out << "    [+] Capture includes vertical blanking\n";
    } else if (v && v->region == timing::FrameRegion::ACTIVE_AND_BLANKING) {
        out << "    [+] Capture spans into vertical blanking\n";
    }
}

void writeSync(std::ostream& out, const timing::SyncReport& report, const TimeBase& time_base) {
    writeBanner(out, "SYNC SIGNAL ANALYSIS");

    auto one = [&](const char* name, const timing::SyncSignal& sig) {
        if (!sig.available) {
            out << "\n" << name << ": not captured\n";
            return;
        }
        out << "\n" << name << " transitions: " << sig.transitions << "\n";
        if (sig.pulse_interval) {
            out << name << " pulse interval:\n";
            out << "  Average: " << formatTime(sig.pulse_interval->average, time_base) << "\n";
            out << "  Min: " << formatTime(sig.pulse_interval->min, time_base) << "\n";
            out << "  Max: " << formatTime(sig.pulse_interval->max, time_base) << "\n";
        }
    };
    one("HSync", report.hsync);
    one("VSync", report.vsync);
}

void writeStateMachine(std::ostream& out, const std::optional<timing::StateMachineReport>& report,
                       size_t max_listed) {
    writeBanner(out, "STATE MACHINE ANALYSIS");
    if (!report) {
        out << "\n[-] State bus not found\n";
        return;
    }
    if (report->changes.empty()) {
        out << "\n[!] No state changes detected on " << report->bus << "\n";
        return;
    }

    out << "\nState bus: " << report->bus << "\n";
    out << "Total state changes: " << report->changes.size() << "\n";
    const size_t listed = std::min(max_listed, report->changes.size());
    out << "\nFirst " << listed << " state transitions:\n";
    out << strprintf("%10s | %6s | %6s\n", "Time", "From", "To");
    out << std::string(30, '-') << "\n";
    for (size_t i = 0; i < listed; i++) {
        const timing::StateChange& c = report->changes[i];
        out << strprintf("%10lld | %6u | %6u\n", static_cast<long long>(c.time), c.from, c.to);
    }

    out << "\nState transition summary:\n";
    out << strprintf("%6s -> %-6s | Count\n", "From", "To");
    out << std::string(30, '-') << "\n";
    for (const auto& [edge, count] : report->counts) {
        out << strprintf("%6u -> %-6u | %zu\n", edge.first, edge.second, count);
    }
}

// ============================================================================
// BCH polynomial search
// ============================================================================

void writePolynomialSearch(std::ostream& out, const std::optional<PolynomialSearch>& search) {
    writeBanner(out, "BCH POLYNOMIAL TEST AGAINST WAVEFORM DATA", 70);
    if (!search) {
        out << "\n[!] No packet with a complete header and ECC byte\n";
        return;
    }

    out << "\nTest Packet (#" << search->packet_index + 1 << "):\n";
    out << "  Type: " << search->packet_label << "\n";
    out << strprintf("  Header: HB0=0x%02X, HB1=0x%02X, HB2=0x%02X\n", search->hb0, search->hb1, search->hb2);
    out << strprintf("  ECC from waveform: 0x%02X\n", search->received);
    out << "\nTesting " << search->scores.size() << " BCH polynomials (best first):\n";
    out << std::string(70, '=') << "\n";

    for (const auto& s : search->scores) {
        out << strprintf("%-45s Poly=0x%02X -> 0x%02X", s.candidate.name.c_str(),
                      s.candidate.polynomial, s.computed);
        if (s.isPerfect()) {
            out << " *** PERFECT MATCH";
        } else if (s.bit_errors < 3) {
            out << " (close: " << s.bit_errors << " bit errors)";
        }
        out << "\n";
    }
    out << std::string(70, '=') << "\n";

    if (!search->scores.empty() && search->scores.front().isPerfect()) {
        const auto& best = search->scores.front();
        out << "\n[+] Best Match: " << best.candidate.name << "\n";
        out << strprintf("    Polynomial: 0x%02X\n", best.candidate.polynomial);
        out << strprintf("    Calculated ECC: 0x%02X\n", best.computed);
    } else {
        out << "\n[!] No perfect matches found\n";
        out << "    The generator may not be in the candidate list, or the header\n";
        out << "    bytes may be ordered differently on the wire\n";
    }
}

void writeTypeSummary(std::ostream& out, const std::map<std::string, size_t>& summary) {
    writeBanner(out, "PACKET TYPE SUMMARY");
    if (summary.empty()) {
        out << "  No packets found\n";
        return;
    }
    for (const auto& [label, count] : summary) {
        out << "  - " << label << ": " << count << "\n";
    }
}

// ============================================================================
// Info
// ============================================================================

void writeTerc4Table(std::ostream& out) {
    out << "TERC4 code table:\n";
    for (size_t sym = 0; sym < terc4::SYMBOL_COUNT; sym++) {
        uint32_t code = terc4::CODE_TABLE[sym];
        out << strprintf("  0x%X -> 0x%03X  ", static_cast<unsigned>(sym), code);
        for (int bit = 9; bit >= 0; bit--) {
            out << ((code >> bit) & 1);
        }
        out << "\n";
    }
    out << strprintf("  Preamble     0x%03X\n", terc4::PREAMBLE_CODE);
    out << strprintf("  Guard band   0x%03X\n", terc4::GUARD_CODE);
}

void writeConfig(std::ostream& out, const AnalyzerConfig& config) {
    out << "Signals:\n";
    out << "  Island enable:   " << config.island_enable_signal << "\n";
    out << "  Preamble:        " << config.preamble_signal << "\n";
    out << "  Line counter:    " << config.line_counter_bus << "\n";
    out << "  Frame counter:   " << config.frame_counter_bus << "\n";
    for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
        out << "  Channel " << ch << " (" << channelName(static_cast<Channel>(ch)) << "): "
            << config.channel_buses[ch] << "\n";
    }
    out << "  HSync / VSync:   " << config.hsync_signal << " / " << config.vsync_signal << "\n";
    out << "  State bus:      ";
    for (const auto& name : config.state_buses) out << " " << name;
    out << "\n";
    out << "\nFraming:\n";
    out << "  Preamble length: " << config.preamble_length << " samples (fallback)\n";
    out << "  Guard length:    " << config.guard_length << " samples\n";
    out << "  Island cap:      " << config.max_island_samples << " samples\n";
    out << "\nVideo timing:\n";
    out << "  H: " << config.h_active << " active / " << config.h_total << " total\n";
    out << "  V: " << config.v_active << " active / " << config.v_total << " total\n";
    out << strprintf("  Pixel clock: %.3f MHz\n", config.pixel_clock_mhz);
    out << "\nHeader ECC: BCH(31,24), G(x) = "
        << bch::polynomialToString(bch::HDMI_POLYNOMIAL, bch::DEGREE) << "\n";
}

// ============================================================================
// Full report
// ============================================================================

void writeAnalysis(std::ostream& out, WaveformAnalyzer& analyzer) {
    const Capture& cap = analyzer.capture();
    const TimeBase tb = analyzer.timeBase();

    out << "HDMI WAVEFORM ANALYSIS REPORT\n";
    out << std::string(60, '=') << "\n";
    out << "Source: " << (analyzer.source().empty() ? "(memory)" : analyzer.source()) << "\n";
    out << "Samples: " << cap.sampleCount() << "\n";
    if (cap.sampleCount() > 0) {
        out << "Duration: " << formatTime(cap.timeAt(cap.sampleCount() - 1), tb) << "\n";
    }

    writeTiming(out, analyzer.timing());
    writeStateMachine(out, analyzer.stateMachine());
    writeSync(out, analyzer.sync(), tb);

    writeBanner(out, "DATA ISLAND ANALYSIS");
    writeIslandDurations(out, timing::islandDurations(analyzer.islands()), tb);

    const auto& packets = analyzer.packets();
    for (size_t i = 0; i < packets.size(); i++) {
        writePacket(out, packets[i], i + 1, true);
    }
}

bool exportAnalysis(WaveformAnalyzer& analyzer, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("REPORT", "Cannot open %s for writing", path.c_str());
        return false;
    }
    writeAnalysis(file, analyzer);
    file.flush();
    if (!file) {
        LOG_ERROR("REPORT", "Write to %s failed", path.c_str());
        return false;
    }
    LOG_INFO("REPORT", "Analysis exported to %s", path.c_str());
    return true;
}

std::string defaultExportPath(const std::string& source) {
    const std::string ext = ".csv";
    std::string base = source;
    if (base.size() >= ext.size() && base.compare(base.size() - ext.size(), ext.size(), ext) == 0) {
        base.erase(base.size() - ext.size());
    }
    return base + "_analysis.txt";
}

} // namespace report
} // namespace tmdsprobe
