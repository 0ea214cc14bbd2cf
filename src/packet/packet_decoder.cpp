#include "tmdsprobe/packet.hpp"
#include "tmdsprobe/ecc.hpp"
#include "tmdsprobe/terc4.hpp"
#include "tmdsprobe/logging.hpp"
#include <algorithm>
#include <cstdio>

namespace tmdsprobe {

// ============================================================================
// Packet types
// ============================================================================

PacketType PacketType::fromByte(uint8_t hb0) {
    PacketType t;
    t.raw = hb0;
    switch (hb0) {
        case 0x00: t.kind = PacketKind::NULL_PACKET; break;
        case 0x01: t.kind = PacketKind::AUDIO_CLOCK_REGEN; break;
        case 0x02: t.kind = PacketKind::AUDIO_SAMPLE; break;
        case 0x03: t.kind = PacketKind::GENERAL_CONTROL; break;
        case 0x04:
        case 0x82: t.kind = PacketKind::AVI_INFOFRAME; break;
        case 0x05:
        case 0x83: t.kind = PacketKind::SPD_INFOFRAME; break;
        case 0x06:
        case 0x84: t.kind = PacketKind::AUDIO_INFOFRAME; break;
        case 0x07:
        case 0x85: t.kind = PacketKind::MPEG_INFOFRAME; break;
        case 0x0A: t.kind = PacketKind::GAMUT_METADATA; break;
        case 0x0D:
        case 0x81: t.kind = PacketKind::VENDOR_INFOFRAME; break;
        default:   t.kind = PacketKind::UNKNOWN; break;
    }
    return t;
}

const char* packetKindToString(PacketKind kind) {
    switch (kind) {
        case PacketKind::NULL_PACKET:       return "Null Packet";
        case PacketKind::AUDIO_CLOCK_REGEN: return "Audio Clock Regeneration (ACR)";
        case PacketKind::AUDIO_SAMPLE:      return "Audio Sample Packet";
        case PacketKind::GENERAL_CONTROL:   return "General Control Packet";
        case PacketKind::AVI_INFOFRAME:     return "AVI InfoFrame";
        case PacketKind::SPD_INFOFRAME:     return "Source Product Description InfoFrame";
        case PacketKind::AUDIO_INFOFRAME:   return "Audio InfoFrame";
        case PacketKind::MPEG_INFOFRAME:    return "MPEG Source InfoFrame";
        case PacketKind::GAMUT_METADATA:    return "Gamut Metadata Packet";
        case PacketKind::VENDOR_INFOFRAME:  return "Vendor-Specific InfoFrame";
        default:                            return "Unknown";
    }
}

std::string PacketType::label() const {
    if (isKnown()) return packetKindToString(kind);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "Unknown (0x%02X)", raw);
    return buf;
}

std::optional<uint32_t> PacketHeader::word() const {
    if (!complete()) return std::nullopt;
    return bch::headerWord(*bytes[0], *bytes[1], *bytes[2]);
}

std::string PacketHeader::label() const {
    if (!type) return "Incomplete header";
    return type->label();
}

size_t SegmentDetail::anomalyCount() const {
    size_t count = 0;
    for (const auto& s : samples) {
        for (const auto& ch : s.channels) {
            if (ch.anomaly) count++;
        }
    }
    return count;
}

namespace packet {

// ============================================================================
// Byte assembly
// ============================================================================

std::optional<uint8_t> assembleByte(std::span<const IslandSample> window, size_t channel) {
    if (window.size() < SUBPACKET_SAMPLES || channel >= CHANNEL_COUNT) return std::nullopt;

    uint8_t value = 0;
    for (size_t i = 0; i < SUBPACKET_SAMPLES; i++) {
        Nibble nib = terc4::decode(window[i].channels[channel]);
        if (!nib) return std::nullopt;
        value |= static_cast<uint8_t>((*nib & 0x3) << (i * 2));
    }
    return value;
}

PacketHeader decodeHeader(std::span<const IslandSample> header_samples) {
    PacketHeader header;

    const size_t count = std::min(header_samples.size(), HEADER_SAMPLES);
    for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
        for (size_t i = 0; i < count; i++) {
            header.nibbles[ch][i] = terc4::decode(header_samples[i].channels[ch]);
        }
        header.bytes[ch] = assembleByte(header_samples, ch);
    }

    if (header.complete()) {
        header.type = PacketType::fromByte(*header.bytes[0]);
    }
    return header;
}

EccResult decodeEcc(std::span<const IslandSample> ecc_samples, const PacketHeader& header) {
    EccResult ecc;

    const size_t count = std::min(ecc_samples.size(), ECC_SAMPLES);
    for (size_t i = 0; i < count; i++) {
        ecc.nibbles[i] = terc4::decode(ecc_samples[i].channels[0]);
    }
    ecc.received = assembleByte(ecc_samples, 0);

    if (auto word = header.word()) {
        ecc.expected = bch::encode(*word);
    }

    if (ecc.received && ecc.expected) {
        ecc.bit_errors = bch::bitErrors(*ecc.received, *ecc.expected);
        ecc.match = (*ecc.bit_errors == 0) ? Match::MATCH : Match::MISMATCH;
    }
    return ecc;
}

// ============================================================================
// Segment diagnostics
// ============================================================================

SegmentDetail describeSegment(const DataIsland& island, SegmentKind kind) {
    SegmentDetail detail;
    detail.kind = kind;
    detail.confirmed = island.segment(kind).confirmed;

    // Preamble and guards have a fixed expected character; data segments
    // are checked by re-encoding what was decoded.
    std::optional<uint32_t> pattern;
    if (kind == SegmentKind::PREAMBLE) {
        pattern = terc4::PREAMBLE_CODE;
    } else if (kind == SegmentKind::LEADING_GUARD || kind == SegmentKind::TRAILING_GUARD) {
        pattern = terc4::GUARD_CODE;
    }

    for (const auto& sample : island.samplesOf(kind)) {
        SampleDetail sd;
        sd.index = sample.index;
        sd.time = sample.time;
        sd.line_count = sample.line_count;

        for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
            SymbolDetail& sym = sd.channels[ch];
            sym.code = sample.channels[ch];
            sym.nibble = terc4::decode(sym.code);
            // The preamble is a control token, never a TERC4 character
            sym.anomaly = kind != SegmentKind::PREAMBLE && sym.code.has_value() && !sym.nibble.has_value();

            if (pattern) {
                sym.expected = *pattern;
            } else if (sym.nibble) {
                sym.expected = terc4::encode(*sym.nibble);
            }
            sym.match = compareValues(sym.code, sym.expected);
        }
        detail.samples.push_back(sd);
    }
    return detail;
}

} // namespace packet

// ============================================================================
// Island -> Packet
// ============================================================================

Packet decodeIsland(const DataIsland& island) {
    Packet pkt;
    pkt.total_samples = island.samples.size();
    pkt.termination = island.termination;
    if (!island.samples.empty()) {
        pkt.start_time = island.startTime();
        pkt.end_time = island.endTime();
        pkt.start_line_count = island.samples.front().line_count;
        pkt.end_line_count = island.samples.back().line_count;
    }

    for (size_t k = 0; k < SEGMENT_COUNT; k++) {
        pkt.segments[k] = packet::describeSegment(island, static_cast<SegmentKind>(k));
    }

    pkt.header = packet::decodeHeader(island.samplesOf(SegmentKind::HEADER));
    pkt.ecc = packet::decodeEcc(island.samplesOf(SegmentKind::ECC), pkt.header);

    auto payload = island.samplesOf(SegmentKind::PAYLOAD);
    pkt.payload_samples = payload.size();

    if (pkt.header.type) {
        switch (pkt.header.type->kind) {
            case PacketKind::AUDIO_SAMPLE:
                pkt.payload = packet::decodeAudioSample(payload);
                break;
            case PacketKind::AUDIO_CLOCK_REGEN:
                pkt.payload = packet::decodeClockRegen(payload);
                break;
            default:
                break;
        }
    }

    size_t anomalies = 0;
    for (const auto& seg : pkt.segments) anomalies += seg.anomalyCount();

    LOG_PACKET(DEBUG, "t=%lld %s, ECC %s, %zu payload samples, %zu decode anomalies",
               static_cast<long long>(pkt.start_time), pkt.header.label().c_str(),
               pkt.ecc.match == Match::MATCH ? "ok" :
               pkt.ecc.match == Match::MISMATCH ? "mismatch" : "n/a",
               pkt.payload_samples, anomalies);

    return pkt;
}

} // namespace tmdsprobe
