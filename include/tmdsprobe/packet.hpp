#pragma once

#include "island.hpp"
#include "types.hpp"
#include <array>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace tmdsprobe {

// Packet kinds (HB0). UNKNOWN carries the raw byte in PacketType::raw.
enum class PacketKind : uint8_t {
    NULL_PACKET,
    AUDIO_CLOCK_REGEN,
    AUDIO_SAMPLE,
    GENERAL_CONTROL,
    AVI_INFOFRAME,
    SPD_INFOFRAME,
    AUDIO_INFOFRAME,
    MPEG_INFOFRAME,
    GAMUT_METADATA,
    VENDOR_INFOFRAME,
    UNKNOWN,
};

struct PacketType {
    PacketKind kind = PacketKind::UNKNOWN;
    uint8_t raw = 0;

    static PacketType fromByte(uint8_t hb0);

    bool isKnown() const { return kind != PacketKind::UNKNOWN; }

    // "Audio Sample Packet", or "Unknown (0x42)"
    std::string label() const;

    bool operator==(const PacketType& other) const = default;
};

const char* packetKindToString(PacketKind kind);

// Per-channel decode detail for one sample (diagnostics)
struct SymbolDetail {
    BusValue code;                   // Captured 10-bit character
    Nibble nibble;                   // TERC4 decode
    BusValue expected;               // Pattern for preamble/guards, re-encoded nibble otherwise
    Match match = Match::UNKNOWN;
    bool anomaly = false;            // Code known but not a valid TERC4 symbol
};

struct SampleDetail {
    size_t index = 0;
    int64_t time = 0;
    BusValue line_count;
    std::array<SymbolDetail, CHANNEL_COUNT> channels;
};

struct SegmentDetail {
    SegmentKind kind = SegmentKind::PREAMBLE;
    bool confirmed = false;
    std::vector<SampleDetail> samples;

    size_t anomalyCount() const;
};

struct PacketHeader {
    std::array<std::optional<uint8_t>, 3> bytes;            // HB0, HB1, HB2
    std::array<std::array<Nibble, HEADER_SAMPLES>, CHANNEL_COUNT> nibbles{};
    std::optional<PacketType> type;                         // Resolved only when complete

    bool complete() const { return bytes[0] && bytes[1] && bytes[2]; }

    // 24-bit {HB0, HB1, HB2}, nullopt if incomplete
    std::optional<uint32_t> word() const;

    std::string label() const;
};

struct EccResult {
    std::optional<uint8_t> received;
    std::optional<uint8_t> expected;     // Only for a complete header
    std::optional<int> bit_errors;
    Match match = Match::UNKNOWN;
    std::array<Nibble, ECC_SAMPLES> nibbles{};
};

// ============================================================================
// Typed payloads
// ============================================================================

// One audio sub-packet: SB0 present flags, SB1-3 left, SB4-6 right
struct AudioSubPacket {
    std::optional<uint8_t> present;
    std::optional<int32_t> left;         // Sign-extended 24-bit PCM
    std::optional<int32_t> right;
};

struct AudioSamplePayload {
    size_t available_subpackets = 0;     // Whole sub-packets in the payload segment
    std::vector<AudioSubPacket> subpackets;   // Decoded, at most 4
};

enum class AudioRate : uint8_t {
    UNSPECIFIED,                         // N == 0
    RATE_44K1,
    RATE_48K,
    RATE_96K,
    CUSTOM,
};

const char* audioRateToString(AudioRate rate);

struct ClockRegenPayload {
    std::optional<uint32_t> cts;         // Cycle Time Stamp, 20 bits
    std::optional<uint32_t> n;           // 20 bits
    std::optional<AudioRate> rate;
};

using Payload = std::variant<std::monostate, AudioSamplePayload, ClockRegenPayload>;

struct Packet {
    size_t island_index = 0;
    size_t total_samples = 0;
    int64_t start_time = 0;
    int64_t end_time = 0;
    BusValue start_line_count;
    BusValue end_line_count;
    Termination termination = Termination::END_OF_CAPTURE;

    PacketHeader header;
    EccResult ecc;
    size_t payload_samples = 0;
    Payload payload;
    std::array<SegmentDetail, SEGMENT_COUNT> segments;

    const SegmentDetail& segment(SegmentKind kind) const {
        return segments[static_cast<size_t>(kind)];
    }
};

/**
 * Packet Decoder
 *
 * Turns a segmented island into a Packet. Every byte is assembled the same
 * way: sample i of a 4-sample window contributes the low two bits of a
 * channel's decoded symbol as bits [2i+1:2i]. An unknown symbol makes the
 * byte, and everything built from it, unknown.
 */
namespace packet {

// Assemble one byte from a channel over a 4-sample window (nullopt if short or unknown)
std::optional<uint8_t> assembleByte(std::span<const IslandSample> window, size_t channel);

PacketHeader decodeHeader(std::span<const IslandSample> header_samples);

EccResult decodeEcc(std::span<const IslandSample> ecc_samples, const PacketHeader& header);

// Seven sub-packet bytes; byte b rides channel b % 3
std::array<std::optional<uint8_t>, 7> subPacketBytes(std::span<const IslandSample> window);

// Sign-extend a 24-bit two's complement value
inline int32_t signExtend24(uint32_t value) {
    value &= 0xFFFFFF;
    return (value & 0x800000) ? static_cast<int32_t>(value | 0xFF000000u) : static_cast<int32_t>(value);
}

AudioSubPacket decodeAudioSubPacket(const std::array<std::optional<uint8_t>, 7>& bytes);

AudioSamplePayload decodeAudioSample(std::span<const IslandSample> payload_samples);

// CTS/N field: b0 | b1 << 8 | (b2 & 0xF) << 16
std::optional<uint32_t> clockRegenField(const std::array<std::optional<uint8_t>, 7>& bytes);

AudioRate classifyAudioRate(uint32_t n);

ClockRegenPayload decodeClockRegen(std::span<const IslandSample> payload_samples);

SegmentDetail describeSegment(const DataIsland& island, SegmentKind kind);

} // namespace packet

// decodeIsland(island)
Packet decodeIsland(const DataIsland& island);

} // namespace tmdsprobe
