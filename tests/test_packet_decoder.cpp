/**
 * Packet Decoder Tests
 *
 * Header / ECC decoding with unknown propagation, packet type labels,
 * audio sample and clock regeneration payloads, segment diagnostics.
 */

#include "tmdsprobe/packet.hpp"
#include "island_builder.hpp"
#include <algorithm>
#include <iostream>
#include <cassert>

using namespace tmdsprobe;
using namespace testutil;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

// Rows -> segmented island
static DataIsland islandFrom(const std::vector<CodeRow>& rows) {
    DataIsland island = makeIsland(rows);
    IslandSegmenter().partition(island);
    return island;
}

static Packet decodeRows(const std::vector<CodeRow>& rows) {
    return decodeIsland(islandFrom(rows));
}

// Index of the first header row in packetRows() output (preamble + guard)
constexpr size_t HEADER_ROW = 10;
constexpr size_t ECC_ROW = HEADER_ROW + HEADER_SAMPLES;
constexpr size_t PAYLOAD_ROW = ECC_ROW + ECC_SAMPLES;

// ============================================================================
// Packet types
// ============================================================================

bool test_packet_types() {
    TEST("HB0 to packet type, aliases and unknown label");

    assert(PacketType::fromByte(0x00).kind == PacketKind::NULL_PACKET);
    assert(PacketType::fromByte(0x01).kind == PacketKind::AUDIO_CLOCK_REGEN);
    assert(PacketType::fromByte(0x02).kind == PacketKind::AUDIO_SAMPLE);
    assert(PacketType::fromByte(0x03).kind == PacketKind::GENERAL_CONTROL);
    assert(PacketType::fromByte(0x0A).kind == PacketKind::GAMUT_METADATA);

    // InfoFrame type codes with bit 7 set map to the same kinds
    assert(PacketType::fromByte(0x82).kind == PacketKind::AVI_INFOFRAME);
    assert(PacketType::fromByte(0x04).kind == PacketKind::AVI_INFOFRAME);
    assert(PacketType::fromByte(0x83).kind == PacketKind::SPD_INFOFRAME);
    assert(PacketType::fromByte(0x84).kind == PacketKind::AUDIO_INFOFRAME);
    assert(PacketType::fromByte(0x85).kind == PacketKind::MPEG_INFOFRAME);
    assert(PacketType::fromByte(0x81).kind == PacketKind::VENDOR_INFOFRAME);

    PacketType unknown = PacketType::fromByte(0x42);
    assert(!unknown.isKnown());
    if (unknown.label() != "Unknown (0x42)") FAIL("label: " << unknown.label());
    if (PacketType::fromByte(0x02).label() != "Audio Sample Packet") FAIL("audio label");

    PASS();
    return true;
}

// ============================================================================
// Header and ECC
// ============================================================================

bool test_known_audio_packet() {
    TEST("audio sample packet with matching ECC");

    PacketLayout layout;
    layout.subpackets.push_back({0x80, 0x34, 0x12});
    Packet pkt = decodeRows(packetRows(layout));

    if (!pkt.header.complete()) FAIL("header incomplete");
    assert(*pkt.header.bytes[0] == 0x02 && *pkt.header.bytes[1] == 0x00 && *pkt.header.bytes[2] == 0x00);
    assert(pkt.header.word() == std::optional<uint32_t>(0x020000));
    if (pkt.header.label() != "Audio Sample Packet") FAIL("label: " << pkt.header.label());

    if (pkt.ecc.received != std::optional<uint8_t>(0x67)) FAIL("received ECC");
    if (pkt.ecc.expected != std::optional<uint8_t>(0x67)) FAIL("expected ECC");
    assert(pkt.ecc.bit_errors == std::optional<int>(0));
    assert(pkt.ecc.match == Match::MATCH);

    assert(pkt.total_samples == 24);
    assert(pkt.payload_samples == 4);
    assert(pkt.start_line_count == BusValue(650));
    assert(pkt.end_line_count == BusValue(673));

    auto* audio = std::get_if<AudioSamplePayload>(&pkt.payload);
    if (!audio) FAIL("no audio payload");
    assert(audio->available_subpackets == 1);
    assert(audio->subpackets.size() == 1);

    // Bytes 0, 3, 6 ride channel 0; 1, 4 channel 1; 2, 5 channel 2
    const AudioSubPacket& sp = audio->subpackets[0];
    assert(sp.present == std::optional<uint8_t>(0x80));
    assert(sp.left == std::optional<int32_t>(-8383948));     // 0x801234
    assert(sp.right == sp.left);

    for (const auto& seg : pkt.segments) {
        if (seg.anomalyCount() != 0) FAIL(segmentKindToString(seg.kind) << " has anomalies");
    }

    PASS();
    return true;
}

bool test_header_nibbles() {
    TEST("header nibbles kept per channel and sample");

    PacketLayout layout;
    layout.header = {0x84, 0x0D, 0x02};
    Packet pkt = decodeRows(packetRows(layout));

    // 0x84 = 10 00 01 00: pieces 0, 1, 0, 2 from LSB
    assert(pkt.header.nibbles[0][0] == Nibble(0));
    assert(pkt.header.nibbles[0][1] == Nibble(1));
    assert(pkt.header.nibbles[0][2] == Nibble(0));
    assert(pkt.header.nibbles[0][3] == Nibble(2));

    assert(pkt.header.type && pkt.header.type->kind == PacketKind::AUDIO_INFOFRAME);
    assert(pkt.ecc.expected == std::optional<uint8_t>(0x18));
    assert(pkt.ecc.match == Match::MATCH);
    assert(std::holds_alternative<std::monostate>(pkt.payload));

    PASS();
    return true;
}

bool test_upper_symbol_bits_ignored() {
    TEST("only the low two symbol bits contribute to a byte");

    auto rows = packetRows(PacketLayout{});
    auto noisy = byteWindow(0x02, 0x00, 0x00, 0x3);
    std::copy(noisy.begin(), noisy.end(), rows.begin() + HEADER_ROW);

    Packet pkt = decodeRows(rows);
    assert(pkt.header.bytes[0] == std::optional<uint8_t>(0x02));
    assert(pkt.header.nibbles[0][0] == Nibble(0xE));
    assert(pkt.ecc.match == Match::MATCH);

    PASS();
    return true;
}

bool test_unknown_header_type() {
    TEST("unrecognized HB0 is reported with its raw value");

    PacketLayout layout;
    layout.header = {0x42, 0x10, 0x20};
    Packet pkt = decodeRows(packetRows(layout));

    if (pkt.header.label() != "Unknown (0x42)") FAIL("label: " << pkt.header.label());
    assert(pkt.ecc.match == Match::MATCH);
    assert(std::holds_alternative<std::monostate>(pkt.payload));

    PASS();
    return true;
}

bool test_ecc_mismatch() {
    TEST("ECC mismatch reports both values and the bit distance");

    PacketLayout layout;
    layout.ecc = 0x66;
    Packet pkt = decodeRows(packetRows(layout));

    assert(pkt.ecc.received == std::optional<uint8_t>(0x66));
    assert(pkt.ecc.expected == std::optional<uint8_t>(0x67));
    if (pkt.ecc.bit_errors != std::optional<int>(1)) FAIL("bit errors");
    assert(pkt.ecc.match == Match::MISMATCH);

    PASS();
    return true;
}

bool test_unknown_ecc_symbol() {
    TEST("unknown ECC symbol gives unknown match, not mismatch");

    auto rows = packetRows(PacketLayout{});
    rows[ECC_ROW + 2][0] = std::nullopt;

    Packet pkt = decodeRows(rows);
    assert(!pkt.ecc.received.has_value());
    assert(pkt.ecc.expected == std::optional<uint8_t>(0x67));
    assert(!pkt.ecc.bit_errors.has_value());
    if (pkt.ecc.match != Match::UNKNOWN) FAIL("match should be unknown");
    assert(!pkt.ecc.nibbles[2].has_value());
    assert(pkt.ecc.nibbles[0].has_value());

    PASS();
    return true;
}

bool test_incomplete_header() {
    TEST("unknown header symbol leaves type unresolved");

    auto rows = packetRows(PacketLayout{});
    rows[HEADER_ROW + 1][1] = std::nullopt;

    Packet pkt = decodeRows(rows);
    assert(pkt.header.bytes[0] == std::optional<uint8_t>(0x02));
    assert(!pkt.header.bytes[1].has_value());
    assert(!pkt.header.complete());
    assert(!pkt.header.type.has_value());
    assert(!pkt.header.word().has_value());
    if (pkt.header.label() != "Incomplete header") FAIL("label: " << pkt.header.label());

    // No expected ECC without a complete header
    assert(pkt.ecc.received == std::optional<uint8_t>(0x67));
    assert(!pkt.ecc.expected.has_value());
    assert(pkt.ecc.match == Match::UNKNOWN);

    PASS();
    return true;
}

bool test_short_header_window() {
    TEST("header shorter than 4 samples assembles nothing");

    auto rows = packetRows(PacketLayout{});
    rows.resize(HEADER_ROW + 3);

    Packet pkt = decodeRows(rows);
    assert(!pkt.header.complete());
    assert(pkt.header.nibbles[0][2].has_value());
    assert(!pkt.header.nibbles[0][3].has_value());
    assert(!pkt.ecc.received.has_value());
    assert(pkt.payload_samples == 0);

    PASS();
    return true;
}

// ============================================================================
// Payloads
// ============================================================================

bool test_audio_sign_extension() {
    TEST("24-bit PCM sign extension");

    std::array<std::optional<uint8_t>, 7> bytes = {0x01, 0x00, 0x00, 0x80, 0x00, 0x00, 0x00};
    AudioSubPacket sp = packet::decodeAudioSubPacket(bytes);
    assert(sp.present == std::optional<uint8_t>(0x01));
    if (sp.left != std::optional<int32_t>(-8388608)) FAIL("left");
    assert(sp.right == std::optional<int32_t>(0));

    bytes = {0x00, 0xFF, 0xFF, 0x7F, 0xFF, 0xFF, 0xFF};
    sp = packet::decodeAudioSubPacket(bytes);
    assert(sp.left == std::optional<int32_t>(8388607));
    assert(sp.right == std::optional<int32_t>(-1));

    // Unknown byte only affects its own channel
    bytes[5] = std::nullopt;
    sp = packet::decodeAudioSubPacket(bytes);
    assert(sp.left.has_value());
    assert(!sp.right.has_value());

    assert(packet::signExtend24(0xFFFFFF) == -1);
    assert(packet::signExtend24(0x1000001) == 1);

    PASS();
    return true;
}

bool test_audio_subpacket_count() {
    TEST("audio sub-packets limited to whole windows, at most 4");

    PacketLayout layout;
    for (uint8_t i = 0; i < 5; i++) layout.subpackets.push_back({i, 0x00, 0x00});
    auto rows = packetRows(layout);
    // Two extra samples before the trailing guard
    rows.insert(rows.end() - 2, symbols(0, 0, 0));
    rows.insert(rows.end() - 2, symbols(0, 0, 0));

    Packet pkt = decodeRows(rows);
    auto* audio = std::get_if<AudioSamplePayload>(&pkt.payload);
    if (!audio) FAIL("no audio payload");
    assert(pkt.payload_samples == 22);
    assert(audio->available_subpackets == 5);
    if (audio->subpackets.size() != 4) FAIL("decoded " << audio->subpackets.size());
    assert(audio->subpackets[3].present == std::optional<uint8_t>(3));

    // No payload at all
    auto empty = packet::decodeAudioSample({});
    assert(empty.available_subpackets == 0 && empty.subpackets.empty());

    PASS();
    return true;
}

bool test_clock_regen_packet() {
    TEST("ACR packet: CTS, N and audio rate");

    PacketLayout layout;
    layout.header = {0x01, 0x00, 0x00};
    layout.subpackets.push_back({25200 & 0xFF, (25200 >> 8) & 0xFF, 0x00});   // CTS
    layout.subpackets.push_back({6144 & 0xFF, (6144 >> 8) & 0xFF, 0x00});     // N

    Packet pkt = decodeRows(packetRows(layout));
    assert(pkt.header.label() == "Audio Clock Regeneration (ACR)");
    assert(pkt.ecc.expected == std::optional<uint8_t>(0x75));
    assert(pkt.ecc.match == Match::MATCH);

    auto* acr = std::get_if<ClockRegenPayload>(&pkt.payload);
    if (!acr) FAIL("no ACR payload");
    if (acr->cts != std::optional<uint32_t>(25200)) FAIL("CTS");
    if (acr->n != std::optional<uint32_t>(6144)) FAIL("N");
    assert(acr->rate == std::optional<AudioRate>(AudioRate::RATE_48K));

    PASS();
    return true;
}

bool test_clock_regen_short() {
    TEST("ACR without an N sub-packet has no rate");

    PacketLayout layout;
    layout.header = {0x01, 0x00, 0x00};
    layout.subpackets.push_back({0x10, 0x00, 0x0F});

    Packet pkt = decodeRows(packetRows(layout));
    auto* acr = std::get_if<ClockRegenPayload>(&pkt.payload);
    if (!acr) FAIL("no ACR payload");
    assert(acr->cts == std::optional<uint32_t>(0xF0010));
    assert(!acr->n.has_value());
    assert(!acr->rate.has_value());

    PASS();
    return true;
}

bool test_classify_audio_rate() {
    TEST("N value to audio rate");

    assert(packet::classifyAudioRate(6144) == AudioRate::RATE_48K);
    assert(packet::classifyAudioRate(6272) == AudioRate::RATE_44K1);
    assert(packet::classifyAudioRate(12288) == AudioRate::RATE_96K);
    assert(packet::classifyAudioRate(5000) == AudioRate::CUSTOM);
    assert(packet::classifyAudioRate(0) == AudioRate::UNSPECIFIED);

    std::array<std::optional<uint8_t>, 7> bytes = {0x00, 0x18, 0xF0, 0, 0, 0, 0};
    // Only the low nibble of the third byte belongs to the field
    assert(packet::clockRegenField(bytes) == std::optional<uint32_t>(0x1800));

    PASS();
    return true;
}

// ============================================================================
// Segment diagnostics
// ============================================================================

bool test_segment_diagnostics() {
    TEST("per-sample expected codes, matches and anomalies");

    PacketLayout layout;
    layout.subpackets.push_back({0x01, 0x02, 0x03});
    auto rows = packetRows(layout);
    rows[PAYLOAD_ROW + 1][2] = 0x3FF;                 // Not a TERC4 character

    Packet pkt = decodeRows(rows);

    const SegmentDetail& pre = pkt.segment(SegmentKind::PREAMBLE);
    assert(pre.samples.size() == 8);
    assert(pre.samples[0].channels[0].expected == BusValue(terc4::PREAMBLE_CODE));
    assert(pre.samples[0].channels[0].match == Match::MATCH);
    assert(pre.anomalyCount() == 0);

    const SegmentDetail& guard = pkt.segment(SegmentKind::LEADING_GUARD);
    assert(guard.confirmed);
    assert(guard.samples[1].channels[2].expected == BusValue(terc4::GUARD_CODE));
    assert(guard.samples[1].channels[2].match == Match::MATCH);

    const SegmentDetail& payload = pkt.segment(SegmentKind::PAYLOAD);
    if (payload.anomalyCount() != 1) FAIL("payload anomalies: " << payload.anomalyCount());
    const SymbolDetail& bad = payload.samples[1].channels[2];
    assert(bad.anomaly);
    assert(!bad.nibble.has_value());
    assert(!bad.expected.has_value());
    assert(bad.match == Match::UNKNOWN);
    assert(payload.samples[1].index == PAYLOAD_ROW + 1);

    // Good data samples re-encode to themselves
    assert(payload.samples[0].channels[0].match == Match::MATCH);

    // Channel 2 bytes are unknown, so both PCM values are
    auto* audio = std::get_if<AudioSamplePayload>(&pkt.payload);
    assert(audio && audio->subpackets.size() == 1);
    assert(audio->subpackets[0].present == std::optional<uint8_t>(0x01));
    assert(!audio->subpackets[0].left.has_value());
    assert(!audio->subpackets[0].right.has_value());

    PASS();
    return true;
}

bool test_guard_fallback_mismatch() {
    TEST("fallback guard region compares against the guard pattern");

    PacketLayout layout;
    layout.subpackets.push_back({0x01, 0x02, 0x03});
    layout.trailing_guard = false;

    Packet pkt = decodeRows(packetRows(layout));
    const SegmentDetail& trail = pkt.segment(SegmentKind::TRAILING_GUARD);
    assert(!trail.confirmed);
    assert(trail.samples.size() == 2);
    assert(trail.samples[0].channels[0].match == Match::MISMATCH);
    assert(trail.anomalyCount() == 0);

    PASS();
    return true;
}

int main() {
    std::cout << "=== Packet Decoder Tests ===\n\n";

    std::cout << "Header and ECC:\n";
    test_packet_types();
    test_known_audio_packet();
    test_header_nibbles();
    test_upper_symbol_bits_ignored();
    test_unknown_header_type();
    test_ecc_mismatch();
    test_unknown_ecc_symbol();
    test_incomplete_header();
    test_short_header_window();

    std::cout << "\nPayloads:\n";
    test_audio_sign_extension();
    test_audio_subpacket_count();
    test_clock_regen_packet();
    test_clock_regen_short();
    test_classify_audio_rate();

    std::cout << "\nSegment diagnostics:\n";
    test_segment_diagnostics();
    test_guard_fallback_mismatch();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
