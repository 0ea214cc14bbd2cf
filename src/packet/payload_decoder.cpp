#include "tmdsprobe/packet.hpp"
#include "tmdsprobe/logging.hpp"
#include <algorithm>

namespace tmdsprobe {

const char* audioRateToString(AudioRate rate) {
    switch (rate) {
        case AudioRate::RATE_44K1:   return "44.1 kHz";
        case AudioRate::RATE_48K:    return "48 kHz";
        case AudioRate::RATE_96K:    return "96 kHz";
        case AudioRate::CUSTOM:      return "custom";
        case AudioRate::UNSPECIFIED: return "unspecified";
        default:                     return "unknown";
    }
}

namespace packet {

// Up to 4 sub-packets per packet
constexpr size_t MAX_SUBPACKETS = 4;

std::array<std::optional<uint8_t>, 7> subPacketBytes(std::span<const IslandSample> window) {
    std::array<std::optional<uint8_t>, 7> bytes{};
    if (window.size() < SUBPACKET_SAMPLES) return bytes;

    for (size_t b = 0; b < bytes.size(); b++) {
        bytes[b] = assembleByte(window.first(SUBPACKET_SAMPLES), b % CHANNEL_COUNT);
    }
    return bytes;
}

// ============================================================================
// Audio Sample Packet
// ============================================================================

AudioSubPacket decodeAudioSubPacket(const std::array<std::optional<uint8_t>, 7>& bytes) {
    AudioSubPacket sp;
    sp.present = bytes[0];

    // 24-bit little-endian PCM, SB1-SB3 left, SB4-SB6 right
    auto pcm = [&](size_t first) -> std::optional<int32_t> {
        if (!bytes[first] || !bytes[first + 1] || !bytes[first + 2]) return std::nullopt;
        uint32_t raw = static_cast<uint32_t>(*bytes[first])
                     | (static_cast<uint32_t>(*bytes[first + 1]) << 8)
                     | (static_cast<uint32_t>(*bytes[first + 2]) << 16);
        return signExtend24(raw);
    };

    sp.left = pcm(1);
    sp.right = pcm(4);
    return sp;
}

AudioSamplePayload decodeAudioSample(std::span<const IslandSample> payload_samples) {
    AudioSamplePayload out;
    out.available_subpackets = payload_samples.size() / SUBPACKET_SAMPLES;

    const size_t count = std::min(out.available_subpackets, MAX_SUBPACKETS);
    for (size_t sp = 0; sp < count; sp++) {
        auto window = payload_samples.subspan(sp * SUBPACKET_SAMPLES, SUBPACKET_SAMPLES);
        out.subpackets.push_back(decodeAudioSubPacket(subPacketBytes(window)));
    }

    if (out.subpackets.empty()) {
        LOG_PACKET(DEBUG, "Audio sample packet too short (%zu payload samples)",
                   payload_samples.size());
    }
    return out;
}

// ============================================================================
// Audio Clock Regeneration
// ============================================================================

std::optional<uint32_t> clockRegenField(const std::array<std::optional<uint8_t>, 7>& bytes) {
    if (!bytes[0] || !bytes[1] || !bytes[2]) return std::nullopt;
    return static_cast<uint32_t>(*bytes[0])
         | (static_cast<uint32_t>(*bytes[1]) << 8)
         | (static_cast<uint32_t>(*bytes[2] & 0x0F) << 16);
}

AudioRate classifyAudioRate(uint32_t n) {
    switch (n) {
        case 0:     return AudioRate::UNSPECIFIED;
        case 6144:  return AudioRate::RATE_48K;
        case 6272:  return AudioRate::RATE_44K1;
        case 12288: return AudioRate::RATE_96K;
        default:    return AudioRate::CUSTOM;
    }
}

ClockRegenPayload decodeClockRegen(std::span<const IslandSample> payload_samples) {
    ClockRegenPayload acr;

    // Sub-packet 0 carries CTS, sub-packet 1 carries N
    if (payload_samples.size() >= SUBPACKET_SAMPLES) {
        acr.cts = clockRegenField(subPacketBytes(payload_samples.first(SUBPACKET_SAMPLES)));
    }
    if (payload_samples.size() >= 2 * SUBPACKET_SAMPLES) {
        acr.n = clockRegenField(subPacketBytes(payload_samples.subspan(SUBPACKET_SAMPLES, SUBPACKET_SAMPLES)));
    }
    if (acr.n) {
        acr.rate = classifyAudioRate(*acr.n);
    } else {
        LOG_PACKET(DEBUG, "ACR packet without a usable N value (%zu payload samples)",
                   payload_samples.size());
    }
    return acr;
}

} // namespace packet
} // namespace tmdsprobe
