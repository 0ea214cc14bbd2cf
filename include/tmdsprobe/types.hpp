#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tmdsprobe {

// Core types
using BusValue = std::optional<uint32_t>;      // nullopt = at least one bit was 'X'
using BusTrace = std::vector<BusValue>;        // One entry per capture row
using BitTrace = std::vector<std::optional<bool>>;
using Bytes = std::vector<uint8_t>;
using Nibble = std::optional<uint8_t>;         // Decoded TERC4 symbol, nullopt = unknown

// TMDS channels carrying data-island symbols.
// Channel 0 carries HB0 and the ECC byte, sub-packet bytes rotate 0,1,2.
constexpr size_t CHANNEL_COUNT = 3;

enum class Channel : uint8_t {
    RED = 0,
    GREEN = 1,
    BLUE = 2,
};

inline const char* channelName(Channel ch) {
    switch (ch) {
        case Channel::RED:   return "red";
        case Channel::GREEN: return "green";
        case Channel::BLUE:  return "blue";
        default:             return "?";
    }
}

// Tri-state comparison result. UNKNOWN whenever either side is unavailable,
// so an unknown value can never read as a mismatch (or a match).
enum class Match : uint8_t {
    UNKNOWN = 0,
    MATCH = 1,
    MISMATCH = 2,
};

inline Match compareValues(const BusValue& observed, const BusValue& expected) {
    if (!observed || !expected) return Match::UNKNOWN;
    return *observed == *expected ? Match::MATCH : Match::MISMATCH;
}

inline const char* matchToString(Match m) {
    switch (m) {
        case Match::MATCH:    return "OK";
        case Match::MISMATCH: return "ERR";
        default:              return "";
    }
}

// Analyzer configuration
struct AnalyzerConfig {
    // Signal names as they appear in the capture header.
    // Single-bit signals are matched by substring (hierarchical probe names),
    // buses by base name (exact, else a hierarchical name ending in it).
    std::string island_enable_signal = "data_island_enable";
    std::string preamble_signal = "preamble_active";
    std::string line_counter_bus = "horizontal_counter";
    std::string frame_counter_bus = "vertical_counter";
    std::array<std::string, CHANNEL_COUNT> channel_buses = {
        "tmds_encoded_red",
        "tmds_encoded_green",
        "tmds_encoded_blue",
    };
    std::string hsync_signal = "video_hsync";
    std::string vsync_signal = "video_vsync";
    // Controller state bus, first one present wins
    std::vector<std::string> state_buses = {
        "u_audio_controller/state",
        "debug_state",
    };

    // Data island framing
    size_t preamble_length = 8;        // Fallback when the preamble indicator is missing
    size_t guard_length = 2;           // Guard band width (each end)
    size_t max_island_samples = 96;    // Safety cap per burst (stuck-high gate)

    // Video timing, used by the timing analysis only
    uint32_t h_active = 640;
    uint32_t h_total = 800;
    uint32_t v_active = 480;
    uint32_t v_total = 525;
    float pixel_clock_mhz = 25.175f;
};

// Timing presets
namespace presets {

// 640x480@60Hz (VESA DMT), the default capture target
inline AnalyzerConfig vga640x480() {
    AnalyzerConfig cfg;
    cfg.h_active = 640;
    cfg.h_total = 800;
    cfg.v_active = 480;
    cfg.v_total = 525;
    cfg.pixel_clock_mhz = 25.175f;
    return cfg;
}

// 1280x720@60Hz (CEA-861 VIC 4)
inline AnalyzerConfig hd720p60() {
    AnalyzerConfig cfg;
    cfg.h_active = 1280;
    cfg.h_total = 1650;
    cfg.v_active = 720;
    cfg.v_total = 750;
    cfg.pixel_clock_mhz = 74.25f;
    return cfg;
}

// Look up a preset by name ("vga", "720p"); nullopt for unknown names
inline std::optional<AnalyzerConfig> forName(const std::string& name) {
    if (name == "vga" || name == "640x480") return vga640x480();
    if (name == "720p" || name == "1280x720") return hd720p60();
    return std::nullopt;
}

} // namespace presets

} // namespace tmdsprobe
