#pragma once

#include "types.hpp"
#include <array>
#include <span>
#include <vector>

namespace tmdsprobe {

// ============================================================================
// Data island structure (one burst of TERC4 traffic)
// ============================================================================
//
//   ┌──────────┬───────┬────────┬─────┬──────────────┬───────┐
//   │ PREAMBLE │ GUARD │ HEADER │ ECC │ PAYLOAD      │ GUARD │
//   │    8     │   2   │   4    │  4  │ 4 per subpkt │   2   │
//   └──────────┴───────┴────────┴─────┴──────────────┴───────┘
//
// Counts are samples (pixel clocks). Header/ECC/Payload form the data region.
// ============================================================================

constexpr size_t HEADER_SAMPLES = 4;
constexpr size_t ECC_SAMPLES = 4;
constexpr size_t SUBPACKET_SAMPLES = 4;

// Per-row inputs of the segmenter. A signal that is not in the capture is an
// empty trace; each step that needs it reports it as unavailable.
struct SignalTraces {
    std::vector<int64_t> time;
    BitTrace island_enable;          // Burst gate (preferred)
    BitTrace preamble;               // Preamble indicator (gate fallback)
    BusTrace line_counter;           // Horizontal counter, wrap = new line
    std::array<BusTrace, CHANNEL_COUNT> channels;

    size_t size() const { return time.size(); }
    bool hasEnable() const { return !island_enable.empty(); }
    bool hasPreamble() const { return !preamble.empty(); }
    bool hasLineCounter() const { return !line_counter.empty(); }
};

// One captured pixel clock inside an island
struct IslandSample {
    size_t index = 0;                // Row in the capture
    int64_t time = 0;
    BusValue line_count;
    std::optional<bool> preamble;    // nullopt if the indicator is unavailable
    std::array<BusValue, CHANNEL_COUNT> channels;
};

enum class SegmentKind : uint8_t {
    PREAMBLE = 0,
    LEADING_GUARD,
    HEADER,
    ECC,
    PAYLOAD,
    TRAILING_GUARD,
};

constexpr size_t SEGMENT_COUNT = 6;

const char* segmentKindToString(SegmentKind kind);

// Half-open sample range inside an island
struct Segment {
    SegmentKind kind = SegmentKind::PREAMBLE;
    size_t begin = 0;
    size_t end = 0;
    bool confirmed = false;          // Located by pattern/indicator, not by fallback offset

    size_t size() const { return end - begin; }
    bool empty() const { return begin == end; }
};

// Why the outer state machine closed a burst
enum class Termination : uint8_t {
    FALLING_EDGE,                    // Gate dropped; that sample is excluded
    LINE_WRAP,                       // Line counter decreased; sample excluded and re-examined
    LENGTH_CAP,                      // max_island_samples reached
    END_OF_CAPTURE,
};

const char* terminationToString(Termination t);

struct DataIsland {
    std::vector<IslandSample> samples;
    Termination termination = Termination::END_OF_CAPTURE;
    bool has_preamble_indicator = false;
    std::array<Segment, SEGMENT_COUNT> segments{};

    const Segment& segment(SegmentKind kind) const {
        return segments[static_cast<size_t>(kind)];
    }

    std::span<const IslandSample> samplesOf(SegmentKind kind) const {
        const Segment& s = segment(kind);
        return std::span<const IslandSample>(samples).subspan(s.begin, s.size());
    }

    int64_t startTime() const { return samples.empty() ? 0 : samples.front().time; }
    int64_t endTime() const { return samples.empty() ? 0 : samples.back().time; }
};

/**
 * Island Segmenter
 *
 * Two-level state machine.
 *
 * Outer (burst detection): IDLE -> ACTIVE on a rising edge of the gate. While
 * ACTIVE every sample is appended until the first of: gate falling edge, line
 * counter wrap, safety cap, end of capture. A wrap sample belongs to the next
 * line: it is dropped from the burst and scanning resumes at it in IDLE.
 *
 * The gate is the island-enable signal. Without it the preamble indicator
 * gates bursts; its falling edge then ends the preamble only, so such bursts
 * run until wrap, cap or end of capture.
 *
 * Inner (segments): preamble prefix, guard search forward and backward, then
 * header / ECC / payload split of what lies between.
 */
class IslandSegmenter {
public:
    enum class State : uint8_t {
        IDLE,
        ACTIVE,
    };

    struct Burst {
        size_t begin = 0;            // First row (inclusive)
        size_t end = 0;              // Last row (exclusive)
        Termination termination = Termination::END_OF_CAPTURE;
    };

    explicit IslandSegmenter(const AnalyzerConfig& config = AnalyzerConfig{});

    // Outer level only: row ranges of every burst
    std::vector<Burst> findBursts(const SignalTraces& traces) const;

    // Both levels: segmented islands in capture order
    std::vector<DataIsland> segment(const SignalTraces& traces) const;

    // Inner level: fill island.segments from island.samples
    void partition(DataIsland& island) const;

private:
    size_t preamble_length_;
    size_t guard_length_;
    size_t max_samples_;

    bool isGuardWindow(const DataIsland& island, size_t begin) const;
    Segment locateLeadingGuard(const DataIsland& island, size_t start) const;
    Segment locateTrailingGuard(const DataIsland& island, size_t min_start) const;
};

// Convenience: segmentIslands(traces)
std::vector<DataIsland> segmentIslands(const SignalTraces& traces,
                                       const AnalyzerConfig& config = AnalyzerConfig{});

} // namespace tmdsprobe
