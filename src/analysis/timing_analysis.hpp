#pragma once

#include "tmdsprobe/capture.hpp"
#include "tmdsprobe/island.hpp"
#include "tmdsprobe/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tmdsprobe {
namespace timing {

// Smallest and largest known value of a counter bus
struct CounterRange {
    uint32_t min = 0;
    uint32_t max = 0;

    uint32_t span() const { return max - min + 1; }
};

// Where a counter range sits relative to the active area
enum class FrameRegion : uint8_t {
    ACTIVE,
    ACTIVE_AND_BLANKING,
    BLANKING,
};

// "Active Video", "Active Video + Horizontal Blanking", "Horizontal Blanking"
std::string frameRegionToString(FrameRegion region, const char* axis);

// One counter decrease between consecutive known samples
struct CounterWrap {
    int64_t time = 0;           // Time of the first sample after the wrap
    uint32_t last_value = 0;    // Value just before the wrap
};

struct AxisTiming {
    CounterRange range;
    FrameRegion region = FrameRegion::ACTIVE;
    uint32_t active = 0;                     // Configured active count
    uint32_t total = 0;                      // Configured total count
    std::vector<CounterWrap> wraps;
    std::optional<uint32_t> detected_total;  // Largest value before a wrap, plus one

    double coverage() const { return total ? 100.0 * range.span() / total : 0.0; }
};

struct TimingReport {
    AxisTiming horizontal;
    std::optional<AxisTiming> vertical;      // Frame counter unavailable -> nullopt

    // Share of the whole frame covered by the capture, only for multi-line captures
    std::optional<double> frameCoverage() const;
};

// Interval statistics between consecutive pulses
struct IntervalStats {
    size_t count = 0;
    double average = 0.0;
    int64_t min = 0;
    int64_t max = 0;
};

struct SyncSignal {
    bool available = false;
    size_t transitions = 0;
    std::optional<IntervalStats> pulse_interval;   // Between 1 -> 0 edges
};

struct SyncReport {
    SyncSignal hsync;
    SyncSignal vsync;
};

// One value change of the controller state bus
struct StateChange {
    int64_t time = 0;       // Time of the sample holding the new value
    uint32_t from = 0;
    uint32_t to = 0;
};

struct StateMachineReport {
    std::string bus;                                            // Bus the changes were read from
    std::vector<StateChange> changes;
    std::map<std::pair<uint32_t, uint32_t>, size_t> counts;    // (from, to) -> occurrences
};

struct IslandDurations {
    size_t count = 0;
    double average = 0.0;
    int64_t min = 0;
    int64_t max = 0;
};

std::optional<CounterRange> counterRange(const BusTrace& trace);

FrameRegion classifyRegion(const CounterRange& range, uint32_t active);

// Every decrease of the counter; unknown samples break the comparison
std::vector<CounterWrap> findWraps(const BusTrace& trace, const std::vector<int64_t>& time);

// Line / frame counter analysis. nullopt if the line counter is unavailable
// or never known.
std::optional<TimingReport> analyzeTiming(const BusTrace& line_counter,
                                          const BusTrace& frame_counter,
                                          const std::vector<int64_t>& time,
                                          const AnalyzerConfig& config);

std::optional<IntervalStats> intervalStats(const std::vector<int64_t>& times);

SyncReport analyzeSync(const Capture& capture, const AnalyzerConfig& config);

// Value changes between consecutive known samples; an unknown sample on
// either side is not a change
std::vector<StateChange> findStateChanges(const BusTrace& state, const std::vector<int64_t>& time);

StateMachineReport analyzeStateMachine(const std::string& bus, const BusTrace& state,
                                       const std::vector<int64_t>& time);

// Duration of each island in capture time (first to last sample)
std::optional<IslandDurations> islandDurations(const std::vector<DataIsland>& islands);

} // namespace timing
} // namespace tmdsprobe
