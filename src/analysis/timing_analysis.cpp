#include "timing_analysis.hpp"
#include "tmdsprobe/logging.hpp"
#include <algorithm>

namespace tmdsprobe {
namespace timing {

std::string frameRegionToString(FrameRegion region, const char* axis) {
    switch (region) {
        case FrameRegion::ACTIVE:
            return "Active Video";
        case FrameRegion::ACTIVE_AND_BLANKING:
            return std::string("Active Video + ") + axis + " Blanking";
        case FrameRegion::BLANKING:
            return std::string(axis) + " Blanking";
        default:
            return "Unknown";
    }
}

std::optional<double> TimingReport::frameCoverage() const {
    if (!vertical || vertical->range.max <= vertical->range.min) return std::nullopt;
    const double frame = static_cast<double>(horizontal.total) * vertical->total;
    if (frame <= 0.0) return std::nullopt;
    return 100.0 * static_cast<double>(horizontal.range.span()) * vertical->range.span() / frame;
}

std::optional<CounterRange> counterRange(const BusTrace& trace) {
    std::optional<CounterRange> range;
    for (const auto& v : trace) {
        if (!v) continue;
        if (!range) {
            range = CounterRange{*v, *v};
        } else {
            range->min = std::min(range->min, *v);
            range->max = std::max(range->max, *v);
        }
    }
    return range;
}

FrameRegion classifyRegion(const CounterRange& range, uint32_t active) {
    if (range.min >= active) return FrameRegion::BLANKING;
    if (range.max < active) return FrameRegion::ACTIVE;
    return FrameRegion::ACTIVE_AND_BLANKING;
}

std::vector<CounterWrap> findWraps(const BusTrace& trace, const std::vector<int64_t>& time) {
    std::vector<CounterWrap> wraps;
    for (size_t i = 1; i < trace.size(); i++) {
        if (trace[i] && trace[i - 1] && *trace[i] < *trace[i - 1]) {
            int64_t t = i < time.size() ? time[i] : static_cast<int64_t>(i);
            wraps.push_back(CounterWrap{t, *trace[i - 1]});
        }
    }
    return wraps;
}

namespace {

std::optional<AxisTiming> analyzeAxis(const BusTrace& trace, const std::vector<int64_t>& time,
                                      uint32_t active, uint32_t total) {
    auto range = counterRange(trace);
    if (!range) return std::nullopt;

    AxisTiming axis;
    axis.range = *range;
    axis.region = classifyRegion(*range, active);
    axis.active = active;
    axis.total = total;
    axis.wraps = findWraps(trace, time);
    for (const auto& w : axis.wraps) {
        uint32_t candidate = w.last_value + 1;
        if (!axis.detected_total || candidate > *axis.detected_total) {
            axis.detected_total = candidate;
        }
    }
    return axis;
}

} // anonymous namespace

std::optional<TimingReport> analyzeTiming(const BusTrace& line_counter,
                                          const BusTrace& frame_counter,
                                          const std::vector<int64_t>& time,
                                          const AnalyzerConfig& config) {
    auto horizontal = analyzeAxis(line_counter, time, config.h_active, config.h_total);
    if (!horizontal) {
        LOG_TIMING(WARN, "Horizontal counter unavailable, timing analysis skipped");
        return std::nullopt;
    }

    TimingReport report;
    report.horizontal = std::move(*horizontal);
    report.vertical = analyzeAxis(frame_counter, time, config.v_active, config.v_total);

    if (report.horizontal.detected_total && *report.horizontal.detected_total != config.h_total) {
        LOG_TIMING(WARN, "Detected H_TOTAL %u, expected %u",
                   *report.horizontal.detected_total, config.h_total);
    }
    if (report.vertical && report.vertical->detected_total &&
        *report.vertical->detected_total != config.v_total) {
        LOG_TIMING(WARN, "Detected V_TOTAL %u, expected %u",
                   *report.vertical->detected_total, config.v_total);
    }
    return report;
}

std::optional<IntervalStats> intervalStats(const std::vector<int64_t>& times) {
    if (times.size() < 2) return std::nullopt;

    IntervalStats stats;
    int64_t sum = 0;
    for (size_t i = 1; i < times.size(); i++) {
        int64_t d = times[i] - times[i - 1];
        if (stats.count == 0) {
            stats.min = stats.max = d;
        } else {
            stats.min = std::min(stats.min, d);
            stats.max = std::max(stats.max, d);
        }
        sum += d;
        stats.count++;
    }
    stats.average = static_cast<double>(sum) / stats.count;
    return stats;
}

namespace {

SyncSignal analyzeSyncSignal(const Capture& capture, const std::string& name) {
    SyncSignal sig;
    auto col = capture.findColumn(name);
    if (!col) {
        LOG_TIMING(DEBUG, "Sync signal '%s' unavailable", name.c_str());
        return sig;
    }

    sig.available = true;
    auto transitions = findTransitions(capture, *col);
    sig.transitions = transitions.size();

    std::vector<int64_t> pulses;
    for (const auto& t : transitions) {
        if (t.from == "1" && t.to == "0") pulses.push_back(t.time);
    }
    sig.pulse_interval = intervalStats(pulses);
    return sig;
}

} // anonymous namespace

SyncReport analyzeSync(const Capture& capture, const AnalyzerConfig& config) {
    SyncReport report;
    report.hsync = analyzeSyncSignal(capture, config.hsync_signal);
    report.vsync = analyzeSyncSignal(capture, config.vsync_signal);
    return report;
}

std::vector<StateChange> findStateChanges(const BusTrace& state, const std::vector<int64_t>& time) {
    std::vector<StateChange> changes;
    for (size_t i = 1; i < state.size(); i++) {
        if (state[i] && state[i - 1] && *state[i] != *state[i - 1]) {
            int64_t t = i < time.size() ? time[i] : static_cast<int64_t>(i);
            changes.push_back(StateChange{t, *state[i - 1], *state[i]});
        }
    }
    return changes;
}

StateMachineReport analyzeStateMachine(const std::string& bus, const BusTrace& state,
                                       const std::vector<int64_t>& time) {
    StateMachineReport report;
    report.bus = bus;
    report.changes = findStateChanges(state, time);
    for (const auto& c : report.changes) {
        report.counts[{c.from, c.to}]++;
    }
    LOG_TIMING(DEBUG, "%s: %zu state changes, %zu distinct transitions",
               bus.c_str(), report.changes.size(), report.counts.size());
    return report;
}

std::optional<IslandDurations> islandDurations(const std::vector<DataIsland>& islands) {
    if (islands.empty()) return std::nullopt;

    IslandDurations d;
    int64_t sum = 0;
    for (const auto& island : islands) {
        int64_t len = island.endTime() - island.startTime();
        if (d.count == 0) {
            d.min = d.max = len;
        } else {
            d.min = std::min(d.min, len);
            d.max = std::max(d.max, len);
        }
        sum += len;
        d.count++;
    }
    d.average = static_cast<double>(sum) / d.count;
    return d;
}

} // namespace timing
} // namespace tmdsprobe
