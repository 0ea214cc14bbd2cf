#include "tmdsprobe/island.hpp"
#include "tmdsprobe/terc4.hpp"
#include "tmdsprobe/logging.hpp"
#include <algorithm>

namespace tmdsprobe {

const char* segmentKindToString(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::PREAMBLE:       return "Preamble";
        case SegmentKind::LEADING_GUARD:  return "Guard Band (Start)";
        case SegmentKind::HEADER:         return "Header Symbols";
        case SegmentKind::ECC:            return "ECC Symbols";
        case SegmentKind::PAYLOAD:        return "Packet Data";
        case SegmentKind::TRAILING_GUARD: return "Guard Band (End)";
        default:                          return "Unknown";
    }
}

const char* terminationToString(Termination t) {
    switch (t) {
        case Termination::FALLING_EDGE:   return "falling edge";
        case Termination::LINE_WRAP:      return "line wrap";
        case Termination::LENGTH_CAP:     return "length cap";
        case Termination::END_OF_CAPTURE: return "end of capture";
        default:                          return "unknown";
    }
}

IslandSegmenter::IslandSegmenter(const AnalyzerConfig& config)
    : preamble_length_(config.preamble_length)
    , guard_length_(config.guard_length)
    , max_samples_(std::max<size_t>(1, config.max_island_samples))
{
}

// ============================================================================
// Outer level: burst detection
// ============================================================================

std::vector<IslandSegmenter::Burst> IslandSegmenter::findBursts(const SignalTraces& traces) const {
    std::vector<Burst> bursts;

    // Island enable gates bursts when present; otherwise the preamble
    // indicator does, and its falling edge does not end the burst.
    const bool gate_is_enable = traces.hasEnable();
    const BitTrace* gate = gate_is_enable ? &traces.island_enable
                         : traces.hasPreamble() ? &traces.preamble
                         : nullptr;
    if (!gate) {
        LOG_ISLAND(WARN, "No island gate signal, segmentation unavailable");
        return bursts;
    }
    if (!traces.hasLineCounter()) {
        LOG_ISLAND(WARN, "Line counter unavailable, wrap detection disabled");
    }

    const size_t n = traces.size();

    // Indeterminate gate samples count as inactive
    auto level = [&](size_t i) {
        return i < gate->size() && (*gate)[i].value_or(false);
    };
    auto line = [&](size_t i) -> BusValue {
        return i < traces.line_counter.size() ? traces.line_counter[i] : std::nullopt;
    };

    State state = State::IDLE;
    Burst current;
    bool prev_level = false;
    BusValue prev_line;

    auto close = [&](size_t end, Termination why) {
        current.end = end;
        current.termination = why;
        bursts.push_back(current);
        LOG_ISLAND(TRACE, "Burst rows %zu-%zu closed by %s",
                   current.begin, end, terminationToString(why));
        state = State::IDLE;
    };

    size_t i = 0;
    while (i < n) {
        const bool lvl = level(i);

        switch (state) {
            case State::IDLE:
                if (lvl && !prev_level) {
                    current = Burst{};
                    current.begin = i;
                    prev_line = line(i);
                    state = State::ACTIVE;
                }
                prev_level = lvl;
                i++;
                break;

            case State::ACTIVE: {
                // Each termination leaves i on the boundary sample, which IDLE
                // then examines like any other sample.
                if (i - current.begin >= max_samples_) {
                    close(i, Termination::LENGTH_CAP);
                    prev_level = level(i - 1);
                    break;
                }
                if (gate_is_enable && !lvl) {
                    close(i, Termination::FALLING_EDGE);
                    prev_level = false;
                    break;
                }
                BusValue cur_line = line(i);
                if (prev_line && cur_line && *cur_line < *prev_line) {
                    close(i, Termination::LINE_WRAP);
                    prev_level = false;
                    break;
                }
                prev_line = cur_line;
                i++;
                break;
            }
        }
    }

    if (state == State::ACTIVE) {
        close(n, Termination::END_OF_CAPTURE);
    }

    return bursts;
}

// ============================================================================
// Inner level: segment decomposition
// ============================================================================

bool IslandSegmenter::isGuardWindow(const DataIsland& island, size_t begin) const {
    for (size_t k = begin; k < begin + guard_length_; k++) {
        for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
            if (!terc4::isGuard(island.samples[k].channels[ch])) return false;
        }
    }
    return true;
}

Segment IslandSegmenter::locateLeadingGuard(const DataIsland& island, size_t start) const {
    const size_t n = island.samples.size();
    Segment seg{SegmentKind::LEADING_GUARD, start, start, false};
    if (start >= n) return seg;

    for (size_t b = start; b + guard_length_ <= n; b++) {
        if (isGuardWindow(island, b)) {
            return Segment{SegmentKind::LEADING_GUARD, b, b + guard_length_, true};
        }
    }

    // Not found: take the next guard_length samples as-is
    seg.end = std::min(start + guard_length_, n);
    return seg;
}

Segment IslandSegmenter::locateTrailingGuard(const DataIsland& island, size_t min_start) const {
    const size_t n = island.samples.size();

    if (n >= guard_length_) {
        for (size_t b = n - guard_length_ + 1; b-- > min_start;) {
            if (isGuardWindow(island, b)) {
                return Segment{SegmentKind::TRAILING_GUARD, b, b + guard_length_, true};
            }
        }
    }

    size_t start = std::max(n >= guard_length_ ? n - guard_length_ : size_t(0), min_start);
    if (start < n) {
        return Segment{SegmentKind::TRAILING_GUARD, start, n, false};
    }
    return Segment{SegmentKind::TRAILING_GUARD, n, n, false};
}

void IslandSegmenter::partition(DataIsland& island) const {
    const size_t n = island.samples.size();

    // Preamble: samples flagged by the indicator, else a fixed prefix
    size_t pre = 0;
    if (island.has_preamble_indicator) {
        while (pre < n && island.samples[pre].preamble.value_or(false)) pre++;
    }
    const bool pre_confirmed = pre > 0;
    if (!pre_confirmed) {
        pre = std::min(preamble_length_, n);
    }
    island.segments[static_cast<size_t>(SegmentKind::PREAMBLE)] =
        Segment{SegmentKind::PREAMBLE, 0, pre, pre_confirmed};

    Segment lead = locateLeadingGuard(island, pre);
    const size_t data_start = lead.end;

    // The trailing guard may not reach into the header
    Segment trail = locateTrailingGuard(island, std::min(data_start + HEADER_SAMPLES, n));
    if (trail.begin <= data_start) {
        trail = Segment{SegmentKind::TRAILING_GUARD, n, n, false};
    }
    const size_t data_end = trail.begin;

    const size_t header_end = std::min(data_start + HEADER_SAMPLES, data_end);
    const size_t ecc_end = std::min(header_end + ECC_SAMPLES, data_end);

    island.segments[static_cast<size_t>(SegmentKind::LEADING_GUARD)] = lead;
    island.segments[static_cast<size_t>(SegmentKind::HEADER)] =
        Segment{SegmentKind::HEADER, data_start, header_end, true};
    island.segments[static_cast<size_t>(SegmentKind::ECC)] =
        Segment{SegmentKind::ECC, header_end, ecc_end, true};
    island.segments[static_cast<size_t>(SegmentKind::PAYLOAD)] =
        Segment{SegmentKind::PAYLOAD, ecc_end, data_end, true};
    island.segments[static_cast<size_t>(SegmentKind::TRAILING_GUARD)] = trail;

    if (data_end - data_start < HEADER_SAMPLES + ECC_SAMPLES) {
        LOG_ISLAND(DEBUG, "Island at t=%lld: data region only %zu samples",
                   static_cast<long long>(island.startTime()), data_end - data_start);
    }
}

std::vector<DataIsland> IslandSegmenter::segment(const SignalTraces& traces) const {
    std::vector<DataIsland> islands;
    auto bursts = findBursts(traces);
    islands.reserve(bursts.size());

    for (const auto& burst : bursts) {
        DataIsland island;
        island.termination = burst.termination;
        island.has_preamble_indicator = traces.hasPreamble();
        island.samples.reserve(burst.end - burst.begin);

        for (size_t r = burst.begin; r < burst.end; r++) {
            IslandSample s;
            s.index = r;
            s.time = r < traces.time.size() ? traces.time[r] : static_cast<int64_t>(r);
            s.line_count = r < traces.line_counter.size() ? traces.line_counter[r] : std::nullopt;
            if (r < traces.preamble.size()) s.preamble = traces.preamble[r];
            for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
                const BusTrace& trace = traces.channels[ch];
                s.channels[ch] = r < trace.size() ? trace[r] : std::nullopt;
            }
            island.samples.push_back(s);
        }

        partition(island);
        islands.push_back(std::move(island));
    }

    LOG_ISLAND(INFO, "Found %zu data islands", islands.size());
    return islands;
}

std::vector<DataIsland> segmentIslands(const SignalTraces& traces, const AnalyzerConfig& config) {
    return IslandSegmenter(config).segment(traces);
}

} // namespace tmdsprobe
