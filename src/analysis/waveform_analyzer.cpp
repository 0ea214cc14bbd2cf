#include "waveform_analyzer.hpp"
#include "tmdsprobe/logging.hpp"

namespace tmdsprobe {

WaveformAnalyzer::WaveformAnalyzer(const AnalyzerConfig& config)
    : config_(config)
{
}

bool WaveformAnalyzer::load(const std::string& path) {
    auto capture = CaptureReader::load(path);
    if (!capture) {
        return false;
    }
    setCapture(std::move(*capture));
    source_ = path;
    return true;
}

void WaveformAnalyzer::setCapture(Capture capture) {
    capture_ = std::move(capture);
    has_capture_ = true;
    source_.clear();
    invalidate();
}

void WaveformAnalyzer::setConfig(const AnalyzerConfig& config) {
    config_ = config;
    invalidate();
}

void WaveformAnalyzer::invalidate() {
    buses_.reset();
    traces_.reset();
    islands_.reset();
    packets_.reset();
}

TimeBase WaveformAnalyzer::timeBase() const {
    if (time_base_) return *time_base_;
    TimeBase tb;
    if (!capture_.time_unit.empty()) tb.unit = capture_.time_unit;
    return tb;
}

// ============================================================================
// Cached stages
// ============================================================================

const BusMap& WaveformAnalyzer::buses() {
    if (!buses_) {
        buses_ = reconstructBuses(capture_.columns, capture_.rows);
    }
    return *buses_;
}

const BusTrace* WaveformAnalyzer::findBus(const std::string& name) {
    const BusMap& map = buses();
    auto it = map.find(name);
    if (it != map.end()) return &it->second;

    const std::string suffix = "/" + name;
    for (const auto& [bus_name, trace] : map) {
        if (bus_name.size() > suffix.size() &&
            bus_name.compare(bus_name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return &trace;
        }
    }
    return nullptr;
}

SignalTraces WaveformAnalyzer::buildTraces() {
    SignalTraces t;
    const size_t n = capture_.sampleCount();

    t.time.reserve(n);
    for (size_t r = 0; r < n; r++) {
        t.time.push_back(capture_.timeAt(r));
    }

    if (auto col = capture_.findColumn(config_.island_enable_signal)) {
        t.island_enable = capture_.bitTrace(*col);
    } else {
        LOG_ISLAND(INFO, "Island enable '%s' unavailable", config_.island_enable_signal.c_str());
    }

    if (auto col = capture_.findColumn(config_.preamble_signal)) {
        t.preamble = capture_.bitTrace(*col);
    } else {
        LOG_ISLAND(INFO, "Preamble indicator '%s' unavailable", config_.preamble_signal.c_str());
    }

    if (const BusTrace* line = findBus(config_.line_counter_bus)) {
        t.line_counter = *line;
    } else {
        LOG_ISLAND(WARN, "Line counter '%s' unavailable", config_.line_counter_bus.c_str());
    }

    for (size_t ch = 0; ch < CHANNEL_COUNT; ch++) {
        if (const BusTrace* bus = findBus(config_.channel_buses[ch])) {
            t.channels[ch] = *bus;
        } else {
            LOG_ISLAND(WARN, "Channel bus '%s' unavailable, its symbols read as unknown",
                       config_.channel_buses[ch].c_str());
        }
    }
    return t;
}

const SignalTraces& WaveformAnalyzer::traces() {
    if (!traces_) {
        traces_ = buildTraces();
    }
    return *traces_;
}

const std::vector<DataIsland>& WaveformAnalyzer::islands() {
    if (!islands_) {
        islands_ = segmentIslands(traces(), config_);
    }
    return *islands_;
}

const std::vector<Packet>& WaveformAnalyzer::packets() {
    if (!packets_) {
        std::vector<Packet> out;
        const auto& isl = islands();
        out.reserve(isl.size());
        for (size_t i = 0; i < isl.size(); i++) {
            Packet pkt = decodeIsland(isl[i]);
            pkt.island_index = i;
            out.push_back(std::move(pkt));
        }
        LOG_PACKET(INFO, "Decoded %zu packets", out.size());
        packets_ = std::move(out);
    }
    return *packets_;
}

// ============================================================================
// Reports
// ============================================================================

std::optional<timing::TimingReport> WaveformAnalyzer::timing() {
    const BusTrace* line = findBus(config_.line_counter_bus);
    if (!line) {
        LOG_TIMING(WARN, "Line counter '%s' unavailable", config_.line_counter_bus.c_str());
        return std::nullopt;
    }
    const BusTrace* frame = findBus(config_.frame_counter_bus);
    static const BusTrace no_frame;
    return timing::analyzeTiming(*line, frame ? *frame : no_frame, traces().time, config_);
}

timing::SyncReport WaveformAnalyzer::sync() {
    return timing::analyzeSync(capture_, config_);
}

std::optional<timing::StateMachineReport> WaveformAnalyzer::stateMachine() {
    for (const auto& name : config_.state_buses) {
        if (const BusTrace* state = findBus(name)) {
            return timing::analyzeStateMachine(name, *state, traces().time);
        }
    }
    LOG_TIMING(INFO, "State bus unavailable");
    return std::nullopt;
}

std::optional<PolynomialSearch> WaveformAnalyzer::polynomialSearch(
    const std::vector<bch::Candidate>& candidates)
{
    const auto& pkts = packets();
    for (size_t i = 0; i < pkts.size(); i++) {
        const Packet& p = pkts[i];
        auto word = p.header.word();
        if (!word || !p.ecc.received) continue;

        PolynomialSearch search;
        search.packet_index = i;
        search.packet_label = p.header.label();
        search.hb0 = *p.header.bytes[0];
        search.hb1 = *p.header.bytes[1];
        search.hb2 = *p.header.bytes[2];
        search.received = *p.ecc.received;
        search.scores = bch::testPolynomials(*word, search.received, candidates);
        return search;
    }

    LOG_PACKET(WARN, "No packet with a complete header and ECC to test against");
    return std::nullopt;
}

std::map<std::string, size_t> WaveformAnalyzer::packetTypeSummary() {
    std::map<std::string, size_t> summary;
    for (const auto& p : packets()) {
        summary[p.header.label()]++;
    }
    return summary;
}

} // namespace tmdsprobe
