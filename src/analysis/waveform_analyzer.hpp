#pragma once

#include "timing_analysis.hpp"
#include "tmdsprobe/capture.hpp"
#include "tmdsprobe/ecc.hpp"
#include "tmdsprobe/island.hpp"
#include "tmdsprobe/packet.hpp"
#include "tmdsprobe/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tmdsprobe {

// Polynomial search run against one captured packet
struct PolynomialSearch {
    size_t packet_index = 0;
    std::string packet_label;
    uint8_t hb0 = 0, hb1 = 0, hb2 = 0;
    uint8_t received = 0;
    std::vector<bch::CandidateScore> scores;   // Best first
};

/**
 * WaveformAnalyzer
 *
 * Owns one capture and derives everything else from it on demand:
 *
 *   Capture -> buses -> traces -> islands -> packets
 *
 * Each stage is computed on first use and cached. Loading a new capture (or
 * changing the configuration) drops every cached stage; nothing derived is
 * ever patched in place.
 */
class WaveformAnalyzer {
public:
    explicit WaveformAnalyzer(const AnalyzerConfig& config = AnalyzerConfig{});

    // Load a CSV export. On failure the previous capture is kept.
    bool load(const std::string& path);
    void setCapture(Capture capture);

    bool hasCapture() const { return has_capture_; }
    const Capture& capture() const { return capture_; }
    const std::string& source() const { return source_; }

    const AnalyzerConfig& config() const { return config_; }
    void setConfig(const AnalyzerConfig& config);

    // Time axis override ("ns", "25.2mhz"); default is the capture's own unit
    void setTimeBase(const TimeBase& time_base) { time_base_ = time_base; }
    TimeBase timeBase() const;

    const BusMap& buses();
    const SignalTraces& traces();
    const std::vector<DataIsland>& islands();
    const std::vector<Packet>& packets();

    std::optional<timing::TimingReport> timing();
    timing::SyncReport sync();

    // First configured state bus present in the capture, nullopt if none is
    std::optional<timing::StateMachineReport> stateMachine();

    // Search against the first packet with a complete header and a received ECC
    std::optional<PolynomialSearch> polynomialSearch(
        const std::vector<bch::Candidate>& candidates = bch::commonPolynomials());

    // Packet label -> count, in label order
    std::map<std::string, size_t> packetTypeSummary();

    // Bus by base name: exact match, else a hierarchical name ending in "/<name>"
    const BusTrace* findBus(const std::string& name);

private:
    void invalidate();
    SignalTraces buildTraces();

    AnalyzerConfig config_;
    std::optional<TimeBase> time_base_;

    Capture capture_;
    bool has_capture_ = false;
    std::string source_;

    std::optional<BusMap> buses_;
    std::optional<SignalTraces> traces_;
    std::optional<std::vector<DataIsland>> islands_;
    std::optional<std::vector<Packet>> packets_;
};

} // namespace tmdsprobe
