#pragma once

#include "analysis/timing_analysis.hpp"
#include "analysis/waveform_analyzer.hpp"
#include "tmdsprobe/packet.hpp"
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tmdsprobe {
namespace report {

// Fixed-width hex; unknown values print as dashes of the same width
std::string hexCode(const BusValue& value);                 // "0x2CC" / "----"
std::string hexByte(const std::optional<uint8_t>& value);   // "0xA5" / "--"
std::string hexNibble(const Nibble& value);                 // "0x5" / "--"
std::string countOrNA(const BusValue& value);               // "123" / "N/A"

// Section banner: title between two rules of '='
void writeBanner(std::ostream& out, const std::string& title, size_t width = 60);

// One line per sample: H count, time, then code/expected match per channel
void writeSegment(std::ostream& out, const SegmentDetail& segment);

// Header, ECC, payload and (optionally) the per-segment symbol dump
void writePacket(std::ostream& out, const Packet& packet, size_t number, bool segments);

void writePayload(std::ostream& out, const Payload& payload);

void writeIslandDurations(std::ostream& out, const std::optional<timing::IslandDurations>& d,
                          const TimeBase& time_base);

void writeTiming(std::ostream& out, const std::optional<timing::TimingReport>& report);

void writeSync(std::ostream& out, const timing::SyncReport& report, const TimeBase& time_base);

// Change count, the first `max_listed` changes and a (from, to) count table
void writeStateMachine(std::ostream& out, const std::optional<timing::StateMachineReport>& report,
                       size_t max_listed = 20);

void writePolynomialSearch(std::ostream& out, const std::optional<PolynomialSearch>& search);

void writeTypeSummary(std::ostream& out, const std::map<std::string, size_t>& summary);

void writeTerc4Table(std::ostream& out);

void writeConfig(std::ostream& out, const AnalyzerConfig& config);

// Full report: source summary, timing, sync, islands, packets with segment dumps
void writeAnalysis(std::ostream& out, WaveformAnalyzer& analyzer);

// writeAnalysis into a file; false (and an ERROR log) if it cannot be written
bool exportAnalysis(WaveformAnalyzer& analyzer, const std::string& path);

// "capture.csv" -> "capture_analysis.txt"
std::string defaultExportPath(const std::string& source);

} // namespace report
} // namespace tmdsprobe
