#pragma once

#include "types.hpp"
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tmdsprobe {

// Literal the analyzer writes for an indeterminate bit
constexpr const char* INDETERMINATE_LITERAL = "X";

using Row = std::vector<std::string>;

// True for "<bus>[<bit>]" columns, which only contribute to a reconstructed bus
bool isBusBitColumn(const std::string& column);

/**
 * Capture
 *
 * One logic-analyzer export held in memory: column names (column 0 is the
 * time index) and the raw, trimmed literals of every row. Immutable once
 * loaded; everything else is derived from it.
 */
struct Capture {
    std::string time_unit;
    std::vector<std::string> columns;
    std::vector<Row> rows;

    size_t sampleCount() const { return rows.size(); }

    // First single-bit column whose name contains `name`. The time column
    // and "<bus>[<bit>]" columns are skipped.
    std::optional<size_t> findColumn(const std::string& name) const;

    // Integer time index of a row; falls back to the row index if unparsable
    int64_t timeAt(size_t row) const;

    // '1' -> true, '0' -> false, anything else (X, missing column) -> nullopt
    std::optional<bool> bitAt(size_t row, size_t column) const;

    // Whole single-bit column as a trace
    BitTrace bitTrace(size_t column) const;
};

// Time axis description ("ns" or a sample clock such as "25.2mhz")
struct TimeBase {
    std::string unit = "samples";
    double period = 1.0;           // Duration of one time index, in `unit`

    // Accepts a plain unit ("ns", "us") or a frequency ("25.2mhz", "27MHz", "100khz").
    // Frequencies are turned into a period in the largest fitting unit.
    static std::optional<TimeBase> fromString(const std::string& text);
};

/**
 * CaptureReader
 *
 * Parses the Gowin analyzer CSV export. Lines before the header (the first
 * line containing "time unit:") are ignored; every later line with more than
 * one field is a sample row.
 */
class CaptureReader {
public:
    static std::optional<Capture> load(const std::string& path);
    static std::optional<Capture> parse(std::istream& in);
};

// One bus: (bit position, source column) pairs, MSB first
struct BusLayout {
    std::string name;
    std::vector<std::pair<int, size_t>> bits;

    int width() const { return bits.empty() ? 0 : bits.front().first + 1; }
};

using BusMap = std::map<std::string, BusTrace>;

/**
 * BusReconstructor
 *
 * Merges per-bit columns named "<bus>[<bit>]" into bus values. A value is
 * unknown if any contributing bit is indeterminate or missing from the row;
 * partial values are never built from the known bits alone.
 */
class BusReconstructor {
public:
    // Group bracketed columns into bus layouts (other columns are single-bit signals)
    static std::map<std::string, BusLayout> discover(const std::vector<std::string>& columns);

    // Value of one bus on one row
    static BusValue valueAt(const BusLayout& layout, const Row& row);

    // Rebuild every bus across all rows
    static BusMap reconstruct(const std::vector<std::string>& columns, const std::vector<Row>& rows);
};

// Convenience: reconstructBuses(columns, rows)
inline BusMap reconstructBuses(const std::vector<std::string>& columns, const std::vector<Row>& rows) {
    return BusReconstructor::reconstruct(columns, rows);
}

// Level change on a single-bit column
struct Transition {
    int64_t time = 0;
    std::string from;
    std::string to;
};

// All changes of a raw column's literal (missing cells read as "X")
std::vector<Transition> findTransitions(const Capture& capture, size_t column);

} // namespace tmdsprobe
