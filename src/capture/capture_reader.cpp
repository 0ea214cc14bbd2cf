#include "tmdsprobe/capture.hpp"
#include "tmdsprobe/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <regex>
#include <sstream>

namespace tmdsprobe {

namespace {

const char* TIME_UNIT_MARKER = "time unit:";

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    // getline drops an empty trailing field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

// "time unit: ns" -> "ns"
std::string extractTimeUnit(const std::string& header) {
    size_t pos = header.find(TIME_UNIT_MARKER);
    if (pos == std::string::npos) return "";
    pos += std::strlen(TIME_UNIT_MARKER);
    while (pos < header.size() && std::isspace(static_cast<unsigned char>(header[pos]))) pos++;
    size_t end = pos;
    while (end < header.size() &&
           (std::isalnum(static_cast<unsigned char>(header[end])) || header[end] == '_')) {
        end++;
    }
    return header.substr(pos, end - pos);
}

} // anonymous namespace

// ============================================================================
// Capture
// ============================================================================

bool isBusBitColumn(const std::string& column) {
    static const std::regex bit_pattern(R"(.+\[\d+\])");
    return std::regex_search(column, bit_pattern);
}

std::optional<size_t> Capture::findColumn(const std::string& name) const {
    if (name.empty()) return std::nullopt;
    for (size_t i = 1; i < columns.size(); i++) {
        if (isBusBitColumn(columns[i])) continue;
        if (columns[i].find(name) != std::string::npos) {
            return i;
        }
    }
    return std::nullopt;
}

int64_t Capture::timeAt(size_t row) const {
    if (row >= rows.size() || rows[row].empty()) return static_cast<int64_t>(row);
    const std::string& text = rows[row][0];
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || end == text.c_str() || *end != '\0') {
        return static_cast<int64_t>(row);
    }
    return static_cast<int64_t>(value);
}

std::optional<bool> Capture::bitAt(size_t row, size_t column) const {
    if (row >= rows.size() || column >= rows[row].size()) return std::nullopt;
    const std::string& v = rows[row][column];
    if (v == "1") return true;
    if (v == "0") return false;
    return std::nullopt;
}

BitTrace Capture::bitTrace(size_t column) const {
    BitTrace trace;
    trace.reserve(rows.size());
    for (size_t r = 0; r < rows.size(); r++) {
        trace.push_back(bitAt(r, column));
    }
    return trace;
}

// ============================================================================
// TimeBase
// ============================================================================

std::optional<TimeBase> TimeBase::fromString(const std::string& text) {
    std::string lower = trim(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.empty()) return std::nullopt;

    TimeBase tb;
    if (lower.size() < 2 || lower.compare(lower.size() - 2, 2, "hz") != 0) {
        tb.unit = lower;
        tb.period = 1.0;
        return tb;
    }

    // Frequency: "<number>[k|m|g]hz"
    std::string number = lower.substr(0, lower.size() - 2);
    double scale = 1.0;
    if (!number.empty()) {
        switch (number.back()) {
            case 'k': scale = 1e3; number.pop_back(); break;
            case 'm': scale = 1e6; number.pop_back(); break;
            case 'g': scale = 1e9; number.pop_back(); break;
            default: break;
        }
    }

    char* end = nullptr;
    double freq = std::strtod(number.c_str(), &end);
    if (number.empty() || end == number.c_str() || *end != '\0' || freq <= 0.0) {
        LOG_CAPTURE(ERROR, "Invalid sample clock '%s'", text.c_str());
        return std::nullopt;
    }
    freq *= scale;

    double period_s = 1.0 / freq;
    if (period_s < 1e-6) {
        tb.unit = "ns";
        tb.period = period_s * 1e9;
    } else if (period_s < 1e-3) {
        tb.unit = "us";
        tb.period = period_s * 1e6;
    } else {
        tb.unit = "ms";
        tb.period = period_s * 1e3;
    }
    return tb;
}

// ============================================================================
// CaptureReader
// ============================================================================

std::optional<Capture> CaptureReader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_CAPTURE(ERROR, "Cannot open %s", path.c_str());
        return std::nullopt;
    }
    auto capture = parse(file);
    if (capture) {
        LOG_CAPTURE(INFO, "Loaded %zu samples, %zu signals from %s",
                    capture->sampleCount(),
                    capture->columns.empty() ? size_t(0) : capture->columns.size() - 1,
                    path.c_str());
    }
    return capture;
}

std::optional<Capture> CaptureReader::parse(std::istream& in) {
    Capture capture;
    std::string line;
    bool have_header = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (!have_header) {
            if (line.find(TIME_UNIT_MARKER) == std::string::npos) continue;
            capture.columns = splitFields(line);
            capture.time_unit = extractTimeUnit(line);
            have_header = true;
            continue;
        }

        Row row = splitFields(line);
        if (row.size() > 1) {
            capture.rows.push_back(std::move(row));
        }
    }

    if (!have_header) {
        LOG_CAPTURE(ERROR, "No header line containing '%s'", TIME_UNIT_MARKER);
        return std::nullopt;
    }

    LOG_CAPTURE(DEBUG, "Time unit: %s", capture.time_unit.empty() ? "(none)" : capture.time_unit.c_str());
    return capture;
}

// ============================================================================
// Transitions
// ============================================================================

std::vector<Transition> findTransitions(const Capture& capture, size_t column) {
    std::vector<Transition> out;
    std::string prev;
    bool have_prev = false;

    for (size_t r = 0; r < capture.rows.size(); r++) {
        const Row& row = capture.rows[r];
        std::string value = column < row.size() ? row[column] : INDETERMINATE_LITERAL;
        if (have_prev && value != prev) {
            out.push_back(Transition{capture.timeAt(r), prev, value});
        }
        prev = value;
        have_prev = true;
    }
    return out;
}

} // namespace tmdsprobe
