#include "tmdsprobe/capture.hpp"
#include "tmdsprobe/logging.hpp"
#include <algorithm>
#include <regex>

namespace tmdsprobe {

// Bus values are uint32_t
constexpr int MAX_BUS_BIT = 31;

std::map<std::string, BusLayout> BusReconstructor::discover(const std::vector<std::string>& columns) {
    // "counter[3]" -> ("counter", 3); anything after the bracket is ignored
    static const std::regex bus_pattern(R"((.+)\[(\d+)\])");

    std::map<std::string, BusLayout> layouts;

    // Column 0 is the time index
    for (size_t col = 1; col < columns.size(); col++) {
        std::smatch m;
        if (!std::regex_search(columns[col], m, bus_pattern)) {
            continue;   // Single-bit signal
        }

        std::string name = m[1].str();
        const std::string digits = m[2].str();
        if (digits.size() > 2 || std::stoi(digits) > MAX_BUS_BIT) {
            LOG_BUS(WARN, "%s: bit index %s exceeds %d, column ignored",
                    columns[col].c_str(), digits.c_str(), MAX_BUS_BIT);
            continue;
        }
        int bit = std::stoi(digits);

        BusLayout& layout = layouts[name];
        layout.name = name;

        auto dup = std::find_if(layout.bits.begin(), layout.bits.end(),
                                [bit](const auto& b) { return b.first == bit; });
        if (dup != layout.bits.end()) {
            LOG_BUS(WARN, "%s: bit %d already mapped to column %zu, column %zu ignored",
                    name.c_str(), bit, dup->second, col);
            continue;
        }
        layout.bits.emplace_back(bit, col);
    }

    // MSB first
    for (auto& [name, layout] : layouts) {
        std::sort(layout.bits.begin(), layout.bits.end(),
                  [](const auto& a, const auto& b) { return a.first > b.first; });
    }

    return layouts;
}

BusValue BusReconstructor::valueAt(const BusLayout& layout, const Row& row) {
    uint32_t value = 0;
    for (const auto& [bit, col] : layout.bits) {
        // A short row is as indeterminate as an 'X'
        if (col >= row.size()) return std::nullopt;

        const std::string& literal = row[col];
        if (literal == "1") {
            value |= (1u << bit);
        } else if (literal != "0") {
            return std::nullopt;
        }
    }
    return value;
}

BusMap BusReconstructor::reconstruct(const std::vector<std::string>& columns, const std::vector<Row>& rows) {
    BusMap buses;
    auto layouts = discover(columns);

    for (const auto& [name, layout] : layouts) {
        BusTrace trace;
        trace.reserve(rows.size());
        size_t unknown = 0;
        for (const auto& row : rows) {
            trace.push_back(valueAt(layout, row));
            if (!trace.back()) unknown++;
        }
        LOG_BUS(DEBUG, "%s: %d bits, %zu/%zu samples indeterminate",
                name.c_str(), layout.width(), unknown, rows.size());
        buses.emplace(name, std::move(trace));
    }

    LOG_BUS(INFO, "Reconstructed %zu bus signals", buses.size());
    return buses;
}

} // namespace tmdsprobe
