#include "tmdsprobe/capture.hpp"
#include "tmdsprobe/logging.hpp"
#include "tmdsprobe/types.hpp"
#include "analysis/waveform_analyzer.hpp"
#include "report/text_report.hpp"

#include <iostream>
#include <cstring>

using namespace tmdsprobe;

void printUsage(const char* prog) {
    std::cerr << "tmdsprobe - HDMI data island decoder for logic analyzer captures\n\n";
    std::cerr << "Usage: " << prog << " [options] <command> [file]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  analyze [file]  Full analysis: timing, state machine, sync, islands, packet types\n";
    std::cerr << "  packets [file]  Per-packet header, ECC, payload and segment dump\n";
    std::cerr << "  bch [file]      Test common BCH generators against the first full packet\n";
    std::cerr << "  export [file]   Write the analysis report to <file>_analysis.txt\n";
    std::cerr << "  info            Show configuration and the TERC4 table\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -f <file>       Capture CSV (same as the file argument)\n";
    std::cerr << "  -o <file>       Output path for export\n";
    std::cerr << "  -t <unit>       Override the time unit: ns, us, ms, or a sample clock (25.2mhz)\n";
    std::cerr << "  -p <preset>     Video timing preset: vga, 720p (default: vga)\n";
    std::cerr << "  -v              Verbose logging\n";
    std::cerr << "  -q              Errors only\n";
    std::cerr << "  -l <list>       Log categories: capture,bus,island,packet,ecc,timing (-name disables)\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " analyze capture.csv\n";
    std::cerr << "  " << prog << " packets -t 25.2mhz capture.csv\n";
    std::cerr << "  " << prog << " export capture.csv -o report.txt\n";
    std::cerr << "\n";
}

void printInfo(const AnalyzerConfig& config) {
    std::cout << "=== tmdsprobe ===\n\n";
    report::writeConfig(std::cout, config);
    std::cout << "\n";
    report::writeTerc4Table(std::cout);
}

bool loadCapture(WaveformAnalyzer& analyzer, const char* input_file) {
    if (!input_file) {
        std::cerr << "Error: no capture file given\n";
        return false;
    }
    if (!analyzer.load(input_file)) {
        std::cerr << "Error: Cannot load capture: " << input_file << "\n";
        return false;
    }
    return true;
}

int runAnalyze(WaveformAnalyzer& analyzer) {
    const TimeBase tb = analyzer.timeBase();

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "HDMI WAVEFORM ANALYZER\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "File: " << analyzer.source() << "\n";
    std::cout << "Samples: " << analyzer.capture().sampleCount() << "\n";
    std::cout << "Time unit: " << tb.unit << "\n";
    std::cout << "Bus signals: " << analyzer.buses().size() << "\n";
    for (const auto& [name, trace] : analyzer.buses()) {
        std::cout << "  - " << name << "\n";
    }

    report::writeBanner(std::cout, "DATA ISLAND ANALYSIS");
    report::writeIslandDurations(std::cout, timing::islandDurations(analyzer.islands()), tb);

    const auto& packets = analyzer.packets();
    for (size_t i = 0; i < packets.size(); i++) {
        report::writePacket(std::cout, packets[i], i + 1, false);
    }

    report::writeTiming(std::cout, analyzer.timing());
    report::writeStateMachine(std::cout, analyzer.stateMachine());
    report::writeSync(std::cout, analyzer.sync(), tb);
    report::writeTypeSummary(std::cout, analyzer.packetTypeSummary());

    report::writeBanner(std::cout, "ANALYSIS COMPLETE");
    return 0;
}

int runPackets(WaveformAnalyzer& analyzer) {
    const auto& packets = analyzer.packets();
    if (packets.empty()) {
        std::cout << "[!] No data islands detected\n";
        return 0;
    }
    for (size_t i = 0; i < packets.size(); i++) {
        report::writePacket(std::cout, packets[i], i + 1, true);
    }
    return 0;
}

int runBch(WaveformAnalyzer& analyzer) {
    auto search = analyzer.polynomialSearch();
    report::writePolynomialSearch(std::cout, search);
    return search ? 0 : 1;
}

int runExport(WaveformAnalyzer& analyzer, const char* output_file) {
    std::string path = output_file ? output_file : report::defaultExportPath(analyzer.source());
    if (!report::exportAnalysis(analyzer, path)) {
        std::cerr << "Error: Cannot write report: " << path << "\n";
        return 1;
    }
    std::cout << "[+] Summary exported to: " << path << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    AnalyzerConfig config;
    const char* command = nullptr;
    const char* input_file = nullptr;
    const char* output_file = nullptr;
    const char* time_unit = nullptr;

    // Options may appear before or after the command
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            input_file = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            time_unit = argv[++i];
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            auto preset = presets::forName(argv[++i]);
            if (!preset) {
                std::cerr << "Unknown preset: " << argv[i] << "\n";
                return 1;
            }
            config = *preset;
        } else if (strcmp(argv[i], "-v") == 0) {
            setLogLevel(LogLevel::DEBUG);
        } else if (strcmp(argv[i], "-q") == 0) {
            setLogLevel(LogLevel::ERROR);
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            if (!applyLogCategories(argv[++i])) {
                std::cerr << "Unknown log category in: " << argv[i] << "\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            // Non-option argument: first is command, second is input file
            if (!command) {
                command = argv[i];
            } else if (!input_file) {
                input_file = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    if (strcmp(command, "info") == 0) {
        printInfo(config);
        return 0;
    }

    WaveformAnalyzer analyzer(config);
    if (time_unit) {
        auto tb = TimeBase::fromString(time_unit);
        if (!tb) {
            std::cerr << "Error: Invalid time unit: " << time_unit << "\n";
            return 1;
        }
        analyzer.setTimeBase(*tb);
    }

    if (strcmp(command, "analyze") == 0) {
        if (!loadCapture(analyzer, input_file)) return 1;
        return runAnalyze(analyzer);
    } else if (strcmp(command, "packets") == 0) {
        if (!loadCapture(analyzer, input_file)) return 1;
        return runPackets(analyzer);
    } else if (strcmp(command, "bch") == 0) {
        if (!loadCapture(analyzer, input_file)) return 1;
        return runBch(analyzer);
    } else if (strcmp(command, "export") == 0) {
        if (!loadCapture(analyzer, input_file)) return 1;
        return runExport(analyzer, output_file);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }
}
