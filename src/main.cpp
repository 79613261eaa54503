// main.cpp
// ALMA Supertrend Signal Driver
// Loads historical klines per symbol from CSV and reports the current supertrend signal

#include <algorithm>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <stdexcept>

#include "core/exceptions.hpp"
#include "core/indicator_types.hpp"
#include "data/kline_csv_loader.hpp"
#include "engine/trend_evaluator.hpp"

using namespace almatrend;

// ============================================================================
// Configuration Structure
// ============================================================================

struct DriverConfig {
    // SYMBOL=FILE pairs
    std::vector<std::pair<std::string, std::string>> inputs;

    TrendEvaluator::EvaluatorConfig evaluator;
    KlineCsvLoader::CsvConfig csv;

    // Output configuration
    bool dump_series = false;
    bool verbose = false;
    bool show_help = false;
};

// ============================================================================
// Command Line Argument Parser
// ============================================================================

void printUsage(const char* program_name) {
    std::cout << "ALMA Supertrend Signal Driver\n";
    std::cout << "=============================\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] --data SYMBOL=FILE [--data SYMBOL=FILE ...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --data SYMBOL=FILE   Kline CSV for a symbol (time,open,high,low,close,volume)\n";
    std::cout << "  -l, --alma-length N      ALMA window length (default: 5)\n";
    std::cout << "      --alma-offset X      ALMA offset in [0,1] (default: 0.85)\n";
    std::cout << "      --alma-sigma X       ALMA sigma (default: 2.75)\n";
    std::cout << "  -s, --sd-length N        Standard deviation window (default: 20)\n";
    std::cout << "  -f, --factor X           Band factor (default: 1.8)\n";
    std::cout << "      --min-bars N         Minimum bars required per symbol (default: 100)\n";
    std::cout << "      --max-bars N         Trailing bars fed to the indicator, 0 = all (default: 750)\n";
    std::cout << "      --mirrored-bear      Bear trend compares trendLine[t-2] with close[t-2]\n";
    std::cout << "      --no-header          CSV files have no header row\n";
    std::cout << "      --delimiter C        CSV field delimiter (default: ,)\n";
    std::cout << "      --dump               Print per-bar series as CSV\n";
    std::cout << "  --verbose                Enable verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --data BTCUSDT=data/BTCUSDT_1d.csv\n";
    std::cout << "  " << program_name << " -d ETHUSDT=eth.csv -l 9 -s 30 -f 2.0 --dump\n";
}

namespace {

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigException("Invalid integer for " + flag + ": '" + value + "'");
    }
}

double parseDouble(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigException("Invalid number for " + flag + ": '" + value + "'");
    }
}

size_t parseCount(const std::string& flag, const std::string& value) {
    int v = parseInt(flag, value);
    if (v < 0) {
        throw ConfigException(flag + " must not be negative");
    }
    return static_cast<size_t>(v);
}

std::pair<std::string, std::string> parseInput(const std::string& value) {
    size_t eq = value.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) {
        throw ConfigException("Expected SYMBOL=FILE, got '" + value + "'");
    }
    return {value.substr(0, eq), value.substr(eq + 1)};
}

} // namespace

bool parseArguments(int argc, char* argv[], DriverConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return false;
        }
        else if ((arg == "-d" || arg == "--data") && has_value) {
            config.inputs.push_back(parseInput(argv[++i]));
        }
        else if ((arg == "-l" || arg == "--alma-length") && has_value) {
            config.evaluator.supertrend.alma_length = parseInt(arg, argv[++i]);
        }
        else if (arg == "--alma-offset" && has_value) {
            config.evaluator.supertrend.alma_offset = parseDouble(arg, argv[++i]);
        }
        else if (arg == "--alma-sigma" && has_value) {
            config.evaluator.supertrend.alma_sigma = parseDouble(arg, argv[++i]);
        }
        else if ((arg == "-s" || arg == "--sd-length") && has_value) {
            config.evaluator.supertrend.sd_length = parseInt(arg, argv[++i]);
        }
        else if ((arg == "-f" || arg == "--factor") && has_value) {
            config.evaluator.supertrend.factor = parseDouble(arg, argv[++i]);
        }
        else if (arg == "--min-bars" && has_value) {
            config.evaluator.min_bars_required = parseCount(arg, argv[++i]);
        }
        else if (arg == "--max-bars" && has_value) {
            config.evaluator.max_bars = parseCount(arg, argv[++i]);
        }
        else if (arg == "--mirrored-bear") {
            config.evaluator.bear_rule = BearTrendRule::MIRRORED;
        }
        else if (arg == "--no-header") {
            config.csv.has_header = false;
        }
        else if (arg == "--delimiter" && has_value) {
            std::string delim = argv[++i];
            if (delim.size() != 1) {
                throw ConfigException("Delimiter must be a single character");
            }
            config.csv.delimiter = delim[0];
        }
        else if (arg == "--dump") {
            config.dump_series = true;
        }
        else if (arg == "--verbose") {
            config.verbose = true;
            config.evaluator.verbose = true;
        }
        else {
            std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
            return false;
        }
    }

    if (config.inputs.empty()) {
        std::cerr << "No input data given (use --data SYMBOL=FILE)" << std::endl;
        return false;
    }

    return true;
}

// ============================================================================
// Reporting
// ============================================================================

void printOptional(std::ostream& os, const std::optional<double>& value) {
    if (value) os << *value;
}

void printReport(const SignalReport& report) {
    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();

    std::cout << std::left << std::setw(12) << report.symbol << std::right;
    if (!report.ok()) {
        std::cout << "  " << toString(report.status)
                  << " (bars: " << report.bars_used << ")\n";
        std::cout.flags(flags);
        return;
    }

    std::cout << "  " << std::setw(11) << toString(*report.signal)
              << "  trend=" << std::setw(7) << toString(report.market_trend)
              << "  action=" << std::setw(4) << toString(report.action)
              << "  close=" << std::setprecision(10) << report.latest_close
              << "  supertrend=";
    printOptional(std::cout, report.latest_trend);
    if (report.trend_distance_pct) {
        std::cout << "  distance=" << std::fixed << std::setprecision(2)
                  << *report.trend_distance_pct << "%";
    }
    std::cout << "\n";

    std::cout.flags(flags);
    std::cout.precision(precision);
}

void dumpSeries(const std::string& symbol, const PriceSeries& bars, const SupertrendSeries& series) {
    std::cout << "symbol,timestamp,close,upper_band,lower_band,direction,trend_line\n";
    const std::streamsize precision = std::cout.precision(17);
    // Timestamps are aligned at the newest bar and may be absent
    const size_t ts_offset = bars.size() - std::min(bars.size(), bars.timestamps.size());
    for (size_t i = 0; i < series.size(); ++i) {
        std::cout << symbol << ",";
        if (i >= ts_offset) std::cout << bars.timestamps[i - ts_offset];
        std::cout << "," << bars.close[i] << ",";
        printOptional(std::cout, series.upper_band[i]);
        std::cout << ",";
        printOptional(std::cout, series.lower_band[i]);
        std::cout << ",";
        if (series.direction[i]) std::cout << static_cast<int>(*series.direction[i]);
        std::cout << ",";
        printOptional(std::cout, series.trend_line[i]);
        std::cout << "\n";
    }
    std::cout.precision(precision);
}

// ============================================================================
// Main Function
// ============================================================================

int main(int argc, char* argv[]) {
    DriverConfig config;
    try {
        if (!parseArguments(argc, argv, config)) {
            printUsage(argv[0]);
            return config.show_help ? 0 : 1;
        }
    } catch (const ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (config.verbose) {
        const auto& st = config.evaluator.supertrend;
        std::cout << "Loaded configuration:\n";
        std::cout << "  ALMA:      length=" << st.alma_length << " offset=" << st.alma_offset
                  << " sigma=" << st.alma_sigma << "\n";
        std::cout << "  SD length: " << st.sd_length << "\n";
        std::cout << "  Factor:    " << st.factor << "\n";
        std::cout << "  Bars:      min=" << config.evaluator.min_bars_required
                  << " max=" << config.evaluator.max_bars << "\n";
        std::cout << "  Bear rule: "
                  << (config.evaluator.bear_rule == BearTrendRule::MIRRORED ? "mirrored" : "legacy")
                  << "\n\n";
    }

    int failures = 0;
    try {
        TrendEvaluator evaluator(config.evaluator);
        KlineCsvLoader loader(config.csv);

        for (const auto& [symbol, path] : config.inputs) {
            try {
                if (config.verbose) {
                    std::cout << "[Loader] " << symbol << " <- " << path << std::endl;
                }
                PriceSeries bars = loader.loadFile(path);
                if (config.verbose) {
                    std::cout << "[Loader] " << symbol << " loaded " << bars.size() << " bars" << std::endl;
                }

                SignalReport report = evaluator.evaluate(symbol, bars);
                printReport(report);
                if (!report.ok()) ++failures;

                if (config.dump_series) {
                    PriceSeries window = evaluator.window(bars);
                    dumpSeries(symbol, window, evaluator.computeSeries(bars));
                }
            } catch (const DataException& e) {
                std::cerr << symbol << ": " << e.what() << std::endl;
                ++failures;
            }
        }
    } catch (const AlmaTrendException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return failures == 0 ? 0 : 2;
}
