// kline_csv_loader.hpp
// CSV Kline Loader for the ALMA Supertrend Driver
// Reads historical OHLCV bars of one symbol into a PriceSeries, oldest bar first

#pragma once

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/indicator_types.hpp"
#include "../core/exceptions.hpp"

namespace almatrend {

// ============================================================================
// CSV Kline Loader
// ============================================================================

class KlineCsvLoader {
public:
    struct CsvConfig {
        bool has_header;
        char delimiter;
        std::string date_format;  // used when the timestamp column is not an integer
        bool check_data_integrity;

        CsvConfig()
            : has_header(true)
            , delimiter(',')
            , date_format("%Y-%m-%d")
            , check_data_integrity(true) {}

        static CsvConfig getDefault() {
            return CsvConfig();
        }
    };

private:
    struct Bar {
        int64_t timestamp;
        double open, high, low, close, volume;

        bool validate() const {
            return high >= low &&
                   high >= open && high >= close &&
                   low <= open && low <= close &&
                   volume >= 0;
        }
    };

    CsvConfig config_;

    std::vector<std::string> splitLine(const std::string& line) const {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, config_.delimiter)) {
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            tokens.push_back(token);
        }
        return tokens;
    }

    static bool isInteger(const std::string& s) {
        if (s.empty()) return false;
        size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
        if (i == s.size()) return false;
        for (; i < s.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        }
        return true;
    }

    // Integer epoch values are kept as given; dates become epoch seconds (UTC)
    int64_t parseTimestamp(const std::string& text) const {
        if (isInteger(text)) {
            return std::stoll(text);
        }

        std::tm tm = {};
        std::istringstream ss(text);
        ss >> std::get_time(&tm, config_.date_format.c_str());
        if (ss.fail()) {
            throw std::invalid_argument("unparseable timestamp '" + text + "'");
        }
        return static_cast<int64_t>(daysFromCivil(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday)) * 86400 +
               tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
    }

    // Days since 1970-01-01 for a proleptic Gregorian date
    static int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

public:
    KlineCsvLoader() : config_(CsvConfig::getDefault()) {}

    explicit KlineCsvLoader(const CsvConfig& config)
        : config_(config) {}

    PriceSeries loadFile(const std::string& filepath) const {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw DataException("Failed to open CSV file: " + filepath);
        }
        return load(file, filepath);
    }

    PriceSeries load(std::istream& in, const std::string& source = "<stream>") const {
        std::vector<Bar> bars;
        std::string line;

        if (config_.has_header && !std::getline(in, line)) {
            throw DataException("Empty CSV file: " + source);
        }

        size_t line_num = config_.has_header ? 2 : 1;
        while (std::getline(in, line)) {
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
                line_num++;
                continue;
            }

            auto tokens = splitLine(line);
            if (tokens.size() < 6) {  // Minimum: Time,O,H,L,C,V
                throw DataException("Invalid CSV format at line " +
                                    std::to_string(line_num) + " of " + source);
            }

            Bar bar;
            try {
                bar.timestamp = parseTimestamp(tokens[0]);
                bar.open = std::stod(tokens[1]);
                bar.high = std::stod(tokens[2]);
                bar.low = std::stod(tokens[3]);
                bar.close = std::stod(tokens[4]);
                bar.volume = std::stod(tokens[5]);
            } catch (const std::exception& e) {
                throw DataException("Error parsing line " + std::to_string(line_num) +
                                    " of " + source + ": " + e.what());
            }

            if (config_.check_data_integrity && !bar.validate()) {
                throw DataException("Invalid bar data at line " +
                                    std::to_string(line_num) + " of " + source);
            }

            bars.push_back(bar);
            line_num++;
        }

        if (bars.empty()) {
            throw DataException("No valid bars loaded from: " + source);
        }

        std::stable_sort(bars.begin(), bars.end(),
                         [](const Bar& a, const Bar& b) {
                             return a.timestamp < b.timestamp;
                         });

        PriceSeries series;
        series.reserve(bars.size());
        for (const auto& bar : bars) {
            series.timestamps.push_back(bar.timestamp);
            series.open.push_back(bar.open);
            series.high.push_back(bar.high);
            series.low.push_back(bar.low);
            series.close.push_back(bar.close);
            series.volume.push_back(bar.volume);
        }
        return series;
    }

    const CsvConfig& getConfig() const { return config_; }
};

} // namespace almatrend
