// test_kline_csv_loader.cpp
// Tests for reading kline CSV data into a PriceSeries

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "../include/data/kline_csv_loader.hpp"
#include "test_reporter.hpp"

using namespace almatrend;

namespace {

bool throwsDataException(const KlineCsvLoader& loader, const std::string& csv) {
    std::istringstream in(csv);
    try {
        loader.load(in);
    } catch (const DataException&) {
        return true;
    }
    return false;
}

} // namespace

void test_sorted_by_timestamp() {
    std::istringstream in(
        "open_time,open,high,low,close,volume\n"
        "1700000120000,102,103,101,102.5,10\n"
        "1700000000000,100,101,99,100.5,12\n"
        "\n"
        "1700000060000,101,102,100,101.5,11\n");

    KlineCsvLoader loader;
    auto bars = loader.load(in);
    check(bars.size() == 3, "three bars");
    check(bars.timestamps[0] == 1700000000000LL, "oldest first");
    check(bars.timestamps[2] == 1700000120000LL, "newest last");
    check(bars.close[0] == 100.5 && bars.close[1] == 101.5 && bars.close[2] == 102.5, "closes follow the sort");
    check(bars.volume[1] == 11.0, "volume column");
    check(bars.open.size() == 3 && bars.high.size() == 3 && bars.low.size() == 3, "columns aligned");
}

void test_date_timestamps() {
    std::istringstream in(
        "date,open,high,low,close,volume\n"
        "2024-01-02,10,11,9,10.5,100\n"
        "2024-01-01,9,10,8,9.5,100\n");

    KlineCsvLoader loader;
    auto bars = loader.load(in);
    check(bars.timestamps[0] == 1704067200LL, "2024-01-01 in epoch seconds");
    check(bars.timestamps[1] == 1704153600LL, "2024-01-02 in epoch seconds");
}

void test_headerless_custom_delimiter() {
    KlineCsvLoader::CsvConfig config;
    config.has_header = false;
    config.delimiter = ';';
    KlineCsvLoader loader(config);

    std::istringstream in("1;5;6;4;5.5;1\n2; 5.5 ;7;5;6.5;2\n");
    auto bars = loader.load(in);
    check(bars.size() == 2, "first line is data");
    check(bars.open[1] == 5.5, "tokens are trimmed");
    check(bars.close[1] == 6.5, "semicolon separated");
}

void test_malformed_rows() {
    KlineCsvLoader loader;
    check(throwsDataException(loader, ""), "empty input");
    check(throwsDataException(loader, "time,open,high,low,close,volume\n"), "header only");
    check(throwsDataException(loader, "h\n1,2,3,4,5\n"), "too few columns");
    check(throwsDataException(loader, "h\n1,2,abc,1,2,3\n"), "bad number");
    check(throwsDataException(loader, "h\nyesterday,2,3,1,2,3\n"), "bad timestamp");
    check(throwsDataException(loader, "h\n1,10,9,11,10,1\n"), "high below low");
    check(throwsDataException(loader, "h\n1,10,11,9,10,-1\n"), "negative volume");
}

void test_integrity_check_can_be_disabled() {
    KlineCsvLoader::CsvConfig config;
    config.check_data_integrity = false;
    KlineCsvLoader loader(config);

    std::istringstream in("h\n1,10,9,11,10,1\n");
    auto bars = loader.load(in);
    check(bars.size() == 1 && bars.close[0] == 10.0, "inconsistent bar accepted");
}

void test_load_file() {
    auto path = std::filesystem::temp_directory_path() / "almatrend_loader_test.csv";
    {
        std::ofstream out(path);
        out << "open_time,open,high,low,close,volume\n";
        for (int i = 0; i < 5; ++i) {
            out << (1000 + i) << ",100,101,99," << (100 + i * 0.25) << ",1\n";
        }
    }

    KlineCsvLoader loader;
    auto bars = loader.loadFile(path.string());
    std::remove(path.string().c_str());

    check(bars.size() == 5, "five bars from file");
    check(bars.close[4] == 101.0, "last close");

    bool thrown = false;
    try {
        loader.loadFile(path.string());
    } catch (const DataException& e) {
        thrown = std::string(e.what()).find("Data Error") != std::string::npos;
    }
    check(thrown, "missing file");
}

int main() {
    std::cout << "\n=== Kline CSV Loader Tests ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Sorted by Timestamp", test_sorted_by_timestamp);
    reporter.test("Date Timestamps", test_date_timestamps);
    reporter.test("Headerless Custom Delimiter", test_headerless_custom_delimiter);
    reporter.test("Malformed Rows", test_malformed_rows);
    reporter.test("Integrity Check Disabled", test_integrity_check_can_be_disabled);
    reporter.test("Load File", test_load_file);

    return reporter.report();
}
