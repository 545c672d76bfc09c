#include "backtest/DataHistory.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace ninetofive;
using backtest::DataHistory;

namespace {
constexpr TimestampMs kMonday = 1764547200000LL;
constexpr long long kFiveMinutes = 5LL * 60LL * 1000LL;

std::filesystem::path writeFile(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

bool loadFails(const std::filesystem::path& path) {
    try {
        DataHistory::load(path.string());
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}
}

int main() {
    // Binance kline CSV: header skipped, rows sorted, extra columns ignored
    {
        const auto path = writeFile("ninetofive_klines.csv",
            "open_time,open,high,low,close,volume,close_time\n"
            "1764547500000,100.5,101.0,100.0,100.8,12.5,1764547799999\n"
            "1764547200000,100.0,100.9,99.5,100.5,10.0,1764547499999\n"
            "\n"
            "1764547800,100.8,101.2,100.6,101.1,8.0,1764548099999\n");

        const auto candles = DataHistory::loadCSV(path.string());
        assert(candles.size() == 3);
        assert(candles[0].timestamp == kMonday);
        assert(candles[1].timestamp == kMonday + kFiveMinutes);
        assert(candles[2].timestamp == kMonday + 2 * kFiveMinutes);  // seconds promoted
        assert(candles[0].open == 100.0);
        assert(candles[0].close == 100.5);
        assert(candles[1].volume == 12.5);

        const auto points = DataHistory::toPricePoints(candles);
        assert(points.size() == 3);
        assert(points[2].price == 101.1);
        assert(points[2].high == 101.2);
        assert(points[2].low == 100.6);
        assert(points[2].open == 100.8);
        assert(points[2].timestamp == candles[2].timestamp);

        std::filesystem::remove(path);
    }

    // Malformed CSV rows fail the whole load
    {
        const auto short_row = writeFile("ninetofive_short_row.csv",
            "1764547200000,100.0,100.9,99.5,100.5,10.0\n"
            "1764547500000,100.5,101.0,100.0\n");
        assert(loadFails(short_row));

        const auto bad_number = writeFile("ninetofive_bad_number.csv",
            "1764547200000,100.0,abc,99.5,100.5,10.0\n");
        assert(loadFails(bad_number));

        assert(loadFails(std::filesystem::temp_directory_path() / "ninetofive_missing.csv"));

        std::filesystem::remove(short_row);
        std::filesystem::remove(bad_number);
    }

    // JSON: long and short keys, ISO or numeric timestamps
    {
        const auto path = writeFile("ninetofive_candles.JSON", R"([
            {"timestamp": "2025-12-01T00:05:00.000Z", "open": 100.5, "high": 101.0, "low": 100.0, "close": 100.8, "volume": 3},
            {"t": 1764547200000, "o": 100.0, "h": "100.9", "l": 99.5, "c": 100.5}
        ])");

        const auto candles = DataHistory::load(path.string());
        assert(candles.size() == 2);
        assert(candles[0].timestamp == kMonday);
        assert(candles[0].high == 100.9);
        assert(candles[0].volume == 0.0);
        assert(candles[1].timestamp == kMonday + kFiveMinutes);
        assert(candles[1].volume == 3.0);

        std::filesystem::remove(path);
    }

    // Malformed JSON
    {
        const auto not_array = writeFile("ninetofive_object.json", R"({"timestamp": 1})");
        assert(loadFails(not_array));

        const auto missing_field = writeFile("ninetofive_missing_field.json",
            R"([{"timestamp": 1764547200000, "open": 1, "high": 1, "low": 1}])");
        assert(loadFails(missing_field));

        const auto broken = writeFile("ninetofive_broken.json", "[{");
        assert(loadFails(broken));

        std::filesystem::remove(not_array);
        std::filesystem::remove(missing_field);
        std::filesystem::remove(broken);
    }

    // Inclusive whole-day date filter
    {
        std::vector<Candle> candles;
        const long long day = 24LL * 60LL * 60LL * 1000LL;
        for (int i = 0; i < 4; ++i) {
            candles.emplace_back(1.0, 1.0, 1.0, 1.0, 0.0, kMonday + i * day + 23LL * 60LL * 60LL * 1000LL);
        }

        const auto middle = DataHistory::filterByDate(candles, "2025-12-02", "2025-12-03");
        assert(middle.size() == 2);
        assert(middle.front().timestamp == candles[1].timestamp);
        assert(middle.back().timestamp == candles[2].timestamp);

        assert(DataHistory::filterByDate(candles, "", "").size() == 4);
        assert(DataHistory::filterByDate(candles, "2025-12-03", "").size() == 2);
        assert(DataHistory::filterByDate(candles, "", "2025-12-01").size() == 1);

        bool threw = false;
        try {
            DataHistory::filterByDate(candles, "Dec 1", "");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
