#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace ninetofive {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

void sortByTimestamp(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}

[[noreturn]] void failLoad(const std::string& message) {
    LOG_ERROR("{}", message);
    throw std::runtime_error(message);
}

double numberField(const nlohmann::json& item, const char* key, const char* short_key) {
    const nlohmann::json* field = nullptr;
    if (item.contains(key)) {
        field = &item[key];
    } else if (item.contains(short_key)) {
        field = &item[short_key];
    } else {
        throw std::invalid_argument(std::string("missing field '") + key + "'");
    }
    if (field->is_string()) {
        return std::stod(field->get<std::string>());
    }
    return field->get<double>();
}

TimestampMs timestampField(const nlohmann::json& item) {
    const nlohmann::json* field = nullptr;
    if (item.contains("timestamp")) {
        field = &item["timestamp"];
    } else if (item.contains("t")) {
        field = &item["t"];
    } else {
        throw std::invalid_argument("missing field 'timestamp'");
    }
    if (field->is_string()) {
        return utils::TimeUtils::parseTimestamp(field->get<std::string>());
    }
    return utils::TimeUtils::toMsTimestamp(field->get<long long>());
}
} // namespace

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        failLoad("Failed to open CSV file: " + file_path);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;
        if (!row[0].empty() && !std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header row
            continue;
        }
        if (row.size() < 6) {
            failLoad("Malformed CSV row " + std::to_string(line_no) + " in " + file_path +
                     ": expected at least 6 columns");
        }

        try {
            Candle candle;
            candle.timestamp = utils::TimeUtils::toMsTimestamp(std::stoll(row[0]));
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            failLoad("Malformed CSV row " + std::to_string(line_no) + " in " + file_path + ": " + e.what());
        }
    }

    sortByTimestamp(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        failLoad("Failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        failLoad("Error parsing JSON file: " + file_path + " - " + e.what());
    }
    if (!j.is_array()) {
        failLoad("JSON candle file must contain an array: " + file_path);
    }

    size_t index = 0;
    for (const auto& item : j) {
        try {
            Candle candle;
            candle.timestamp = timestampField(item);
            candle.open = numberField(item, "open", "o");
            candle.high = numberField(item, "high", "h");
            candle.low = numberField(item, "low", "l");
            candle.close = numberField(item, "close", "c");
            candle.volume = (item.contains("volume") || item.contains("v"))
                ? numberField(item, "volume", "v")
                : 0.0;
            candles.push_back(candle);
        } catch (const std::exception& e) {
            failLoad("Malformed candle #" + std::to_string(index) + " in " + file_path + ": " + e.what());
        }
        ++index;
    }

    sortByTimestamp(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    std::string lower = file_path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".json") == 0) {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    const long long day_ms = utils::TimeUtils::MS_PER_DAY;
    const bool has_start = !start_date.empty();
    const bool has_end = !end_date.empty();
    const TimestampMs start_ms = has_start ? utils::TimeUtils::parseDate(start_date) * day_ms : 0;
    const TimestampMs end_ms = has_end ? (utils::TimeUtils::parseDate(end_date) + 1) * day_ms : 0;

    std::vector<Candle> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) {
        if (has_start && candle.timestamp < start_ms) continue;
        if (has_end && candle.timestamp >= end_ms) continue;
        out.push_back(candle);
    }
    return out;
}

std::vector<PricePoint> DataHistory::toPricePoints(const std::vector<Candle>& candles) {
    std::vector<PricePoint> points;
    points.reserve(candles.size());
    for (const auto& c : candles) {
        points.emplace_back(c.timestamp, c.close, c.high, c.low, c.open);
    }
    return points;
}

} // namespace backtest
} // namespace ninetofive
