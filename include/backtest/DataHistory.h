#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace ninetofive {
namespace backtest {

// Loads cached candles from disk. Remote fetching lives outside this project;
// anything unreadable or malformed throws std::runtime_error.
class DataHistory {
public:
    // Binance kline layout: open_time,open,high,low,close,volume[,close_time,...]
    // Header rows are skipped, second timestamps promoted to ms.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects: timestamp (ISO string or epoch number), open, high, low, close, volume.
    // Short keys t/o/h/l/c/v are accepted as well.
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Dispatches on the file extension
    static std::vector<Candle> load(const std::string& file_path);

    // Inclusive whole-day UTC range; empty bound means unbounded.
    // Throws std::invalid_argument on a malformed date.
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);

    static std::vector<PricePoint> toPricePoints(const std::vector<Candle>& candles);
};

} // namespace backtest
} // namespace ninetofive
