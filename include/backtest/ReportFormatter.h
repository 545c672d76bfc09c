#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtest/BacktestResult.h"
#include "backtest/StatsAggregator.h"

namespace ninetofive {
namespace backtest {

class ReportFormatter {
public:
    static std::string formatResults(const BacktestResult& result);
    static std::string formatTrades(const std::vector<Trade>& trades, size_t limit = 0);
    static std::string formatKelly(const KellySizing& kelly);

    static nlohmann::json toJson(const Trade& trade);
    static nlohmann::json toJson(const BacktestResult& result, bool include_trades = false);

    // "+1.23%" / "-0.50%"
    static std::string signedPct(double value, int precision = 2);
};

} // namespace backtest
} // namespace ninetofive
