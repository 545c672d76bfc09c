#include "backtest/BacktestEngine.h"
#include "backtest/ReportFormatter.h"
#include "backtest/StatsAggregator.h"
#include "backtest/SyntheticData.h"
#include "strategy/ZoneClassifier.h"

#include <cassert>
#include <iostream>

using namespace ninetofive;

int main() {
    // 2025-12-01T00:00:00Z
    const TimestampMs start = 1764547200000LL;
    const auto prices = backtest::SyntheticData::generateNineToFive(14, start, 100000.0, 42);

    // Series shape
    {
        assert(prices.size() == 14u * 288u);
        assert(prices.front().timestamp == start);
        for (size_t i = 1; i < prices.size(); ++i) {
            assert(prices[i].timestamp - prices[i - 1].timestamp == 5LL * 60LL * 1000LL);
        }
        for (const auto& p : prices) {
            assert(p.high >= p.price);
            assert(p.low <= p.price);
            assert(p.low > 0.0);
        }

        const auto again = backtest::SyntheticData::generateNineToFive(14, start, 100000.0, 42);
        assert(again.size() == prices.size());
        assert(again.back().price == prices.back().price);

        const auto other = backtest::SyntheticData::generateNineToFive(14, start, 100000.0, 43);
        assert(other.back().price != prices.back().price);

        assert(backtest::SyntheticData::generateNineToFive(0, start, 100000.0, 42).empty());
    }

    // Two weeks of the session pattern through the default strategy
    const auto result = backtest::runBacktest(prices);
    {
        const auto& s = result.stats;
        assert(!result.trades.empty());
        assert(s.long_stats.count > 0);
        assert(s.short_stats.count > 0);
        assert(s.long_stats.winning_trades > s.long_stats.losing_trades);
        assert(s.long_stats.count + s.short_stats.count == s.total_trades);
        assert(result.win_rate >= 0.0 && result.win_rate <= 100.0);
        assert(result.max_drawdown_pct >= 0.0);

        for (size_t i = 1; i < result.trades.size(); ++i) {
            assert(result.trades[i].exit_time >= result.trades[i - 1].exit_time);
        }
        for (const auto& t : result.trades) {
            if (t.exit_reason == ExitReason::TP_BELOW_ENTRY ||
                t.exit_reason == ExitReason::TP_TRAILING_STOP ||
                t.exit_reason == ExitReason::TP_TIME_EXIT) {
                assert(t.side == Side::LONG);
            }
        }
    }

    // Reports render every section
    {
        const std::string text = backtest::ReportFormatter::formatResults(result);
        assert(text.find("RESULTS") != std::string::npos);
        assert(text.find("TRADING COSTS") != std::string::npos);
        assert(text.find("EXIT REASONS") != std::string::npos);

        const auto j = backtest::ReportFormatter::toJson(result, true);
        assert(j.contains("trades"));
        assert(j["trades"].size() == result.trades.size());
        assert(j.contains("kelly"));

        const auto summary = backtest::ReportFormatter::toJson(result);
        assert(!summary.contains("trades"));

        const std::string first_three = backtest::ReportFormatter::formatTrades(result.trades, 3);
        assert(!first_three.empty());
        assert(backtest::ReportFormatter::signedPct(1.234) == "+1.23%");
        assert(backtest::ReportFormatter::signedPct(-0.5) == "-0.50%");
    }

    std::cout << "[TEST] SyntheticBacktest PASSED\n";
    return 0;
}
