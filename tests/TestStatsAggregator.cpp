#include "backtest/StatsAggregator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace ninetofive;
using backtest::CostTotals;
using backtest::StatsAggregator;
using backtest::Trade;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

Trade makeTrade(Side side, ExitReason reason, double gross, double net, double hours) {
    Trade t;
    t.side = side;
    t.exit_reason = reason;
    t.gross_pnl_pct = gross;
    t.net_pnl_pct = net;
    t.duration_hours = hours;
    return t;
}
}

int main() {
    std::cout << "[TEST] Starting StatsAggregator Test..." << std::endl;

    // Sharpe ratio
    {
        assert(StatsAggregator::sharpeRatio({}) == 0.0);
        assert(StatsAggregator::sharpeRatio({1.5}) == 0.0);
        assert(StatsAggregator::sharpeRatio({1.0, 1.0, 1.0}) == 0.0);

        // mean 2, sample stdev sqrt(2)
        const double expected = (2.0 / std::sqrt(2.0)) * std::sqrt(252.0);
        assert(near(StatsAggregator::sharpeRatio({1.0, 3.0}), expected));
        assert(StatsAggregator::sharpeRatio({-1.0, -3.0}) < 0.0);
    }

    // Aggregation of a hand-built trade log
    const std::vector<Trade> trades = {
        makeTrade(Side::LONG, ExitReason::TP_TRAILING_STOP, 5.0, 3.0, 10.0),
        makeTrade(Side::SHORT, ExitReason::ZONE_FLIP, 1.0, -1.0, 6.0),
        makeTrade(Side::LONG, ExitReason::TP_TRAILING_STOP, 2.0, 0.0, 2.0),
        makeTrade(Side::SHORT, ExitReason::PROFIT_TARGET, 10.0, 8.0, 1.0),
    };
    CostTotals totals;
    totals.fees = 4.0;
    totals.slippage = 4.0;
    totals.funding = 0.2;

    const auto result = StatsAggregator::aggregate(trades, 110.0, 1.25,
                                                   strategy::ZoneConfig{}, strategy::CostConfig{}, totals);
    {
        const auto& s = result.stats;
        assert(result.trades.size() == 4);
        assert(s.total_trades == 4);
        assert(s.winning_trades == 2);
        assert(s.losing_trades == 2);  // zero net counts as a loss
        assert(near(result.win_rate, 50.0));
        assert(near(result.gross_pnl_pct, 18.0));
        assert(near(result.net_pnl_pct, 10.0));
        assert(near(result.max_drawdown_pct, 1.25));
        assert(near(s.avg_win, 5.5));
        assert(near(s.avg_loss, -0.5));
        assert(near(s.avg_trade_duration_hours, 4.75));
        assert(near(s.total_costs.total(), 8.2));

        assert(s.long_stats.count == 2);
        assert(s.long_stats.winning_trades == 1);
        assert(near(s.long_stats.win_rate, 50.0));
        assert(near(s.long_stats.net_pnl, 3.0));
        assert(near(s.long_stats.avg_duration_hours, 6.0));

        assert(s.short_stats.count == 2);
        assert(near(s.short_stats.gross_pnl, 11.0));
        assert(near(s.short_stats.avg_loss, -1.0));
    }

    // Exit reasons in first-seen order
    {
        const auto& groups = result.stats.by_exit_reason;
        assert(groups.size() == 3);
        assert(groups[0].reason == ExitReason::TP_TRAILING_STOP);
        assert(groups[0].count == 2);
        assert(near(groups[0].net_pnl, 3.0));
        assert(groups[1].reason == ExitReason::ZONE_FLIP);
        assert(groups[2].reason == ExitReason::PROFIT_TARGET);

        for (const auto& g : groups) {
            auto parsed = exitReasonFromString(exitReasonToString(g.reason));
            assert(parsed.has_value() && *parsed == g.reason);
        }
        assert(!exitReasonFromString("stop-loss").has_value());
    }

    // Kelly sizing
    {
        const auto kelly = backtest::computeKellySizing(result);
        assert(near(kelly.win_probability, 0.5));
        assert(near(kelly.win_loss_ratio, 11.0));
        assert(near(kelly.kelly_fraction, 0.5 - 0.5 / 11.0));
        assert(near(kelly.half_kelly_fraction, kelly.kelly_fraction / 2.0));

        const auto empty = backtest::computeKellySizing(backtest::BacktestResult{});
        assert(empty.kelly_fraction == 0.0);
        assert(empty.win_loss_ratio == 0.0);

        // No losses to size against
        const auto all_wins = StatsAggregator::aggregate(
            {makeTrade(Side::LONG, ExitReason::PROFIT_TARGET, 2.0, 1.0, 1.0)}, 101.0, 0.0,
            strategy::ZoneConfig{}, strategy::CostConfig{}, CostTotals{});
        const auto k = backtest::computeKellySizing(all_wins);
        assert(k.win_probability == 1.0);
        assert(k.kelly_fraction == 0.0);

        // Negative edge clamps to zero
        const auto losing = StatsAggregator::aggregate(
            {makeTrade(Side::LONG, ExitReason::PROFIT_TARGET, 1.0, 0.5, 1.0),
             makeTrade(Side::SHORT, ExitReason::ZONE_FLIP, -4.0, -5.0, 1.0),
             makeTrade(Side::SHORT, ExitReason::ZONE_FLIP, -4.0, -5.0, 1.0)},
            90.5, 9.5, strategy::ZoneConfig{}, strategy::CostConfig{}, CostTotals{});
        assert(backtest::computeKellySizing(losing).kelly_fraction == 0.0);
    }

    std::cout << "[TEST] StatsAggregator PASSED" << std::endl;
    return 0;
}
