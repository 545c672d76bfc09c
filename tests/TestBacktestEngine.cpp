#include "backtest/BacktestEngine.h"
#include "backtest/SyntheticData.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace ninetofive;
using backtest::BacktestEngine;
using backtest::BacktestResult;
using strategy::CostConfig;
using strategy::HolidayCalendar;
using strategy::ZoneConfig;
using utils::TimeUtils;

namespace {
constexpr TimestampMs kMonday = 1764547200000LL;

TimestampMs localMonday(int hour, int minute) {
    return kMonday + (hour + 5) * TimeUtils::MS_PER_HOUR + minute * TimeUtils::MS_PER_MINUTE;
}

PricePoint flat(TimestampMs ts, double price) {
    return PricePoint(ts, price, price, price, price);
}

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

// long zone -> short zone -> long zone on a Monday, no price wicks
std::vector<PricePoint> zoneFlipSeries() {
    return {
        flat(localMonday(8, 0), 100000.0),
        flat(localMonday(9, 30), 100000.0),
        flat(localMonday(16, 5), 99500.0),
    };
}
}

int main() {
    const CostConfig no_costs = strategy::costConfigForTier("none");
    const HolidayCalendar holidays = HolidayCalendar::usMarketDefaults();

    // Empty input
    {
        const BacktestEngine engine(ZoneConfig{}, CostConfig{}, holidays);
        const BacktestResult r = engine.run({});
        assert(r.trades.empty());
        assert(r.stats.total_trades == 0);
        assert(r.net_pnl_pct == 0.0);
        assert(r.gross_pnl_pct == 0.0);
        assert(r.win_rate == 0.0);
        assert(r.max_drawdown_pct == 0.0);
        assert(r.sharpe_ratio == 0.0);
        assert(r.stats.by_exit_reason.empty());
    }

    // A single candle never opens anything
    {
        const BacktestResult r = backtest::runBacktest({flat(localMonday(10, 0), 100.0)});
        assert(r.trades.empty());
    }

    // Zone flips without costs
    {
        const BacktestEngine engine(ZoneConfig{}, no_costs, holidays);
        const BacktestResult r = engine.run(zoneFlipSeries());
        assert(r.trades.size() == 2);

        const auto& shrt = r.trades[0];
        assert(shrt.side == Side::SHORT);
        assert(shrt.exit_reason == ExitReason::ZONE_FLIP);
        assert(shrt.entry_price == 100000.0);
        assert(shrt.exit_price == 99500.0);
        assert(near(shrt.gross_pnl_pct, 5.0));
        assert(near(shrt.net_pnl_pct, 5.0));
        assert(near(shrt.duration_hours, 6.0 + 35.0 / 60.0));

        const auto& lng = r.trades[1];
        assert(lng.side == Side::LONG);
        assert(lng.exit_reason == ExitReason::BACKTEST_END);
        assert(lng.entry_price == 99500.0);
        assert(lng.duration_hours == 0.0);

        assert(near(r.net_pnl_pct, 5.0));
        assert(near(r.gross_pnl_pct, 5.0));
        assert(r.max_drawdown_pct == 0.0);

        assert(r.stats.by_exit_reason.size() == 2);
        assert(r.stats.by_exit_reason[0].reason == ExitReason::ZONE_FLIP);
        assert(r.stats.by_exit_reason[1].reason == ExitReason::BACKTEST_END);
    }

    // Same series with default costs: the end-of-run close moves equity and drawdown
    {
        const BacktestResult r = backtest::runBacktest(zoneFlipSeries());
        assert(r.trades.size() == 2);
        assert(near(r.trades[0].net_pnl_pct, 3.0));
        assert(near(r.trades[1].net_pnl_pct, -2.0));
        assert(near(r.net_pnl_pct, 1.0));
        assert(near(r.max_drawdown_pct, 2.0 / 103.0 * 100.0));
        assert(near(r.stats.total_costs.fees, 2.0));
        assert(near(r.stats.total_costs.slippage, 2.0));
        assert(near(r.stats.total_costs.funding, 0.0));
        assert(r.stats.winning_trades == 1);
        assert(r.stats.losing_trades == 1);
        assert(near(r.win_rate, 50.0));
    }

    // TP zone with trailing stop
    {
        const std::vector<PricePoint> prices = {
            flat(localMonday(16, 0), 100000.0),
            flat(localMonday(16, 5), 100000.0),
            PricePoint(localMonday(16, 10), 101100.0, 101200.0, 100900.0, 100000.0),
            PricePoint(localMonday(16, 15), 100800.0, 101300.0, 100700.0, 101100.0),
        };
        const BacktestEngine engine(ZoneConfig{}, no_costs, holidays);
        const BacktestResult r = engine.run(prices);
        assert(r.trades.size() == 1);
        assert(r.trades[0].side == Side::LONG);
        assert(r.trades[0].exit_reason == ExitReason::TP_TRAILING_STOP);
        assert(near(r.trades[0].exit_price, 100793.5));
        assert(near(r.trades[0].gross_pnl_pct, 7.935));
        assert(r.trades[0].exit_time == localMonday(16, 15));
    }

    // Deterministic and bounded on a longer series
    {
        const auto prices = backtest::SyntheticData::generateNineToFive(10, kMonday, 100000.0, 7);
        const BacktestEngine engine(ZoneConfig{}, CostConfig{}, holidays);
        const BacktestResult a = engine.run(prices);
        const BacktestResult b = engine.run(prices);
        assert(a.trades.size() == b.trades.size());
        assert(a.net_pnl_pct == b.net_pnl_pct);
        assert(a.sharpe_ratio == b.sharpe_ratio);

        assert(a.win_rate >= 0.0 && a.win_rate <= 100.0);
        assert(a.max_drawdown_pct >= 0.0);
        assert(a.stats.winning_trades + a.stats.losing_trades == a.stats.total_trades);
        assert(a.stats.long_stats.count + a.stats.short_stats.count == a.stats.total_trades);

        int grouped = 0;
        for (const auto& g : a.stats.by_exit_reason) {
            grouped += g.count;
        }
        assert(grouped == a.stats.total_trades);

        double net_sum = 0.0;
        for (const auto& t : a.trades) {
            assert(t.exit_time >= t.entry_time);
            net_sum += t.net_pnl_pct;
        }
        assert(near(net_sum, a.net_pnl_pct, 1e-6));
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
