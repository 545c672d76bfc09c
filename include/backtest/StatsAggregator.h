#pragma once

#include <vector>

#include "backtest/BacktestResult.h"

namespace ninetofive {
namespace backtest {

struct KellySizing {
    double win_probability = 0.0;
    double win_loss_ratio = 0.0;
    double kelly_fraction = 0.0;
    double half_kelly_fraction = 0.0;
};

class StatsAggregator {
public:
    static constexpr double STARTING_EQUITY = 100.0;
    static constexpr double ANNUALIZATION_PERIODS = 252.0;

    // Reduces the trade log into the final result. Wins are trades with
    // net PnL > 0; everything else counts as a loss.
    static BacktestResult aggregate(std::vector<Trade> trades,
                                    double final_equity,
                                    double max_drawdown_pct,
                                    const strategy::ZoneConfig& config,
                                    const strategy::CostConfig& costs,
                                    const CostTotals& total_costs);

    // mean / sample stdev x sqrt(252); zero with fewer than two samples or no dispersion
    static double sharpeRatio(const std::vector<double>& returns);

    static SideStats sideStats(const std::vector<Trade>& trades, Side side);
    static std::vector<ExitReasonStats> groupByExitReason(const std::vector<Trade>& trades);
};

// Optional position-sizing hint derived from aggregated stats, clamped to [0, 1].
// Zero when there are no trades or no losing trades to size against.
KellySizing computeKellySizing(const BacktestResult& result);

} // namespace backtest
} // namespace ninetofive
