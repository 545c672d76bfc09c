#pragma once

#include <vector>

#include "common/Types.h"
#include "strategy/CostModel.h"
#include "strategy/StrategyConfig.h"

namespace ninetofive {
namespace backtest {

struct Trade {
    TimestampMs entry_time = 0;
    TimestampMs exit_time = 0;
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    Side side = Side::LONG;
    ExitReason exit_reason = ExitReason::BACKTEST_END;
    double gross_pnl_pct = 0.0;
    double net_pnl_pct = 0.0;
    double duration_hours = 0.0;
    strategy::CostBreakdown costs;
};

// Equity impact of costs over the run (already multiplied by leverage)
struct CostTotals {
    double fees = 0.0;
    double slippage = 0.0;
    double funding = 0.0;

    double total() const { return fees + slippage + funding; }
};

struct SideStats {
    int count = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double gross_pnl = 0.0;
    double net_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double avg_duration_hours = 0.0;
};

struct ExitReasonStats {
    ExitReason reason = ExitReason::BACKTEST_END;
    int count = 0;
    double gross_pnl = 0.0;
    double net_pnl = 0.0;
};

struct BacktestStats {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double avg_trade_duration_hours = 0.0;
    SideStats long_stats;
    SideStats short_stats;
    std::vector<ExitReasonStats> by_exit_reason;  // first-seen order
    CostTotals total_costs;
    strategy::CostConfig costs;
    strategy::ZoneConfig config;
};

struct BacktestResult {
    std::vector<Trade> trades;
    double gross_pnl_pct = 0.0;
    double net_pnl_pct = 0.0;
    double win_rate = 0.0;
    double max_drawdown_pct = 0.0;
    double sharpe_ratio = 0.0;
    BacktestStats stats;
};

} // namespace backtest
} // namespace ninetofive
