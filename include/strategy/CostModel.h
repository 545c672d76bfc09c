#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace ninetofive {
namespace strategy {

// Round-trip costs as percentages of notional (before leverage)
struct CostBreakdown {
    double fees_pct = 0.0;
    double slippage_pct = 0.0;
    double funding_pct = 0.0;   // negative when the position receives funding
    int funding_periods = 0;
    double total_pct = 0.0;
};

struct TradingCosts {
    double total_cost_pct = 0.0;
    double total_cost_amount = 0.0;  // in notional units
    CostBreakdown breakdown;
};

struct NetPnl {
    double gross_pnl_pct = 0.0;
    double leveraged_cost_pct = 0.0;
    double net_pnl_pct = 0.0;
    CostBreakdown costs;
};

class CostModel {
public:
    // Market (IOC) execution on both legs: taker fee twice, slippage twice,
    // plus floor(duration / interval) funding periods. Longs pay positive
    // funding, shorts receive it.
    static TradingCosts tradingCosts(double notional,
                                     double duration_hours,
                                     Side side,
                                     const CostConfig& costs);

    // gross = price move x leverage, net = gross - total cost x leverage
    static NetPnl netPnl(double entry_price,
                         double exit_price,
                         Side side,
                         double leverage,
                         double duration_hours,
                         const CostConfig& costs);
};

} // namespace strategy
} // namespace ninetofive
