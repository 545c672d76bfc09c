#include "strategy/CostModel.h"
#include "strategy/ZoneClassifier.h"

#include <cmath>

namespace ninetofive {
namespace strategy {

namespace {
constexpr double BPS_TO_PCT = 1.0 / 100.0;
constexpr double ROUND_TRIP_LEGS = 2.0;
}

TradingCosts CostModel::tradingCosts(double notional,
                                     double duration_hours,
                                     Side side,
                                     const CostConfig& costs) {
    CostBreakdown breakdown;
    breakdown.fees_pct = ROUND_TRIP_LEGS * costs.taker_fee_bps * BPS_TO_PCT;
    breakdown.slippage_pct = ROUND_TRIP_LEGS * costs.slippage_bps * BPS_TO_PCT;

    if (costs.funding_interval_hours > 0.0 && duration_hours > 0.0) {
        breakdown.funding_periods = static_cast<int>(std::floor(duration_hours / costs.funding_interval_hours));
    }
    const double funding_per_period_pct = costs.avg_funding_rate_bps * BPS_TO_PCT;
    const double funding_sign = (side == Side::LONG) ? 1.0 : -1.0;
    breakdown.funding_pct = static_cast<double>(breakdown.funding_periods) * funding_per_period_pct * funding_sign;

    breakdown.total_pct = breakdown.fees_pct + breakdown.slippage_pct + breakdown.funding_pct;

    TradingCosts out;
    out.total_cost_pct = breakdown.total_pct;
    out.total_cost_amount = notional * breakdown.total_pct / 100.0;
    out.breakdown = breakdown;
    return out;
}

NetPnl CostModel::netPnl(double entry_price,
                         double exit_price,
                         Side side,
                         double leverage,
                         double duration_hours,
                         const CostConfig& costs) {
    const double price_pct = profitPct(entry_price, exit_price, side);
    const TradingCosts trading = tradingCosts(1.0, duration_hours, side, costs);

    NetPnl out;
    out.gross_pnl_pct = price_pct * leverage;
    out.leveraged_cost_pct = trading.total_cost_pct * leverage;
    out.net_pnl_pct = out.gross_pnl_pct - out.leveraged_cost_pct;
    out.costs = trading.breakdown;
    return out;
}

} // namespace strategy
} // namespace ninetofive
