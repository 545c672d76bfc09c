#pragma once

#include <vector>

#include "common/Types.h"
#include "backtest/BacktestResult.h"
#include "strategy/HolidayCalendar.h"
#include "strategy/PositionStateMachine.h"
#include "strategy/StrategyConfig.h"

namespace ninetofive {
namespace backtest {

// Replays an ascending price series through the zone/position state machine.
// run() keeps all mutable state local, so one engine may be shared across threads.
class BacktestEngine {
public:
    BacktestEngine(strategy::ZoneConfig config,
                   strategy::CostConfig costs,
                   strategy::HolidayCalendar holidays);

    BacktestResult run(const std::vector<PricePoint>& prices) const;

    const strategy::ZoneConfig& config() const { return config_; }
    const strategy::CostConfig& costs() const { return costs_; }
    const strategy::HolidayCalendar& holidays() const { return holidays_; }

private:
    struct RunState {
        strategy::PositionState position = strategy::FlatState{};
        std::vector<Trade> trades;
        double equity = 0.0;
        double peak_equity = 0.0;
        double max_drawdown_pct = 0.0;
        CostTotals total_costs;
    };

    strategy::ZoneConfig config_;
    strategy::CostConfig costs_;
    strategy::HolidayCalendar holidays_;

    Trade closeTrade(const strategy::PositionExit& exit) const;
    void recordTrade(RunState& state, Trade trade) const;
};

BacktestResult runBacktest(const std::vector<PricePoint>& prices,
                           const strategy::ZoneConfig& config = strategy::ZoneConfig{},
                           const strategy::CostConfig& costs = strategy::CostConfig{},
                           const strategy::HolidayCalendar& holidays = strategy::HolidayCalendar::usMarketDefaults());

} // namespace backtest
} // namespace ninetofive
