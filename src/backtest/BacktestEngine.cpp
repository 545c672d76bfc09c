#include "backtest/BacktestEngine.h"
#include "backtest/StatsAggregator.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include "strategy/CostModel.h"
#include "strategy/ZoneClassifier.h"

#include <optional>
#include <utility>

namespace ninetofive {
namespace backtest {

BacktestEngine::BacktestEngine(strategy::ZoneConfig config,
                               strategy::CostConfig costs,
                               strategy::HolidayCalendar holidays)
    : config_(std::move(config)),
      costs_(std::move(costs)),
      holidays_(std::move(holidays)) {}

BacktestResult BacktestEngine::run(const std::vector<PricePoint>& prices) const {
    LOG_DEBUG("Starting backtest with {} candles.", prices.size());

    RunState state;
    state.equity = StatsAggregator::STARTING_EQUITY;
    state.peak_equity = StatsAggregator::STARTING_EQUITY;

    std::optional<Zone> previous_zone;
    for (const auto& candle : prices) {
        strategy::PositionTransitionInput input;
        input.candle = candle;
        input.zone = strategy::ZoneClassifier::classify(candle.timestamp, config_, holidays_);
        input.previous_zone = previous_zone;

        auto transition = strategy::PositionStateMachine::transition(state.position, input, config_);
        for (const auto& exit : transition.exits) {
            recordTrade(state, closeTrade(exit));
        }
        state.position = std::move(transition.next);
        previous_zone = input.zone;
    }

    if (!prices.empty()) {
        if (auto exit = strategy::PositionStateMachine::finalize(state.position, prices.back())) {
            recordTrade(state, closeTrade(*exit));
            state.position = strategy::FlatState{};
        }
    }

    LOG_DEBUG("Backtest completed: {} trades, final equity {:.4f}, max drawdown {:.4f}%",
              state.trades.size(), state.equity, state.max_drawdown_pct);

    return StatsAggregator::aggregate(std::move(state.trades),
                                      state.equity,
                                      state.max_drawdown_pct,
                                      config_,
                                      costs_,
                                      state.total_costs);
}

Trade BacktestEngine::closeTrade(const strategy::PositionExit& exit) const {
    Trade trade;
    trade.entry_time = exit.entry_time;
    trade.exit_time = exit.exit_time;
    trade.entry_price = exit.entry_price;
    trade.exit_price = exit.exit_price;
    trade.side = exit.side;
    trade.exit_reason = exit.reason;
    trade.duration_hours = utils::TimeUtils::hoursBetween(exit.entry_time, exit.exit_time);

    const auto pnl = strategy::CostModel::netPnl(exit.entry_price,
                                                  exit.exit_price,
                                                  exit.side,
                                                  config_.leverage,
                                                  trade.duration_hours,
                                                  costs_);
    trade.gross_pnl_pct = pnl.gross_pnl_pct;
    trade.net_pnl_pct = pnl.net_pnl_pct;
    trade.costs = pnl.costs;
    return trade;
}

void BacktestEngine::recordTrade(RunState& state, Trade trade) const {
    state.equity += trade.net_pnl_pct;
    state.total_costs.fees += trade.costs.fees_pct * config_.leverage;
    state.total_costs.slippage += trade.costs.slippage_pct * config_.leverage;
    state.total_costs.funding += trade.costs.funding_pct * config_.leverage;

    if (state.equity > state.peak_equity) {
        state.peak_equity = state.equity;
    }
    const double drawdown = (state.peak_equity > 0.0)
        ? ((state.peak_equity - state.equity) / state.peak_equity) * 100.0
        : 0.0;
    if (drawdown > state.max_drawdown_pct) {
        state.max_drawdown_pct = drawdown;
    }

    state.trades.push_back(std::move(trade));
}

BacktestResult runBacktest(const std::vector<PricePoint>& prices,
                           const strategy::ZoneConfig& config,
                           const strategy::CostConfig& costs,
                           const strategy::HolidayCalendar& holidays) {
    return BacktestEngine(config, costs, holidays).run(prices);
}

} // namespace backtest
} // namespace ninetofive
