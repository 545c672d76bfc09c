#include "backtest/StatsAggregator.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <utility>

namespace ninetofive {
namespace backtest {

namespace {
struct OutcomeAccumulator {
    int count = 0;
    int wins = 0;
    int losses = 0;
    double gross_pnl = 0.0;
    double net_pnl = 0.0;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    double duration_sum = 0.0;

    void add(const Trade& trade) {
        count++;
        gross_pnl += trade.gross_pnl_pct;
        net_pnl += trade.net_pnl_pct;
        duration_sum += trade.duration_hours;
        if (trade.net_pnl_pct > 0.0) {
            wins++;
            win_sum += trade.net_pnl_pct;
        } else {
            losses++;
            loss_sum += trade.net_pnl_pct;
        }
    }

    double winRate() const {
        return (count > 0) ? (static_cast<double>(wins) / static_cast<double>(count)) * 100.0 : 0.0;
    }
    double avgWin() const {
        return (wins > 0) ? (win_sum / static_cast<double>(wins)) : 0.0;
    }
    double avgLoss() const {
        return (losses > 0) ? (loss_sum / static_cast<double>(losses)) : 0.0;
    }
    double avgDuration() const {
        return (count > 0) ? (duration_sum / static_cast<double>(count)) : 0.0;
    }
};
} // namespace

BacktestResult StatsAggregator::aggregate(std::vector<Trade> trades,
                                          double final_equity,
                                          double max_drawdown_pct,
                                          const strategy::ZoneConfig& config,
                                          const strategy::CostConfig& costs,
                                          const CostTotals& total_costs) {
    OutcomeAccumulator all;
    std::vector<double> returns;
    returns.reserve(trades.size());
    for (const auto& trade : trades) {
        all.add(trade);
        returns.push_back(trade.net_pnl_pct);
    }

    BacktestResult result;
    result.gross_pnl_pct = all.gross_pnl;
    result.net_pnl_pct = final_equity - STARTING_EQUITY;
    result.win_rate = all.winRate();
    result.max_drawdown_pct = max_drawdown_pct;
    result.sharpe_ratio = sharpeRatio(returns);

    BacktestStats& stats = result.stats;
    stats.total_trades = all.count;
    stats.winning_trades = all.wins;
    stats.losing_trades = all.losses;
    stats.avg_win = all.avgWin();
    stats.avg_loss = all.avgLoss();
    stats.avg_trade_duration_hours = all.avgDuration();
    stats.long_stats = sideStats(trades, Side::LONG);
    stats.short_stats = sideStats(trades, Side::SHORT);
    stats.by_exit_reason = groupByExitReason(trades);
    stats.total_costs = total_costs;
    stats.costs = costs;
    stats.config = config;

    result.trades = std::move(trades);
    return result;
}

double StatsAggregator::sharpeRatio(const std::vector<double>& returns) {
    if (returns.size() < 2) {
        return 0.0;
    }

    const double n = static_cast<double>(returns.size());
    const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;
    double sq_sum = 0.0;
    for (double r : returns) {
        const double diff = r - mean;
        sq_sum += diff * diff;
    }
    const double stddev = std::sqrt(sq_sum / (n - 1.0));
    if (!(stddev > 0.0)) {
        return 0.0;
    }
    return (mean / stddev) * std::sqrt(ANNUALIZATION_PERIODS);
}

SideStats StatsAggregator::sideStats(const std::vector<Trade>& trades, Side side) {
    OutcomeAccumulator acc;
    for (const auto& trade : trades) {
        if (trade.side == side) {
            acc.add(trade);
        }
    }

    SideStats out;
    out.count = acc.count;
    out.winning_trades = acc.wins;
    out.losing_trades = acc.losses;
    out.win_rate = acc.winRate();
    out.gross_pnl = acc.gross_pnl;
    out.net_pnl = acc.net_pnl;
    out.avg_win = acc.avgWin();
    out.avg_loss = acc.avgLoss();
    out.avg_duration_hours = acc.avgDuration();
    return out;
}

std::vector<ExitReasonStats> StatsAggregator::groupByExitReason(const std::vector<Trade>& trades) {
    std::vector<ExitReasonStats> out;
    for (const auto& trade : trades) {
        auto it = std::find_if(out.begin(), out.end(), [&](const ExitReasonStats& s) {
            return s.reason == trade.exit_reason;
        });
        if (it == out.end()) {
            ExitReasonStats fresh;
            fresh.reason = trade.exit_reason;
            out.push_back(fresh);
            it = std::prev(out.end());
        }
        it->count++;
        it->gross_pnl += trade.gross_pnl_pct;
        it->net_pnl += trade.net_pnl_pct;
    }
    return out;
}

KellySizing computeKellySizing(const BacktestResult& result) {
    KellySizing out;
    const BacktestStats& stats = result.stats;
    if (stats.total_trades == 0) {
        return out;
    }

    out.win_probability = result.win_rate / 100.0;
    if (stats.avg_loss < 0.0) {
        out.win_loss_ratio = stats.avg_win / std::abs(stats.avg_loss);
    }
    if (out.win_loss_ratio > 0.0) {
        const double raw = out.win_probability - (1.0 - out.win_probability) / out.win_loss_ratio;
        out.kelly_fraction = std::clamp(raw, 0.0, 1.0);
        out.half_kelly_fraction = out.kelly_fraction * 0.5;
    }
    return out;
}

} // namespace backtest
} // namespace ninetofive
