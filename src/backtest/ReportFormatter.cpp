#include "backtest/ReportFormatter.h"
#include "common/TimeUtils.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ninetofive {
namespace backtest {

namespace {
const char* const HEAVY_RULE = "===========================================================\n";
const char* const LIGHT_RULE = "-----------------------------------------------------------\n";

void section(std::ostringstream& out, const std::string& title) {
    out << "\n" << LIGHT_RULE
        << std::string(20, ' ') << title << "\n"
        << LIGHT_RULE << "\n";
}

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string label(const std::string& text) {
    std::ostringstream oss;
    oss << std::left << std::setw(20) << text;
    return oss.str();
}

void sideBlock(std::ostringstream& out, const std::string& name, const SideStats& s) {
    out << label(name + " Trades:") << s.count << " (" << fixed(s.win_rate, 1) << "% win)\n"
        << label("  Gross PnL:") << ReportFormatter::signedPct(s.gross_pnl) << "\n"
        << label("  Net PnL:") << ReportFormatter::signedPct(s.net_pnl) << "\n";
}
} // namespace

std::string ReportFormatter::signedPct(double value, int precision) {
    return (value >= 0.0 ? "+" : "") + fixed(value, precision) + "%";
}

std::string ReportFormatter::formatResults(const BacktestResult& result) {
    const BacktestStats& stats = result.stats;
    const CostTotals& totals = stats.total_costs;

    std::ostringstream out;
    out << HEAVY_RULE
        << std::string(20, ' ') << "BACKTEST RESULTS\n"
        << HEAVY_RULE << "\n"
        << label("Gross PnL:") << signedPct(result.gross_pnl_pct) << "\n"
        << label("Net PnL:") << signedPct(result.net_pnl_pct) << "\n"
        << label("Win Rate:") << fixed(result.win_rate, 1) << "%\n"
        << label("Max Drawdown:") << fixed(result.max_drawdown_pct, 2) << "%\n"
        << label("Sharpe Ratio:") << fixed(result.sharpe_ratio, 2) << "\n";

    section(out, "TRADING COSTS");
    out << label("Total Costs:") << "-" << fixed(totals.total(), 2) << "%\n"
        << label("  Fees:") << "-" << fixed(totals.fees, 2) << "% ("
        << stats.costs.taker_fee_bps << " bps/trade)\n"
        << label("  Slippage:") << "-" << fixed(totals.slippage, 2) << "% ("
        << stats.costs.slippage_bps << " bps/trade)\n"
        << label("  Funding:") << (totals.funding >= 0.0 ? "-" : "+")
        << fixed(std::abs(totals.funding), 2) << "%\n";

    section(out, "TRADE STATS");
    out << label("Total Trades:") << stats.total_trades << "\n"
        << label("  Winners:") << stats.winning_trades << " (" << fixed(result.win_rate, 1) << "%)\n"
        << label("  Losers:") << stats.losing_trades << "\n"
        << label("Avg Win:") << "+" << fixed(stats.avg_win, 2) << "%\n"
        << label("Avg Loss:") << fixed(stats.avg_loss, 2) << "%\n"
        << label("Avg Duration:") << fixed(stats.avg_trade_duration_hours, 1) << " hours\n";

    section(out, "LONG vs SHORT");
    sideBlock(out, "Long", stats.long_stats);
    sideBlock(out, "Short", stats.short_stats);

    section(out, "EXIT REASONS");
    for (const auto& reason : stats.by_exit_reason) {
        out << std::left << std::setw(20) << exitReasonToString(reason.reason) << " "
            << std::right << std::setw(4) << reason.count << " trades  "
            << signedPct(reason.net_pnl) << "\n";
    }

    out << "\n" << HEAVY_RULE;
    return out.str();
}

std::string ReportFormatter::formatTrades(const std::vector<Trade>& trades, size_t limit) {
    std::ostringstream out;
    const size_t n = (limit > 0 && limit < trades.size()) ? limit : trades.size();
    for (size_t i = 0; i < n; ++i) {
        const Trade& t = trades[i];
        std::string side = sideToString(t.side);
        for (auto& ch : side) {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        out << "#" << std::right << std::setw(3) << (i + 1) << " "
            << std::left << std::setw(5) << side << " "
            << utils::TimeUtils::formatTimestamp(t.entry_time) << " -> "
            << utils::TimeUtils::formatTimestamp(t.exit_time) << " "
            << "$" << fixed(t.entry_price, 0) << " -> $" << fixed(t.exit_price, 0) << " "
            << "gross: " << signedPct(t.gross_pnl_pct) << " "
            << "net: " << signedPct(t.net_pnl_pct) << " "
            << "(" << exitReasonToString(t.exit_reason) << ")\n";
    }
    return out.str();
}

std::string ReportFormatter::formatKelly(const KellySizing& kelly) {
    std::ostringstream out;
    out << label("Kelly Fraction:") << fixed(kelly.kelly_fraction * 100.0, 1) << "%"
        << " (half: " << fixed(kelly.half_kelly_fraction * 100.0, 1) << "%)\n"
        << label("  Win Prob:") << fixed(kelly.win_probability * 100.0, 1) << "%\n"
        << label("  Win/Loss:") << fixed(kelly.win_loss_ratio, 2) << "\n";
    return out.str();
}

nlohmann::json ReportFormatter::toJson(const Trade& trade) {
    return {
        {"entry_time", trade.entry_time},
        {"exit_time", trade.exit_time},
        {"entry_price", trade.entry_price},
        {"exit_price", trade.exit_price},
        {"side", sideToString(trade.side)},
        {"exit_reason", exitReasonToString(trade.exit_reason)},
        {"gross_pnl_pct", trade.gross_pnl_pct},
        {"net_pnl_pct", trade.net_pnl_pct},
        {"duration_hours", trade.duration_hours},
        {"costs", {
            {"fees_pct", trade.costs.fees_pct},
            {"slippage_pct", trade.costs.slippage_pct},
            {"funding_pct", trade.costs.funding_pct},
            {"funding_periods", trade.costs.funding_periods},
            {"total_pct", trade.costs.total_pct}
        }}
    };
}

nlohmann::json ReportFormatter::toJson(const BacktestResult& result, bool include_trades) {
    const BacktestStats& stats = result.stats;
    auto side_json = [](const SideStats& s) {
        return nlohmann::json{
            {"count", s.count},
            {"winning_trades", s.winning_trades},
            {"losing_trades", s.losing_trades},
            {"win_rate", s.win_rate},
            {"gross_pnl", s.gross_pnl},
            {"net_pnl", s.net_pnl},
            {"avg_win", s.avg_win},
            {"avg_loss", s.avg_loss},
            {"avg_duration_hours", s.avg_duration_hours}
        };
    };

    nlohmann::json j;
    j["gross_pnl_pct"] = result.gross_pnl_pct;
    j["net_pnl_pct"] = result.net_pnl_pct;
    j["win_rate"] = result.win_rate;
    j["max_drawdown_pct"] = result.max_drawdown_pct;
    j["sharpe_ratio"] = result.sharpe_ratio;
    j["total_trades"] = stats.total_trades;
    j["winning_trades"] = stats.winning_trades;
    j["losing_trades"] = stats.losing_trades;
    j["avg_win"] = stats.avg_win;
    j["avg_loss"] = stats.avg_loss;
    j["avg_trade_duration_hours"] = stats.avg_trade_duration_hours;
    j["long_stats"] = side_json(stats.long_stats);
    j["short_stats"] = side_json(stats.short_stats);

    // Array keeps first-seen order
    j["by_exit_reason"] = nlohmann::json::array();
    for (const auto& r : stats.by_exit_reason) {
        j["by_exit_reason"].push_back({
            {"reason", exitReasonToString(r.reason)},
            {"count", r.count},
            {"gross_pnl", r.gross_pnl},
            {"net_pnl", r.net_pnl}
        });
    }
    j["total_costs"] = {
        {"fees", stats.total_costs.fees},
        {"slippage", stats.total_costs.slippage},
        {"funding", stats.total_costs.funding}
    };
    j["costs"] = strategy::toJson(stats.costs);
    j["config"] = strategy::toJson(stats.config);

    const KellySizing kelly = computeKellySizing(result);
    j["kelly"] = {
        {"win_probability", kelly.win_probability},
        {"win_loss_ratio", kelly.win_loss_ratio},
        {"kelly_fraction", kelly.kelly_fraction},
        {"half_kelly_fraction", kelly.half_kelly_fraction}
    };

    if (include_trades) {
        j["trades"] = nlohmann::json::array();
        for (const auto& t : result.trades) {
            j["trades"].push_back(toJson(t));
        }
    }
    return j;
}

} // namespace backtest
} // namespace ninetofive
