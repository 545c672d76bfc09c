#include "common/Logger.h"
#include "common/Config.h"
#include "common/TimeUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/ParameterOptimizer.h"
#include "backtest/ReportFormatter.h"
#include "backtest/StatsAggregator.h"
#include "backtest/SyntheticData.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ninetofive;

namespace {

struct CliOptions {
    std::string command;
    std::string data_path;
    std::string config_path = "config/config.json";
    std::string start_date;
    std::string end_date;
    std::optional<double> profit_target;
    std::optional<double> leverage;
    std::optional<std::string> fee_tier;
    bool no_costs = false;
    bool show_trades = false;
    bool json = false;

    std::string param = "profitTarget";
    std::optional<std::string> range;
    bool multi = false;
    std::string metric = "netPnl";
    int top = 10;
    std::optional<size_t> threads;

    int days = 14;
    unsigned int seed = 42;
    bool help = false;
};

void printUsage() {
    std::cout <<
        "ninetofive - session-zone strategy backtester\n"
        "\n"
        "Usage:\n"
        "  ninetofive backtest <candles.csv|json> [options]\n"
        "  ninetofive optimize <candles.csv|json> [options]\n"
        "  ninetofive simulate [--days n] [--seed s] [options]\n"
        "\n"
        "Common options:\n"
        "  --config <path>       Config file (default: config/config.json)\n"
        "  --start <YYYY-MM-DD>  First day of data to use\n"
        "  --end <YYYY-MM-DD>    Last day of data to use\n"
        "  --profit <pct>        Profit target percentage\n"
        "  --leverage <x>        Leverage multiplier\n"
        "  --fee-tier <name>     default, tier1, tier2, tier3, tier4, none\n"
        "  --no-costs            Ignore fees, slippage and funding\n"
        "\n"
        "backtest / simulate:\n"
        "  --trades              Print individual trades\n"
        "  --json                Print the result as JSON\n"
        "\n"
        "optimize:\n"
        "  --param <name>        profitTarget, shortStart, shortEnd, tpThreshold, trailingStop, leverage\n"
        "  --range <min,max,step>\n"
        "  --multi               Predefined multi-parameter grid\n"
        "  --metric <name>       netPnl, sharpe, winRate (default: netPnl)\n"
        "  --top <n>             Show top N results (default: 10)\n"
        "  --threads <n>         Concurrent backtests (default: config or hardware)\n";
}

std::string requireValue(int& i, int argc, char* argv[]) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + flag);
    }
    return argv[++i];
}

double parseDouble(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    double out = 0.0;
    try {
        out = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + flag + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid number for " + flag + ": " + value);
    }
    return out;
}

int parseInt(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    int out = 0;
    try {
        out = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for " + flag + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid integer for " + flag + ": " + value);
    }
    return out;
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    int i = 1;
    if (i < argc && argv[i][0] != '-') {
        options.command = argv[i++];
    }
    if ((options.command == "backtest" || options.command == "optimize") &&
        i < argc && argv[i][0] != '-') {
        options.data_path = argv[i++];
    }

    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--config") {
            options.config_path = requireValue(i, argc, argv);
        } else if (arg == "--start" || arg == "-s") {
            options.start_date = requireValue(i, argc, argv);
        } else if (arg == "--end" || arg == "-e") {
            options.end_date = requireValue(i, argc, argv);
        } else if (arg == "--profit" || arg == "-p") {
            options.profit_target = parseDouble(arg, requireValue(i, argc, argv));
        } else if (arg == "--leverage" || arg == "-l") {
            options.leverage = parseDouble(arg, requireValue(i, argc, argv));
        } else if (arg == "--fee-tier") {
            options.fee_tier = requireValue(i, argc, argv);
        } else if (arg == "--no-costs") {
            options.no_costs = true;
        } else if (arg == "--trades" || arg == "-t") {
            options.show_trades = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--param") {
            options.param = requireValue(i, argc, argv);
        } else if (arg == "--range" || arg == "-r") {
            options.range = requireValue(i, argc, argv);
        } else if (arg == "--multi" || arg == "-m") {
            options.multi = true;
        } else if (arg == "--metric") {
            options.metric = requireValue(i, argc, argv);
        } else if (arg == "--top") {
            options.top = parseInt(arg, requireValue(i, argc, argv));
        } else if (arg == "--threads") {
            const int n = parseInt(arg, requireValue(i, argc, argv));
            if (n < 1) {
                throw std::invalid_argument("--threads must be >= 1");
            }
            options.threads = static_cast<size_t>(n);
        } else if (arg == "--days" || arg == "-d") {
            options.days = parseInt(arg, requireValue(i, argc, argv));
        } else if (arg == "--seed") {
            options.seed = static_cast<unsigned int>(parseInt(arg, requireValue(i, argc, argv)));
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return options;
}

strategy::ZoneConfig buildZoneConfig(const CliOptions& options, const Config& config) {
    strategy::ZoneConfig zone = config.getZoneConfig();
    if (options.profit_target) {
        zone.profit_target_pct = *options.profit_target;
    }
    if (options.leverage) {
        zone.leverage = *options.leverage;
    }
    strategy::validateZoneConfig(zone);
    return zone;
}

strategy::CostConfig buildCostConfig(const CliOptions& options, const Config& config) {
    if (options.no_costs) {
        return strategy::costConfigForTier("none");
    }
    if (options.fee_tier) {
        return strategy::mergeCostConfig(config.getCostConfig(), {{"fee_tier", *options.fee_tier}});
    }
    return config.getCostConfig();
}

std::vector<PricePoint> loadPricePoints(const CliOptions& options) {
    if (options.data_path.empty()) {
        throw std::invalid_argument("A candle file is required for '" + options.command + "'");
    }
    if (!std::filesystem::exists(options.data_path)) {
        throw std::runtime_error("Candle file not found: " + options.data_path);
    }

    auto candles = backtest::DataHistory::load(options.data_path);
    if (!options.start_date.empty() || !options.end_date.empty()) {
        candles = backtest::DataHistory::filterByDate(candles, options.start_date, options.end_date);
    }
    if (candles.empty()) {
        throw std::runtime_error("No candles loaded from " + options.data_path);
    }
    return backtest::DataHistory::toPricePoints(candles);
}

void printConfiguration(const std::vector<PricePoint>& prices,
                        const strategy::ZoneConfig& zone,
                        const strategy::CostConfig& costs) {
    std::cout << "Configuration:\n"
              << "  Period:        " << utils::TimeUtils::formatTimestamp(prices.front().timestamp)
              << " to " << utils::TimeUtils::formatTimestamp(prices.back().timestamp) << " UTC\n"
              << "  Candles:       " << prices.size() << "\n"
              << "  Profit Target: " << zone.profit_target_pct << "%\n"
              << "  Leverage:      " << zone.leverage << "x\n"
              << "  Short Zone:    " << zone.short_zone_start.hour << ":"
              << std::setw(2) << std::setfill('0') << zone.short_zone_start.minute << " - "
              << zone.short_zone_end.hour << ":" << std::setw(2) << zone.short_zone_end.minute
              << std::setfill(' ') << " (UTC-5)\n"
              << "  Taker Fee:     " << costs.taker_fee_bps << " bps\n"
              << "  Slippage:      " << costs.slippage_bps << " bps\n"
              << "  Funding Rate:  " << costs.avg_funding_rate_bps << " bps/"
              << costs.funding_interval_hours << "h\n\n";
}

int runBacktestCommand(const CliOptions& options,
                       const std::vector<PricePoint>& prices,
                       const strategy::ZoneConfig& zone,
                       const strategy::CostConfig& costs,
                       const strategy::HolidayCalendar& holidays) {
    LOG_INFO("Running backtest over {} price points", prices.size());
    const backtest::BacktestEngine engine(zone, costs, holidays);
    const backtest::BacktestResult result = engine.run(prices);

    for (const auto& t : result.trades) {
        Logger::getInstance().logTrade(sideToString(t.side), t.entry_price, t.exit_price,
                                       exitReasonToString(t.exit_reason), t.gross_pnl_pct, t.net_pnl_pct);
    }

    if (options.json) {
        std::cout << backtest::ReportFormatter::toJson(result, options.show_trades).dump(2) << "\n";
        return 0;
    }

    printConfiguration(prices, zone, costs);
    std::cout << backtest::ReportFormatter::formatResults(result) << "\n";
    std::cout << backtest::ReportFormatter::formatKelly(backtest::computeKellySizing(result)) << "\n";

    if (options.show_trades && !result.trades.empty()) {
        std::cout << "INDIVIDUAL TRADES\n"
                  << backtest::ReportFormatter::formatTrades(result.trades) << "\n";
    }

    LOG_INFO("Backtest complete: {} trades, net {:.2f}%", result.stats.total_trades, result.net_pnl_pct);
    return 0;
}

int runOptimizeCommand(const CliOptions& options,
                       const std::vector<PricePoint>& prices,
                       const strategy::ZoneConfig& zone,
                       const strategy::CostConfig& costs,
                       const strategy::HolidayCalendar& holidays,
                       size_t max_threads) {
    const backtest::OptimizationMetric metric = backtest::parseMetric(options.metric);
    std::optional<backtest::ParameterRange> range;
    if (options.range) {
        range = backtest::parseRange(*options.range);
    }

    const backtest::ParameterOptimizer optimizer(prices, zone, costs, holidays, max_threads);
    LOG_INFO("Optimizer using {} concurrent tasks, metric {}", optimizer.maxThreads(),
             backtest::metricToString(metric));

    const auto runs = options.multi
        ? optimizer.optimizeGrid(metric)
        : optimizer.optimizeSingle(options.param, range, metric);
    if (runs.empty()) {
        throw std::runtime_error("Optimizer produced no results");
    }

    const size_t shown = std::min(runs.size(), static_cast<size_t>(std::max(1, options.top)));
    if (options.json) {
        nlohmann::json j = nlohmann::json::array();
        for (size_t i = 0; i < shown; ++i) {
            const auto& r = runs[i];
            nlohmann::json params = nlohmann::json::object();
            for (const auto& [name, value] : r.params) {
                params[name] = value;
            }
            j.push_back({
                {"rank", i + 1},
                {"label", r.label},
                {"params", params},
                {"net_pnl", r.net_pnl},
                {"gross_pnl", r.gross_pnl},
                {"sharpe", r.sharpe},
                {"win_rate", r.win_rate},
                {"max_drawdown", r.max_drawdown},
                {"trades", r.trades}
            });
        }
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << "\n===========================================================\n"
              << "                    OPTIMIZATION RESULTS (" << backtest::metricToString(metric) << ")\n"
              << "===========================================================\n\n";
    if (!options.multi) {
        std::cout << "Parameter:  " << options.param << "\n"
                  << "Best value: " << runs.front().label << "\n\n";
    }
    std::cout << "Rank  " << std::left << std::setw(24) << "Params"
              << std::right << std::setw(10) << "Net PnL"
              << std::setw(11) << "Gross PnL"
              << std::setw(8) << "Sharpe"
              << std::setw(7) << "Win%"
              << std::setw(7) << "DD%"
              << std::setw(8) << "Trades" << "\n";
    for (size_t i = 0; i < shown; ++i) {
        const auto& r = runs[i];
        std::cout << "#" << std::left << std::setw(4) << (i + 1) << " "
                  << std::setw(24) << r.label << std::right
                  << std::setw(10) << backtest::ReportFormatter::signedPct(r.net_pnl)
                  << std::setw(11) << backtest::ReportFormatter::signedPct(r.gross_pnl)
                  << std::setw(8) << std::fixed << std::setprecision(2) << r.sharpe
                  << std::setw(6) << std::setprecision(0) << r.win_rate << "%"
                  << std::setw(6) << std::setprecision(1) << r.max_drawdown << "%"
                  << std::setw(8) << r.trades << "\n";
    }
    std::cout << "\n";
    LOG_INFO("Optimization complete: best {} ({} = {:.4f})", runs.front().label,
             backtest::metricToString(metric), backtest::metricValue(runs.front(), metric));
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const CliOptions options = parseArgs(argc, argv);
        if (options.help || options.command.empty()) {
            printUsage();
            return options.help ? 0 : 1;
        }
        if (options.command != "backtest" && options.command != "optimize" && options.command != "simulate") {
            std::cerr << "Unknown command: " << options.command << "\n\n";
            printUsage();
            return 1;
        }

        auto& config = Config::getInstance();
        config.load(options.config_path);

        Logger::getInstance().initialize(config.getLogDir());
        Logger::getInstance().setLevel(config.getLogLevel());
        LOG_INFO("ninetofive {} (config: {})", options.command, options.config_path);
        if (!std::filesystem::exists(options.config_path)) {
            LOG_WARN("Config file not found: {}, using defaults", options.config_path);
        }

        const strategy::ZoneConfig zone = buildZoneConfig(options, config);
        const strategy::CostConfig costs = buildCostConfig(options, config);
        const strategy::HolidayCalendar holidays = config.getHolidays();

        std::vector<PricePoint> prices;
        if (options.command == "simulate") {
            if (options.days < 1) {
                throw std::invalid_argument("--days must be >= 1");
            }
            const TimestampMs start_ms = utils::TimeUtils::parseTimestamp(
                options.start_date.empty() ? "2025-12-01" : options.start_date);
            prices = backtest::SyntheticData::generateNineToFive(options.days, start_ms, 100000.0, options.seed);
            LOG_INFO("Generated {} synthetic price points (seed {})", prices.size(), options.seed);
        } else {
            prices = loadPricePoints(options);
        }

        if (options.command == "optimize") {
            const size_t max_threads = options.threads.value_or(config.getOptimizerMaxThreads());
            return runOptimizeCommand(options, prices, zone, costs, holidays, max_threads);
        }
        return runBacktestCommand(options, prices, zone, costs, holidays);

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
