#include "backtest/ParameterOptimizer.h"
#include "backtest/BacktestEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace ninetofive {
namespace backtest {

namespace {
std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string sessionLabel(const strategy::SessionTime& t) {
    std::ostringstream oss;
    oss << t.hour << ":" << std::setfill('0') << std::setw(2) << t.minute;
    return oss.str();
}

std::string fractionalHourLabel(double value) {
    strategy::ZoneConfig scratch;
    strategy::applyParameter(scratch, "shortStart", value);
    return sessionLabel(scratch.short_zone_start);
}
} // namespace

OptimizationMetric parseMetric(const std::string& name) {
    if (name == "netPnl") return OptimizationMetric::NET_PNL;
    if (name == "sharpe") return OptimizationMetric::SHARPE;
    if (name == "winRate") return OptimizationMetric::WIN_RATE;
    throw std::invalid_argument("Unknown metric: " + name + " (expected netPnl, sharpe or winRate)");
}

const char* metricToString(OptimizationMetric metric) {
    switch (metric) {
        case OptimizationMetric::NET_PNL: return "netPnl";
        case OptimizationMetric::SHARPE: return "sharpe";
        case OptimizationMetric::WIN_RATE: return "winRate";
    }
    return "netPnl";
}

const std::vector<ParameterDefinition>& parameterDefinitions() {
    static const std::vector<ParameterDefinition> kDefinitions = {
        {"profitTarget", {0.5, 2.0, 0.25}},
        {"shortStart", {8.0, 11.0, 0.5}},
        {"shortEnd", {14.0, 17.0, 0.5}},
        {"tpThreshold", {4.0, 10.0, 1.0}},
        {"trailingStop", {0.25, 1.0, 0.25}},
        {"leverage", {5.0, 20.0, 5.0}}
    };
    return kDefinitions;
}

const ParameterDefinition& findParameter(const std::string& name) {
    for (const auto& def : parameterDefinitions()) {
        if (def.name == name) {
            return def;
        }
    }
    throw std::invalid_argument("Unknown parameter: " + name);
}

std::string formatParameterValue(const std::string& name, double value) {
    if (name == "profitTarget" || name == "trailingStop") {
        return fixed(value, 2) + "%";
    }
    if (name == "shortStart" || name == "shortEnd") {
        return fractionalHourLabel(value);
    }
    if (name == "tpThreshold") {
        return fixed(value, 0) + "h";
    }
    if (name == "leverage") {
        return fixed(value, 0) + "x";
    }
    throw std::invalid_argument("Unknown parameter: " + name);
}

std::vector<double> generateRange(const ParameterRange& range) {
    if (!(range.step > 0.0)) {
        throw std::invalid_argument("Range step must be > 0");
    }
    if (range.max < range.min) {
        throw std::invalid_argument("Range max must be >= min");
    }

    std::vector<double> values;
    for (int i = 0;; ++i) {
        const double v = range.min + static_cast<double>(i) * range.step;
        if (v > range.max + 0.0001) {
            break;
        }
        values.push_back(std::round(v * 1000.0) / 1000.0);
    }
    return values;
}

ParameterRange parseRange(const std::string& text) {
    std::vector<double> parts;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        try {
            size_t consumed = 0;
            parts.push_back(std::stod(token, &consumed));
            if (consumed != token.size()) {
                throw std::invalid_argument(token);
            }
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid range value '" + token + "' in: " + text);
        }
    }
    if (parts.size() != 3) {
        throw std::invalid_argument("Range must be min,max,step: " + text);
    }
    ParameterRange range{parts[0], parts[1], parts[2]};
    generateRange(range);
    return range;
}

double metricValue(const OptimizationRun& run, OptimizationMetric metric) {
    switch (metric) {
        case OptimizationMetric::SHARPE: return run.sharpe;
        case OptimizationMetric::WIN_RATE: return run.win_rate;
        case OptimizationMetric::NET_PNL: return run.net_pnl;
    }
    return run.net_pnl;
}

ParameterOptimizer::ParameterOptimizer(std::vector<PricePoint> prices,
                                       strategy::ZoneConfig base_config,
                                       strategy::CostConfig costs,
                                       strategy::HolidayCalendar holidays,
                                       size_t max_threads)
    : prices_(std::move(prices)),
      base_config_(std::move(base_config)),
      costs_(std::move(costs)),
      holidays_(std::move(holidays)),
      max_threads_(max_threads) {
    if (max_threads_ == 0) {
        max_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

std::vector<OptimizationRun> ParameterOptimizer::optimizeSingle(const std::string& param,
                                                                const std::optional<ParameterRange>& range,
                                                                OptimizationMetric metric) const {
    const ParameterDefinition& def = findParameter(param);
    const ParameterRange effective = range.value_or(def.default_range);
    const std::vector<double> values = generateRange(effective);

    LOG_INFO("Optimizing {} from {} to {} (step {}), {} values",
             param, effective.min, effective.max, effective.step, values.size());

    std::vector<Candidate> candidates;
    candidates.reserve(values.size());
    for (double value : values) {
        Candidate c;
        c.config = base_config_;
        strategy::applyParameter(c.config, param, value);
        c.params.emplace_back(param, value);
        c.label = formatParameterValue(param, value);
        candidates.push_back(std::move(c));
    }

    auto runs = evaluate(candidates);
    rankResults(runs, metric);
    return runs;
}

std::vector<OptimizationRun> ParameterOptimizer::optimizeGrid(OptimizationMetric metric) const {
    static const double kProfitTargets[] = {0.5, 0.75, 1.0, 1.25, 1.5};
    static const int kShortStartHours[] = {8, 9, 10};
    static const int kShortEndHours[] = {15, 16, 17};
    static const double kTpThresholds[] = {4.0, 6.0, 8.0};

    std::vector<Candidate> candidates;
    for (double pt : kProfitTargets) {
        for (int ss : kShortStartHours) {
            for (int se : kShortEndHours) {
                for (double tp : kTpThresholds) {
                    Candidate c;
                    c.config = base_config_;
                    c.config.profit_target_pct = pt;
                    c.config.short_zone_start = strategy::SessionTime{ss, 29};
                    c.config.short_zone_end = strategy::SessionTime{se, 1};
                    c.config.tp_zone_hours_threshold = tp;
                    c.params = {
                        {"profitTarget", pt},
                        {"shortStart", static_cast<double>(ss)},
                        {"shortEnd", static_cast<double>(se)},
                        {"tpThreshold", tp}
                    };
                    c.label = fixed(pt, 2) + "% " +
                              sessionLabel(c.config.short_zone_start) + "-" +
                              sessionLabel(c.config.short_zone_end) + " " +
                              fixed(tp, 0) + "h";
                    candidates.push_back(std::move(c));
                }
            }
        }
    }

    LOG_INFO("Multi-parameter optimization: {} combinations", candidates.size());
    auto runs = evaluate(candidates);
    rankResults(runs, metric);
    return runs;
}

void ParameterOptimizer::rankResults(std::vector<OptimizationRun>& runs, OptimizationMetric metric) {
    std::stable_sort(runs.begin(), runs.end(), [metric](const OptimizationRun& a, const OptimizationRun& b) {
        return metricValue(a, metric) > metricValue(b, metric);
    });
}

std::vector<OptimizationRun> ParameterOptimizer::evaluate(const std::vector<Candidate>& candidates) const {
    std::vector<OptimizationRun> runs;
    runs.reserve(candidates.size());

    for (size_t begin = 0; begin < candidates.size(); begin += max_threads_) {
        const size_t end = std::min(candidates.size(), begin + max_threads_);

        std::vector<std::future<OptimizationRun>> batch;
        batch.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            batch.push_back(std::async(std::launch::async, [this, &candidates, i]() {
                return evaluateOne(candidates[i]);
            }));
        }
        for (auto& f : batch) {
            runs.push_back(f.get());
        }
        LOG_DEBUG("Optimizer progress: {}/{}", end, candidates.size());
    }
    return runs;
}

OptimizationRun ParameterOptimizer::evaluateOne(const Candidate& candidate) const {
    const BacktestEngine engine(candidate.config, costs_, holidays_);
    const BacktestResult result = engine.run(prices_);

    OptimizationRun run;
    run.params = candidate.params;
    run.label = candidate.label;
    run.net_pnl = result.net_pnl_pct;
    run.gross_pnl = result.gross_pnl_pct;
    run.sharpe = result.sharpe_ratio;
    run.win_rate = result.win_rate;
    run.max_drawdown = result.max_drawdown_pct;
    run.trades = result.stats.total_trades;
    return run;
}

} // namespace backtest
} // namespace ninetofive
