#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Types.h"
#include "strategy/HolidayCalendar.h"
#include "strategy/StrategyConfig.h"

namespace ninetofive {
namespace backtest {

enum class OptimizationMetric { NET_PNL, SHARPE, WIN_RATE };

// netPnl, sharpe, winRate. Throws std::invalid_argument.
OptimizationMetric parseMetric(const std::string& name);
const char* metricToString(OptimizationMetric metric);

struct ParameterRange {
    double min = 0.0;
    double max = 0.0;
    double step = 0.0;
};

struct ParameterDefinition {
    std::string name;
    ParameterRange default_range;
};

const std::vector<ParameterDefinition>& parameterDefinitions();

// Throws std::invalid_argument for an unknown name
const ParameterDefinition& findParameter(const std::string& name);

std::string formatParameterValue(const std::string& name, double value);

// Inclusive of max (with a small tolerance), values rounded to 1e-3.
// Throws std::invalid_argument when step <= 0 or max < min.
std::vector<double> generateRange(const ParameterRange& range);

// "min,max,step"
ParameterRange parseRange(const std::string& text);

struct OptimizationRun {
    std::vector<std::pair<std::string, double>> params;
    std::string label;
    double net_pnl = 0.0;
    double gross_pnl = 0.0;
    double sharpe = 0.0;
    double win_rate = 0.0;
    double max_drawdown = 0.0;
    int trades = 0;
};

double metricValue(const OptimizationRun& run, OptimizationMetric metric);

// Grid search over strategy parameters. Every combination is an independent
// engine run on the same immutable price series, evaluated on up to
// max_threads concurrent tasks.
class ParameterOptimizer {
public:
    ParameterOptimizer(std::vector<PricePoint> prices,
                       strategy::ZoneConfig base_config,
                       strategy::CostConfig costs,
                       strategy::HolidayCalendar holidays,
                       size_t max_threads = 0);

    std::vector<OptimizationRun> optimizeSingle(const std::string& param,
                                                const std::optional<ParameterRange>& range,
                                                OptimizationMetric metric) const;

    // profit target x short start hour x short end hour x TP threshold
    std::vector<OptimizationRun> optimizeGrid(OptimizationMetric metric) const;

    // Descending by metric, stable for ties
    static void rankResults(std::vector<OptimizationRun>& runs, OptimizationMetric metric);

    size_t maxThreads() const { return max_threads_; }

private:
    struct Candidate {
        strategy::ZoneConfig config;
        std::vector<std::pair<std::string, double>> params;
        std::string label;
    };

    std::vector<PricePoint> prices_;
    strategy::ZoneConfig base_config_;
    strategy::CostConfig costs_;
    strategy::HolidayCalendar holidays_;
    size_t max_threads_;

    std::vector<OptimizationRun> evaluate(const std::vector<Candidate>& candidates) const;
    OptimizationRun evaluateOne(const Candidate& candidate) const;
};

} // namespace backtest
} // namespace ninetofive
