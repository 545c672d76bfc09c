#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ninetofive {
namespace strategy {

struct SessionTime {
    int hour = 0;
    int minute = 0;

    int minuteOfDay() const { return hour * 60 + minute; }
};

// Strategy parameters. Session times are local (UTC-5) wall-clock.
struct ZoneConfig {
    double profit_target_pct = 1.0;
    double tp_zone_trailing_stop_pct = 0.5;
    double tp_zone_hours_threshold = 6.0;
    double leverage = 10.0;
    SessionTime short_zone_start{9, 29};
    SessionTime short_zone_end{16, 1};
};

// Trading cost assumptions, all in basis points
struct CostConfig {
    double taker_fee_bps = 5.0;
    double maker_rebate_bps = 0.0;      // carried for reporting, never applied (taker on both legs)
    double slippage_bps = 5.0;
    double avg_funding_rate_bps = 1.0;  // per funding interval
    double funding_interval_hours = 8.0;
};

// Returns base with every key present in overrides replaced.
// Keys: profit_target_pct, tp_zone_trailing_stop_pct, tp_zone_hours_threshold, leverage,
//       short_zone_start {hour, minute}, short_zone_end {hour, minute}
ZoneConfig mergeZoneConfig(const ZoneConfig& base, const nlohmann::json& overrides);

// Keys: fee_tier (applied first), taker_fee_bps, maker_rebate_bps, slippage_bps,
//       avg_funding_rate_bps, funding_interval_hours
CostConfig mergeCostConfig(const CostConfig& base, const nlohmann::json& overrides);

// Exchange fee-tier presets: default, tier1..tier4, none (all costs zero).
// Throws std::invalid_argument for an unknown tier.
CostConfig costConfigForTier(const std::string& tier);
std::vector<std::string> feeTierNames();

// Throw std::invalid_argument describing the first offending field
void validateZoneConfig(const ZoneConfig& config);
void validateCostConfig(const CostConfig& config);

// Sets a single optimizer parameter by name:
// profitTarget, shortStart, shortEnd, tpThreshold, trailingStop, leverage.
// Session hours take a fractional part of .5 as minute 30, otherwise minute 0.
void applyParameter(ZoneConfig& config, const std::string& name, double value);

nlohmann::json toJson(const ZoneConfig& config);
nlohmann::json toJson(const CostConfig& config);

} // namespace strategy
} // namespace ninetofive
