#include "strategy/StrategyConfig.h"

#include <cmath>
#include <stdexcept>

namespace ninetofive {
namespace strategy {

namespace {
struct FeeTier {
    const char* name;
    double taker_fee_bps;
    double maker_rebate_bps;
};

// Futures VIP ladder, taker side
constexpr FeeTier FEE_TIERS[] = {
    {"default", 5.0, 0.0},
    {"tier1", 4.0, 0.0},
    {"tier2", 3.5, 0.0},
    {"tier3", 3.2, 0.0},
    {"tier4", 3.0, 0.0},
};

SessionTime mergeSessionTime(const SessionTime& base, const nlohmann::json& j) {
    SessionTime out = base;
    if (!j.is_object()) {
        throw std::invalid_argument("Session time must be an object with hour/minute");
    }
    out.hour = j.value("hour", base.hour);
    out.minute = j.value("minute", base.minute);
    return out;
}

void requireSessionTime(const SessionTime& t, const char* field) {
    if (t.hour < 0 || t.hour > 23 || t.minute < 0 || t.minute > 59) {
        throw std::invalid_argument(std::string(field) + " must be within 00:00-23:59");
    }
}

void requireNonNegative(double value, const char* field) {
    if (!(value >= 0.0)) {
        throw std::invalid_argument(std::string(field) + " must be >= 0");
    }
}

SessionTime sessionFromFractionalHour(double value) {
    SessionTime t;
    t.hour = static_cast<int>(std::floor(value));
    t.minute = (std::abs((value - std::floor(value)) - 0.5) < 1e-9) ? 30 : 0;
    return t;
}
} // namespace

ZoneConfig mergeZoneConfig(const ZoneConfig& base, const nlohmann::json& overrides) {
    ZoneConfig out = base;
    if (overrides.is_null()) {
        return out;
    }
    if (!overrides.is_object()) {
        throw std::invalid_argument("Strategy overrides must be a JSON object");
    }

    out.profit_target_pct = overrides.value("profit_target_pct", base.profit_target_pct);
    out.tp_zone_trailing_stop_pct = overrides.value("tp_zone_trailing_stop_pct", base.tp_zone_trailing_stop_pct);
    out.tp_zone_hours_threshold = overrides.value("tp_zone_hours_threshold", base.tp_zone_hours_threshold);
    out.leverage = overrides.value("leverage", base.leverage);
    if (overrides.contains("short_zone_start")) {
        out.short_zone_start = mergeSessionTime(base.short_zone_start, overrides["short_zone_start"]);
    }
    if (overrides.contains("short_zone_end")) {
        out.short_zone_end = mergeSessionTime(base.short_zone_end, overrides["short_zone_end"]);
    }
    return out;
}

CostConfig mergeCostConfig(const CostConfig& base, const nlohmann::json& overrides) {
    CostConfig out = base;
    if (overrides.is_null()) {
        return out;
    }
    if (!overrides.is_object()) {
        throw std::invalid_argument("Cost overrides must be a JSON object");
    }

    if (overrides.contains("fee_tier")) {
        out = costConfigForTier(overrides["fee_tier"].get<std::string>());
    }
    out.taker_fee_bps = overrides.value("taker_fee_bps", out.taker_fee_bps);
    out.maker_rebate_bps = overrides.value("maker_rebate_bps", out.maker_rebate_bps);
    out.slippage_bps = overrides.value("slippage_bps", out.slippage_bps);
    out.avg_funding_rate_bps = overrides.value("avg_funding_rate_bps", out.avg_funding_rate_bps);
    out.funding_interval_hours = overrides.value("funding_interval_hours", out.funding_interval_hours);
    return out;
}

CostConfig costConfigForTier(const std::string& tier) {
    if (tier == "none") {
        CostConfig zero;
        zero.taker_fee_bps = 0.0;
        zero.maker_rebate_bps = 0.0;
        zero.slippage_bps = 0.0;
        zero.avg_funding_rate_bps = 0.0;
        return zero;
    }
    for (const auto& t : FEE_TIERS) {
        if (tier == t.name) {
            CostConfig out;
            out.taker_fee_bps = t.taker_fee_bps;
            out.maker_rebate_bps = t.maker_rebate_bps;
            return out;
        }
    }
    throw std::invalid_argument("Unknown fee tier: " + tier);
}

std::vector<std::string> feeTierNames() {
    std::vector<std::string> names;
    for (const auto& t : FEE_TIERS) {
        names.emplace_back(t.name);
    }
    names.emplace_back("none");
    return names;
}

void validateZoneConfig(const ZoneConfig& config) {
    requireNonNegative(config.profit_target_pct, "profit_target_pct");
    requireNonNegative(config.tp_zone_trailing_stop_pct, "tp_zone_trailing_stop_pct");
    requireNonNegative(config.tp_zone_hours_threshold, "tp_zone_hours_threshold");
    if (!(config.leverage > 0.0)) {
        throw std::invalid_argument("leverage must be > 0");
    }
    requireSessionTime(config.short_zone_start, "short_zone_start");
    requireSessionTime(config.short_zone_end, "short_zone_end");
}

void validateCostConfig(const CostConfig& config) {
    requireNonNegative(config.taker_fee_bps, "taker_fee_bps");
    requireNonNegative(config.maker_rebate_bps, "maker_rebate_bps");
    requireNonNegative(config.slippage_bps, "slippage_bps");
    if (!(config.funding_interval_hours > 0.0)) {
        throw std::invalid_argument("funding_interval_hours must be > 0");
    }
    // avg_funding_rate_bps may be negative (shorts pay)
    if (!std::isfinite(config.avg_funding_rate_bps)) {
        throw std::invalid_argument("avg_funding_rate_bps must be finite");
    }
}

void applyParameter(ZoneConfig& config, const std::string& name, double value) {
    if (name == "profitTarget") {
        config.profit_target_pct = value;
    } else if (name == "shortStart") {
        config.short_zone_start = sessionFromFractionalHour(value);
    } else if (name == "shortEnd") {
        config.short_zone_end = sessionFromFractionalHour(value);
    } else if (name == "tpThreshold") {
        config.tp_zone_hours_threshold = value;
    } else if (name == "trailingStop") {
        config.tp_zone_trailing_stop_pct = value;
    } else if (name == "leverage") {
        config.leverage = value;
    } else {
        throw std::invalid_argument("Unknown parameter: " + name);
    }
}

nlohmann::json toJson(const ZoneConfig& config) {
    return {
        {"profit_target_pct", config.profit_target_pct},
        {"tp_zone_trailing_stop_pct", config.tp_zone_trailing_stop_pct},
        {"tp_zone_hours_threshold", config.tp_zone_hours_threshold},
        {"leverage", config.leverage},
        {"short_zone_start", {{"hour", config.short_zone_start.hour}, {"minute", config.short_zone_start.minute}}},
        {"short_zone_end", {{"hour", config.short_zone_end.hour}, {"minute", config.short_zone_end.minute}}}
    };
}

nlohmann::json toJson(const CostConfig& config) {
    return {
        {"taker_fee_bps", config.taker_fee_bps},
        {"maker_rebate_bps", config.maker_rebate_bps},
        {"slippage_bps", config.slippage_bps},
        {"avg_funding_rate_bps", config.avg_funding_rate_bps},
        {"funding_interval_hours", config.funding_interval_hours}
    };
}

} // namespace strategy
} // namespace ninetofive
