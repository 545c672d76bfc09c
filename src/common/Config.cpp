#include "common/Config.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace ninetofive {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config()
    : holidays_(strategy::HolidayCalendar::usMarketDefaults()) {}

void Config::reset() {
    zone_config_ = strategy::ZoneConfig{};
    cost_config_ = strategy::CostConfig{};
    holidays_ = strategy::HolidayCalendar::usMarketDefaults();
    log_level_ = "info";
    log_dir_ = "logs";
    optimizer_max_threads_ = 0;
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = std::filesystem::absolute(path);
    LOG_INFO("Config file: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}, using defaults", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Config parse error in " + config_path.string() + ": " + e.what());
    }

    try {
        loadFromJson(j);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid config " + config_path.string() + ": " + e.what());
    }

    LOG_INFO("Config loaded: target={}%, leverage={}x, taker={}bps, slippage={}bps, holidays={}",
             zone_config_.profit_target_pct, zone_config_.leverage,
             cost_config_.taker_fee_bps, cost_config_.slippage_bps, holidays_.size());
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Config root must be a JSON object");
    }

    strategy::ZoneConfig zone = zone_config_;
    strategy::CostConfig costs = cost_config_;
    strategy::HolidayCalendar holidays = holidays_;

    if (j.contains("strategy")) {
        zone = strategy::mergeZoneConfig(zone, j["strategy"]);
    }
    if (j.contains("costs")) {
        costs = strategy::mergeCostConfig(costs, j["costs"]);
    }
    if (j.contains("holidays")) {
        holidays = strategy::HolidayCalendar::fromDateStrings(j["holidays"].get<std::vector<std::string>>());
    }

    strategy::validateZoneConfig(zone);
    strategy::validateCostConfig(costs);

    zone_config_ = zone;
    cost_config_ = costs;
    holidays_ = std::move(holidays);

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }
    if (j.contains("optimizer")) {
        const auto& o = j["optimizer"];
        optimizer_max_threads_ = o.value("max_threads", optimizer_max_threads_);
    }
}

} // namespace ninetofive
