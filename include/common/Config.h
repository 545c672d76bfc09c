#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "strategy/HolidayCalendar.h"
#include "strategy/StrategyConfig.h"

namespace ninetofive {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults with a warning; unreadable or invalid content throws std::runtime_error
    void load(const std::string& config_path);

    // Merges the sections present in j over the current values
    void loadFromJson(const nlohmann::json& j);

    // Back to built-in defaults
    void reset();

    strategy::ZoneConfig getZoneConfig() const { return zone_config_; }
    strategy::CostConfig getCostConfig() const { return cost_config_; }
    strategy::HolidayCalendar getHolidays() const { return holidays_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    size_t getOptimizerMaxThreads() const { return optimizer_max_threads_; }

    void setZoneConfig(const strategy::ZoneConfig& v) { zone_config_ = v; }
    void setCostConfig(const strategy::CostConfig& v) { cost_config_ = v; }

private:
    Config();

    strategy::ZoneConfig zone_config_;
    strategy::CostConfig cost_config_;
    strategy::HolidayCalendar holidays_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    size_t optimizer_max_threads_ = 0;  // 0 = hardware concurrency
};

} // namespace ninetofive
