#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/model/StagingSettings.h"
#include "risk/RiskLimits.h"

namespace tradegate {

// Process-wide loader for config.json. Components receive copies of the
// parsed settings at construction and never read this object themselves.
class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    risk::RiskLimits getRiskLimits() const { return risk_limits_; }
    core::StagingSettings getStagingSettings() const { return staging_settings_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    void setRiskLimits(const risk::RiskLimits& limits) { risk_limits_ = limits; }

private:
    Config() = default;

    risk::RiskLimits risk_limits_;
    core::StagingSettings staging_settings_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace tradegate
