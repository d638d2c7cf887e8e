#include "common/Config.h"
#include "common/PathUtils.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tradegate {

namespace {
void warnIfDisabled(const char* name, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::cout << "Warning: risk." << name << " = " << value
                  << " is not a positive finite limit; the check will always fail." << std::endl;
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolve(path);

    std::cout << "Config path: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found: " << config_path.string() << std::endl;
        std::cout << "Using defaults." << std::endl;
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
        throw std::runtime_error("Malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    try {
        if (j.contains("risk")) {
            const auto& r = j["risk"];
            risk_limits_.max_position_size = r.value("max_position_size", 10000.0);
            risk_limits_.max_portfolio_exposure = r.value("max_portfolio_exposure", 50000.0);
            risk_limits_.max_loss_per_trade = r.value("max_loss_per_trade", 1000.0);
            risk_limits_.max_loss_per_day = r.value("max_loss_per_day", 5000.0);
            risk_limits_.contract_multiplier = r.value("contract_multiplier", 100.0);
        }

        if (j.contains("staging")) {
            const auto& s = j["staging"];
            staging_settings_.audit_journal_path =
                s.value("audit_journal_path", std::string("logs/audit_journal.jsonl"));
            staging_settings_.drafts_dir = s.value("drafts_dir", std::string("drafts"));
            staging_settings_.trade_date_utc_offset_minutes = s.value("trade_date_utc_offset_minutes", 0);
            staging_settings_.default_actor = s.value("default_actor", std::string("system"));
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level_ = l.value("level", std::string("info"));
            log_dir_ = l.value("dir", std::string("logs"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    warnIfDisabled("max_position_size", risk_limits_.max_position_size);
    warnIfDisabled("max_portfolio_exposure", risk_limits_.max_portfolio_exposure);
    warnIfDisabled("max_loss_per_trade", risk_limits_.max_loss_per_trade);
    warnIfDisabled("max_loss_per_day", risk_limits_.max_loss_per_day);
    warnIfDisabled("contract_multiplier", risk_limits_.contract_multiplier);
}

} // namespace tradegate
