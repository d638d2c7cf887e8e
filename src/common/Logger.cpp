#include "common/Logger.h"
#include "common/PathUtils.h"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tradegate {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    const std::filesystem::path logs_path = utils::PathUtils::resolve(log_dir);

    try {
        std::filesystem::create_directories(logs_path);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/tradegate.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        audit_logger_ = spdlog::daily_logger_mt("audit", logs_path.string() + "/audit.log");
        audit_logger_->set_pattern("%v");
        audit_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logAudit(const std::string& strategy_id, const std::string& order_id,
                      const std::string& event, const std::string& actor,
                      const std::string& note, long long ts_ms) {
    if (audit_logger_) {
        std::ostringstream oss;
        oss << ts_ms << "," << csvField(strategy_id) << "," << csvField(order_id) << ","
            << csvField(event) << "," << csvField(actor) << "," << csvField(note);
        audit_logger_->info(oss.str());
    }
}

std::string Logger::csvField(const std::string& value) {
    std::string flat = value;
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    std::replace(flat.begin(), flat.end(), '\r', ' ');
    if (flat.find_first_of(",\"") == std::string::npos) {
        return flat;
    }

    std::string quoted = "\"";
    for (char c : flat) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace tradegate
