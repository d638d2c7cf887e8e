#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace tradegate {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV row per lifecycle audit event.
    void logAudit(const std::string& strategy_id, const std::string& order_id,
                  const std::string& event, const std::string& actor,
                  const std::string& note, long long ts_ms);

    // Line breaks become spaces; a field holding a comma or quote is quoted.
    static std::string csvField(const std::string& value);

    bool isInitialized() const { return initialized_; }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> audit_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) tradegate::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) tradegate::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) tradegate::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tradegate::Logger::getInstance().error(__VA_ARGS__)

} // namespace tradegate
