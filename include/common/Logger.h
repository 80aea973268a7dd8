#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

#include "common/Types.h"

namespace emis {

class Logger {
public:
    static Logger& getInstance();
    // console_to_stderr keeps stdout clean for machine-readable output
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info",
                    bool console_to_stderr = false);
    void setLevel(const std::string& level);

    // Calls before initialize() are dropped, so library code can log freely in tests.
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

    // One CSV line per backtested trade: market,strategy,mode,entry,exit,return
    void logTrade(const std::string& market, const std::string& strategy,
                  const std::string& mode, const Trade& trade);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) emis::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) emis::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) emis::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) emis::Logger::getInstance().error(__VA_ARGS__)

} // namespace emis
