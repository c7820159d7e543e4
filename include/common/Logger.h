#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace kitbt {

class Logger {
public:
    static Logger& getInstance();

    // Console sink always; rotating file sink and daily trade log only when
    // file_output is set. Calls before initialize() are dropped.
    void initialize(const std::string& log_dir = "logs", bool file_output = true);
    void setLevel(const std::string& level);
    bool isInitialized() const { return initialized_; }

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

    // One CSV row per closed trade: id,symbol,side,entry,exit,amount,pnl,reason
    void logTrade(const std::string& trade_id, const std::string& symbol,
                  const std::string& side, double entry_price, double exit_price,
                  double amount, double pnl, const std::string& reason);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) kitbt::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) kitbt::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) kitbt::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) kitbt::Logger::getInstance().error(__VA_ARGS__)

} // namespace kitbt
