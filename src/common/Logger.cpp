#include "common/Logger.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace kitbt {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, bool file_output) {
    if (initialized_) return;

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        std::filesystem::path logs_path;
        if (file_output) {
            logs_path = std::filesystem::path(log_dir).is_absolute()
                ? std::filesystem::path(log_dir)
                : std::filesystem::current_path() / log_dir;
            std::filesystem::create_directories(logs_path);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (logs_path / "kitbt.log").string(), 1024 * 1024 * 10, 3
            );
            sinks.push_back(file_sink);
        }

        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::info);
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        if (file_output) {
            trade_logger_ = spdlog::daily_logger_mt("trade", (logs_path / "trades.log").string());
            trade_logger_->set_pattern("%v");
        }

        initialized_ = true;
        main_logger_->info("Logger initialized");
        if (file_output) {
            main_logger_->info("Log directory: {}", logs_path.string());
        }
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::logTrade(const std::string& trade_id, const std::string& symbol,
                      const std::string& side, double entry_price, double exit_price,
                      double amount, double pnl, const std::string& reason) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << trade_id << "," << symbol << "," << side << ","
            << std::fixed << std::setprecision(8) << entry_price << ","
            << std::fixed << std::setprecision(8) << exit_price << ","
            << std::fixed << std::setprecision(8) << amount << ","
            << std::fixed << std::setprecision(2) << pnl << ","
            << reason;
        trade_logger_->info(oss.str());
    }
}

} // namespace kitbt
