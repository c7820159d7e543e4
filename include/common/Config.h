#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace kitbt {

class Config {
public:
    static Config& getInstance();

    // Missing file: defaults are kept and false is returned.
    // Unreadable JSON or invalid values: ConfigError.
    bool load(const std::string& config_path);

    // Applies a parsed document on top of the current values.
    void apply(const nlohmann::json& j);

    // Restores every field to its built-in default.
    void reset();

    const backtest::BacktestConfig& getBacktestConfig() const { return backtest_config_; }
    backtest::BacktestConfig& mutableBacktestConfig() { return backtest_config_; }

    std::string getSymbol() const { return symbol_; }
    std::string getTimeframe() const { return timeframe_; }
    size_t getLookback() const { return lookback_; }
    size_t getProgressInterval() const { return progress_interval_; }
    double getRiskFreeRate() const { return risk_free_rate_; }
    const std::vector<std::string>& getEnabledStrategies() const { return enabled_strategies_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    bool getLogToFile() const { return log_to_file_; }

    void setSymbol(const std::string& v) { symbol_ = v; }
    void setTimeframe(const std::string& v) { timeframe_ = v; }
    void setLookback(size_t v) { lookback_ = v; }
    void setEnabledStrategies(const std::vector<std::string>& v) { enabled_strategies_ = v; }
    void setLogLevel(const std::string& v) { log_level_ = v; }

private:
    Config() = default;

    backtest::BacktestConfig backtest_config_;

    std::string symbol_ = "BTC/USDT";
    std::string timeframe_ = "1h";
    size_t lookback_ = 50;
    size_t progress_interval_ = 1000;
    double risk_free_rate_ = 0.02;
    std::vector<std::string> enabled_strategies_;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    bool log_to_file_ = true;
};

} // namespace kitbt
