#pragma once

#include <stdexcept>
#include <string>

namespace kitbt {

// Missing, malformed or out-of-order candle input. Aborts a run.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& message)
        : std::runtime_error("DataError: " + message) {}
};

// Invalid BacktestConfig. A run never starts with one.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("ConfigError: " + message) {}
};

// Raised from inside IStrategy::analyze. The engine catches it per strategy per step.
class StrategyError : public std::runtime_error {
public:
    StrategyError(const std::string& strategy_name, const std::string& message)
        : std::runtime_error("StrategyError(" + strategy_name + "): " + message)
        , strategy_name_(strategy_name) {}

    const std::string& strategyName() const { return strategy_name_; }

private:
    std::string strategy_name_;
};

} // namespace kitbt
