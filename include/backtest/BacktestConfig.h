#pragma once

#include <string>

namespace kitbt {
namespace backtest {

enum class PositionSizing {
    FIXED,      // position_size is an absolute quote-currency amount
    PERCENT,    // position_size is a percent of current equity
    KELLY       // half-Kelly from the strategy's trailing trades
};

// Fill order when a single candle touches both the stop and the target.
// OHLC data cannot tell which came first, so this is a modelling choice.
enum class IntrabarPolicy {
    STOP_FIRST,
    TARGET_FIRST
};

struct BacktestConfig {
    double initial_capital = 10000.0;
    double fee_rate = 0.001;            // per side, 0.001 = 0.1%
    double slippage_rate = 0.0005;      // 0.0005 = 0.05%
    int max_positions = 5;

    PositionSizing position_sizing = PositionSizing::PERCENT;
    double position_size = 2.0;

    bool use_stop_loss = true;
    double stop_loss_percent = 2.0;
    bool use_take_profit = true;
    double take_profit_percent = 4.0;

    bool allow_shorts = true;
    double leverage = 1.0;              // margin = notional / leverage

    IntrabarPolicy intrabar_policy = IntrabarPolicy::STOP_FIRST;
    double min_confidence = 0.5;

    // Throws ConfigError on the first invalid field.
    void validate() const;
};

const char* positionSizingToString(PositionSizing sizing);
const char* intrabarPolicyToString(IntrabarPolicy policy);

// Throw ConfigError for unknown names. Case-insensitive.
PositionSizing parsePositionSizing(const std::string& name);
IntrabarPolicy parseIntrabarPolicy(const std::string& name);

} // namespace backtest
} // namespace kitbt
