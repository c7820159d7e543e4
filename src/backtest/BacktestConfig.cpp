#include "backtest/BacktestConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace kitbt {
namespace backtest {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void requireFinite(double value, const char* field) {
    if (!std::isfinite(value)) {
        throw ConfigError(std::string(field) + " must be a finite number");
    }
}
}

void BacktestConfig::validate() const {
    requireFinite(initial_capital, "initial_capital");
    requireFinite(fee_rate, "fee_rate");
    requireFinite(slippage_rate, "slippage_rate");
    requireFinite(position_size, "position_size");
    requireFinite(stop_loss_percent, "stop_loss_percent");
    requireFinite(take_profit_percent, "take_profit_percent");
    requireFinite(leverage, "leverage");
    requireFinite(min_confidence, "min_confidence");

    if (initial_capital <= 0.0) {
        throw ConfigError("initial_capital must be positive");
    }
    if (fee_rate < 0.0 || fee_rate >= 1.0) {
        throw ConfigError("fee_rate must be in [0, 1)");
    }
    if (slippage_rate < 0.0 || slippage_rate >= 1.0) {
        throw ConfigError("slippage_rate must be in [0, 1)");
    }
    if (max_positions <= 0) {
        throw ConfigError("max_positions must be at least 1");
    }
    if (position_sizing != PositionSizing::KELLY && position_size <= 0.0) {
        throw ConfigError("position_size must be positive");
    }
    if (position_sizing == PositionSizing::PERCENT && position_size > 100.0) {
        throw ConfigError("percent position_size must not exceed 100");
    }
    if (use_stop_loss && (stop_loss_percent <= 0.0 || stop_loss_percent >= 100.0)) {
        throw ConfigError("stop_loss_percent must be in (0, 100) when stop-loss is enabled");
    }
    if (use_take_profit && take_profit_percent <= 0.0) {
        throw ConfigError("take_profit_percent must be positive when take-profit is enabled");
    }
    if (leverage < 1.0) {
        throw ConfigError("leverage must be >= 1");
    }
    if (min_confidence < 0.0 || min_confidence > 1.0) {
        throw ConfigError("min_confidence must be in [0, 1]");
    }
}

const char* positionSizingToString(PositionSizing sizing) {
    switch (sizing) {
        case PositionSizing::FIXED: return "fixed";
        case PositionSizing::PERCENT: return "percent";
        case PositionSizing::KELLY: return "kelly";
    }
    return "percent";
}

const char* intrabarPolicyToString(IntrabarPolicy policy) {
    return policy == IntrabarPolicy::STOP_FIRST ? "stop-first" : "target-first";
}

PositionSizing parsePositionSizing(const std::string& name) {
    const std::string key = toLowerCopy(name);
    if (key == "fixed") return PositionSizing::FIXED;
    if (key == "percent") return PositionSizing::PERCENT;
    if (key == "kelly") return PositionSizing::KELLY;
    throw ConfigError("unknown position sizing mode: " + name);
}

IntrabarPolicy parseIntrabarPolicy(const std::string& name) {
    const std::string key = toLowerCopy(name);
    if (key == "stop-first" || key == "stop_first") return IntrabarPolicy::STOP_FIRST;
    if (key == "target-first" || key == "target_first") return IntrabarPolicy::TARGET_FIRST;
    throw ConfigError("unknown intrabar policy: " + name);
}

} // namespace backtest
} // namespace kitbt
