#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/MetricsCalculator.h"
#include "risk/RiskManager.h"
#include "strategy/IStrategy.h"
#include <map>
#include <string>
#include <vector>

namespace kitbt {
namespace backtest {

struct SkippedSignal {
    strategy::Signal signal;
    TimestampMs timestamp = 0;      // step the signal was rejected on
    risk::SkipReason reason = risk::SkipReason::NONE;
};

struct DataSummary {
    std::string symbol;
    std::string timeframe;
    TimestampMs start_time = 0;
    TimestampMs end_time = 0;
    size_t total_candles = 0;
};

// Everything one run produced. Plain data; identical inputs give an
// identical result.
struct BacktestResult {
    DataSummary data;
    BacktestConfig config;
    size_t lookback = 0;

    std::vector<risk::Trade> trades;                // exit order
    std::vector<EquityPoint> equity_curve;          // one point per step
    std::map<std::string, PerformanceMetrics> metrics_by_strategy;
    PerformanceMetrics overall_metrics;

    std::vector<strategy::Signal> signals;          // accepted (opened or closed a position)
    std::vector<SkippedSignal> skipped_signals;

    bool cancelled = false;
};

} // namespace backtest
} // namespace kitbt
