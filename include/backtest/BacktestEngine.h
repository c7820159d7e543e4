#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestResult.h"
#include "backtest/DataHistory.h"
#include "backtest/MetricsCalculator.h"
#include "risk/RiskManager.h"
#include "strategy/IStrategy.h"

namespace kitbt {
namespace backtest {

struct ProgressEvent {
    double percent;     // 0 ~ 100
    size_t index;       // candle index just processed
    size_t total;       // candle count

    ProgressEvent() : percent(0), index(0), total(0) {}
    ProgressEvent(double p, size_t i, size_t t) : percent(p), index(i), total(t) {}
};

using ProgressListener = std::function<void(const ProgressEvent&)>;
using CancelPredicate = std::function<bool()>;

// Per-run side channels. Listeners observe only; nothing they do reaches the
// simulation state.
struct RunHooks {
    std::vector<ProgressListener> progress_listeners;
    CancelPredicate should_cancel;          // polled once per step
    size_t progress_interval = 1000;        // steps between events, 0 = completion only
};

// Chronological single-symbol replay. Single-threaded; strategies run in
// registration order.
class BacktestEngine {
public:
    // Throws ConfigError when the config is invalid.
    explicit BacktestEngine(const BacktestConfig& config);

    void addStrategy(std::shared_ptr<strategy::IStrategy> strategy);
    void clearStrategies();
    size_t getStrategyCount() const { return strategies_.size(); }

    void setRiskFreeRate(double rate) { metrics_calculator_.setRiskFreeRate(rate); }

    const BacktestConfig& getConfig() const { return config_; }

    // Replays candles[lookback..]. Throws DataError for empty, malformed or
    // out-of-order data and when there are not more than `lookback` candles.
    BacktestResult run(const HistoricalData& data, size_t lookback, const RunHooks& hooks = RunHooks());

private:
    struct StepContext {
        const HistoricalData& data;
        size_t index;
        risk::RiskManager& risk;
        BacktestResult& result;
    };

    std::vector<strategy::Signal> collectSignals(const std::string& symbol,
                                                 const std::vector<Candle>& window);
    bool isWellFormed(const strategy::Signal& signal, const std::string& symbol) const;
    void processSignal(const strategy::Signal& signal, StepContext& ctx);
    void emitProgress(const RunHooks& hooks, const ProgressEvent& event) const;

    BacktestConfig config_;
    std::vector<std::shared_ptr<strategy::IStrategy>> strategies_;
    MetricsCalculator metrics_calculator_;
};

} // namespace backtest
} // namespace kitbt
