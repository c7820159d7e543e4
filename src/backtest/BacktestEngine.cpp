#include "backtest/BacktestEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace kitbt {
namespace backtest {

BacktestEngine::BacktestEngine(const BacktestConfig& config)
    : config_(config)
{
    config_.validate();
}

void BacktestEngine::addStrategy(std::shared_ptr<strategy::IStrategy> strategy) {
    if (!strategy) {
        throw ConfigError("addStrategy: null strategy");
    }
    LOG_INFO("Strategy registered: {}", strategy->getName());
    strategies_.push_back(std::move(strategy));
}

void BacktestEngine::clearStrategies() {
    strategies_.clear();
}

BacktestResult BacktestEngine::run(const HistoricalData& data, size_t lookback, const RunHooks& hooks) {
    DataHistory::validate(data.candles);
    const auto& candles = data.candles;
    if (candles.size() <= lookback) {
        throw DataError("need more than " + std::to_string(lookback) + " candles for lookback, got " +
                        std::to_string(candles.size()));
    }

    LOG_INFO("Starting backtest: {} {} | {} candles | lookback {} | {} strategies",
             data.symbol, data.timeframe, candles.size(), lookback, strategies_.size());

    BacktestResult result;
    result.data.symbol = data.symbol;
    result.data.timeframe = data.timeframe;
    result.data.start_time = candles.front().timestamp;
    result.data.end_time = candles.back().timestamp;
    result.data.total_candles = candles.size();
    result.config = config_;
    result.lookback = lookback;
    result.equity_curve.reserve(candles.size() - lookback);

    risk::RiskManager risk(config_);
    double peak_equity = config_.initial_capital;

    for (size_t i = lookback; i < candles.size(); ++i) {
        if (hooks.should_cancel && hooks.should_cancel()) {
            LOG_WARN("Backtest cancelled at candle {}/{}", i, candles.size());
            result.cancelled = true;
            break;
        }

        const Candle& candle = candles[i];

        // 1. Mark to market, then stops/targets for positions from earlier steps
        risk.markToMarket(data.symbol, candle.close);
        risk.evaluateStops(data.symbol, candle, i);

        // 2. Strategy window ending at this candle
        const size_t begin = i >= lookback ? i - lookback : 0;
        const std::vector<Candle> window(candles.begin() + begin, candles.begin() + i + 1);
        const auto signals = collectSignals(data.symbol, window);

        // 3. Risk filters, sizing, entries
        StepContext ctx{data, i, risk, result};
        for (const auto& signal : signals) {
            processSignal(signal, ctx);
        }

        const bool last = (i + 1 == candles.size());
        if (last) {
            const auto closed = risk.closeAll(data.symbol, candle.close, candle.timestamp,
                                              risk::CloseReason::END_OF_DATA);
            if (!closed.empty()) {
                LOG_INFO("Closed {} open positions at end of data", closed.size());
            }
        }

        // 4. Equity snapshot
        risk.markToMarket(data.symbol, candle.close);
        const double equity = risk.getEquity();
        peak_equity = std::max(peak_equity, equity);
        const double drawdown = peak_equity - equity;
        result.equity_curve.emplace_back(candle.timestamp, equity, drawdown,
                                         peak_equity > 0 ? drawdown / peak_equity * 100.0 : 0.0);

        // 5. Progress
        const size_t step = i - lookback + 1;
        if (last || (hooks.progress_interval > 0 && step % hooks.progress_interval == 0)) {
            emitProgress(hooks, ProgressEvent(static_cast<double>(i + 1) * 100.0 / candles.size(),
                                              i, candles.size()));
        }
    }

    result.trades = risk.getTradeHistory();
    result.overall_metrics = metrics_calculator_.calculateMetrics(
        result.trades, result.equity_curve, config_.initial_capital);
    result.metrics_by_strategy = metrics_calculator_.calculateStrategyMetrics(
        result.trades, config_.initial_capital);

    LOG_INFO("Backtest completed: {} trades | {} signals skipped | final equity {:.2f} ({:+.2f}%)",
             result.trades.size(), result.skipped_signals.size(),
             result.overall_metrics.final_capital, result.overall_metrics.total_return);

    return result;
}

std::vector<strategy::Signal> BacktestEngine::collectSignals(const std::string& symbol,
                                                             const std::vector<Candle>& window) {
    std::vector<strategy::Signal> signals;

    for (const auto& strategy : strategies_) {
        try {
            auto produced = strategy->analyze(symbol, window);
            for (auto& signal : produced) {
                if (signal.symbol.empty()) {
                    signal.symbol = symbol;
                }
                if (!isWellFormed(signal, symbol)) {
                    LOG_WARN("Malformed signal from {} dropped (symbol={}, price={}, confidence={}, amount={})",
                             strategy->getName(), signal.symbol, signal.price,
                             signal.confidence, signal.amount);
                    continue;
                }
                signals.push_back(std::move(signal));
            }
        } catch (const std::exception& e) {
            const StrategyError error(strategy->getName(), e.what());
            LOG_WARN("{} (candle {})", error.what(),
                     window.empty() ? 0 : window.back().timestamp);
        } catch (...) {
            const StrategyError error(strategy->getName(), "unknown exception");
            LOG_WARN("{} (candle {})", error.what(),
                     window.empty() ? 0 : window.back().timestamp);
        }
    }

    return signals;
}

bool BacktestEngine::isWellFormed(const strategy::Signal& signal, const std::string& symbol) const {
    if (signal.strategy.empty() || signal.symbol != symbol) {
        return false;
    }
    if (!std::isfinite(signal.price) || signal.price <= 0.0) {
        return false;
    }
    if (!std::isfinite(signal.confidence) || signal.confidence < 0.0 || signal.confidence > 1.0) {
        return false;
    }
    if (!std::isfinite(signal.amount) || signal.amount < 0.0) {
        return false;
    }
    return true;
}

void BacktestEngine::processSignal(const strategy::Signal& signal, StepContext& ctx) {
    const Candle& candle = ctx.data.candles[ctx.index];

    auto skip = [&](risk::SkipReason reason) {
        SkippedSignal skipped;
        skipped.signal = signal;
        skipped.timestamp = candle.timestamp;
        skipped.reason = reason;
        ctx.result.skipped_signals.push_back(skipped);
        LOG_DEBUG("Signal skipped: {} {} from {} ({})", orderSideToString(signal.side),
                  signal.symbol, signal.strategy, risk::skipReasonToString(reason));
    };

    if (!ctx.risk.meetsMinConfidence(signal)) {
        skip(risk::SkipReason::LOW_CONFIDENCE);
        return;
    }

    // An opposite signal from the owning strategy closes its position
    const PositionSide opposite = positionSideFor(signal.side) == PositionSide::LONG
        ? PositionSide::SHORT
        : PositionSide::LONG;
    if (const auto* pos = ctx.risk.findPosition(signal.symbol, signal.strategy, opposite)) {
        const std::string position_id = pos->id;
        ctx.risk.exitPosition(position_id, candle.close, candle.timestamp, risk::CloseReason::SIGNAL);
        ctx.result.signals.push_back(signal);
        return;
    }

    const auto decision = ctx.risk.evaluateEntry(signal, candle.close);
    if (!decision.accepted()) {
        skip(decision.skip_reason);
        return;
    }

    ctx.risk.enterPosition(signal, decision, candle.timestamp, ctx.index);
    ctx.result.signals.push_back(signal);
}

void BacktestEngine::emitProgress(const RunHooks& hooks, const ProgressEvent& event) const {
    for (const auto& listener : hooks.progress_listeners) {
        if (!listener) continue;
        try {
            listener(event);
        } catch (const std::exception& e) {
            LOG_WARN("Progress listener failed: {}", e.what());
        } catch (...) {
            LOG_WARN("Progress listener failed: unknown exception");
        }
    }
}

} // namespace backtest
} // namespace kitbt
