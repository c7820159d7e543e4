#include "strategy/MomentumStrategy.h"
#include "analytics/TechnicalIndicators.h"

namespace kitbt {
namespace strategy {

namespace {
constexpr double kBaseConfidence = 0.6;
constexpr double kConfidenceRange = 0.3;
constexpr double kSignalAmount = 0.01;
}

MomentumStrategy::MomentumStrategy(int rsi_period, double oversold, double overbought)
    : rsi_period_(rsi_period)
    , oversold_(oversold)
    , overbought_(overbought)
{
}

StrategyInfo MomentumStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "Momentum";
    info.description = "Trades based on price momentum and RSI";
    info.min_candles = static_cast<size_t>(rsi_period_) + 1;
    return info;
}

std::vector<Signal> MomentumStrategy::analyze(const std::string& symbol,
                                              const std::vector<Candle>& window) {
    std::vector<Signal> signals;
    if (window.size() < getInfo().min_candles) {
        return signals;
    }

    using analytics::TechnicalIndicators;
    const double rsi = TechnicalIndicators::calculateRSI(
        TechnicalIndicators::extractClosePrices(window), rsi_period_);

    Signal signal;
    signal.symbol = symbol;
    signal.amount = kSignalAmount;
    signal.price = window.back().close;
    signal.strategy = "Momentum";
    signal.timestamp = window.back().timestamp;

    if (rsi < oversold_) {
        signal.side = OrderSide::BUY;
        signal.confidence = kBaseConfidence + kConfidenceRange * ((oversold_ - rsi) / oversold_);
        signals.push_back(signal);
    } else if (rsi > overbought_) {
        signal.side = OrderSide::SELL;
        signal.confidence = kBaseConfidence +
            kConfidenceRange * ((rsi - overbought_) / (100.0 - overbought_));
        signals.push_back(signal);
    }

    return signals;
}

} // namespace strategy
} // namespace kitbt
