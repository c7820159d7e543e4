#include "strategy/TrendFollowerStrategy.h"
#include "analytics/TechnicalIndicators.h"

namespace kitbt {
namespace strategy {

namespace {
constexpr double kCrossoverConfidence = 0.7;
constexpr double kSignalAmount = 0.01;
}

TrendFollowerStrategy::TrendFollowerStrategy(int fast_period, int slow_period)
    : fast_period_(fast_period)
    , slow_period_(slow_period)
{
}

StrategyInfo TrendFollowerStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "TrendFollower";
    info.description = "Follows trends using SMA crossovers";
    info.min_candles = static_cast<size_t>(slow_period_) + 1;   // previous bar's SMAs too
    return info;
}

std::vector<Signal> TrendFollowerStrategy::analyze(const std::string& symbol,
                                                   const std::vector<Candle>& window) {
    std::vector<Signal> signals;
    if (window.size() < getInfo().min_candles) {
        return signals;
    }

    using analytics::TechnicalIndicators;
    auto closes = TechnicalIndicators::extractClosePrices(window);
    const double fast = TechnicalIndicators::calculateSMA(closes, fast_period_);
    const double slow = TechnicalIndicators::calculateSMA(closes, slow_period_);

    closes.pop_back();
    const double prev_fast = TechnicalIndicators::calculateSMA(closes, fast_period_);
    const double prev_slow = TechnicalIndicators::calculateSMA(closes, slow_period_);

    Signal signal;
    signal.symbol = symbol;
    signal.amount = kSignalAmount;
    signal.price = window.back().close;
    signal.strategy = "TrendFollower";
    signal.confidence = kCrossoverConfidence;
    signal.timestamp = window.back().timestamp;

    if (fast > slow && prev_fast <= prev_slow) {
        signal.side = OrderSide::BUY;
        signals.push_back(signal);
    } else if (fast < slow && prev_fast >= prev_slow) {
        signal.side = OrderSide::SELL;
        signals.push_back(signal);
    }

    return signals;
}

} // namespace strategy
} // namespace kitbt
