#include "strategy/BreakoutStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>

namespace kitbt {
namespace strategy {

namespace {
constexpr double kBaseConfidence = 0.5;
constexpr double kMaxConfidence = 0.9;
constexpr double kSignalAmount = 0.01;
}

BreakoutStrategy::BreakoutStrategy(int period)
    : period_(period)
{
}

StrategyInfo BreakoutStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "Breakout";
    info.description = "Trades breakouts from support/resistance levels";
    info.min_candles = static_cast<size_t>(period_) + 1;
    return info;
}

std::vector<Signal> BreakoutStrategy::analyze(const std::string& symbol,
                                              const std::vector<Candle>& window) {
    std::vector<Signal> signals;
    if (window.size() < getInfo().min_candles) {
        return signals;
    }

    using analytics::TechnicalIndicators;
    const size_t end = window.size() - 1;
    const size_t begin = end - static_cast<size_t>(period_);
    const double recent_high = TechnicalIndicators::highestHigh(window, begin, end);
    const double recent_low = TechnicalIndicators::lowestLow(window, begin, end);
    const double range = recent_high - recent_low;
    const double price = window.back().close;

    if (range <= 0.0) {
        return signals;
    }

    Signal signal;
    signal.symbol = symbol;
    signal.amount = kSignalAmount;
    signal.price = price;
    signal.strategy = "Breakout";
    signal.timestamp = window.back().timestamp;

    if (price > recent_high) {
        signal.side = OrderSide::BUY;
        signal.confidence = std::min(kBaseConfidence + (price - recent_high) / range, kMaxConfidence);
        signals.push_back(signal);
    } else if (price < recent_low) {
        signal.side = OrderSide::SELL;
        signal.confidence = std::min(kBaseConfidence + (recent_low - price) / range, kMaxConfidence);
        signals.push_back(signal);
    }

    return signals;
}

} // namespace strategy
} // namespace kitbt
