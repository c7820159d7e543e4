#include "strategy/MeanReversionStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>

namespace kitbt {
namespace strategy {

namespace {
constexpr double kBaseConfidence = 0.65;
constexpr double kConfidencePerStdDev = 0.1;
constexpr double kSignalAmount = 0.01;
}

MeanReversionStrategy::MeanReversionStrategy(int period, double std_dev_mult)
    : period_(period)
    , std_dev_mult_(std_dev_mult)
{
}

StrategyInfo MeanReversionStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "MeanReversion";
    info.description = "Trades on mean reversion principles using Bollinger Bands";
    info.min_candles = static_cast<size_t>(period_);
    return info;
}

std::vector<Signal> MeanReversionStrategy::analyze(const std::string& symbol,
                                                   const std::vector<Candle>& window) {
    std::vector<Signal> signals;
    if (window.size() < getInfo().min_candles) {
        return signals;
    }

    using analytics::TechnicalIndicators;
    const double price = window.back().close;
    const auto closes = TechnicalIndicators::extractClosePrices(window);
    const auto bands = TechnicalIndicators::calculateBollingerBands(closes, price, period_, std_dev_mult_);
    if (bands.std_dev <= 0.0) {
        return signals;     // flat market, no band
    }

    Signal signal;
    signal.symbol = symbol;
    signal.amount = kSignalAmount;
    signal.price = price;
    signal.strategy = "MeanReversion";
    signal.timestamp = window.back().timestamp;

    if (price < bands.lower) {
        signal.side = OrderSide::BUY;
        signal.confidence = std::min(1.0,
            kBaseConfidence + kConfidencePerStdDev * ((bands.lower - price) / bands.std_dev));
        signals.push_back(signal);
    } else if (price > bands.upper) {
        signal.side = OrderSide::SELL;
        signal.confidence = std::min(1.0,
            kBaseConfidence + kConfidencePerStdDev * ((price - bands.upper) / bands.std_dev));
        signals.push_back(signal);
    }

    return signals;
}

} // namespace strategy
} // namespace kitbt
