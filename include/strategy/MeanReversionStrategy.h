#pragma once

#include "strategy/IStrategy.h"

namespace kitbt {
namespace strategy {

// Bollinger band reversion: buy below the lower band, sell above the upper.
// Confidence grows with the distance outside the band in standard deviations.
class MeanReversionStrategy : public IStrategy {
public:
    MeanReversionStrategy(int period = 20, double std_dev_mult = 2.0);

    StrategyInfo getInfo() const override;
    std::vector<Signal> analyze(const std::string& symbol,
                                const std::vector<Candle>& window) override;

private:
    int period_;
    double std_dev_mult_;
};

} // namespace strategy
} // namespace kitbt
