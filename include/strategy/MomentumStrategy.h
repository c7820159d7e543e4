#pragma once

#include "strategy/IStrategy.h"

namespace kitbt {
namespace strategy {

// RSI momentum: oversold buys, overbought sells.
class MomentumStrategy : public IStrategy {
public:
    MomentumStrategy(int rsi_period = 14, double oversold = 30.0, double overbought = 70.0);

    StrategyInfo getInfo() const override;
    std::vector<Signal> analyze(const std::string& symbol,
                                const std::vector<Candle>& window) override;

private:
    int rsi_period_;
    double oversold_;
    double overbought_;
};

} // namespace strategy
} // namespace kitbt
