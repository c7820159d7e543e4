#pragma once

#include "strategy/IStrategy.h"

namespace kitbt {
namespace strategy {

// SMA crossover: buy when the fast SMA crosses above the slow SMA, sell on
// the cross below.
class TrendFollowerStrategy : public IStrategy {
public:
    TrendFollowerStrategy(int fast_period = 10, int slow_period = 20);

    StrategyInfo getInfo() const override;
    std::vector<Signal> analyze(const std::string& symbol,
                                const std::vector<Candle>& window) override;

private:
    int fast_period_;
    int slow_period_;
};

} // namespace strategy
} // namespace kitbt
