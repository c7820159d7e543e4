#pragma once

#include "strategy/IStrategy.h"

namespace kitbt {
namespace strategy {

// Range breakout over the previous `period` candles (current candle excluded).
class BreakoutStrategy : public IStrategy {
public:
    explicit BreakoutStrategy(int period = 20);

    StrategyInfo getInfo() const override;
    std::vector<Signal> analyze(const std::string& symbol,
                                const std::vector<Candle>& window) override;

private:
    int period_;
};

} // namespace strategy
} // namespace kitbt
